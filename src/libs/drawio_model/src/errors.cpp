#include <drawio_model/errors.hpp>

namespace drawio_model {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Structural: return "structural";
    case ErrorKind::Vocabulary: return "vocabulary";
    case ErrorKind::Resolution: return "resolution";
    case ErrorKind::Sanitisation: return "sanitisation";
    case ErrorKind::Configuration: return "configuration";
    }
    return "unknown";
}

} // namespace drawio_model
