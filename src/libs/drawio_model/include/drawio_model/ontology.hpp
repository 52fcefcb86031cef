#pragma once

#include <string>

namespace drawio_model {

// An OWL individual typed by a RiC-O class. A node declaring several classes
// gives one Individual per class, all with the same identifier.
struct Individual {
    std::string identifier;
    std::string ric_class;
};

// An arrow of the graph: a RiC-O object or datatype property from source to
// target. identifier is the property name without the "rico:" prefix.
struct Arrow {
    std::string identifier;
    std::string source;
    std::string target;
};

inline bool operator==(const Individual& a, const Individual& b) {
    return a.identifier == b.identifier && a.ric_class == b.ric_class;
}

inline bool operator==(const Arrow& a, const Arrow& b) {
    return a.identifier == b.identifier && a.source == b.source && a.target == b.target;
}

} // namespace drawio_model
