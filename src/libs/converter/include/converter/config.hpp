#pragma once

#include <drawio_placement/endpoint_resolver.hpp>
#include <owl_blocks/identifier_sanitiser.hpp>
#include <owl_serialise/serialiser.hpp>
#include <spdlog/common.h>
#include <optional>
#include <string>

namespace converter {

// Everything a conversion run can be configured with. Built from the defaults,
// then a JSON configuration file, then the command line.
struct ConverterConfig {
    owl_serialise::SerialisationConfig serialisation;
    drawio_placement::ResolveOptions resolve;
    owl_blocks::SanitiserConfig sanitiser;
    spdlog::level::level_enum log_level = spdlog::level::warn;
    std::optional<std::string> log_file;
};

} // namespace converter
