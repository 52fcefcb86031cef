#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace drawio_logging {

constexpr const char* logger_name = "drawio_owl";

// Shared logger of the conversion pipeline. Writes to stderr; stdout is
// reserved for the generated ontology.
std::shared_ptr<spdlog::logger> logger();

// Replaces the shared logger: stderr at the given level, plus a file sink
// truncating log_file when one is given.
void configure(spdlog::level::level_enum level, const std::optional<std::string>& log_file = std::nullopt);

} // namespace drawio_logging
