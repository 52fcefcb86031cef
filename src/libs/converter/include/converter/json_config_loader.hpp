#pragma once

#include <converter/config.hpp>
#include <istream>
#include <optional>
#include <string>

namespace converter {

// Reads a JSON object of settings over base. Every key is optional; values of
// the wrong type are ignored with a warning. Returns nullopt if the input is
// not a JSON object. Throws ConfigurationError for malformed substitution
// rules.
std::optional<ConverterConfig> load_config_from_json(std::istream& in, ConverterConfig base = {});
std::optional<ConverterConfig> load_config_from_json_file(const std::string& path, ConverterConfig base = {});

} // namespace converter
