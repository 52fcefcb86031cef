#pragma once

#include <converter/config.hpp>
#include <owl_blocks/identifier_sanitiser.hpp>
#include <optional>
#include <string>
#include <vector>

namespace converter {

// Settings given on the command line. Unset members leave the configuration
// file (or the default) in force.
struct CommandLine {
    bool help = false;
    bool verbose = false;
    std::optional<std::string> input_path;   // stdin if unset or "-"
    std::optional<std::string> config_path;
    std::optional<std::string> log_file;

    bool disable_preamble = false;
    bool disable_type_inference = false;
    bool disable_labels = false;
    bool strict_mode = false;
    std::optional<double> max_gap;
    std::optional<int> indentation;
    std::optional<std::string> ontology_iri;
    std::optional<std::string> prefix;
    std::optional<std::string> prefix_iri;
    std::optional<owl_blocks::CapitalisationScheme> capitalisation;
    std::vector<std::string> substitution_rules;
};

// argv[1..argc) as strings; empty when argc is 0 or 1.
std::vector<std::string> arguments_of(int argc, const char* const argv[]);

// args excludes the program name. Throws ConfigurationError on an unknown
// option, a missing or malformed value, or more than one input file.
CommandLine parse_command_line(const std::vector<std::string>& args);

// Throws ConfigurationError for malformed substitution rules.
ConverterConfig apply_command_line(const CommandLine& command_line, ConverterConfig base);

std::string usage(const std::string& program);

} // namespace converter
