#include <converter/command_line.hpp>
#include <drawio_model/errors.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <utility>

namespace converter {

namespace {

using drawio_model::ConfigurationError;

double parse_non_negative_number(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    double parsed = 0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationError("The value '" + value + "' of the option " + option + " is not a number");
    }
    if (consumed != value.size() || parsed < 0) {
        throw ConfigurationError("The value '" + value + "' of the option " + option
            + " is not a non-negative number");
    }
    return parsed;
}

int parse_non_negative_integer(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::logic_error&) {
        throw ConfigurationError("The value '" + value + "' of the option " + option + " is not an integer");
    }
    if (consumed != value.size() || parsed < 0) {
        throw ConfigurationError("The value '" + value + "' of the option " + option
            + " is not a non-negative integer");
    }
    return parsed;
}

} // namespace

std::vector<std::string> arguments_of(int argc, const char* const argv[]) {
    std::vector<std::string> args;
    if (argc > 1) args.assign(argv + 1, argv + argc);
    return args;
}

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size())
                throw ConfigurationError("The option " + arg + " expects a value");
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            out.verbose = true;
        } else if (arg == "-d" || arg == "--preamble-disable") {
            out.disable_preamble = true;
        } else if (arg == "-i" || arg == "--infer-types-disable") {
            out.disable_type_inference = true;
        } else if (arg == "-l" || arg == "--label-disable") {
            out.disable_labels = true;
        } else if (arg == "-s" || arg == "--strict-mode") {
            out.strict_mode = true;
        } else if (arg == "-g" || arg == "--max-gap") {
            out.max_gap = parse_non_negative_number(arg, value());
        } else if (arg == "-n" || arg == "--indentation") {
            out.indentation = parse_non_negative_integer(arg, value());
        } else if (arg == "-o" || arg == "--ontology-iri") {
            out.ontology_iri = value();
        } else if (arg == "-x" || arg == "--prefix") {
            out.prefix = value();
        } else if (arg == "-p" || arg == "--prefix-iri") {
            out.prefix_iri = value();
        } else if (arg == "-c" || arg == "--capitalisation") {
            const std::string& scheme = value();
            out.capitalisation = owl_blocks::capitalisation_scheme_from_string(scheme);
            if (!out.capitalisation) {
                throw ConfigurationError("Unknown capitalisation scheme '" + scheme
                    + "': expecting one of upper-camel, lower-camel, flat, none");
            }
        } else if (arg == "-m" || arg == "--metacharacter") {
            out.substitution_rules.push_back(value());
        } else if (arg == "--config") {
            out.config_path = value();
        } else if (arg == "--log-file") {
            out.log_file = value();
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw ConfigurationError("Unknown option " + arg);
        } else if (out.input_path) {
            throw ConfigurationError("Expecting at most one input file, but got " + *out.input_path
                + " and " + arg);
        } else {
            out.input_path = arg;
        }
    }
    return out;
}

ConverterConfig apply_command_line(const CommandLine& command_line, ConverterConfig base) {
    auto& s = base.serialisation;
    if (command_line.disable_preamble) s.include_preamble = false;
    if (command_line.disable_type_inference) s.infer_type_of_literals = false;
    if (command_line.disable_labels) s.include_label = false;
    if (command_line.indentation) s.indentation = *command_line.indentation;
    if (command_line.ontology_iri) s.ontology_iri = command_line.ontology_iri;
    if (command_line.prefix) s.prefix = command_line.prefix;
    if (command_line.prefix_iri) s.prefix_iri = command_line.prefix_iri;

    if (command_line.strict_mode) base.resolve.strict_mode = true;
    if (command_line.max_gap) base.resolve.max_gap = *command_line.max_gap;

    const auto scheme = command_line.capitalisation.value_or(base.sanitiser.scheme);
    if (!command_line.substitution_rules.empty())
        base.sanitiser = owl_blocks::parse_substitution_rules(scheme, command_line.substitution_rules);
    else
        base.sanitiser.scheme = scheme;

    if (command_line.verbose) base.log_level = spdlog::level::debug;
    if (command_line.log_file) base.log_file = command_line.log_file;
    return base;
}

std::string usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [options] [input.drawio]\n"
        "\n"
        "Constructs individuals in OWL (Manchester syntax) with respect to the RiC-O\n"
        "ontology from a draw.io diagram, read from the input file or stdin.\n"
        "\n"
        "Options:\n"
        "  -d, --preamble-disable        omit the prefix and ontology declarations\n"
        "  -g, --max-gap <n>             max gap in pixels between an unlocked arrow end\n"
        "                                and a node (default {})\n"
        "  -i, --infer-types-disable     emit every literal as an untyped string\n"
        "  -n, --indentation <n>         indentation width (default {})\n"
        "  -o, --ontology-iri <iri>      IRI of the generated ontology\n"
        "  -p, --prefix-iri <iri>        IRI of the identifier prefix\n"
        "  -s, --strict-mode             only accept arrows locked to their nodes\n"
        "  -x, --prefix <prefix>         prefix of the generated identifiers\n"
        "  -l, --label-disable           omit the rdfs:label annotations\n"
        "  -c, --capitalisation <scheme> upper-camel (default), lower-camel, flat or none\n"
        "  -m, --metacharacter <rule>    'c=replacement', 'remove' or 'url'; repeatable\n"
        "      --config <file.json>      read settings from a JSON file first\n"
        "  -v, --verbose                 log debug messages to stderr\n"
        "      --log-file <path>         also write the log to a file\n"
        "  -h, --help                    show this message\n",
        program, drawio_placement::default_max_gap, owl_serialise::default_indentation);
}

} // namespace converter
