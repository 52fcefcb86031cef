// draw.io to OWL (Manchester syntax) converter for RiC-O individuals (C++20)
#include <converter/command_line.hpp>
#include <converter/converter.hpp>
#include <converter/json_config_loader.hpp>
#include <drawio_logging/logger.hpp>
#include <drawio_model/errors.hpp>
#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace {

std::string read_all(std::istream& in) {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string read_input(const converter::CommandLine& command_line) {
    if (!command_line.input_path || *command_line.input_path == "-")
        return read_all(std::cin);
    std::ifstream f(*command_line.input_path, std::ios::binary);
    if (!f)
        throw drawio_model::ConfigurationError("Could not open the input file " + *command_line.input_path);
    return read_all(f);
}

converter::ConverterConfig build_config(const converter::CommandLine& command_line) {
    converter::ConverterConfig config;
    if (command_line.config_path) {
        auto loaded = converter::load_config_from_json_file(*command_line.config_path);
        if (!loaded) {
            throw drawio_model::ConfigurationError("Could not read the configuration file "
                + *command_line.config_path);
        }
        config = std::move(*loaded);
    }
    return converter::apply_command_line(command_line, std::move(config));
}

} // namespace

int main(int argc, char* argv[])
{
    const std::string program = argc > 0 ? argv[0] : "drawio_to_owl";
    try {
        const auto command_line = converter::parse_command_line(converter::arguments_of(argc, argv));
        if (command_line.help) {
            std::cout << converter::usage(program);
            return 0;
        }
        const auto config = build_config(command_line);
        drawio_logging::configure(config.log_level, config.log_file);

        const std::string output = converter::convert(read_input(command_line), config);
        std::cout << output << "\n";
    } catch (const drawio_model::ConversionError& ex) {
        drawio_logging::logger()->debug("Conversion failed with a {} error", drawio_model::to_string(ex.kind()));
        (void)fprintf(stderr, "%s\n", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        (void)fprintf(stderr, "An unexpected error occurred: %s\n", ex.what());
        return 1;
    }
    return 0;
}
