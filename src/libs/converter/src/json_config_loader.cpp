#include <converter/json_config_loader.hpp>
#include <drawio_logging/logger.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <utility>
#include <vector>

namespace converter {

namespace {

void warn_ignored(const char* key, const char* expected) {
    drawio_logging::logger()->warn("Ignoring the configuration key '{}': expecting {}", key, expected);
}

void read_bool(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) return;
    if (j[key].is_boolean()) out = j[key].get<bool>();
    else warn_ignored(key, "a boolean");
}

void read_string(const nlohmann::json& j, const char* key, std::optional<std::string>& out) {
    if (!j.contains(key)) return;
    if (j[key].is_string()) out = j[key].get<std::string>();
    else if (j[key].is_null()) out.reset();
    else warn_ignored(key, "a string");
}

void read_sanitiser(const nlohmann::json& j, owl_blocks::SanitiserConfig& out) {
    owl_blocks::CapitalisationScheme scheme = out.scheme;
    if (j.contains("capitalisation")) {
        const auto& c = j["capitalisation"];
        std::optional<owl_blocks::CapitalisationScheme> parsed;
        if (c.is_string()) parsed = owl_blocks::capitalisation_scheme_from_string(c.get<std::string>());
        if (parsed) scheme = *parsed;
        else warn_ignored("capitalisation", "one of 'upper-camel', 'lower-camel', 'flat', 'none'");
    }

    if (j.contains("substitutions")) {
        const auto& s = j["substitutions"];
        if (!s.is_array()) {
            warn_ignored("substitutions", "an array of rules");
        } else {
            std::vector<std::string> rules;
            for (const auto& rule : s) {
                if (rule.is_string()) rules.push_back(rule.get<std::string>());
                else warn_ignored("substitutions", "rules given as strings");
            }
            out = owl_blocks::parse_substitution_rules(scheme, rules);
            return;
        }
    }
    out.scheme = scheme;
}

ConverterConfig parse_config_json(const nlohmann::json& j, ConverterConfig config) {
    auto& s = config.serialisation;
    read_bool(j, "infer_literal_types", s.infer_type_of_literals);
    read_bool(j, "preamble", s.include_preamble);
    read_bool(j, "label_annotations", s.include_label);
    read_string(j, "ontology_iri", s.ontology_iri);
    read_string(j, "prefix", s.prefix);
    read_string(j, "prefix_iri", s.prefix_iri);
    if (j.contains("indentation")) {
        if (j["indentation"].is_number_integer() && j["indentation"].get<int>() >= 0)
            s.indentation = j["indentation"].get<int>();
        else
            warn_ignored("indentation", "a non-negative integer");
    }

    read_bool(j, "strict_mode", config.resolve.strict_mode);
    if (j.contains("max_gap")) {
        if (j["max_gap"].is_number() && j["max_gap"].get<double>() >= 0)
            config.resolve.max_gap = j["max_gap"].get<double>();
        else
            warn_ignored("max_gap", "a non-negative number");
    }

    read_sanitiser(j, config.sanitiser);
    return config;
}

} // namespace

std::optional<ConverterConfig> load_config_from_json(std::istream& in, ConverterConfig base) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& ex) {
        drawio_logging::logger()->error("Could not parse the configuration: {}", ex.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        drawio_logging::logger()->error("Could not parse the configuration: expecting a JSON object");
        return std::nullopt;
    }
    return parse_config_json(j, std::move(base));
}

std::optional<ConverterConfig> load_config_from_json_file(const std::string& path, ConverterConfig base) {
    std::ifstream f(path);
    if (!f) {
        drawio_logging::logger()->error("Could not open the configuration file {}", path);
        return std::nullopt;
    }
    return load_config_from_json(f, std::move(base));
}

} // namespace converter
