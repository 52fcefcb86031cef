#include <owl_serialise/serialiser.hpp>
#include <owl_serialise/literal_types.hpp>
#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>

namespace owl_serialise {

namespace {

std::string prefixed(const SerialisationConfig& config, const std::string& identifier) {
    if (config.prefix && !config.prefix->empty()) return *config.prefix + ":" + identifier;
    return identifier;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

std::string fact_value(const std::string& property, const std::string& value,
    const SerialisationConfig& config, const drawio_model::Vocabulary& vocabulary)
{
    if (vocabulary.is_datatype_property(property))
        return config.infer_type_of_literals ? typed_literal(value) : quote_literal(value);
    return prefixed(config, value);
}

} // namespace

std::string default_ontology_iri(std::time_t now) {
    return fmt::format("ontology://generated-from-draw-io/{:%Y-%m-%dT%H-%M-%S}", fmt::localtime(now));
}

std::string preamble(const SerialisationConfig& config) {
    const std::string ontology_iri = config.ontology_iri ? *config.ontology_iri
                                                         : default_ontology_iri(std::time(nullptr));
    const std::string prefix_iri = config.prefix_iri ? *config.prefix_iri : ontology_iri + "#";
    const std::string indent(static_cast<std::size_t>(config.indentation), ' ');

    return fmt::format("Prefix: rico: <{}>\n"
                       "Prefix: {}: <{}>\n"
                       "Ontology: <{}>\n"
                       "{}Import: <{}>",
        ric_namespace_iri, config.prefix.value_or(""), prefix_iri, ontology_iri, indent, ric_ontology_iri);
}

std::string serialise_block(const owl_blocks::Block& block, const SerialisationConfig& config,
    const drawio_model::Vocabulary& vocabulary)
{
    const std::string indent(static_cast<std::size_t>(config.indentation), ' ');
    const std::string fact_indent = indent + indent;

    std::string out = "Individual: " + prefixed(config, block.identifier);
    if (config.include_label)
        out += "\n" + indent + "Annotations: rdfs:label " + quote_literal(block.label);

    if (!block.types.empty()) {
        std::vector<std::string> types;
        for (const auto& type : block.types)
            types.push_back("rico:" + type);
        out += "\n" + indent + "Types: " + join(types, ", ");
    }

    std::vector<std::string> facts;
    for (const auto& [property, values] : block.facts) {
        for (const auto& value : values)
            facts.push_back("rico:" + property + " " + fact_value(property, value, config, vocabulary));
    }
    if (!facts.empty())
        out += "\n" + indent + "Facts:\n" + fact_indent + join(facts, ",\n" + fact_indent);
    return out;
}

std::string serialise(const std::vector<owl_blocks::Block>& blocks, const SerialisationConfig& config,
    const drawio_model::Vocabulary& vocabulary)
{
    std::vector<std::string> sections;
    sections.reserve(blocks.size() + 1);
    if (config.include_preamble) sections.push_back(preamble(config));
    for (const auto& block : blocks)
        sections.push_back(serialise_block(block, config, vocabulary));
    return join(sections, "\n\n");
}

} // namespace owl_serialise
