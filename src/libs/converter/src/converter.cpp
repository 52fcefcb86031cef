#include <converter/converter.hpp>
#include <drawio_loaders/diagram_tree.hpp>
#include <drawio_logging/logger.hpp>
#include <drawio_placement/endpoint_resolver.hpp>
#include <owl_blocks/block_assembler.hpp>
#include <owl_serialise/serialiser.hpp>

namespace converter {

std::string convert(std::string_view raw_xml, const ConverterConfig& config,
    const drawio_model::Vocabulary& vocabulary)
{
    const drawio_loaders::DiagramTree tree(raw_xml, vocabulary);
    const drawio_placement::EndpointResolver resolver(tree, config.resolve);
    const auto arrows = resolver.resolve_all();
    const auto blocks = owl_blocks::individual_blocks(tree.individuals(), arrows, vocabulary, config.sanitiser);

    std::string out = owl_serialise::serialise(blocks, config.serialisation, vocabulary);
    const auto last = out.find_last_not_of(" \t\r\n");
    out.erase(last == std::string::npos ? 0 : last + 1);
    drawio_logging::logger()->debug("Serialised {} blocks into {} bytes", blocks.size(), out.size());
    return out;
}

} // namespace converter
