#include <owl_blocks/block_assembler.hpp>
#include <drawio_logging/logger.hpp>
#include <drawio_model/errors.hpp>
#include <utility>

namespace owl_blocks {

BlockAssembler::BlockAssembler(const drawio_model::Vocabulary& vocabulary, SanitiserConfig config)
    : vocabulary_(vocabulary), sanitiser_(std::move(config)) {}

Block& BlockAssembler::block_for(const std::string& label) {
    std::string identifier = sanitiser_.sanitise(label);
    if (const auto it = index_.find(identifier); it != index_.end()) {
        Block& block = blocks_[it->second];
        if (block.label != label) {
            drawio_logging::logger()->debug("The labels '{}' and '{}' both give the identifier {}",
                block.label, label, block.identifier);
        }
        return block;
    }
    index_.emplace(identifier, blocks_.size());
    Block& block = blocks_.emplace_back();
    block.identifier = std::move(identifier);
    block.label = label;
    return block;
}

void BlockAssembler::add(const drawio_model::Individual& individual) {
    if (!vocabulary_.is_class(individual.ric_class)) {
        throw drawio_model::VocabularyError("Not a RiC-O class: rico:" + individual.ric_class
            + " (declared for the individual '" + individual.identifier + "')");
    }
    block_for(individual.identifier).types.insert(individual.ric_class);
}

void BlockAssembler::add(const drawio_model::Arrow& arrow) {
    if (!vocabulary_.is_property(arrow.identifier)) {
        throw drawio_model::VocabularyError("An arrow has label rico:'" + arrow.identifier
            + "', which is not an object property or datatype property in RiC-O");
    }
    // Datatype property values are literals and stay as written.
    std::string value = vocabulary_.is_object_property(arrow.identifier)
        ? sanitiser_.sanitise(arrow.target) : arrow.target;
    block_for(arrow.source).facts[arrow.identifier].insert(std::move(value));
}

std::vector<Block> BlockAssembler::take_blocks() {
    std::vector<Block> blocks = std::move(blocks_);
    blocks_.clear();
    index_.clear();
    return blocks;
}

std::vector<Block> individual_blocks(const std::vector<drawio_model::Individual>& individuals,
    const std::vector<drawio_model::Arrow>& arrows, const drawio_model::Vocabulary& vocabulary,
    const SanitiserConfig& config)
{
    BlockAssembler assembler(vocabulary, config);
    for (const auto& individual : individuals)
        assembler.add(individual);
    for (const auto& arrow : arrows)
        assembler.add(arrow);
    drawio_logging::logger()->info("Assembled {} blocks from {} individuals and {} arrows",
        assembler.blocks().size(), individuals.size(), arrows.size());
    return assembler.take_blocks();
}

} // namespace owl_blocks
