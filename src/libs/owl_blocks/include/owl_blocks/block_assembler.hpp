#pragma once

#include <owl_blocks/identifier_sanitiser.hpp>
#include <drawio_model/ontology.hpp>
#include <drawio_model/vocabulary.hpp>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace owl_blocks {

// Everything declared about one individual.
struct Block {
    std::string identifier; // sanitised
    std::string label;      // original label of the first occurrence
    std::set<std::string> types;
    // property name -> values; object property values are sanitised
    // identifiers, datatype property values raw literals.
    std::map<std::string, std::set<std::string>> facts;
};

// Gathers Individuals and Arrows into Blocks keyed by sanitised identifier.
// Blocks are kept in the order they were first referred to.
class BlockAssembler {
public:
    BlockAssembler(const drawio_model::Vocabulary& vocabulary, SanitiserConfig config);

    // Throws VocabularyError for a class or property unknown to the vocabulary,
    // SanitisationError if an identifier cannot be sanitised.
    void add(const drawio_model::Individual& individual);
    void add(const drawio_model::Arrow& arrow);

    const std::vector<Block>& blocks() const { return blocks_; }
    std::vector<Block> take_blocks();

private:
    Block& block_for(const std::string& label);

    const drawio_model::Vocabulary& vocabulary_;
    IdentifierSanitiser sanitiser_;
    std::vector<Block> blocks_;
    std::unordered_map<std::string, std::size_t> index_;
};

std::vector<Block> individual_blocks(const std::vector<drawio_model::Individual>& individuals,
    const std::vector<drawio_model::Arrow>& arrows, const drawio_model::Vocabulary& vocabulary,
    const SanitiserConfig& config);

} // namespace owl_blocks
