#pragma once

#include <owl_blocks/block_assembler.hpp>
#include <drawio_model/vocabulary.hpp>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace owl_serialise {

constexpr const char* ric_namespace_iri = "https://www.ica.org/standards/RiC/ontology#";
constexpr const char* ric_ontology_iri =
    "https://raw.githubusercontent.com/ICA-EGAD/RiC-O/master/ontology/current-version/RiC-O_1-0.rdf";
constexpr int default_indentation = 2;

struct SerialisationConfig {
    bool infer_type_of_literals = true;
    bool include_preamble = true;
    // Defaults to default_ontology_iri() at the time of serialisation.
    std::optional<std::string> ontology_iri;
    // Prefix of the generated identifiers, without the colon.
    std::optional<std::string> prefix;
    // Defaults to the ontology IRI followed by '#'.
    std::optional<std::string> prefix_iri;
    int indentation = default_indentation;
    bool include_label = true;
};

// "ontology://generated-from-draw-io/2024-05-01T09-30-00", in local time.
std::string default_ontology_iri(std::time_t now);

// Prefix and ontology declarations, without a trailing newline.
std::string preamble(const SerialisationConfig& config);

// One "Individual:" statement, without a trailing newline.
std::string serialise_block(const owl_blocks::Block& block, const SerialisationConfig& config,
    const drawio_model::Vocabulary& vocabulary);

// The preamble (if enabled) and the blocks in the given order, separated by
// blank lines. The result has no trailing newline.
std::string serialise(const std::vector<owl_blocks::Block>& blocks, const SerialisationConfig& config,
    const drawio_model::Vocabulary& vocabulary);

} // namespace owl_serialise
