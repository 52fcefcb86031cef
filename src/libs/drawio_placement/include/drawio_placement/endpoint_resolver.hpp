#pragma once

#include <drawio_loaders/diagram_tree.hpp>
#include <drawio_model/ontology.hpp>
#include <drawio_model/types.hpp>
#include <string>
#include <vector>

namespace drawio_placement {

constexpr double default_max_gap = 10.0;

struct ResolveOptions {
    // Only accept sources and targets the edge is locked to.
    bool strict_mode = false;
    // Tolerance, in pixels, around a shape within which an unlocked arrow end
    // is taken to touch it.
    double max_gap = default_max_gap;
};

enum class Endpoint { Source, Target };

// Determines the source and target of the arrows of a DiagramTree.
class EndpointResolver {
public:
    EndpointResolver(const drawio_loaders::DiagramTree& tree, ResolveOptions options);

    // Throws ResolutionError if an end cannot be determined or the source is
    // not an individual, VocabularyError if the label has no "rico:" term.
    drawio_model::Arrow resolve(const drawio_loaders::ArrowCell& arrow) const;
    std::vector<drawio_model::Arrow> resolve_all() const;

    // First individual or literal cell, in document order, whose bounds grown
    // by max_gap contain the absolute point; nullptr if none.
    const drawio_model::Cell* cell_close_to(const drawio_model::Point& absolute) const;

private:
    struct Candidate {
        const drawio_model::Cell* cell;
        drawio_model::Rect bounds; // absolute
        std::size_t document_index;
    };

    const drawio_model::Cell& endpoint_cell(const drawio_loaders::ArrowCell& arrow, Endpoint which) const;
    std::string endpoint_value(const drawio_model::Cell& cell, const drawio_loaders::ArrowCell& arrow,
        Endpoint which) const;
    std::string failure_message(const drawio_loaders::ArrowCell& arrow, Endpoint which,
        const std::string& reason) const;

    const drawio_loaders::DiagramTree& tree_;
    ResolveOptions options_;
    std::vector<Candidate> candidates_;
};

// Name of the property of an arrow label: "rico:hasBirthPlace" -> "hasBirthPlace".
// Throws VocabularyError unless the label is "rico:" followed by exactly one name.
std::string property_name(const std::string& label, const std::string& cell_id);

} // namespace drawio_placement
