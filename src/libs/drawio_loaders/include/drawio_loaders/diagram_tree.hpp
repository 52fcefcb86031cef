#pragma once

#include <drawio_loaders/xml_loader.hpp>
#include <drawio_model/ontology.hpp>
#include <drawio_model/types.hpp>
#include <drawio_model/vocabulary.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace drawio_loaders {

// Style token of the shapes whose label is a plain literal value.
constexpr std::string_view literal_style_marker = "text";
// Style fragment of the cells carrying the label of an edge.
constexpr std::string_view edge_label_style_marker = "edgeLabel";

// A cell labelled "rico:SomeClass" inside a shape whose label names the
// individual. bounds is the shape geometry, relative to the shape's container.
struct IndividualCell {
    const drawio_model::Cell* cell = nullptr;
    const drawio_model::Cell* shape = nullptr;
    drawio_model::Individual individual;
    drawio_model::Rect bounds;
};

// An edge whose label names a property. Points are relative to the edge's
// container and are missing when the end is locked to a node.
struct ArrowCell {
    const drawio_model::Cell* cell = nullptr;
    std::optional<drawio_model::Point> start;
    std::optional<drawio_model::Point> end;
    std::string label;
};

// A top-level text shape holding a literal value.
struct LiteralCell {
    const drawio_model::Cell* cell = nullptr;
    std::string text;
    drawio_model::Rect bounds;
};

// Classifies the cells of a draw.io document into individuals, arrows and
// literals. The document is parsed and classified once, on construction.
class DiagramTree {
public:
    DiagramTree(std::string_view raw_xml, const drawio_model::Vocabulary& vocabulary);

    DiagramTree(const DiagramTree&) = delete;
    DiagramTree& operator=(const DiagramTree&) = delete;
    DiagramTree(DiagramTree&&) = default;
    DiagramTree& operator=(DiagramTree&&) = default;

    const CellIndex& cells() const { return cells_; }
    const std::vector<IndividualCell>& individual_cells() const { return individual_cells_; }
    const std::vector<ArrowCell>& arrow_cells() const { return arrow_cells_; }
    const std::vector<LiteralCell>& literal_cells() const { return literal_cells_; }

    std::vector<drawio_model::Individual> individuals() const;
    bool is_individual(const std::string& identifier) const;

    // Extracted label text; nullopt if the cell has no value attribute.
    std::optional<std::string> label_of(const drawio_model::Cell& cell) const;
    // Label of the parent shape of a "rico:" cell, i.e. the individual it
    // declares a type for. Throws StructuralError if there is none.
    std::string individual_label_of(const drawio_model::Cell& cell) const;

private:
    void classify(const drawio_model::Cell& cell, const drawio_model::Vocabulary& vocabulary);
    void add_arrow(const drawio_model::Cell& cell, std::string label);
    std::optional<std::string> edge_label(const drawio_model::Cell& edge) const;
    bool is_literal_shape(const drawio_model::Cell& cell) const;
    const drawio_model::Cell& parent_of(const drawio_model::Cell& cell) const;

    CellIndex cells_;
    std::vector<IndividualCell> individual_cells_;
    std::vector<ArrowCell> arrow_cells_;
    std::vector<LiteralCell> literal_cells_;
    std::unordered_set<std::string> individual_identifiers_;
};

// Bounding box of a vertex. Throws StructuralError if its geometry or size is
// missing.
drawio_model::Rect bounds_of(const drawio_model::Cell& cell);

// "rico:Person rico:Agent" -> {"Person", "Agent"}. Empty terms are kept:
// "rico:" -> {""}.
std::vector<std::string> split_prefixed_names(std::string_view label);

bool starts_with_prefix(std::string_view label);

} // namespace drawio_loaders
