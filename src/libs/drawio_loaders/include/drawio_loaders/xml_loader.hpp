#pragma once

#include <drawio_model/types.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace drawio_loaders {

// The <mxCell> elements of one diagram, in document order, indexed by id.
class CellIndex {
public:
    CellIndex() = default;
    explicit CellIndex(std::vector<drawio_model::Cell> cells);

    const std::vector<drawio_model::Cell>& cells() const { return cells_; }
    std::size_t size() const { return cells_.size(); }

    const drawio_model::Cell* find(const std::string& id) const;
    // Throws StructuralError if there is no such cell.
    const drawio_model::Cell& at(const std::string& id) const;

    std::vector<const drawio_model::Cell*> children_of(const std::string& id) const;

    // The root cell and the layers below it. They have no geometry and
    // their children are positioned absolutely.
    bool is_layer(const drawio_model::Cell& cell) const;
    // A direct child of a layer, i.e. not nested in a group or container.
    bool is_top_level(const drawio_model::Cell& cell) const;

private:
    std::vector<drawio_model::Cell> cells_;
    std::unordered_map<std::string, std::size_t> by_id_;
};

// Parses the draw.io document and returns the cells below
// mxfile/diagram/mxGraphModel/root.
// Throws NothingToParseError if that element is missing or empty, and
// StructuralError on malformed XML or unexpected elements.
CellIndex load_cells_from_xml(std::string_view raw_xml);

} // namespace drawio_loaders
