#pragma once

#include <drawio_loaders/xml_loader.hpp>
#include <drawio_model/types.hpp>

namespace drawio_placement {

// Groups nested deeper than this are treated as a cycle in the parent chain.
constexpr int max_nesting_depth = 64;

// Absolute position of the origin that the geometry of cell is expressed
// against: (0, 0) for a cell directly in a layer, otherwise the absolute
// position of its parent group. Throws StructuralError on a parent cycle or a
// group without geometry.
drawio_model::Point container_origin(const drawio_loaders::CellIndex& cells, const drawio_model::Cell& cell);

drawio_model::Point to_absolute(const drawio_loaders::CellIndex& cells, const drawio_model::Cell& owner,
    const drawio_model::Point& p);
drawio_model::Rect to_absolute(const drawio_loaders::CellIndex& cells, const drawio_model::Cell& owner,
    const drawio_model::Rect& r);

} // namespace drawio_placement
