#include <drawio_placement/geometry.hpp>
#include <drawio_model/errors.hpp>
#include <string>
#include <unordered_set>

namespace drawio_placement {

namespace {

using drawio_model::Cell;
using drawio_model::Point;

// Absolute position of the top-left corner of container, which is where the
// coordinates of its children are measured from.
Point origin_of_children(const drawio_loaders::CellIndex& cells, const Cell& container,
    int depth, std::unordered_set<std::string>& visited)
{
    if (cells.is_layer(container)) return Point{};
    if (depth > max_nesting_depth || !visited.insert(container.id).second) {
        throw drawio_model::StructuralError("Could not resolve the position of the cell with the "
            "following id: its chain of parents is cyclic or too deep: " + container.id);
    }
    if (!container.geometry) {
        throw drawio_model::StructuralError("Expecting the cell with the following id to have an "
            "mxGeometry sub-element, as it contains other cells: " + container.id);
    }
    const Point parent = origin_of_children(cells, cells.at(container.parent_id), depth + 1, visited);
    return Point{ parent.x + container.geometry->x, parent.y + container.geometry->y };
}

} // namespace

Point container_origin(const drawio_loaders::CellIndex& cells, const Cell& cell) {
    if (!cell.has_parent()) return Point{};
    std::unordered_set<std::string> visited{ cell.id };
    return origin_of_children(cells, cells.at(cell.parent_id), 0, visited);
}

Point to_absolute(const drawio_loaders::CellIndex& cells, const Cell& owner, const Point& p) {
    const Point origin = container_origin(cells, owner);
    return Point{ origin.x + p.x, origin.y + p.y };
}

drawio_model::Rect to_absolute(const drawio_loaders::CellIndex& cells, const Cell& owner,
    const drawio_model::Rect& r)
{
    const Point origin = container_origin(cells, owner);
    return drawio_model::Rect{ origin.x + r.x, origin.y + r.y, r.width, r.height };
}

} // namespace drawio_placement
