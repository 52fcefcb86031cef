#include <drawio_loaders/diagram_tree.hpp>
#include <drawio_loaders/label_text.hpp>
#include <drawio_logging/logger.hpp>
#include <drawio_model/errors.hpp>
#include <utility>

namespace drawio_loaders {

namespace {

using drawio_model::Cell;
using drawio_model::StructuralError;

bool has_style_token(const std::string& style, std::string_view token) {
    std::size_t pos = 0;
    while (pos <= style.size()) {
        std::size_t end = style.find(';', pos);
        if (end == std::string::npos) end = style.size();
        if (std::string_view(style).substr(pos, end - pos) == token) return true;
        pos = end + 1;
    }
    return false;
}

} // namespace

bool starts_with_prefix(std::string_view label) {
    return label.substr(0, drawio_model::namespace_prefix.size()) == drawio_model::namespace_prefix;
}

std::vector<std::string> split_prefixed_names(std::string_view label) {
    std::vector<std::string> names;
    const std::string_view prefix = drawio_model::namespace_prefix;
    std::size_t pos = label.find(prefix);
    while (pos != std::string_view::npos) {
        const std::size_t begin = pos + prefix.size();
        const std::size_t next = label.find(prefix, begin);
        names.push_back(trim(label.substr(begin, next == std::string_view::npos ? next : next - begin)));
        pos = next;
    }
    return names;
}

drawio_model::Rect bounds_of(const Cell& cell) {
    if (!cell.geometry) {
        throw StructuralError("Expecting the cell with the following id to have an mxGeometry "
            "sub-element: " + cell.id);
    }
    const auto& g = *cell.geometry;
    if (!g.width) {
        throw StructuralError("Expecting the mxGeometry element of the cell with the following id "
            "to have a 'width' attribute, but it does not: " + cell.id);
    }
    if (!g.height) {
        throw StructuralError("Expecting the mxGeometry element of the cell with the following id "
            "to have a 'height' attribute, but it does not: " + cell.id);
    }
    return drawio_model::Rect{ g.x, g.y, *g.width, *g.height };
}

DiagramTree::DiagramTree(std::string_view raw_xml, const drawio_model::Vocabulary& vocabulary)
    : cells_(load_cells_from_xml(raw_xml))
{
    for (const auto& cell : cells_.cells())
        classify(cell, vocabulary);

    drawio_logging::logger()->info(
        "Classified {} cells: {} individual cells, {} arrow cells, {} literal cells",
        cells_.size(), individual_cells_.size(), arrow_cells_.size(), literal_cells_.size());
}

std::optional<std::string> DiagramTree::label_of(const Cell& cell) const {
    if (!cell.value) return std::nullopt;
    return extract_label_text(trim(*cell.value));
}

const Cell& DiagramTree::parent_of(const Cell& cell) const {
    if (!cell.has_parent()) {
        throw StructuralError("Could not parse XML tree: found an 'mxCell' element with the "
            "following id which has value beginning with 'rico:' but with no parent: " + cell.id);
    }
    return cells_.at(cell.parent_id);
}

std::string DiagramTree::individual_label_of(const Cell& cell) const {
    const Cell& parent = parent_of(cell);
    auto label = label_of(parent);
    if (!label) {
        throw StructuralError("Expecting the parent of the cell with the following id to have a "
            "label naming an individual, but it has no 'value' attribute: " + cell.id);
    }
    return std::move(*label);
}

std::optional<std::string> DiagramTree::edge_label(const Cell& edge) const {
    for (const Cell* child : cells_.children_of(edge.id)) {
        if (child->style.find(edge_label_style_marker) != std::string::npos)
            return label_of(*child);
    }
    return std::nullopt;
}

bool DiagramTree::is_literal_shape(const Cell& cell) const {
    return has_style_token(cell.style, literal_style_marker) && cells_.is_top_level(cell);
}

void DiagramTree::add_arrow(const Cell& cell, std::string label) {
    ArrowCell arrow;
    arrow.cell = &cell;
    if (cell.geometry) {
        arrow.start = cell.geometry->source_point;
        arrow.end = cell.geometry->target_point;
    }
    arrow.label = std::move(label);
    drawio_logging::logger()->debug("Cell {} is an arrow labelled '{}'", cell.id, arrow.label);
    arrow_cells_.push_back(std::move(arrow));
}

void DiagramTree::classify(const Cell& cell, const drawio_model::Vocabulary& vocabulary) {
    const auto label = label_of(cell);
    if (!label) return;

    if (label->empty()) {
        if (auto carried = edge_label(cell)) {
            add_arrow(cell, std::move(*carried));
        } else {
            drawio_logging::logger()->debug("Dropping cell {}: empty label and no edge label", cell.id);
        }
        return;
    }

    if (!starts_with_prefix(*label)) {
        if (is_literal_shape(cell)) {
            drawio_logging::logger()->debug("Cell {} is a literal '{}'", cell.id, *label);
            literal_cells_.push_back(LiteralCell{ &cell, *label, bounds_of(cell) });
        }
        return;
    }

    const Cell& parent = parent_of(cell);
    const auto identifier = label_of(parent);
    if (!identifier) {
        // An edge labelled directly with its property, not through an edge
        // label cell.
        add_arrow(cell, *label);
        return;
    }
    if (identifier->empty()) return;

    const drawio_model::Rect bounds = bounds_of(parent);
    for (auto& ric_class : split_prefixed_names(*label)) {
        if (!vocabulary.is_class(ric_class)) {
            throw drawio_model::VocabularyError("Not a RiC-O class: rico:" + ric_class
                + " (declared for the node '" + *identifier + "', cell id " + cell.id + ")");
        }
        drawio_logging::logger()->debug("Cell {} declares '{}' of class {}", cell.id, *identifier, ric_class);
        individual_cells_.push_back(IndividualCell{ &cell, &parent,
            drawio_model::Individual{ *identifier, std::move(ric_class) }, bounds });
    }
    individual_identifiers_.insert(*identifier);
}

std::vector<drawio_model::Individual> DiagramTree::individuals() const {
    std::vector<drawio_model::Individual> out;
    out.reserve(individual_cells_.size());
    for (const auto& c : individual_cells_)
        out.push_back(c.individual);
    return out;
}

bool DiagramTree::is_individual(const std::string& identifier) const {
    return individual_identifiers_.count(identifier) > 0;
}

} // namespace drawio_loaders
