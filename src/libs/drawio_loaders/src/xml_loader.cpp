#include <drawio_loaders/xml_loader.hpp>
#include <drawio_logging/logger.hpp>
#include <drawio_model/errors.hpp>
#include <tinyxml2.h>
#include <cstring>
#include <optional>
#include <utility>

namespace drawio_loaders {

namespace {

using drawio_model::StructuralError;

std::string attribute(const tinyxml2::XMLElement* e, const char* name) {
    const char* v = e->Attribute(name);
    return v ? std::string(v) : std::string();
}

std::optional<double> number_attribute(const tinyxml2::XMLElement* e, const char* name,
    const std::string& cell_id)
{
    double value = 0;
    const tinyxml2::XMLError result = e->QueryDoubleAttribute(name, &value);
    if (result == tinyxml2::XML_NO_ATTRIBUTE) return std::nullopt;
    if (result != tinyxml2::XML_SUCCESS) {
        throw StructuralError("Expecting the '" + std::string(name) + "' attribute of the "
            + e->Name() + " element of the cell with the following id to be a number, but it is '"
            + attribute(e, name) + "': " + cell_id);
    }
    return value;
}

drawio_model::Point read_point(const tinyxml2::XMLElement* e, const std::string& cell_id) {
    drawio_model::Point p;
    p.x = number_attribute(e, "x", cell_id).value_or(0.0);
    p.y = number_attribute(e, "y", cell_id).value_or(0.0);
    return p;
}

drawio_model::Geometry read_geometry(const tinyxml2::XMLElement* e, const std::string& cell_id) {
    drawio_model::Geometry g;
    g.x = number_attribute(e, "x", cell_id).value_or(0.0);
    g.y = number_attribute(e, "y", cell_id).value_or(0.0);
    g.width = number_attribute(e, "width", cell_id);
    g.height = number_attribute(e, "height", cell_id);

    for (const auto* child = e->FirstChildElement("mxPoint"); child;
         child = child->NextSiblingElement("mxPoint")) {
        const char* as = child->Attribute("as");
        if (!as) {
            throw StructuralError("Expecting every mxPoint element of the geometry of the cell "
                "with the following id to have an 'as' attribute, but one does not: " + cell_id);
        }
        if (std::strcmp(as, "sourcePoint") == 0) g.source_point = read_point(child, cell_id);
        else if (std::strcmp(as, "targetPoint") == 0) g.target_point = read_point(child, cell_id);
    }
    return g;
}

drawio_model::Cell read_cell(const tinyxml2::XMLElement* e, std::size_t index) {
    if (std::strcmp(e->Name(), "mxCell") != 0) {
        throw StructuralError("Could not parse XML tree: expecting an element with tag 'mxCell', "
            "but had tag '" + std::string(e->Name()) + "'");
    }
    drawio_model::Cell cell;
    const char* id = e->Attribute("id");
    if (!id) {
        throw StructuralError("Could not parse XML tree: found an 'mxCell' element with no 'id' "
            "attribute at position " + std::to_string(index));
    }
    cell.id = id;
    if (const char* value = e->Attribute("value")) cell.value = std::string(value);
    cell.parent_id = attribute(e, "parent");
    cell.style = attribute(e, "style");
    cell.source_id = attribute(e, "source");
    cell.target_id = attribute(e, "target");
    cell.document_index = index;
    if (const auto* geometry = e->FirstChildElement("mxGeometry"))
        cell.geometry = read_geometry(geometry, cell.id);
    return cell;
}

} // namespace

CellIndex::CellIndex(std::vector<drawio_model::Cell> cells)
    : cells_(std::move(cells))
{
    for (std::size_t i = 0; i < cells_.size(); ++i) {
        if (!by_id_.emplace(cells_[i].id, i).second) {
            throw StructuralError("Could not parse XML tree: more than one 'mxCell' element has "
                "the id '" + cells_[i].id + "'");
        }
    }
}

const drawio_model::Cell* CellIndex::find(const std::string& id) const {
    const auto it = by_id_.find(id);
    return it == by_id_.end() ? nullptr : &cells_[it->second];
}

const drawio_model::Cell& CellIndex::at(const std::string& id) const {
    const drawio_model::Cell* cell = find(id);
    if (!cell) throw StructuralError("No cell with id: " + id);
    return *cell;
}

std::vector<const drawio_model::Cell*> CellIndex::children_of(const std::string& id) const {
    std::vector<const drawio_model::Cell*> out;
    for (const auto& c : cells_)
        if (c.parent_id == id) out.push_back(&c);
    return out;
}

bool CellIndex::is_layer(const drawio_model::Cell& cell) const {
    if (!cell.has_parent()) return true;
    const drawio_model::Cell* parent = find(cell.parent_id);
    return parent && !parent->has_parent();
}

bool CellIndex::is_top_level(const drawio_model::Cell& cell) const {
    if (!cell.has_parent()) return true;
    const drawio_model::Cell* parent = find(cell.parent_id);
    return parent && is_layer(*parent);
}

CellIndex load_cells_from_xml(std::string_view raw_xml) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(raw_xml.data(), raw_xml.size()) != tinyxml2::XML_SUCCESS)
        throw StructuralError(std::string("Could not parse XML: ") + doc.ErrorStr());

    // mxfile -> diagram -> mxGraphModel -> root
    const tinyxml2::XMLElement* graph_root = doc.RootElement();
    for (int depth = 0; depth < 3 && graph_root; ++depth) {
        const tinyxml2::XMLElement* next = graph_root->FirstChildElement();
        if (!next && graph_root->GetText()) {
            drawio_logging::logger()->warn(
                "The <{}> element holds text instead of a graph model; compressed diagrams "
                "are not supported", graph_root->Name());
        }
        graph_root = next;
    }
    if (!graph_root || !graph_root->FirstChildElement()) throw drawio_model::NothingToParseError();

    std::vector<drawio_model::Cell> cells;
    for (const auto* e = graph_root->FirstChildElement(); e; e = e->NextSiblingElement())
        cells.push_back(read_cell(e, cells.size()));

    drawio_logging::logger()->debug("Loaded {} cells", cells.size());
    return CellIndex(std::move(cells));
}

} // namespace drawio_loaders
