#pragma once

#include <string>

namespace test_fixtures {

// Wraps mxCell elements in the draw.io document skeleton, below the root cell
// "0" and the default layer "1".
inline std::string drawio_document(const std::string& cells) {
    return "<mxfile host=\"app.diagrams.net\">"
           "<diagram id=\"d\" name=\"Page-1\">"
           "<mxGraphModel dx=\"800\" dy=\"600\" grid=\"1\">"
           "<root>"
           "<mxCell id=\"0\"/>"
           "<mxCell id=\"1\" parent=\"0\"/>"
        + cells
        + "</root></mxGraphModel></diagram></mxfile>";
}

// A group shape labelled with an individual, holding a "rico:" cell.
inline std::string individual(const std::string& group_id, const std::string& label,
    const std::string& ric_label, double x, double y, const std::string& parent = "1")
{
    return "<mxCell id=\"" + group_id + "\" value=\"" + label + "\" style=\"rounded=0;\" vertex=\"1\" parent=\""
        + parent + "\">"
           "<mxGeometry x=\"" + std::to_string(x) + "\" y=\"" + std::to_string(y)
        + "\" width=\"120\" height=\"60\" as=\"geometry\"/></mxCell>"
           "<mxCell id=\"" + group_id + "-type\" value=\"" + ric_label + "\" style=\"text;\" vertex=\"1\" parent=\""
        + group_id + "\">"
           "<mxGeometry x=\"10\" y=\"30\" width=\"100\" height=\"20\" as=\"geometry\"/></mxCell>";
}

// An edge locked to its source and target.
inline std::string linked_edge(const std::string& id, const std::string& label, const std::string& source,
    const std::string& target)
{
    return "<mxCell id=\"" + id + "\" value=\"" + label + "\" style=\"edgeStyle=orthogonalEdgeStyle;\" edge=\"1\" "
           "parent=\"1\" source=\"" + source + "\" target=\"" + target + "\">"
           "<mxGeometry relative=\"1\" as=\"geometry\"/></mxCell>";
}

// An edge with free ends at the given points.
inline std::string free_edge(const std::string& id, const std::string& label, double sx, double sy,
    double tx, double ty, const std::string& parent = "1")
{
    return "<mxCell id=\"" + id + "\" value=\"" + label + "\" style=\"edgeStyle=none;\" edge=\"1\" parent=\""
        + parent + "\">"
           "<mxGeometry relative=\"1\" as=\"geometry\">"
           "<mxPoint x=\"" + std::to_string(sx) + "\" y=\"" + std::to_string(sy) + "\" as=\"sourcePoint\"/>"
           "<mxPoint x=\"" + std::to_string(tx) + "\" y=\"" + std::to_string(ty) + "\" as=\"targetPoint\"/>"
           "</mxGeometry></mxCell>";
}

// The label of an edge, held by a child cell as draw.io does it.
inline std::string edge_label(const std::string& id, const std::string& edge_id, const std::string& label) {
    return "<mxCell id=\"" + id + "\" value=\"" + label + "\" style=\"edgeLabel;html=1;align=center;\" "
           "vertex=\"1\" connectable=\"0\" parent=\"" + edge_id + "\">"
           "<mxGeometry x=\"-0.1\" relative=\"1\" as=\"geometry\"><mxPoint as=\"offset\"/></mxGeometry></mxCell>";
}

// A top-level text shape holding a literal.
inline std::string literal(const std::string& id, const std::string& text, double x, double y) {
    return "<mxCell id=\"" + id + "\" value=\"" + text + "\" style=\"text;html=1;\" vertex=\"1\" parent=\"1\">"
           "<mxGeometry x=\"" + std::to_string(x) + "\" y=\"" + std::to_string(y)
        + "\" width=\"80\" height=\"30\" as=\"geometry\"/></mxCell>";
}

} // namespace test_fixtures
