#include <drawio_placement/endpoint_resolver.hpp>
#include <drawio_placement/geometry.hpp>
#include <drawio_loaders/label_text.hpp>
#include <drawio_logging/logger.hpp>
#include <drawio_model/errors.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <string_view>
#include <utility>

namespace drawio_placement {

namespace {

using drawio_model::Cell;
using drawio_model::ResolutionError;

const char* endpoint_name(Endpoint which) {
    return which == Endpoint::Source ? "source" : "target";
}

} // namespace

std::string property_name(const std::string& label, const std::string& cell_id) {
    const std::string trimmed = drawio_loaders::trim(label);
    std::string name;
    if (drawio_loaders::starts_with_prefix(trimmed))
        name = drawio_loaders::trim(std::string_view(trimmed).substr(drawio_model::namespace_prefix.size()));
    // One name, no second "rico:" term and no surrounding words.
    if (name.empty() || name.find_first_of(" \t\r\n:") != std::string::npos) {
        throw drawio_model::VocabularyError("An arrow has label '" + label + "' (cell id " + cell_id
            + "), which does not name a single RiC-O object property or datatype property");
    }
    return name;
}

EndpointResolver::EndpointResolver(const drawio_loaders::DiagramTree& tree, ResolveOptions options)
    : tree_(tree), options_(options)
{
    if (options_.strict_mode) return;

    const auto& cells = tree_.cells();
    for (const auto& c : tree_.individual_cells())
        candidates_.push_back({ c.cell, to_absolute(cells, *c.shape, c.bounds), c.cell->document_index });
    for (const auto& c : tree_.literal_cells())
        candidates_.push_back({ c.cell, to_absolute(cells, *c.cell, c.bounds), c.cell->document_index });
    std::stable_sort(candidates_.begin(), candidates_.end(),
        [](const Candidate& a, const Candidate& b) { return a.document_index < b.document_index; });
}

const Cell* EndpointResolver::cell_close_to(const drawio_model::Point& absolute) const {
    for (const auto& c : candidates_) {
        if (c.bounds.contains(absolute, options_.max_gap)) return c.cell;
    }
    return nullptr;
}

std::string EndpointResolver::failure_message(const drawio_loaders::ArrowCell& arrow, Endpoint which,
    const std::string& reason) const
{
    std::string message = "The mxCell element with label '" + arrow.label + "' (id " + arrow.cell->id
        + ") seems to be an arrow, but has no " + endpoint_name(which) + " (" + reason + ")";
    if (options_.strict_mode) {
        message += ". If so, try to lock the arrow to an individual node in the original graph; or "
            "the underlying XML could be edited to indicate the ";
        message += endpoint_name(which);
        message += ". Alternatively, try running in non-strict mode (without the '-s/--strict-mode' "
            "flag), optionally making use of the '-g/--max-gap' option";
    } else {
        message += ". If so, consider using the '-g/--max-gap' option to increase the max "
            "recognised gap between a node and an arrow end; or try to lock the arrow to an "
            "individual node in the original graph; or the underlying XML could be edited to "
            "indicate the ";
        message += endpoint_name(which);
    }
    return message;
}

const Cell& EndpointResolver::endpoint_cell(const drawio_loaders::ArrowCell& arrow, Endpoint which) const {
    const Cell& edge = *arrow.cell;
    if (which == Endpoint::Source && edge.has_source()) return tree_.cells().at(edge.source_id);
    if (which == Endpoint::Target && edge.has_target()) return tree_.cells().at(edge.target_id);

    if (options_.strict_mode)
        throw ResolutionError(failure_message(arrow, which, "it is not locked to a node"));

    const auto& point = which == Endpoint::Source ? arrow.start : arrow.end;
    if (!point) {
        throw ResolutionError(failure_message(arrow, which,
            "it is not locked to a node and its geometry has no end point"));
    }
    const drawio_model::Point absolute = to_absolute(tree_.cells(), *arrow.cell, *point);
    const Cell* found = cell_close_to(absolute);
    if (!found) {
        throw ResolutionError(failure_message(arrow, which,
            fmt::format("no node lies within {} pixels of its end", options_.max_gap)));
    }
    drawio_logging::logger()->debug("Arrow {}: {} at ({}, {}) resolved to cell {} by proximity",
        arrow.cell->id, endpoint_name(which), absolute.x, absolute.y, found->id);
    return *found;
}

std::string EndpointResolver::endpoint_value(const Cell& cell, const drawio_loaders::ArrowCell& arrow,
    Endpoint which) const
{
    const auto label = tree_.label_of(cell);
    if (!label) {
        throw ResolutionError("The " + std::string(endpoint_name(which)) + " of the arrow with label '"
            + arrow.label + "' (id " + arrow.cell->id + ") is the cell " + cell.id
            + ", which has no label");
    }
    if (drawio_loaders::starts_with_prefix(*label)) return tree_.individual_label_of(cell);
    return *label;
}

drawio_model::Arrow EndpointResolver::resolve(const drawio_loaders::ArrowCell& arrow) const {
    std::string source = endpoint_value(endpoint_cell(arrow, Endpoint::Source), arrow, Endpoint::Source);
    if (!tree_.is_individual(source)) {
        throw ResolutionError("The source '" + source + "' of the arrow with label '" + arrow.label
            + "' (id " + arrow.cell->id + ") is not an individual: an arrow must start at a node "
            "declaring a rico: class");
    }
    std::string target = endpoint_value(endpoint_cell(arrow, Endpoint::Target), arrow, Endpoint::Target);
    return drawio_model::Arrow{ property_name(arrow.label, arrow.cell->id), std::move(source), std::move(target) };
}

std::vector<drawio_model::Arrow> EndpointResolver::resolve_all() const {
    std::vector<drawio_model::Arrow> arrows;
    arrows.reserve(tree_.arrow_cells().size());
    for (const auto& arrow : tree_.arrow_cells())
        arrows.push_back(resolve(arrow));
    return arrows;
}

} // namespace drawio_placement
