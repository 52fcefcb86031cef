#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace drawio_model {

struct Point {
    double x = 0;
    double y = 0;
};

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double left() const { return x; }
    double right() const { return x + width; }
    double top() const { return y; }
    double bottom() const { return y + height; }

    // True if p lies inside the rect grown by max_gap on every side.
    bool contains(const Point& p, double max_gap = 0) const {
        return left() - max_gap <= p.x && p.x <= right() + max_gap
            && top() - max_gap <= p.y && p.y <= bottom() + max_gap;
    }
};

// <mxGeometry>. draw.io leaves out x and y when they are zero.
struct Geometry {
    double x = 0;
    double y = 0;
    std::optional<double> width;
    std::optional<double> height;
    std::optional<Point> source_point;
    std::optional<Point> target_point;
};

// One <mxCell>, as read from the document. Never modified after loading.
struct Cell {
    std::string id;
    std::optional<std::string> value;
    std::string parent_id;
    std::string style;
    std::string source_id;
    std::string target_id;
    std::optional<Geometry> geometry;
    std::size_t document_index = 0;

    bool has_parent() const { return !parent_id.empty(); }
    bool has_source() const { return !source_id.empty(); }
    bool has_target() const { return !target_id.empty(); }
};

} // namespace drawio_model
