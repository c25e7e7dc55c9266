#include <svg_geometry/shapes.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace svg_geometry {

namespace {

void require_size(const char* kind, const char* field, double value) {
    require_finite(kind, field, value);
    require_non_negative(kind, field, value);
}

BoundingBox box_from_origin(double x, double y, double width, double height) {
    return BoundingBox{ x, y, x + width, y + height };
}

Point center_of(double x, double y, double width, double height) {
    return Point{ x + width / 2, y + height / 2 };
}

} // namespace

const char* to_string(TextAnchor anchor) {
    switch (anchor) {
    case TextAnchor::Start: return "start";
    case TextAnchor::Middle: return "middle";
    case TextAnchor::End: return "end";
    }
    return "middle";
}

const char* to_string(DominantBaseline baseline) {
    switch (baseline) {
    case DominantBaseline::Auto: return "auto";
    case DominantBaseline::Middle: return "middle";
    case DominantBaseline::Hanging: return "hanging";
    case DominantBaseline::Central: return "central";
    }
    return "central";
}

std::optional<TextAnchor> text_anchor_from_string(const std::string& s) {
    if (s == "start") return TextAnchor::Start;
    if (s == "middle") return TextAnchor::Middle;
    if (s == "end") return TextAnchor::End;
    return std::nullopt;
}

std::optional<DominantBaseline> dominant_baseline_from_string(const std::string& s) {
    if (s == "auto") return DominantBaseline::Auto;
    if (s == "middle") return DominantBaseline::Middle;
    if (s == "hanging") return DominantBaseline::Hanging;
    if (s == "central") return DominantBaseline::Central;
    return std::nullopt;
}

void require_finite(const char* kind, const char* field, double value) {
    if (!std::isfinite(value))
        throw GeometryError(fmt::format("{}: {} must be a finite number, got {}", kind, field, value));
}

void require_non_negative(const char* kind, const char* field, double value) {
    if (value < 0)
        throw GeometryError(fmt::format("{}: {} must be non-negative, got {}", kind, field, value));
}

void validate(const CircleGeometry& g) {
    require_finite("circle", "cx", g.cx);
    require_finite("circle", "cy", g.cy);
    require_size("circle", "r", g.r);
}

void validate(const RectangleGeometry& g) {
    require_finite("rectangle", "x", g.x);
    require_finite("rectangle", "y", g.y);
    require_size("rectangle", "width", g.width);
    require_size("rectangle", "height", g.height);
    if (g.rx) require_size("rectangle", "rx", *g.rx);
    if (g.ry) require_size("rectangle", "ry", *g.ry);
}

void validate(const PolylineGeometry& g) {
    if (g.points.empty())
        throw GeometryError("polyline: must have at least one point");
    for (std::size_t i = 0; i < g.points.size(); ++i) {
        const Point& p = g.points[i];
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            throw GeometryError(fmt::format(
                "polyline: point {} coordinates must be finite numbers, got ({}, {})", i, p.x, p.y));
        }
    }
}

void validate(const TextGeometry& g) {
    require_finite("text", "x", g.x);
    require_finite("text", "y", g.y);
    require_size("text", "font_size", g.font_size);
    if (g.color.empty())
        throw GeometryError("text: color must not be empty");
}

void validate(const ImageGeometry& g) {
    require_finite("image", "x", g.x);
    require_finite("image", "y", g.y);
    require_size("image", "width", g.width);
    require_size("image", "height", g.height);
    if (g.href.empty())
        throw GeometryError("image: href is required");
}

void validate(const NestedDocumentGeometry& g) {
    require_finite("svg", "x", g.x);
    require_finite("svg", "y", g.y);
    require_size("svg", "width", g.width);
    require_size("svg", "height", g.height);
}

BoundingBox bounding_box(const CircleGeometry& g) {
    return BoundingBox{ g.cx - g.r, g.cy - g.r, g.cx + g.r, g.cy + g.r };
}

BoundingBox bounding_box(const RectangleGeometry& g) {
    return box_from_origin(g.x, g.y, g.width, g.height);
}

BoundingBox bounding_box(const PolylineGeometry& g) {
    if (g.points.empty())
        throw GeometryError("polyline: bounding box of an empty point list");
    BoundingBox box{ g.points[0].x, g.points[0].y, g.points[0].x, g.points[0].y };
    for (const auto& p : g.points) {
        box.min_x = std::min(box.min_x, p.x);
        box.min_y = std::min(box.min_y, p.y);
        box.max_x = std::max(box.max_x, p.x);
        box.max_y = std::max(box.max_y, p.y);
    }
    return box;
}

std::optional<BoundingBox> bounding_box(const TextGeometry&) {
    return std::nullopt;
}

BoundingBox bounding_box(const ImageGeometry& g) {
    return box_from_origin(g.x, g.y, g.width, g.height);
}

BoundingBox bounding_box(const NestedDocumentGeometry& g) {
    return box_from_origin(g.x, g.y, g.width, g.height);
}

Point central_point(const CircleGeometry& g) {
    return Point{ g.cx, g.cy };
}

Point central_point(const RectangleGeometry& g) {
    return center_of(g.x, g.y, g.width, g.height);
}

Point central_point(const PolylineGeometry& g) {
    if (g.points.empty())
        throw GeometryError("polyline: central point of an empty point list");
    double total_x = 0;
    double total_y = 0;
    for (const auto& p : g.points) {
        total_x += p.x;
        total_y += p.y;
    }
    const double count = static_cast<double>(g.points.size());
    return Point{ total_x / count, total_y / count };
}

std::optional<Point> central_point(const TextGeometry& g) {
    if (g.text_anchor == TextAnchor::Middle && g.dominant_baseline == DominantBaseline::Central)
        return Point{ g.x, g.y };
    return std::nullopt;
}

Point central_point(const ImageGeometry& g) {
    return center_of(g.x, g.y, g.width, g.height);
}

Point central_point(const NestedDocumentGeometry& g) {
    return center_of(g.x, g.y, g.width, g.height);
}

svg_markup::AttributeList to_attributes(const CircleGeometry& g) {
    svg_markup::AttributeList attrs;
    attrs.set_number("cx", g.cx);
    attrs.set_number("cy", g.cy);
    attrs.set_number("r", g.r);
    return attrs;
}

svg_markup::AttributeList to_attributes(const RectangleGeometry& g) {
    svg_markup::AttributeList attrs;
    attrs.set_number("x", g.x);
    attrs.set_number("y", g.y);
    attrs.set_number("width", g.width);
    attrs.set_number("height", g.height);
    if (g.rx) attrs.set_number("rx", *g.rx);
    if (g.ry) attrs.set_number("ry", *g.ry);
    return attrs;
}

svg_markup::AttributeList to_attributes(const PolylineGeometry& g) {
    svg_markup::AttributeList attrs;
    attrs.set("points", format_points(g.points));
    return attrs;
}

svg_markup::AttributeList to_attributes(const TextGeometry& g) {
    svg_markup::AttributeList attrs;
    attrs.set_number("x", g.x);
    attrs.set_number("y", g.y);
    attrs.set_number("font-size", g.font_size);
    attrs.set("font-family", g.font_family);
    attrs.set("fill", g.color);
    attrs.set("text-anchor", to_string(g.text_anchor));
    attrs.set("dominant-baseline", to_string(g.dominant_baseline));
    return attrs;
}

svg_markup::AttributeList to_attributes(const ImageGeometry& g) {
    svg_markup::AttributeList attrs;
    attrs.set_number("x", g.x);
    attrs.set_number("y", g.y);
    attrs.set_number("width", g.width);
    attrs.set_number("height", g.height);
    attrs.set("href", g.href);
    attrs.set("preserveAspectRatio", g.preserve_aspect_ratio);
    return attrs;
}

svg_markup::AttributeList to_attributes(const NestedDocumentGeometry& g) {
    svg_markup::AttributeList attrs;
    attrs.set_number("x", g.x);
    attrs.set_number("y", g.y);
    attrs.set_number("width", g.width);
    attrs.set_number("height", g.height);
    attrs.set("viewBox", "0 0 " + svg_markup::format_number(g.width) + " "
        + svg_markup::format_number(g.height));
    return attrs;
}

std::string format_points(const std::vector<Point>& points) {
    std::string out;
    for (const auto& p : points) {
        if (!out.empty()) out += ' ';
        out += svg_markup::format_number(p.x);
        out += ',';
        out += svg_markup::format_number(p.y);
    }
    return out;
}

} // namespace svg_geometry
