#pragma once

#include <svg_geometry/defaults.hpp>
#include <svg_geometry/types.hpp>
#include <svg_markup/attributes.hpp>
#include <optional>
#include <string>
#include <vector>

namespace svg_geometry {

struct CircleGeometry {
    double cx = defaults::circle_cx;
    double cy = defaults::circle_cy;
    double r = defaults::circle_r;
};

struct RectangleGeometry {
    double x = defaults::rect_x;
    double y = defaults::rect_y;
    double width = defaults::rect_width;
    double height = defaults::rect_height;
    std::optional<double> rx;   // corner radii, emitted only when set
    std::optional<double> ry;
};

struct PolylineGeometry {
    std::vector<Point> points;
};

enum class TextAnchor { Start, Middle, End };
enum class DominantBaseline { Auto, Middle, Hanging, Central };

struct TextGeometry {
    double x = defaults::text_x;
    double y = defaults::text_y;
    std::string text;
    double font_size = defaults::text_font_size;
    std::string font_family = defaults::text_font_family;
    std::string color = defaults::text_color;
    TextAnchor text_anchor = TextAnchor::Middle;
    DominantBaseline dominant_baseline = DominantBaseline::Central;
};

struct ImageGeometry {
    double x = defaults::image_x;
    double y = defaults::image_y;
    double width = defaults::image_width;
    double height = defaults::image_height;
    std::string href;
    std::string preserve_aspect_ratio = defaults::image_preserve_aspect_ratio;
};

struct NestedDocumentGeometry {
    double x = defaults::nested_x;
    double y = defaults::nested_y;
    double width = defaults::nested_width;
    double height = defaults::nested_height;
    std::string content;    // raw markup, written unescaped
};

const char* to_string(TextAnchor anchor);
const char* to_string(DominantBaseline baseline);
std::optional<TextAnchor> text_anchor_from_string(const std::string& s);
std::optional<DominantBaseline> dominant_baseline_from_string(const std::string& s);

// Throw GeometryError naming the offending field.
void require_finite(const char* kind, const char* field, double value);
void require_non_negative(const char* kind, const char* field, double value);

void validate(const CircleGeometry& g);
void validate(const RectangleGeometry& g);
void validate(const PolylineGeometry& g);
void validate(const TextGeometry& g);
void validate(const ImageGeometry& g);
void validate(const NestedDocumentGeometry& g);

// Local-space bounding boxes. Text has no computable extent (font metrics are
// unknown here), so its box is always std::nullopt.
BoundingBox bounding_box(const CircleGeometry& g);
BoundingBox bounding_box(const RectangleGeometry& g);
BoundingBox bounding_box(const PolylineGeometry& g);
std::optional<BoundingBox> bounding_box(const TextGeometry& g);
BoundingBox bounding_box(const ImageGeometry& g);
BoundingBox bounding_box(const NestedDocumentGeometry& g);

Point central_point(const CircleGeometry& g);
Point central_point(const RectangleGeometry& g);
// Arithmetic mean of the points, not the area centroid of the polygon they enclose.
Point central_point(const PolylineGeometry& g);
// Defined only for middle anchor with central baseline.
std::optional<Point> central_point(const TextGeometry& g);
Point central_point(const ImageGeometry& g);
Point central_point(const NestedDocumentGeometry& g);

// Geometry attributes in emission order. None of these names overlap the
// appearance (fill*, stroke*) or transform attributes, except text's own
// `fill`, and text carries no appearance config.
svg_markup::AttributeList to_attributes(const CircleGeometry& g);
svg_markup::AttributeList to_attributes(const RectangleGeometry& g);
svg_markup::AttributeList to_attributes(const PolylineGeometry& g);
svg_markup::AttributeList to_attributes(const TextGeometry& g);
svg_markup::AttributeList to_attributes(const ImageGeometry& g);
svg_markup::AttributeList to_attributes(const NestedDocumentGeometry& g);

// "x1,y1 x2,y2 ..."
std::string format_points(const std::vector<Point>& points);

} // namespace svg_geometry
