#pragma once

#include <svg_components/component.hpp>
#include <svg_geometry/shapes.hpp>
#include <cstddef>
#include <vector>

namespace svg_components {

// Open chain of straight segments. The point list is never empty: the
// constructor rejects an empty list and remove_point refuses the last point.
class Polyline : public Component {
public:
    explicit Polyline(svg_geometry::PolylineGeometry geometry,
        svg_style::AppearanceConfig appearance = {},
        svg_transform::TransformStack transform = {});

    const svg_geometry::PolylineGeometry& geometry() const { return geometry_; }
    const std::vector<svg_geometry::Point>& points() const { return geometry_.points; }
    std::size_t point_count() const { return geometry_.points.size(); }

    // Same as the Component versions, returning Polyline& so point edits chain after them.
    Polyline& translate(double dx, double dy) { Component::translate(dx, dy); return *this; }
    Polyline& move(double dx, double dy) { return translate(dx, dy); }
    Polyline& scale(double factor) { Component::scale(factor); return *this; }
    Polyline& scale(double sx, double sy) { Component::scale(sx, sy); return *this; }
    Polyline& rotate(double angle_degrees,
        const std::optional<svg_geometry::Point>& pivot = std::nullopt)
    {
        Component::rotate(angle_degrees, pivot);
        return *this;
    }

    Polyline& add_point(double x, double y);
    Polyline& add_points(const std::vector<svg_geometry::Point>& points);
    // Throws svg_geometry::GeometryError for an out-of-range index or when
    // only one point is left.
    Polyline& remove_point(std::size_t index);

    double total_length() const;
    std::vector<double> segment_lengths() const;

    const char* tag_name() const override { return "polyline"; }
    std::optional<svg_geometry::BoundingBox> bounding_box() const override;
    // Mean of the points; an approximation, not the enclosed polygon's centroid.
    std::optional<svg_geometry::Point> central_point() const override;

protected:
    svg_markup::AttributeList geometry_attributes() const override;

private:
    svg_geometry::PolylineGeometry geometry_;
};

} // namespace svg_components
