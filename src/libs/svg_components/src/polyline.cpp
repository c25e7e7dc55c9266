#include <svg_components/polyline.hpp>
#include <svg_geometry/measure.hpp>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace svg_components {

Polyline::Polyline(svg_geometry::PolylineGeometry geometry,
    svg_style::AppearanceConfig appearance,
    svg_transform::TransformStack transform)
    : Component(std::move(appearance), std::move(transform))
    , geometry_(std::move(geometry))
{
    svg_geometry::validate(geometry_);
}

Polyline& Polyline::add_point(double x, double y) {
    svg_geometry::require_finite("polyline", "x", x);
    svg_geometry::require_finite("polyline", "y", y);
    geometry_.points.push_back(svg_geometry::Point{ x, y });
    return *this;
}

Polyline& Polyline::add_points(const std::vector<svg_geometry::Point>& points) {
    // Validate all first so a bad entry leaves the list untouched.
    for (const auto& p : points) {
        svg_geometry::require_finite("polyline", "x", p.x);
        svg_geometry::require_finite("polyline", "y", p.y);
    }
    geometry_.points.insert(geometry_.points.end(), points.begin(), points.end());
    return *this;
}

Polyline& Polyline::remove_point(std::size_t index) {
    if (index >= geometry_.points.size()) {
        throw svg_geometry::GeometryError(fmt::format(
            "polyline: point index {} out of range (size {})", index, geometry_.points.size()));
    }
    if (geometry_.points.size() == 1)
        throw svg_geometry::GeometryError("polyline: cannot remove the last remaining point");
    geometry_.points.erase(geometry_.points.begin() + static_cast<std::ptrdiff_t>(index));
    return *this;
}

double Polyline::total_length() const {
    return svg_geometry::total_length(geometry_);
}

std::vector<double> Polyline::segment_lengths() const {
    return svg_geometry::segment_lengths(geometry_);
}

std::optional<svg_geometry::BoundingBox> Polyline::bounding_box() const {
    return svg_geometry::bounding_box(geometry_);
}

std::optional<svg_geometry::Point> Polyline::central_point() const {
    return svg_geometry::central_point(geometry_);
}

svg_markup::AttributeList Polyline::geometry_attributes() const {
    return svg_geometry::to_attributes(geometry_);
}

} // namespace svg_components
