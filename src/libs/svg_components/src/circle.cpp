#include <svg_components/circle.hpp>
#include <svg_geometry/measure.hpp>
#include <utility>

namespace svg_components {

Circle::Circle(svg_geometry::CircleGeometry geometry,
    svg_style::AppearanceConfig appearance,
    svg_transform::TransformStack transform)
    : Component(std::move(appearance), std::move(transform))
    , geometry_(geometry)
{
    svg_geometry::validate(geometry_);
}

std::optional<svg_geometry::BoundingBox> Circle::bounding_box() const {
    return svg_geometry::bounding_box(geometry_);
}

std::optional<svg_geometry::Point> Circle::central_point() const {
    return svg_geometry::central_point(geometry_);
}

double Circle::area() const {
    return svg_geometry::area(geometry_);
}

double Circle::circumference() const {
    return svg_geometry::circumference(geometry_);
}

svg_markup::AttributeList Circle::geometry_attributes() const {
    return svg_geometry::to_attributes(geometry_);
}

} // namespace svg_components
