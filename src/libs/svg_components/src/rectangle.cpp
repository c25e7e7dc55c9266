#include <svg_components/rectangle.hpp>
#include <utility>

namespace svg_components {

Rectangle::Rectangle(svg_geometry::RectangleGeometry geometry,
    svg_style::AppearanceConfig appearance,
    svg_transform::TransformStack transform)
    : Component(std::move(appearance), std::move(transform))
    , geometry_(geometry)
{
    svg_geometry::validate(geometry_);
}

std::optional<svg_geometry::BoundingBox> Rectangle::bounding_box() const {
    return svg_geometry::bounding_box(geometry_);
}

std::optional<svg_geometry::Point> Rectangle::central_point() const {
    return svg_geometry::central_point(geometry_);
}

svg_markup::AttributeList Rectangle::geometry_attributes() const {
    return svg_geometry::to_attributes(geometry_);
}

} // namespace svg_components
