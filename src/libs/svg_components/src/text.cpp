#include <svg_components/text.hpp>
#include <utility>

namespace svg_components {

Text::Text(svg_geometry::TextGeometry geometry, svg_transform::TransformStack transform)
    : Component(std::nullopt, std::move(transform))
    , geometry_(std::move(geometry))
{
    svg_geometry::validate(geometry_);
}

std::optional<svg_geometry::BoundingBox> Text::bounding_box() const {
    return svg_geometry::bounding_box(geometry_);
}

std::optional<svg_geometry::Point> Text::central_point() const {
    return svg_geometry::central_point(geometry_);
}

svg_markup::AttributeList Text::geometry_attributes() const {
    return svg_geometry::to_attributes(geometry_);
}

std::optional<std::string> Text::inner_content() const {
    return svg_markup::escape_text(geometry_.text);
}

} // namespace svg_components
