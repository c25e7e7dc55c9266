#include <svg_components/nested_document.hpp>
#include <utility>

namespace svg_components {

NestedDocument::NestedDocument(svg_geometry::NestedDocumentGeometry geometry,
    svg_transform::TransformStack transform)
    : Component(std::nullopt, std::move(transform))
    , geometry_(std::move(geometry))
{
    svg_geometry::validate(geometry_);
}

std::optional<svg_geometry::BoundingBox> NestedDocument::bounding_box() const {
    return svg_geometry::bounding_box(geometry_);
}

std::optional<svg_geometry::Point> NestedDocument::central_point() const {
    return svg_geometry::central_point(geometry_);
}

svg_markup::AttributeList NestedDocument::geometry_attributes() const {
    return svg_geometry::to_attributes(geometry_);
}

} // namespace svg_components
