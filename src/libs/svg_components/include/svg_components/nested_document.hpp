#pragma once

#include <svg_components/component.hpp>
#include <svg_geometry/shapes.hpp>

namespace svg_components {

// Inner <svg> element wrapping raw markup, e.g. the body of another canvas.
class NestedDocument : public Component {
public:
    explicit NestedDocument(svg_geometry::NestedDocumentGeometry geometry,
        svg_transform::TransformStack transform = {});

    const svg_geometry::NestedDocumentGeometry& geometry() const { return geometry_; }

    const char* tag_name() const override { return "svg"; }
    std::optional<svg_geometry::BoundingBox> bounding_box() const override;
    std::optional<svg_geometry::Point> central_point() const override;

protected:
    svg_markup::AttributeList geometry_attributes() const override;
    std::optional<std::string> inner_content() const override { return geometry_.content; }

private:
    svg_geometry::NestedDocumentGeometry geometry_;
};

} // namespace svg_components
