#pragma once

#include <svg_components/component.hpp>
#include <svg_geometry/shapes.hpp>

namespace svg_components {

class Image : public Component {
public:
    explicit Image(svg_geometry::ImageGeometry geometry,
        svg_transform::TransformStack transform = {});

    const svg_geometry::ImageGeometry& geometry() const { return geometry_; }

    const char* tag_name() const override { return "image"; }
    std::optional<svg_geometry::BoundingBox> bounding_box() const override;
    std::optional<svg_geometry::Point> central_point() const override;

protected:
    svg_markup::AttributeList geometry_attributes() const override;

private:
    svg_geometry::ImageGeometry geometry_;
};

} // namespace svg_components
