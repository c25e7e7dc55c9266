#pragma once

#include <svg_components/component.hpp>
#include <svg_geometry/shapes.hpp>

namespace svg_components {

class Rectangle : public Component {
public:
    explicit Rectangle(svg_geometry::RectangleGeometry geometry = {},
        svg_style::AppearanceConfig appearance = {},
        svg_transform::TransformStack transform = {});

    const svg_geometry::RectangleGeometry& geometry() const { return geometry_; }
    bool has_rounded_corners() const { return geometry_.rx.has_value() || geometry_.ry.has_value(); }

    const char* tag_name() const override { return "rect"; }
    std::optional<svg_geometry::BoundingBox> bounding_box() const override;
    std::optional<svg_geometry::Point> central_point() const override;

protected:
    svg_markup::AttributeList geometry_attributes() const override;

private:
    svg_geometry::RectangleGeometry geometry_;
};

} // namespace svg_components
