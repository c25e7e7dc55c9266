#pragma once

#include <svg_components/component.hpp>
#include <svg_geometry/shapes.hpp>

namespace svg_components {

class Circle : public Component {
public:
    explicit Circle(svg_geometry::CircleGeometry geometry = {},
        svg_style::AppearanceConfig appearance = {},
        svg_transform::TransformStack transform = {});

    const svg_geometry::CircleGeometry& geometry() const { return geometry_; }

    const char* tag_name() const override { return "circle"; }
    std::optional<svg_geometry::BoundingBox> bounding_box() const override;
    std::optional<svg_geometry::Point> central_point() const override;

    double area() const;
    double circumference() const;

protected:
    svg_markup::AttributeList geometry_attributes() const override;

private:
    svg_geometry::CircleGeometry geometry_;
};

} // namespace svg_components
