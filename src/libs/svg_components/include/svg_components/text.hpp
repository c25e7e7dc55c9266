#pragma once

#include <svg_components/component.hpp>
#include <svg_geometry/shapes.hpp>

namespace svg_components {

// Text label. Its color is part of the geometry (emitted as fill); there is no
// appearance config. Rendered size depends on font metrics, so the bounding
// box is always indeterminate and restrict_size reports Indeterminate.
class Text : public Component {
public:
    explicit Text(svg_geometry::TextGeometry geometry,
        svg_transform::TransformStack transform = {});

    const svg_geometry::TextGeometry& geometry() const { return geometry_; }

    const char* tag_name() const override { return "text"; }
    std::optional<svg_geometry::BoundingBox> bounding_box() const override;
    std::optional<svg_geometry::Point> central_point() const override;

protected:
    svg_markup::AttributeList geometry_attributes() const override;
    std::optional<std::string> inner_content() const override;

private:
    svg_geometry::TextGeometry geometry_;
};

} // namespace svg_components
