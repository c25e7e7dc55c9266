#pragma once

#include <svg_geometry/types.hpp>
#include <svg_markup/attributes.hpp>
#include <svg_style/appearance.hpp>
#include <svg_transform/transform_stack.hpp>
#include <optional>
#include <string>

namespace svg_components {

// Outcome of Component::restrict_size.
enum class FitResult {
    AlreadyFits,    // extent within limits, stack unchanged
    Scaled,         // uniform scale appended
    Degenerate,     // zero local width and height, stack unchanged
    Indeterminate   // extent unknown (free text), stack unchanged
};

const char* to_string(FitResult result);

// One drawable unit: shape-specific geometry, optional appearance and an
// exclusively owned transform stack.
//
// Subclasses supply the geometry-dependent parts (tag, geometry attributes,
// local bounding box and central point, optional inner content); everything
// else, including scale-to-fit and element assembly, lives here.
//
// bounding_box() and central_point() describe local, untransformed geometry.
// std::nullopt means the answer cannot be known from the configuration alone.
class Component {
public:
    virtual ~Component() = default;

    // Append to the transform stack and return *this for chaining.
    Component& translate(double dx, double dy);
    Component& move(double dx, double dy) { return translate(dx, dy); }
    Component& scale(double factor);
    Component& scale(double sx, double sy);
    Component& rotate(double angle_degrees,
        const std::optional<svg_geometry::Point>& pivot = std::nullopt);

    bool has_transform() const { return !transform_.empty(); }
    const svg_transform::TransformStack& transform() const { return transform_; }
    const std::optional<svg_style::AppearanceConfig>& appearance() const { return appearance_; }

    virtual const char* tag_name() const = 0;
    virtual std::optional<svg_geometry::BoundingBox> bounding_box() const = 0;
    virtual std::optional<svg_geometry::Point> central_point() const = 0;

    // Shrinks the component, keeping its proportions, so that its extent fits
    // max_width x max_height. The extent is the local bounding box mapped
    // through the current transform stack; a fitting scale is appended last,
    // so a second call with the same limits is a no-op. Never enlarges.
    // Throws svg_geometry::GeometryError unless both limits are positive and finite.
    [[nodiscard]] FitResult restrict_size(double max_width, double max_height);

    // Geometry attributes, then appearance, then transform. Read-only and repeatable.
    std::string to_element() const;

protected:
    Component(std::optional<svg_style::AppearanceConfig> appearance,
        svg_transform::TransformStack transform);

    Component(const Component&) = default;
    Component& operator=(const Component&) = default;
    Component(Component&&) = default;
    Component& operator=(Component&&) = default;

    virtual svg_markup::AttributeList geometry_attributes() const = 0;
    virtual std::optional<std::string> inner_content() const { return std::nullopt; }

private:
    std::optional<svg_style::AppearanceConfig> appearance_;
    svg_transform::TransformStack transform_;
};

} // namespace svg_components
