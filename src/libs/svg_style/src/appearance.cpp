#include <svg_style/appearance.hpp>
#include <svg_geometry/shapes.hpp>
#include <svg_geometry/types.hpp>
#include <spdlog/fmt/fmt.h>

namespace svg_style {

namespace {

const char* const kind = "appearance";

void require_color(const char* field, const std::optional<Color>& color) {
    if (color && color->value.empty())
        throw svg_geometry::GeometryError(fmt::format("{}: {} must not be empty", kind, field));
}

} // namespace

bool AppearanceConfig::empty() const {
    return !fill && !fill_opacity && !stroke && !stroke_width && stroke_dasharray.empty();
}

void validate(const AppearanceConfig& appearance) {
    require_color("fill", appearance.fill);
    require_color("stroke", appearance.stroke);
    if (appearance.fill_opacity) {
        const double opacity = *appearance.fill_opacity;
        svg_geometry::require_finite(kind, "fill_opacity", opacity);
        if (opacity < 0.0 || opacity > 1.0) {
            throw svg_geometry::GeometryError(
                fmt::format("{}: fill_opacity must be within [0, 1], got {}", kind, opacity));
        }
    }
    if (appearance.stroke_width) {
        svg_geometry::require_finite(kind, "stroke_width", *appearance.stroke_width);
        svg_geometry::require_non_negative(kind, "stroke_width", *appearance.stroke_width);
    }
    for (double dash : appearance.stroke_dasharray) {
        svg_geometry::require_finite(kind, "stroke_dasharray", dash);
        svg_geometry::require_non_negative(kind, "stroke_dasharray", dash);
    }
}

svg_markup::AttributeList to_attributes(const AppearanceConfig& appearance) {
    svg_markup::AttributeList attrs;
    if (appearance.fill) attrs.set("fill", appearance.fill->value);
    if (appearance.fill_opacity) attrs.set_number("fill-opacity", *appearance.fill_opacity);
    if (appearance.stroke) attrs.set("stroke", appearance.stroke->value);
    if (appearance.stroke_width) attrs.set_number("stroke-width", *appearance.stroke_width);
    if (!appearance.stroke_dasharray.empty())
        attrs.set("stroke-dasharray", svg_markup::join_numbers(appearance.stroke_dasharray, ","));
    return attrs;
}

} // namespace svg_style
