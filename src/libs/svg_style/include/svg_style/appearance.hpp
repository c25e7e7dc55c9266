#pragma once

#include <svg_markup/attributes.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace svg_style {

// Paint value as written to the document: a color name, #rrggbb, "none", ...
// The string is not interpreted here.
struct Color {
    std::string value;

    Color() = default;
    Color(std::string v) : value(std::move(v)) {}
    Color(const char* v) : value(v) {}
};

inline bool operator==(const Color& a, const Color& b) { return a.value == b.value; }
inline bool operator!=(const Color& a, const Color& b) { return !(a == b); }

// Presentation attributes. Unset fields are not emitted.
struct AppearanceConfig {
    std::optional<Color> fill;
    std::optional<double> fill_opacity;     // 0..1
    std::optional<Color> stroke;
    std::optional<double> stroke_width;     // >= 0
    std::vector<double> stroke_dasharray;   // dash/gap lengths, each >= 0

    bool empty() const;
};

// Throws svg_geometry::GeometryError on out-of-range or non-finite values
// and on empty color strings.
void validate(const AppearanceConfig& appearance);

// fill, fill-opacity, stroke, stroke-width, stroke-dasharray (in that order).
svg_markup::AttributeList to_attributes(const AppearanceConfig& appearance);

} // namespace svg_style
