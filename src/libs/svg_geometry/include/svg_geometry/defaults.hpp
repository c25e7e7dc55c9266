#pragma once

// Default geometry for each component kind. Values in user units.

namespace svg_geometry {
namespace defaults {

constexpr double circle_cx = 50.0;
constexpr double circle_cy = 50.0;
constexpr double circle_r = 50.0;

constexpr double rect_x = 0.0;
constexpr double rect_y = 0.0;
constexpr double rect_width = 200.0;
constexpr double rect_height = 100.0;

constexpr double text_x = 0.0;
constexpr double text_y = 0.0;
constexpr double text_font_size = 12.0;
constexpr const char* text_font_family = "Arial";
constexpr const char* text_color = "black";

constexpr double image_x = 0.0;
constexpr double image_y = 0.0;
constexpr double image_width = 100.0;
constexpr double image_height = 100.0;
constexpr const char* image_preserve_aspect_ratio = "xMidYMid meet";

constexpr double nested_x = 0.0;
constexpr double nested_y = 0.0;
constexpr double nested_width = 100.0;
constexpr double nested_height = 100.0;

// Relative slack when comparing a measured extent against a size limit.
constexpr double fit_tolerance = 1e-9;

} // namespace defaults
} // namespace svg_geometry
