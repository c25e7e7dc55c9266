#pragma once

#include <svg_canvas/canvas.hpp>
#include <istream>
#include <optional>
#include <string>

namespace svg_loaders {

// Scene JSON:
// {
//   "width": 600, "height": 400, "view_box": [0, 0, 600, 400],   (view_box optional)
//   "components": [
//     { "type": "circle" | "rectangle" | "polyline" | "text" | "image" | "svg",
//       ...geometry fields (missing ones take defaults)...,
//       "appearance": { "fill", "fill_opacity", "stroke", "stroke_width", "stroke_dasharray" },
//       "transform": [ { "op": "translate" | "scale" | "rotate", "args": [...] } ],
//       "restrict_size": [max_width, max_height] }
//   ]
// }
// A malformed document or any invalid entry rejects the whole scene; the
// reason is logged.
std::optional<svg_canvas::Canvas> load_scene_from_json(std::istream& in);
std::optional<svg_canvas::Canvas> load_scene_from_json_file(const std::string& path);

} // namespace svg_loaders
