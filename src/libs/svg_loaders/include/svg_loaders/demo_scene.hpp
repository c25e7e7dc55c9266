#pragma once

#include <svg_canvas/canvas.hpp>

namespace svg_loaders {

// 600x400 showcase with every component kind and transform.
svg_canvas::Canvas generate_demo_scene();

} // namespace svg_loaders
