#pragma once

#include <svg_geometry/shapes.hpp>
#include <vector>

namespace svg_geometry {

double area(const CircleGeometry& g);
double circumference(const CircleGeometry& g);

// Zero / empty for fewer than two points.
double total_length(const PolylineGeometry& g);
std::vector<double> segment_lengths(const PolylineGeometry& g);

} // namespace svg_geometry
