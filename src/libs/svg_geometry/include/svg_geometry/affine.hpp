#pragma once

#include <svg_geometry/types.hpp>
#include <optional>

namespace svg_geometry {

// 2D affine map in SVG matrix(a b c d e f) layout:
//   x' = a*x + c*y + e
//   y' = b*x + d*y + f
struct Affine {
    double a = 1;
    double b = 0;
    double c = 0;
    double d = 1;
    double e = 0;
    double f = 0;

    static Affine identity() { return Affine{}; }
    static Affine translation(double dx, double dy);
    static Affine scaling(double sx, double sy);
    // Counter-clockwise in a y-up frame, i.e. clockwise on screen, about `pivot` (origin if unset).
    static Affine rotation(double angle_degrees, const std::optional<Point>& pivot = std::nullopt);

    bool is_identity() const;
    Point apply(const Point& p) const;
};

// (lhs * rhs).apply(p) == lhs.apply(rhs.apply(p))
Affine operator*(const Affine& lhs, const Affine& rhs);

// Axis-aligned box enclosing the four mapped corners of `box`.
BoundingBox transform_box(const Affine& m, const BoundingBox& box);

} // namespace svg_geometry
