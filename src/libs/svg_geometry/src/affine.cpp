#include <svg_geometry/affine.hpp>
#include <algorithm>
#include <cmath>

namespace svg_geometry {

namespace {

constexpr double pi = 3.14159265358979323846;

} // namespace

Affine Affine::translation(double dx, double dy) {
    return Affine{ 1, 0, 0, 1, dx, dy };
}

Affine Affine::scaling(double sx, double sy) {
    return Affine{ sx, 0, 0, sy, 0, 0 };
}

Affine Affine::rotation(double angle_degrees, const std::optional<Point>& pivot) {
    const double rad = angle_degrees * pi / 180.0;
    const double cs = std::cos(rad);
    const double sn = std::sin(rad);
    const Affine rot{ cs, sn, -sn, cs, 0, 0 };
    if (!pivot) return rot;
    // rotate(a, cx, cy) == translate(cx, cy) rotate(a) translate(-cx, -cy)
    return translation(pivot->x, pivot->y) * rot * translation(-pivot->x, -pivot->y);
}

bool Affine::is_identity() const {
    return a == 1 && b == 0 && c == 0 && d == 1 && e == 0 && f == 0;
}

Point Affine::apply(const Point& p) const {
    return Point{ a * p.x + c * p.y + e, b * p.x + d * p.y + f };
}

Affine operator*(const Affine& lhs, const Affine& rhs) {
    Affine out;
    out.a = lhs.a * rhs.a + lhs.c * rhs.b;
    out.b = lhs.b * rhs.a + lhs.d * rhs.b;
    out.c = lhs.a * rhs.c + lhs.c * rhs.d;
    out.d = lhs.b * rhs.c + lhs.d * rhs.d;
    out.e = lhs.a * rhs.e + lhs.c * rhs.f + lhs.e;
    out.f = lhs.b * rhs.e + lhs.d * rhs.f + lhs.f;
    return out;
}

BoundingBox transform_box(const Affine& m, const BoundingBox& box) {
    const Point corners[4] = {
        m.apply(Point{ box.min_x, box.min_y }),
        m.apply(Point{ box.max_x, box.min_y }),
        m.apply(Point{ box.max_x, box.max_y }),
        m.apply(Point{ box.min_x, box.max_y }),
    };
    BoundingBox out{ corners[0].x, corners[0].y, corners[0].x, corners[0].y };
    for (const auto& p : corners) {
        out.min_x = std::min(out.min_x, p.x);
        out.min_y = std::min(out.min_y, p.y);
        out.max_x = std::max(out.max_x, p.x);
        out.max_y = std::max(out.max_y, p.y);
    }
    return out;
}

} // namespace svg_geometry
