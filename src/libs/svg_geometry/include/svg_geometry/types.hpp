#pragma once

#include <stdexcept>
#include <string>

namespace svg_geometry {

struct Point {
    double x = 0;
    double y = 0;
};

inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

// Axis-aligned box in a component's local (pre-transform) space.
struct BoundingBox {
    double min_x = 0;
    double min_y = 0;
    double max_x = 0;
    double max_y = 0;

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    Point center() const { return Point{ (min_x + max_x) * 0.5, (min_y + max_y) * 0.5 }; }
};

inline bool operator==(const BoundingBox& a, const BoundingBox& b) {
    return a.min_x == b.min_x && a.min_y == b.min_y && a.max_x == b.max_x && a.max_y == b.max_y;
}
inline bool operator!=(const BoundingBox& a, const BoundingBox& b) { return !(a == b); }

// Invalid input: negative sizes, empty point lists, non-finite numbers.
// Raised where the value is supplied, never at serialization time.
class GeometryError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace svg_geometry
