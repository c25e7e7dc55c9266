#include <svg_geometry/measure.hpp>
#include <cmath>

namespace svg_geometry {

namespace {

constexpr double pi = 3.14159265358979323846;

} // namespace

double area(const CircleGeometry& g) {
    return pi * g.r * g.r;
}

double circumference(const CircleGeometry& g) {
    return 2.0 * pi * g.r;
}

double total_length(const PolylineGeometry& g) {
    double total = 0.0;
    for (double len : segment_lengths(g))
        total += len;
    return total;
}

std::vector<double> segment_lengths(const PolylineGeometry& g) {
    std::vector<double> lengths;
    if (g.points.size() < 2) return lengths;
    lengths.reserve(g.points.size() - 1);
    for (std::size_t i = 0; i + 1 < g.points.size(); ++i) {
        const double dx = g.points[i + 1].x - g.points[i].x;
        const double dy = g.points[i + 1].y - g.points[i].y;
        lengths.push_back(std::hypot(dx, dy));
    }
    return lengths;
}

} // namespace svg_geometry
