#include <svg_transform/transform_stack.hpp>
#include <svg_geometry/shapes.hpp>
#include <utility>

namespace svg_transform {

namespace {

using svg_markup::format_number;

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void validate(const TransformOp& op) {
    std::visit(overloaded{
        [](const Translate& t) {
            svg_geometry::require_finite("translate", "dx", t.dx);
            svg_geometry::require_finite("translate", "dy", t.dy);
        },
        [](const Scale& s) {
            svg_geometry::require_finite("scale", "sx", s.sx);
            svg_geometry::require_finite("scale", "sy", s.sy);
        },
        [](const Rotate& r) {
            svg_geometry::require_finite("rotate", "angle", r.angle_degrees);
            if (r.pivot) {
                svg_geometry::require_finite("rotate", "cx", r.pivot->x);
                svg_geometry::require_finite("rotate", "cy", r.pivot->y);
            }
        },
    }, op);
}

} // namespace

std::string to_string(const TransformOp& op) {
    return std::visit(overloaded{
        [](const Translate& t) {
            return "translate(" + format_number(t.dx) + "," + format_number(t.dy) + ")";
        },
        [](const Scale& s) {
            if (s.uniform()) return "scale(" + format_number(s.sx) + ")";
            return "scale(" + format_number(s.sx) + "," + format_number(s.sy) + ")";
        },
        [](const Rotate& r) {
            std::string out = "rotate(" + format_number(r.angle_degrees);
            if (r.pivot)
                out += "," + format_number(r.pivot->x) + "," + format_number(r.pivot->y);
            return out + ")";
        },
    }, op);
}

svg_geometry::Affine to_matrix(const TransformOp& op) {
    return std::visit(overloaded{
        [](const Translate& t) { return svg_geometry::Affine::translation(t.dx, t.dy); },
        [](const Scale& s) { return svg_geometry::Affine::scaling(s.sx, s.sy); },
        [](const Rotate& r) { return svg_geometry::Affine::rotation(r.angle_degrees, r.pivot); },
    }, op);
}

TransformStack& TransformStack::translate(double dx, double dy) {
    return push(Translate{ dx, dy });
}

TransformStack& TransformStack::scale(double factor) {
    return push(Scale{ factor, factor });
}

TransformStack& TransformStack::scale(double sx, double sy) {
    return push(Scale{ sx, sy });
}

TransformStack& TransformStack::rotate(double angle_degrees,
    const std::optional<svg_geometry::Point>& pivot)
{
    return push(Rotate{ angle_degrees, pivot });
}

TransformStack& TransformStack::push(const TransformOp& op) {
    validate(op);
    ops_.push_back(op);
    return *this;
}

std::optional<std::string> TransformStack::serialize() const {
    if (ops_.empty()) return std::nullopt;
    std::string out;
    for (const auto& op : ops_) {
        if (!out.empty()) out += ' ';
        out += to_string(op);
    }
    return out;
}

svg_markup::AttributeList TransformStack::to_attributes() const {
    svg_markup::AttributeList attrs;
    if (auto value = serialize()) attrs.set("transform", std::move(*value));
    return attrs;
}

svg_geometry::Affine TransformStack::matrix() const {
    svg_geometry::Affine m;
    for (const auto& op : ops_)
        m = m * to_matrix(op);
    return m;
}

svg_geometry::Point TransformStack::apply(const svg_geometry::Point& p) const {
    return matrix().apply(p);
}

} // namespace svg_transform
