#pragma once

#include <svg_geometry/affine.hpp>
#include <svg_geometry/types.hpp>
#include <svg_markup/attributes.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace svg_transform {

struct Translate {
    double dx = 0;
    double dy = 0;
};

struct Scale {
    double sx = 1;
    double sy = 1;
    bool uniform() const { return sx == sy; }
};

struct Rotate {
    double angle_degrees = 0;
    std::optional<svg_geometry::Point> pivot;
};

using TransformOp = std::variant<Translate, Scale, Rotate>;

// translate(dx,dy) / scale(s) / scale(sx,sy) / rotate(a) / rotate(a,cx,cy)
std::string to_string(const TransformOp& op);
svg_geometry::Affine to_matrix(const TransformOp& op);

// Ordered transform list of one component.
//
// The list [op1, op2, ..., opn] is written "op1 op2 ... opn" and denotes
// M = M(op1) * M(op2) * ... * M(opn). A local point p maps to M * p, so the
// last appended operation acts on the point first and op1 acts last; each new
// operation works inside the coordinate system set up by the earlier ones.
// Operations are never reordered or dropped.
class TransformStack {
public:
    TransformStack() = default;

    // Throw svg_geometry::GeometryError on non-finite arguments.
    TransformStack& translate(double dx, double dy);
    TransformStack& scale(double factor);
    TransformStack& scale(double sx, double sy);
    TransformStack& rotate(double angle_degrees,
        const std::optional<svg_geometry::Point>& pivot = std::nullopt);
    TransformStack& push(const TransformOp& op);

    bool empty() const { return ops_.empty(); }
    std::size_t size() const { return ops_.size(); }
    const std::vector<TransformOp>& ops() const { return ops_; }

    // std::nullopt for an empty stack: no transform attribute is written at all.
    std::optional<std::string> serialize() const;
    svg_markup::AttributeList to_attributes() const;

    svg_geometry::Affine matrix() const;
    svg_geometry::Point apply(const svg_geometry::Point& p) const;

private:
    std::vector<TransformOp> ops_;
};

} // namespace svg_transform
