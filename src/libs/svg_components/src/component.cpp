#include <svg_components/component.hpp>
#include <svg_geometry/affine.hpp>
#include <svg_geometry/defaults.hpp>
#include <svg_logging/logging.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <utility>

namespace svg_components {

namespace {

bool exceeds(double extent, double limit) {
    return extent > limit * (1.0 + svg_geometry::defaults::fit_tolerance);
}

void log_append(const char* element, const svg_transform::TransformStack& stack) {
    svg_logging::logger()->debug("transform_appended element={} op={}",
        element, svg_transform::to_string(stack.ops().back()));
}

} // namespace

const char* to_string(FitResult result) {
    switch (result) {
    case FitResult::AlreadyFits: return "already_fits";
    case FitResult::Scaled: return "scaled";
    case FitResult::Degenerate: return "degenerate";
    case FitResult::Indeterminate: return "indeterminate";
    }
    return "unknown";
}

Component::Component(std::optional<svg_style::AppearanceConfig> appearance,
    svg_transform::TransformStack transform)
    : appearance_(std::move(appearance))
    , transform_(std::move(transform))
{
    if (appearance_) svg_style::validate(*appearance_);
}

Component& Component::translate(double dx, double dy) {
    transform_.translate(dx, dy);
    log_append(tag_name(), transform_);
    return *this;
}

Component& Component::scale(double factor) {
    transform_.scale(factor);
    log_append(tag_name(), transform_);
    return *this;
}

Component& Component::scale(double sx, double sy) {
    transform_.scale(sx, sy);
    log_append(tag_name(), transform_);
    return *this;
}

Component& Component::rotate(double angle_degrees, const std::optional<svg_geometry::Point>& pivot) {
    transform_.rotate(angle_degrees, pivot);
    log_append(tag_name(), transform_);
    return *this;
}

FitResult Component::restrict_size(double max_width, double max_height) {
    if (!std::isfinite(max_width) || !std::isfinite(max_height) || max_width <= 0 || max_height <= 0) {
        throw svg_geometry::GeometryError(fmt::format(
            "restrict_size: limits must be positive finite numbers, got {} x {}", max_width, max_height));
    }

    auto logger = svg_logging::logger();
    const auto local = bounding_box();
    if (!local) {
        logger->warn("fit_indeterminate element={} max=({}, {})", tag_name(), max_width, max_height);
        return FitResult::Indeterminate;
    }
    if (local->width() == 0.0 && local->height() == 0.0) {
        logger->debug("fit_degenerate element={}", tag_name());
        return FitResult::Degenerate;
    }

    const svg_geometry::BoundingBox extent = transform_.empty()
        ? *local
        : svg_geometry::transform_box(transform_.matrix(), *local);
    const double width = extent.width();
    const double height = extent.height();

    const double width_scale = exceeds(width, max_width) ? max_width / width : 1.0;
    const double height_scale = exceeds(height, max_height) ? max_height / height : 1.0;
    const double factor = std::min(width_scale, height_scale);
    if (factor >= 1.0) return FitResult::AlreadyFits;

    transform_.scale(factor);
    logger->debug("fit_scaled element={} extent=({}, {}) max=({}, {}) factor={}",
        tag_name(), width, height, max_width, max_height, factor);
    return FitResult::Scaled;
}

std::string Component::to_element() const {
    svg_markup::AttributeList attrs = geometry_attributes();
    if (appearance_) attrs.merge(svg_style::to_attributes(*appearance_));
    attrs.merge(transform_.to_attributes());
    return svg_markup::make_element(tag_name(), attrs, inner_content());
}

} // namespace svg_components
