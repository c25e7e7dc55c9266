#include <svg_canvas/canvas.hpp>
#include <svg_geometry/shapes.hpp>
#include <svg_logging/logging.hpp>
#include <svg_markup/attributes.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace svg_canvas {

namespace {

const char* const svg_namespace = "http://www.w3.org/2000/svg";
const char* const child_indent = "  ";

std::string format_view_box(const ViewBox& vb) {
    return svg_markup::join_numbers({ vb.min_x, vb.min_y, vb.width, vb.height }, " ");
}

} // namespace

Canvas::Canvas(double width, double height)
    : width_(width)
    , height_(height)
{
    svg_geometry::require_finite("canvas", "width", width);
    svg_geometry::require_finite("canvas", "height", height);
    if (width <= 0 || height <= 0)
        throw svg_geometry::GeometryError("canvas: width and height must be positive");
    view_box_ = ViewBox{ 0, 0, width, height };
}

void Canvas::set_view_box(const ViewBox& view_box) {
    svg_geometry::require_finite("canvas", "view_box.min_x", view_box.min_x);
    svg_geometry::require_finite("canvas", "view_box.min_y", view_box.min_y);
    svg_geometry::require_finite("canvas", "view_box.width", view_box.width);
    svg_geometry::require_finite("canvas", "view_box.height", view_box.height);
    svg_geometry::require_non_negative("canvas", "view_box.width", view_box.width);
    svg_geometry::require_non_negative("canvas", "view_box.height", view_box.height);
    view_box_ = view_box;
}

svg_components::Component& Canvas::add(std::unique_ptr<svg_components::Component> component) {
    if (!component)
        throw std::invalid_argument("canvas: cannot add a null component");
    components_.push_back(std::move(component));
    return *components_.back();
}

std::string Canvas::render_body() const {
    std::string out;
    for (const auto& component : components_) {
        out += component->to_element();
        out += '\n';
    }
    return out;
}

std::string Canvas::render() const {
    svg_markup::AttributeList attrs;
    attrs.set("xmlns", svg_namespace);
    attrs.set_number("width", width_);
    attrs.set_number("height", height_);
    attrs.set("viewBox", format_view_box(view_box_));

    std::string out = "<svg " + attrs.to_string() + ">\n";
    for (const auto& component : components_) {
        out += child_indent;
        out += component->to_element();
        out += '\n';
    }
    out += "</svg>\n";
    return out;
}

svg_components::NestedDocument Canvas::to_nested_document(double x, double y) const {
    svg_geometry::NestedDocumentGeometry geometry;
    geometry.x = x;
    geometry.y = y;
    geometry.width = width_;
    geometry.height = height_;
    geometry.content = render_body();
    return svg_components::NestedDocument(std::move(geometry));
}

bool Canvas::save(const std::string& path) const {
    auto logger = svg_logging::logger();
    const std::filesystem::path file_path(path);

    if (file_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            logger->error("save_failed path={} reason={}", path, ec.message());
            return false;
        }
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        logger->error("save_failed path={} reason=cannot open file", path);
        return false;
    }
    out << render();
    out.flush();
    if (!out) {
        logger->error("save_failed path={} reason=write error", path);
        return false;
    }
    logger->info("saved path={} components={} size={}x{}", path, components_.size(), width_, height_);
    return true;
}

} // namespace svg_canvas
