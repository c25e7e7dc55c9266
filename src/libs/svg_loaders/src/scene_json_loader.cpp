#include <svg_loaders/scene_loader.hpp>
#include <svg_components/circle.hpp>
#include <svg_components/image.hpp>
#include <svg_components/nested_document.hpp>
#include <svg_components/polyline.hpp>
#include <svg_components/rectangle.hpp>
#include <svg_components/text.hpp>
#include <svg_logging/logging.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace svg_loaders {

namespace {

using nlohmann::json;

// Structural problem in the scene document (wrong type, unknown name, ...).
class SceneError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::optional<double> optional_number(const json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    if (!j[key].is_number()) throw SceneError(std::string("'") + key + "' must be a number");
    return j[key].get<double>();
}

double number_or(const json& j, const char* key, double fallback) {
    return optional_number(j, key).value_or(fallback);
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    if (!j.contains(key)) return std::nullopt;
    if (!j[key].is_string()) throw SceneError(std::string("'") + key + "' must be a string");
    return j[key].get<std::string>();
}

std::string string_or(const json& j, const char* key, const std::string& fallback) {
    return optional_string(j, key).value_or(fallback);
}

std::string required_string(const json& j, const char* key) {
    auto value = optional_string(j, key);
    if (!value) throw SceneError(std::string("missing required '") + key + "'");
    return *value;
}

std::vector<double> number_array(const json& j, const char* key) {
    const json& arr = j[key];
    if (!arr.is_array()) throw SceneError(std::string("'") + key + "' must be an array of numbers");
    std::vector<double> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.is_number()) throw SceneError(std::string("'") + key + "' must be an array of numbers");
        out.push_back(v.get<double>());
    }
    return out;
}

svg_geometry::Point parse_point(const json& p) {
    if (!p.is_array() || p.size() != 2 || !p[0].is_number() || !p[1].is_number())
        throw SceneError("'points' entries must be [x, y] number pairs");
    return svg_geometry::Point{ p[0].get<double>(), p[1].get<double>() };
}

svg_style::AppearanceConfig parse_appearance(const json& a) {
    if (!a.is_object()) throw SceneError("'appearance' must be an object");
    svg_style::AppearanceConfig out;
    if (auto fill = optional_string(a, "fill")) out.fill = svg_style::Color(*fill);
    out.fill_opacity = optional_number(a, "fill_opacity");
    if (auto stroke = optional_string(a, "stroke")) out.stroke = svg_style::Color(*stroke);
    out.stroke_width = optional_number(a, "stroke_width");
    if (a.contains("stroke_dasharray")) out.stroke_dasharray = number_array(a, "stroke_dasharray");
    return out;
}

svg_transform::TransformStack parse_transform(const json& t) {
    if (!t.is_array()) throw SceneError("'transform' must be an array");
    svg_transform::TransformStack stack;
    for (const auto& entry : t) {
        if (!entry.is_object()) throw SceneError("'transform' entries must be objects");
        const std::string op = required_string(entry, "op");
        const std::vector<double> args = entry.contains("args") ? number_array(entry, "args") : std::vector<double>{};
        if (op == "translate") {
            // translate(tx) means ty = 0
            if (args.size() == 1) stack.translate(args[0], 0.0);
            else if (args.size() == 2) stack.translate(args[0], args[1]);
            else throw SceneError("translate takes 1 or 2 args");
        } else if (op == "scale") {
            if (args.size() == 1) stack.scale(args[0]);
            else if (args.size() == 2) stack.scale(args[0], args[1]);
            else throw SceneError("scale takes 1 or 2 args");
        } else if (op == "rotate") {
            if (args.size() == 1) stack.rotate(args[0]);
            else if (args.size() == 3) stack.rotate(args[0], svg_geometry::Point{ args[1], args[2] });
            else throw SceneError("rotate takes 1 or 3 args");
        } else {
            throw SceneError("unknown transform op '" + op + "'");
        }
    }
    return stack;
}

svg_geometry::TextGeometry parse_text(const json& c) {
    svg_geometry::TextGeometry g;
    g.x = number_or(c, "x", g.x);
    g.y = number_or(c, "y", g.y);
    g.text = string_or(c, "text", g.text);
    g.font_size = number_or(c, "font_size", g.font_size);
    g.font_family = string_or(c, "font_family", g.font_family);
    g.color = string_or(c, "color", g.color);
    if (auto anchor = optional_string(c, "text_anchor")) {
        auto parsed = svg_geometry::text_anchor_from_string(*anchor);
        if (!parsed) throw SceneError("unknown text_anchor '" + *anchor + "'");
        g.text_anchor = *parsed;
    }
    if (auto baseline = optional_string(c, "dominant_baseline")) {
        auto parsed = svg_geometry::dominant_baseline_from_string(*baseline);
        if (!parsed) throw SceneError("unknown dominant_baseline '" + *baseline + "'");
        g.dominant_baseline = *parsed;
    }
    return g;
}

std::unique_ptr<svg_components::Component> parse_component(const json& c) {
    if (!c.is_object()) throw SceneError("component entries must be objects");
    const std::string type = required_string(c, "type");

    svg_transform::TransformStack transform;
    if (c.contains("transform")) transform = parse_transform(c["transform"]);

    const bool styled = type == "circle" || type == "rectangle" || type == "polyline";
    if (!styled && c.contains("appearance"))
        throw SceneError("'" + type + "' does not take an appearance");
    svg_style::AppearanceConfig appearance;
    if (c.contains("appearance")) appearance = parse_appearance(c["appearance"]);

    std::unique_ptr<svg_components::Component> out;
    if (type == "circle") {
        svg_geometry::CircleGeometry g;
        g.cx = number_or(c, "cx", g.cx);
        g.cy = number_or(c, "cy", g.cy);
        g.r = number_or(c, "r", g.r);
        out = std::make_unique<svg_components::Circle>(g, std::move(appearance), std::move(transform));
    } else if (type == "rectangle") {
        svg_geometry::RectangleGeometry g;
        g.x = number_or(c, "x", g.x);
        g.y = number_or(c, "y", g.y);
        g.width = number_or(c, "width", g.width);
        g.height = number_or(c, "height", g.height);
        g.rx = optional_number(c, "rx");
        g.ry = optional_number(c, "ry");
        out = std::make_unique<svg_components::Rectangle>(g, std::move(appearance), std::move(transform));
    } else if (type == "polyline") {
        if (!c.contains("points") || !c["points"].is_array())
            throw SceneError("polyline requires a 'points' array");
        svg_geometry::PolylineGeometry g;
        for (const auto& p : c["points"])
            g.points.push_back(parse_point(p));
        out = std::make_unique<svg_components::Polyline>(std::move(g), std::move(appearance), std::move(transform));
    } else if (type == "text") {
        out = std::make_unique<svg_components::Text>(parse_text(c), std::move(transform));
    } else if (type == "image") {
        svg_geometry::ImageGeometry g;
        g.x = number_or(c, "x", g.x);
        g.y = number_or(c, "y", g.y);
        g.width = number_or(c, "width", g.width);
        g.height = number_or(c, "height", g.height);
        g.href = required_string(c, "href");
        g.preserve_aspect_ratio = string_or(c, "preserve_aspect_ratio", g.preserve_aspect_ratio);
        out = std::make_unique<svg_components::Image>(std::move(g), std::move(transform));
    } else if (type == "svg") {
        svg_geometry::NestedDocumentGeometry g;
        g.x = number_or(c, "x", g.x);
        g.y = number_or(c, "y", g.y);
        g.width = number_or(c, "width", g.width);
        g.height = number_or(c, "height", g.height);
        g.content = string_or(c, "content", g.content);
        out = std::make_unique<svg_components::NestedDocument>(std::move(g), std::move(transform));
    } else {
        throw SceneError("unknown component type '" + type + "'");
    }

    if (c.contains("restrict_size")) {
        const std::vector<double> limits = number_array(c, "restrict_size");
        if (limits.size() != 2) throw SceneError("'restrict_size' must be [max_width, max_height]");
        if (out->restrict_size(limits[0], limits[1]) == svg_components::FitResult::Indeterminate)
            throw SceneError("restrict_size: indeterminate geometry for '" + type + "'");
    }
    return out;
}

svg_canvas::Canvas parse_scene(const json& j) {
    if (!j.is_object()) throw SceneError("scene must be a JSON object");
    const auto width = optional_number(j, "width");
    const auto height = optional_number(j, "height");
    if (!width || !height) throw SceneError("scene requires 'width' and 'height'");

    svg_canvas::Canvas canvas(*width, *height);
    if (j.contains("view_box")) {
        const std::vector<double> vb = number_array(j, "view_box");
        if (vb.size() != 4) throw SceneError("'view_box' must be [min_x, min_y, width, height]");
        canvas.set_view_box(svg_canvas::ViewBox{ vb[0], vb[1], vb[2], vb[3] });
    }

    if (!j.contains("components") || !j["components"].is_array())
        throw SceneError("scene requires a 'components' array");
    const json& components = j["components"];
    for (std::size_t i = 0; i < components.size(); ++i) {
        try {
            canvas.add(parse_component(components[i]));
        } catch (const SceneError& e) {
            throw SceneError("components[" + std::to_string(i) + "]: " + e.what());
        } catch (const svg_geometry::GeometryError& e) {
            throw SceneError("components[" + std::to_string(i) + "]: " + e.what());
        }
    }
    return canvas;
}

} // namespace

std::optional<svg_canvas::Canvas> load_scene_from_json(std::istream& in) {
    auto logger = svg_logging::logger();
    try {
        const json j = json::parse(in);
        svg_canvas::Canvas canvas = parse_scene(j);
        logger->debug("scene_loaded components={} size={}x{}", canvas.size(), canvas.width(), canvas.height());
        return std::move(canvas);
    } catch (const json::exception& e) {
        logger->warn("scene_rejected reason=invalid json: {}", e.what());
    } catch (const SceneError& e) {
        logger->warn("scene_rejected reason={}", e.what());
    } catch (const svg_geometry::GeometryError& e) {
        logger->warn("scene_rejected reason={}", e.what());
    }
    return std::nullopt;
}

std::optional<svg_canvas::Canvas> load_scene_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        svg_logging::logger()->debug("scene_open_failed path={}", path);
        return std::nullopt;
    }
    return load_scene_from_json(f);
}

} // namespace svg_loaders
