#include <svg_loaders/demo_scene.hpp>
#include <svg_components/circle.hpp>
#include <svg_components/image.hpp>
#include <svg_components/nested_document.hpp>
#include <svg_components/polyline.hpp>
#include <svg_components/rectangle.hpp>
#include <svg_components/text.hpp>
#include <initializer_list>
#include <memory>
#include <optional>

namespace svg_loaders {

svg_canvas::Canvas generate_demo_scene() {
    svg_canvas::Canvas out(600, 400);

    auto style = [](const char* fill, const char* stroke, double stroke_width,
                     std::optional<double> opacity = std::nullopt,
                     std::initializer_list<double> dashes = {}) {
        svg_style::AppearanceConfig a;
        a.fill = svg_style::Color(fill);
        a.stroke = svg_style::Color(stroke);
        a.stroke_width = stroke_width;
        a.fill_opacity = opacity;
        a.stroke_dasharray.assign(dashes.begin(), dashes.end());
        return a;
    };
    auto circle = [](double r) {
        svg_geometry::CircleGeometry g;
        g.cx = 0;
        g.cy = 0;
        g.r = r;
        return g;
    };
    auto rect = [](double width, double height,
                    std::optional<double> rx = std::nullopt, std::optional<double> ry = std::nullopt) {
        svg_geometry::RectangleGeometry g;
        g.width = width;
        g.height = height;
        g.rx = rx;
        g.ry = ry;
        return g;
    };

    // Row 1: circles.
    out.emplace<svg_components::Circle>(circle(30), style("lightgray", "black", 2)).move(80, 80);
    out.emplace<svg_components::Circle>(circle(35), style("lightblue", "navy", 3)).move(200, 80);
    out.emplace<svg_components::Circle>(circle(40), style("coral", "red", 2, 0.7)).move(330, 80);
    out.emplace<svg_components::Circle>(circle(30), style("lightpink", "deeppink", 3, std::nullopt, {10, 5}))
        .move(450, 80);
    // r=50 shrunk to fit 60x60: scale(0.6)
    auto& fitted = out.emplace<svg_components::Circle>(circle(50), style("gold", "orange", 2));
    fitted.move(545, 80);
    (void)fitted.restrict_size(60, 60);

    // Row 2: rectangles.
    out.emplace<svg_components::Rectangle>(rect(100, 50), style("lightgray", "black", 2)).move(30, 160);
    out.emplace<svg_components::Rectangle>(rect(100, 50, 15, 15), style("lightgreen", "green", 2))
        .move(150, 160);
    out.emplace<svg_components::Rectangle>(rect(100, 50), style("lavender", "purple", 2, std::nullopt, {5, 3}))
        .move(270, 160);
    out.emplace<svg_components::Rectangle>(rect(100, 50), style("lightpink", "deeppink", 2))
        .move(440, 160)
        .rotate(30, svg_geometry::Point{ 50, 25 });

    // Row 3: polyline, text and image.
    svg_geometry::PolylineGeometry zigzag;
    zigzag.points = { {0, 40}, {30, 0}, {60, 40}, {90, 0}, {120, 40} };
    svg_style::AppearanceConfig line_style = style("none", "steelblue", 3);
    out.emplace<svg_components::Polyline>(zigzag, line_style).move(30, 260);

    svg_geometry::TextGeometry caption;
    caption.x = 300;
    caption.y = 280;
    caption.text = "svg_composer demo";
    caption.font_size = 20;
    out.emplace<svg_components::Text>(caption);

    svg_geometry::ImageGeometry picture;
    picture.x = 0;
    picture.y = 0;
    picture.width = 160;
    picture.height = 120;
    picture.href = "https://www.w3.org/Icons/SVG/svg-logo-v.svg";
    auto& image = out.emplace<svg_components::Image>(picture);
    image.move(460, 240);
    (void)image.restrict_size(100, 100);

    // Nested document: a small badge canvas embedded at the bottom left.
    svg_canvas::Canvas badge(120, 60);
    badge.emplace<svg_components::Rectangle>(rect(120, 60, 8, 8), style("white", "gray", 1));
    svg_geometry::TextGeometry badge_text;
    badge_text.x = 60;
    badge_text.y = 30;
    badge_text.text = "nested";
    badge_text.color = "gray";
    badge.emplace<svg_components::Text>(badge_text);
    out.add(std::make_unique<svg_components::NestedDocument>(badge.to_nested_document(30, 330)));

    return out;
}

} // namespace svg_loaders
