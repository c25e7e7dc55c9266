#include <svg_canvas/canvas.hpp>
#include <svg_components/circle.hpp>
#include <svg_components/rectangle.hpp>
#include <svg_loaders/demo_scene.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

using svg_canvas::Canvas;

namespace {

svg_geometry::CircleGeometry circle(double r) {
    svg_geometry::CircleGeometry g;
    g.cx = 0;
    g.cy = 0;
    g.r = r;
    return g;
}

} // namespace

TEST(Canvas, EmptyEnvelope) {
    Canvas canvas(100, 50);
    EXPECT_TRUE(canvas.empty());
    EXPECT_EQ(canvas.render(),
        "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"100\" height=\"50\" viewBox=\"0 0 100 50\">\n"
        "</svg>\n");
}

TEST(Canvas, ChildrenInInsertionOrder) {
    Canvas canvas(200, 100);
    canvas.emplace<svg_components::Circle>(circle(10)).move(20, 20);
    canvas.emplace<svg_components::Rectangle>();
    ASSERT_EQ(canvas.size(), 2u);
    EXPECT_EQ(canvas.render(),
        "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"200\" height=\"100\" viewBox=\"0 0 200 100\">\n"
        "  <circle cx=\"0\" cy=\"0\" r=\"10\" transform=\"translate(20,20)\" />\n"
        "  <rect x=\"0\" y=\"0\" width=\"200\" height=\"100\" />\n"
        "</svg>\n");
    EXPECT_EQ(canvas.render_body(),
        "<circle cx=\"0\" cy=\"0\" r=\"10\" transform=\"translate(20,20)\" />\n"
        "<rect x=\"0\" y=\"0\" width=\"200\" height=\"100\" />\n");
}

TEST(Canvas, CustomViewBox) {
    Canvas canvas(300, 150);
    canvas.set_view_box(svg_canvas::ViewBox{ -10, -10, 30, 15 });
    EXPECT_NE(canvas.render().find("viewBox=\"-10 -10 30 15\""), std::string::npos);
    EXPECT_THROW(canvas.set_view_box(svg_canvas::ViewBox{ 0, 0, -1, 10 }), svg_geometry::GeometryError);
}

TEST(Canvas, InvalidSizeRejected) {
    EXPECT_THROW(Canvas(0, 10), svg_geometry::GeometryError);
    EXPECT_THROW(Canvas(10, -5), svg_geometry::GeometryError);
}

TEST(Canvas, NullComponentRejected) {
    Canvas canvas(10, 10);
    EXPECT_THROW(canvas.add(nullptr), std::invalid_argument);
    EXPECT_TRUE(canvas.empty());
}

TEST(Canvas, AddedComponentStaysChainable) {
    Canvas canvas(10, 10);
    svg_components::Component& c = canvas.add(std::make_unique<svg_components::Circle>(circle(4)));
    c.scale(2);
    EXPECT_EQ(canvas.components().front()->transform().size(), 1u);
    canvas.clear();
    EXPECT_TRUE(canvas.empty());
}

TEST(Canvas, NestedDocumentCarriesBody) {
    Canvas inner(40, 20);
    inner.emplace<svg_components::Circle>(circle(5));
    const svg_components::NestedDocument doc = inner.to_nested_document(10, 15);
    EXPECT_EQ(doc.to_element(),
        "<svg x=\"10\" y=\"15\" width=\"40\" height=\"20\" viewBox=\"0 0 40 20\">"
        "<circle cx=\"0\" cy=\"0\" r=\"5\" />\n</svg>");
}

TEST(Canvas, SaveCreatesParentDirectories) {
    const auto dir = std::filesystem::temp_directory_path() / "svg_composer_canvas_test";
    std::filesystem::remove_all(dir);
    const auto path = dir / "nested" / "out.svg";

    Canvas canvas(10, 10);
    canvas.emplace<svg_components::Circle>(circle(3));
    ASSERT_TRUE(canvas.save(path.string()));

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), canvas.render());
    std::filesystem::remove_all(dir);
}

TEST(DemoScene, ContainsEveryKind) {
    const Canvas demo = svg_loaders::generate_demo_scene();
    EXPECT_EQ(demo.width(), 600);
    EXPECT_EQ(demo.height(), 400);
    const std::string svg = demo.render();
    for (const char* tag : { "<circle ", "<rect ", "<polyline ", "<text ", "<image ", "<svg x=" })
        EXPECT_NE(svg.find(tag), std::string::npos) << tag;
    EXPECT_NE(svg.find("scale(0.6)"), std::string::npos);
}
