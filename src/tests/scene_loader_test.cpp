#include <svg_loaders/scene_loader.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace {

std::optional<svg_canvas::Canvas> load(const std::string& text) {
    std::istringstream in(text);
    return svg_loaders::load_scene_from_json(in);
}

} // namespace

TEST(SceneLoader, LoadsComponentsInOrder) {
    const auto scene = load(R"({
        "width": 600, "height": 400,
        "components": [
            { "type": "circle", "cx": 0, "cy": 0, "r": 30,
              "appearance": { "fill": "lightgray", "stroke": "black", "stroke_width": 2 },
              "transform": [ { "op": "translate", "args": [80, 80] } ] },
            { "type": "rectangle", "width": 100, "height": 50, "rx": 5 },
            { "type": "polyline", "points": [[0, 0], [10, 10]] },
            { "type": "text", "x": 10, "y": 20, "text": "hi", "text_anchor": "start" },
            { "type": "image", "href": "a.png" },
            { "type": "svg", "width": 20, "height": 20, "content": "<g />" }
        ]
    })");
    ASSERT_TRUE(scene.has_value());
    ASSERT_EQ(scene->size(), 6u);
    EXPECT_EQ(scene->components()[0]->to_element(),
        "<circle cx=\"0\" cy=\"0\" r=\"30\" fill=\"lightgray\" stroke=\"black\" stroke-width=\"2\" "
        "transform=\"translate(80,80)\" />");
    EXPECT_EQ(scene->components()[1]->to_element(),
        "<rect x=\"0\" y=\"0\" width=\"100\" height=\"50\" rx=\"5\" />");
    EXPECT_STREQ(scene->components()[3]->tag_name(), "text");
    EXPECT_EQ(scene->components()[5]->to_element(),
        "<svg x=\"0\" y=\"0\" width=\"20\" height=\"20\" viewBox=\"0 0 20 20\"><g /></svg>");
}

TEST(SceneLoader, MissingFieldsTakeDefaults) {
    const auto scene = load(R"({ "width": 10, "height": 10, "components": [ { "type": "circle" } ] })");
    ASSERT_TRUE(scene.has_value());
    EXPECT_EQ(scene->components()[0]->to_element(), "<circle cx=\"50\" cy=\"50\" r=\"50\" />");
}

TEST(SceneLoader, TransformsAndFit) {
    const auto scene = load(R"({
        "width": 100, "height": 100,
        "components": [
            { "type": "circle",
              "transform": [ { "op": "translate", "args": [5] },
                             { "op": "rotate", "args": [30, 10, 10] },
                             { "op": "scale", "args": [2, 3] } ] },
            { "type": "circle", "r": 50, "restrict_size": [60, 60] }
        ]
    })");
    ASSERT_TRUE(scene.has_value());
    EXPECT_EQ(scene->components()[0]->transform().serialize(),
        std::optional<std::string>("translate(5,0) rotate(30,10,10) scale(2,3)"));
    EXPECT_EQ(scene->components()[1]->transform().serialize(), std::optional<std::string>("scale(0.6)"));
}

TEST(SceneLoader, ViewBox) {
    const auto scene = load(R"({ "width": 10, "height": 10, "view_box": [1, 2, 3, 4], "components": [] })");
    ASSERT_TRUE(scene.has_value());
    EXPECT_EQ(scene->view_box().min_x, 1);
    EXPECT_EQ(scene->view_box().height, 4);
    EXPECT_TRUE(scene->empty());
}

TEST(SceneLoader, RejectsMalformedDocuments) {
    EXPECT_FALSE(load("{ not json").has_value());
    EXPECT_FALSE(load("[]").has_value());
    EXPECT_FALSE(load(R"({ "height": 10, "components": [] })").has_value());
    EXPECT_FALSE(load(R"({ "width": 10, "height": 10 })").has_value());
    EXPECT_FALSE(load(R"({ "width": 0, "height": 10, "components": [] })").has_value());
    EXPECT_FALSE(load(R"({ "width": 10, "height": 10, "view_box": [0, 0], "components": [] })").has_value());
}

TEST(SceneLoader, OneBadComponentRejectsScene) {
    const char* bad_components[] = {
        R"({ "type": "hexagon" })",
        R"({ "r": 5 })",
        R"({ "type": "circle", "r": -5 })",
        R"({ "type": "circle", "r": "big" })",
        R"({ "type": "polyline", "points": [] })",
        R"({ "type": "polyline", "points": [[1, 2, 3]] })",
        R"({ "type": "image" })",
        R"({ "type": "text", "appearance": { "fill": "red" } })",
        R"({ "type": "text", "dominant_baseline": "top" })",
        R"({ "type": "circle", "appearance": { "fill_opacity": 3 } })",
        R"({ "type": "circle", "transform": [ { "op": "skewX", "args": [10] } ] })",
        R"({ "type": "circle", "transform": [ { "op": "rotate", "args": [10, 1] } ] })",
        R"({ "type": "circle", "restrict_size": [0, 10] })",
        R"({ "type": "text", "restrict_size": [10] })",
    };
    for (const char* component : bad_components) {
        const std::string doc = std::string(R"({ "width": 10, "height": 10, "components": [ { "type": "circle" }, )")
            + component + " ] }";
        EXPECT_FALSE(load(doc).has_value()) << component;
    }
}

TEST(SceneLoader, FitOnFreeTextRejectsScene) {
    EXPECT_FALSE(load(R"({ "width": 100, "height": 100,
        "components": [ { "type": "text", "text": "hello", "restrict_size": [10, 10] } ] })").has_value());
    // Text without a fit request still loads.
    EXPECT_TRUE(load(R"({ "width": 100, "height": 100,
        "components": [ { "type": "text", "text": "hello" } ] })").has_value());
}

TEST(SceneLoader, MissingFile) {
    EXPECT_FALSE(svg_loaders::load_scene_from_json_file("/nonexistent/scene.json").has_value());
}
