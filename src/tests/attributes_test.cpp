#include <svg_markup/attributes.hpp>
#include <gtest/gtest.h>

using svg_markup::AttributeList;

TEST(FormatNumber, ShortestForm) {
    EXPECT_EQ(svg_markup::format_number(0.0), "0");
    EXPECT_EQ(svg_markup::format_number(-0.0), "0");
    EXPECT_EQ(svg_markup::format_number(100.0), "100");
    EXPECT_EQ(svg_markup::format_number(0.6), "0.6");
    EXPECT_EQ(svg_markup::format_number(-12.25), "-12.25");
}

TEST(FormatNumber, JoinNumbers) {
    EXPECT_EQ(svg_markup::join_numbers({ 5, 3, 1.5 }, ","), "5,3,1.5");
    EXPECT_EQ(svg_markup::join_numbers({ 0, 0, 600, 400 }, " "), "0 0 600 400");
    EXPECT_EQ(svg_markup::join_numbers({}, ","), "");
}

TEST(AttributeList, KeepsInsertionOrder) {
    AttributeList attrs;
    EXPECT_TRUE(attrs.set("b", "1"));
    EXPECT_TRUE(attrs.set_number("a", 2));
    EXPECT_EQ(attrs.size(), 2u);
    EXPECT_EQ(attrs.to_string(), "b=\"1\" a=\"2\"");
}

TEST(AttributeList, FirstWriteWins) {
    AttributeList attrs;
    EXPECT_TRUE(attrs.set("fill", "red"));
    EXPECT_FALSE(attrs.set("fill", "blue"));
    ASSERT_NE(attrs.find("fill"), nullptr);
    EXPECT_EQ(*attrs.find("fill"), "red");
    EXPECT_EQ(attrs.find("stroke"), nullptr);
}

TEST(AttributeList, MergeReportsCollisions) {
    AttributeList base;
    base.set("x", "0");
    base.set("fill", "black");

    AttributeList extra;
    extra.set("fill", "red");
    extra.set("stroke", "blue");

    const auto skipped = base.merge(extra);
    ASSERT_EQ(skipped.size(), 1u);
    EXPECT_EQ(skipped[0], "fill");
    EXPECT_EQ(base.to_string(), "x=\"0\" fill=\"black\" stroke=\"blue\"");
}

TEST(Escaping, AttributeAndText) {
    EXPECT_EQ(svg_markup::escape_attribute("a<b & \"c\">"), "a&lt;b &amp; &quot;c&quot;&gt;");
    EXPECT_EQ(svg_markup::escape_text("a<b & \"c\""), "a&lt;b &amp; \"c\"");
}

TEST(MakeElement, SelfClosingAndWithContent) {
    AttributeList attrs;
    attrs.set_number("r", 5);
    EXPECT_EQ(svg_markup::make_element("circle", attrs), "<circle r=\"5\" />");
    EXPECT_EQ(svg_markup::make_element("text", attrs, std::string("hi")), "<text r=\"5\">hi</text>");
    EXPECT_EQ(svg_markup::make_element("g", AttributeList{}), "<g />");
}
