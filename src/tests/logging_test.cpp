#include <svg_logging/logging.hpp>
#include <svg_components/circle.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <gtest/gtest.h>
#include <memory>
#include <sstream>

TEST(Logging, ParseLevel) {
    EXPECT_EQ(svg_logging::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(svg_logging::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(svg_logging::parse_level("off"), spdlog::level::off);
    EXPECT_FALSE(svg_logging::parse_level("verbose").has_value());
    EXPECT_FALSE(svg_logging::parse_level("DEBUG").has_value());
}

TEST(Logging, SharedLoggerFollowsGlobalLevel) {
    const auto previous = svg_logging::global_logging_level();
    svg_logging::set_global_logging_level(spdlog::level::err);
    EXPECT_EQ(svg_logging::global_logging_level(), spdlog::level::err);
    EXPECT_EQ(svg_logging::logger(), svg_logging::logger());
    EXPECT_EQ(svg_logging::logger()->name(), "svg_composer");
    EXPECT_FALSE(svg_logging::logger()->should_log(spdlog::level::info));
    svg_logging::set_global_logging_level(previous);
}

TEST(Logging, TransformAppendsLoggedAtDebug) {
    const auto previous = svg_logging::global_logging_level();
    svg_logging::set_global_logging_level(spdlog::level::debug);
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_pattern("%v");
    svg_logging::logger()->sinks().push_back(sink);

    svg_components::Circle c;
    c.translate(5, 5).rotate(30, svg_geometry::Point{ 1, 2 });

    const std::string text = captured.str();
    EXPECT_NE(text.find("transform_appended element=circle op=translate(5,5)"), std::string::npos);
    EXPECT_NE(text.find("transform_appended element=circle op=rotate(30,1,2)"), std::string::npos);
    svg_logging::set_global_logging_level(previous);
}
