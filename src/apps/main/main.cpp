// Scene composer CLI: loads a JSON scene (or the built-in demo) and writes an SVG file.
#include <svg_canvas/canvas.hpp>
#include <svg_loaders/demo_scene.hpp>
#include <svg_loaders/scene_loader.hpp>
#include <svg_logging/logging.hpp>
#include <cstdio>
#include <optional>
#include <string>

namespace {

void print_usage(const char* program)
{
    (void)fprintf(stderr,
        "usage: %s [--input scene.json] [--output out.svg] [--log-level LEVEL] [--log-file] [--demo]\n",
        program);
}

} // namespace

int main(int argc, char* argv[])
{
    std::optional<std::string> input_path;
    std::string output_path = "output.svg";
    std::optional<spdlog::level::level_enum> log_level;
    bool log_file = false;
    bool demo = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        const bool has_value = i + 1 < argc;
        if (arg == "--input" && has_value) {
            input_path = argv[++i];
        } else if (arg == "--output" && has_value) {
            output_path = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            log_level = svg_logging::parse_level(argv[++i]);
            if (!log_level) {
                (void)fprintf(stderr, "unknown log level: %s\n", argv[i]);
                return 1;
            }
        } else if (arg == "--log-file") {
            log_file = true;
        } else if (arg == "--demo") {
            demo = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (log_level)
        svg_logging::set_global_logging_level(*log_level, log_file);
    else if (log_file)
        svg_logging::configure_logging(std::nullopt, std::nullopt, true);
    auto logger = svg_logging::logger();

    std::optional<svg_canvas::Canvas> scene;
    if (input_path) {
        scene = svg_loaders::load_scene_from_json_file(*input_path);
        if (!scene) {
            logger->error("load_failed path={}", *input_path);
            return 1;
        }
    } else if (!demo) {
        const char* scene_paths[] = { "data/example_scene.json", "example_scene.json" };
        for (const char* path : scene_paths) {
            auto loaded = svg_loaders::load_scene_from_json_file(path);
            if (loaded) {
                logger->info("scene_source path={}", path);
                scene = std::move(loaded);
                break;
            }
        }
    }
    if (!scene) {
        logger->info("scene_source demo");
        scene = svg_loaders::generate_demo_scene();
    }

    if (!scene->save(output_path))
        return 1;
    return 0;
}
