#include <svg_logging/logging.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <filesystem>
#include <utility>
#include <vector>

namespace svg_logging {

namespace {

const char* const logger_name = "svg_composer";
const char* const log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr std::size_t max_log_file_size = 10 * 1024 * 1024;
constexpr std::size_t max_log_files = 3;

spdlog::level::level_enum& global_level() {
    static spdlog::level::level_enum level = spdlog::level::info;
    return level;
}

std::shared_ptr<spdlog::logger>& instance() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

std::shared_ptr<spdlog::logger> make_console_logger(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_level(level);
    auto out = std::make_shared<spdlog::logger>(logger_name, sink);
    out->set_pattern(log_pattern);
    out->set_level(level);
    return out;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& current = instance();
    if (current) return current;
    current = make_console_logger(global_level());
    return current;
}

void configure_logging(std::optional<spdlog::level::level_enum> console_level,
    std::optional<spdlog::level::level_enum> file_level,
    bool use_file_handler)
{
    const auto effective_console = console_level.value_or(global_level());
    const auto effective_file = file_level.value_or(global_level());

    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(effective_console);
    sinks.push_back(console_sink);

    std::string file_error;
    if (use_file_handler) {
        try {
            const std::filesystem::path logs_dir = std::filesystem::current_path() / "logs";
            std::filesystem::create_directories(logs_dir);
            const std::filesystem::path log_file =
                logs_dir / (std::filesystem::current_path().filename().string() + ".log");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file.string(), max_log_file_size, max_log_files);
            file_sink->set_level(effective_file);
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        } catch (const std::filesystem::filesystem_error& e) {
            file_error = e.what();
        }
    }

    auto configured = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    configured->set_pattern(log_pattern);
    // Logger level is the most verbose of its sinks; each sink filters on its own.
    configured->set_level(std::min(effective_console, effective_file));
    configured->flush_on(spdlog::level::warn);
    instance() = configured;
    if (!file_error.empty())
        configured->error("file logging disabled: {}", file_error);
}

void set_global_logging_level(spdlog::level::level_enum level, bool use_file_handler) {
    global_level() = level;
    configure_logging(level, level, use_file_handler);
}

spdlog::level::level_enum global_logging_level() {
    return global_level();
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    static const std::pair<const char*, spdlog::level::level_enum> levels[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    for (const auto& entry : levels) {
        if (name == entry.first) return entry.second;
    }
    return std::nullopt;
}

} // namespace svg_logging
