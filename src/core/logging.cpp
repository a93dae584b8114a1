#include "taildrive/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace taildrive {

namespace {

constexpr std::size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kLogPattern = "[%H:%M:%S] [%^%l%$] %v";

} // namespace

Result<void> init_logging(const std::string& level, const std::string& log_file) {
    const auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        return Err("Unknown log level: " + level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, kMaxLogFileBytes, kMaxLogFiles));
        } catch (const spdlog::spdlog_ex& e) {
            return Err("Cannot open log file " + log_file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("taildrive", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(parsed);
    spdlog::set_pattern(kLogPattern);
    spdlog::flush_on(spdlog::level::warn);
    return Ok();
}

} // namespace taildrive
