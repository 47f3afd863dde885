#include "fieldsync/core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

namespace fieldsync {
namespace {

constexpr std::size_t kMaxLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("FIELDSYNC_LOG_LEVEL")) {
        return level;
    }
    if (!config.level.empty()) {
        return config.level;
    }
    return "info";
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("FIELDSYNC_LOG_PATTERN")) {
        return pattern;
    }
    if (!config.pattern.empty()) {
        return config.pattern;
    }
    return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

} // namespace

void init_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, kMaxLogFileBytes, kMaxLogFiles));
    }

    auto logger = std::make_shared<spdlog::logger>("fieldsync", sinks.begin(), sinks.end());
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace fieldsync
