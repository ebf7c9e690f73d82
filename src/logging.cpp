#include "boatcount/logging.hpp"
#include <filesystem>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace boatcount {

void setupLogging(const LoggingConfig& config) {
    const auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        throw ConfigError("logging.level: unknown level name '" + config.level + "'");
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (!config.directory.empty()) {
        std::filesystem::create_directories(config.directory);
    }
    const auto path = (std::filesystem::path(config.directory) / config.file_name).string();
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path, config.max_file_size, config.max_files));

    auto logger = std::make_shared<spdlog::logger>("boatcount", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");

    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    spdlog::info("Logging to {} at level {}", path, spdlog::level::to_string_view(level));
}

} // namespace boatcount
