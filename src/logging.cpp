// DexPilot - Logging Setup Implementation

#include <dexpilot/logging.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <vector>

namespace dexpilot {

void init_logging(const LoggingConfig& config) {
    auto level = spdlog::level::from_str(config.level);
    if (level == spdlog::level::off && config.level != "off") {
        throw ConfigError("Invalid log level: " + config.level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (config.log_to_file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size_mb * 1024 * 1024, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigError("Cannot open log file " + config.file_path + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("dexpilot", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

}  // namespace dexpilot
