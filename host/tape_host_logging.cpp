#include "tape_host_logging.hpp"
#include "tape_configuration.hpp"

#include "tape_defs.h"

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <memory>
#include <vector>

void setupTapeLogger(const TapeConfiguration &config) {
    static spdlog::level::level_enum levels[] = {spdlog::level::debug, spdlog::level::info,
                                                 spdlog::level::warn, spdlog::level::err,
                                                 spdlog::level::critical};

    auto logLevel = levels[std::clamp(config.logLevel, TAPE_DEBUG_LOG_DEBUG, TAPE_DEBUG_LOG_FATAL)];
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(logLevel);

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (!config.logFile.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logFile, true);
        file_sink->set_level(logLevel);
        sinks.push_back(file_sink);
    }
    auto main_logger = std::make_shared<spdlog::logger>("tape", sinks.begin(), sinks.end());
    spdlog::set_default_logger(main_logger);
    spdlog::set_level(logLevel);
    if (!config.logFile.empty()) {
        spdlog::info("Log file at {}", config.logFile);
    }
}
