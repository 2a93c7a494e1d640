#include "epsim_core/Logging.hpp"

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <vector>

namespace epsim {

static const std::vector<std::string> LOG_LEVELS = {"trace", "debug", "info", "warn", "error", "fatal"};

static spdlog::level::level_enum toSpdlogLevel(const std::string &level) {
    // spdlog names the last level "critical"
    return level == "fatal" ? spdlog::level::critical : spdlog::level::from_str(level);
}

std::shared_ptr<spdlog::logger> getLogger(const std::string &name) {
    static std::mutex getLoggerMutex;
    std::lock_guard<std::mutex> lock(getLoggerMutex);

    auto logLevel = epsim::getEnvAsChecked<std::string>("EPSIM_LOG_LEVEL", LOG_LEVELS, true, "info");
    auto logFolder = epsim::getEnvAs<std::string>("EPSIM_LOG_FOLDER", true, "");
    auto logToConsole = epsim::getEnvAs<bool>("EPSIM_LOG_TO_CONSOLE", true, true);
    auto fileLogLevel = epsim::getEnvAsChecked<std::string>("EPSIM_LOG_FILE_LEVEL", LOG_LEVELS, true, "debug");

    std::vector<spdlog::sink_ptr> sinks;
    if (logToConsole) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        consoleSink->set_level(toSpdlogLevel(logLevel));
        sinks.push_back(consoleSink);
    }

    if (!logFolder.empty()) {
        std::filesystem::create_directories(logFolder);
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFolder + "/" + name + ".logs", true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
        fileSink->set_level(toSpdlogLevel(fileLogLevel));
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(std::min(toSpdlogLevel(logLevel),
                               logFolder.empty() ? spdlog::level::off : toSpdlogLevel(fileLogLevel)));
    return logger;
}

}  // namespace epsim
