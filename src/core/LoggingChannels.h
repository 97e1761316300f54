#pragma once

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace GardenSim {

/**
 * @brief Named spdlog loggers, one per simulation subsystem.
 *
 * Every channel shares the same sinks so output stays interleaved in one
 * console and one file, while levels can be tuned per channel.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize channels with built-in sinks and levels.
     * @param consoleLevel Level for the colored console sink
     * @param fileLevel Level for the garden-sim.log file sink
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug);

    /**
     * @brief Initialize channels from a JSON config file.
     * <configPath>.local takes precedence over <configPath>; a default file is
     * written when neither exists.
     * @return true if a config file was read, false if built-in defaults were used
     */
    static bool initializeFromConfig(const std::string& configPath = "logging-config.json");

    /**
     * @brief Get a channel logger, or the default logger if it does not exist.
     */
    static std::shared_ptr<spdlog::logger> get(const std::string& channel);

    /**
     * @brief Apply a level spec such as "field:trace,economy:debug" or "*:warn".
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    // spdlog flushes on whole seconds; sub-second intervals round up to one.
    static std::chrono::seconds flushIntervalFromMs(int milliseconds);

    static const std::vector<std::string>& channelNames();

    static std::shared_ptr<spdlog::logger> field() { return get("field"); }
    static std::shared_ptr<spdlog::logger> growth() { return get("growth"); }
    static std::shared_ptr<spdlog::logger> economy() { return get("economy"); }
    static std::shared_ptr<spdlog::logger> weather() { return get("weather"); }
    static std::shared_ptr<spdlog::logger> catalog() { return get("catalog"); }
    static std::shared_ptr<spdlog::logger> world() { return get("world"); }
    static std::shared_ptr<spdlog::logger> config() { return get("config"); }

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static nlohmann::json defaultConfig();

    static nlohmann::json loadConfigFile(const std::string& configPath, bool& fromFile);

    static void applyConfig(const nlohmann::json& config);

    static void installChannels(const std::string& pattern, spdlog::level::level_enum level);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

} // namespace GardenSim
