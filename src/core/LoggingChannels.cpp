#include "LoggingChannels.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace GardenSim {

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

namespace {

constexpr const char* DEFAULT_PATTERN = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
constexpr const char* DEFAULT_LOG_FILE = "garden-sim.log";

std::string trim(const std::string& s)
{
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

} // namespace

const std::vector<std::string>& LoggingChannels::channelNames()
{
    static const std::vector<std::string> names = {
        "catalog", "config", "economy", "field", "growth", "weather", "world"
    };
    return names;
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel, spdlog::level::level_enum fileLevel)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(consoleLevel);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(DEFAULT_LOG_FILE, true);
    file_sink->set_level(fileLevel);

    sharedSinks_ = { console_sink, file_sink };
    installChannels(DEFAULT_PATTERN, spdlog::level::trace);

    // Growth logs every stage change; keep it quiet unless asked.
    setChannelLevel("growth", spdlog::level::info);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    spdlog::info("LoggingChannels initialized successfully");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(const std::string& channel)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);
        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        std::string channel = trim(item.substr(0, colonPos));
        auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
                logger->set_level(level);
            });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (logger) {
        logger->set_level(level);
        spdlog::debug(
            "Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
    }
    else {
        spdlog::warn("Channel '{}' not found, cannot set level", channel);
    }
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    spdlog::drop(name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

void LoggingChannels::installChannels(const std::string& pattern, spdlog::level::level_enum level)
{
    for (const auto& name : channelNames()) {
        createLogger(name, sharedSinks_, level);
    }

    auto default_logger =
        std::make_shared<spdlog::logger>("default", sharedSinks_.begin(), sharedSinks_.end());
    default_logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(default_logger);

    // Applies to every registered logger, so set it after they exist.
    spdlog::set_pattern(pattern);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }

    spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
    return spdlog::level::info;
}

std::chrono::seconds LoggingChannels::flushIntervalFromMs(int milliseconds)
{
    const auto interval =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::milliseconds(milliseconds));
    return std::max(interval, std::chrono::seconds(1));
}

nlohmann::json LoggingChannels::defaultConfig()
{
    nlohmann::json channels = nlohmann::json::object();
    for (const auto& name : channelNames()) {
        channels[name] = "info";
    }

    return nlohmann::json{
        { "defaults", { { "pattern", DEFAULT_PATTERN }, { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", DEFAULT_LOG_FILE },
                { "truncate", true } } } } },
        { "channels", channels }
    };
}

bool LoggingChannels::initializeFromConfig(const std::string& configPath)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    bool fromFile = false;
    auto config = loadConfigFile(configPath, fromFile);
    applyConfig(config);

    initialized_ = true;
    return fromFile;
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath, bool& fromFile)
{
    namespace fs = std::filesystem;

    fromFile = false;
    std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        std::ofstream out(configPath);
        if (out.is_open()) {
            out << defaultConfig().dump(2) << std::endl;
            spdlog::info("Created default logging config file: {}", configPath);
        }
        else {
            spdlog::warn("Could not create logging config {}, using built-in defaults", configPath);
        }
        return defaultConfig();
    }

    std::ifstream in(pathToUse);
    if (!in.is_open()) {
        spdlog::error("Cannot open logging config {}, using built-in defaults", pathToUse);
        return defaultConfig();
    }

    try {
        nlohmann::json config = nlohmann::json::parse(in);
        spdlog::info("Loaded logging config from {}", pathToUse);
        fromFile = true;
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse logging config {}: {}", pathToUse, e.what());
        spdlog::error("Fix the JSON syntax or delete the file to regenerate defaults.");
        return defaultConfig();
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config)
{
    std::string pattern = DEFAULT_PATTERN;
    int flushIntervalMs = 1000;
    std::vector<spdlog::sink_ptr> sinks;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            pattern = defaults.value("pattern", pattern);
            flushIntervalMs = defaults.value("flush_interval_ms", flushIntervalMs);
        }

        if (config.contains("sinks")) {
            const auto& sinksConfig = config["sinks"];

            if (sinksConfig.contains("console")) {
                const auto& consoleCfg = sinksConfig["console"];
                if (consoleCfg.value("enabled", true)) {
                    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                    sink->set_level(parseLevelString(consoleCfg.value("level", "info")));
                    sinks.push_back(sink);
                }
            }

            if (sinksConfig.contains("file")) {
                const auto& fileCfg = sinksConfig["file"];
                if (fileCfg.value("enabled", true)) {
                    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                        fileCfg.value("path", std::string(DEFAULT_LOG_FILE)),
                        fileCfg.value("truncate", true));
                    sink->set_level(parseLevelString(fileCfg.value("level", "debug")));
                    sinks.push_back(sink);
                }
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        sinks.clear();
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    sharedSinks_ = sinks;
    installChannels(pattern, spdlog::level::trace);

    try {
        if (config.contains("channels")) {
            for (auto& [channel, levelStr] : config["channels"].items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    spdlog::flush_every(flushIntervalFromMs(flushIntervalMs));
    spdlog::info("LoggingChannels initialized from config successfully");
}

} // namespace GardenSim
