#include "core/LoggingChannels.h"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>

namespace BjornManager {

namespace {

constexpr const char* kDefaultLogFile = "bjorn-manager.log";
constexpr const char* kBasePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";

std::recursive_mutex& initMutex()
{
    static std::recursive_mutex mutex;
    return mutex;
}

std::string patternFor(const std::string& componentName, bool withChannel)
{
    const std::string channelPart = withChannel ? "[%n] " : "";
    if (componentName == "default") {
        return "[%H:%M:%S.%e] " + channelPart + "[%^%l%$] [%s:%#] %v";
    }
    return "[%H:%M:%S.%e] [" + componentName + "] " + channelPart + "[%^%l%$] [%s:%#] %v";
}

spdlog::sink_ptr makeConsoleSink(bool consoleToStderr)
{
    if (consoleToStderr) {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
}

nlohmann::json builtInDefaults()
{
    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kBasePattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kDefaultLogFile },
                { "max_size_mb", 10 },
                { "max_files", 3 } } } } },
        { "channels",
          { { "config", "info" },
            { "discovery", "info" },
            { "events", "info" },
            { "install", "info" },
            { "network", "info" },
            { "session", "info" },
            { "state", "debug" },
            { "ui", "info" } } }
    };
}

std::string trimmed(const std::string& text)
{
    const size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    return text.substr(begin, text.find_last_not_of(" \t") - begin + 1);
}

std::vector<std::string> splitTrimmed(const std::string& text, char separator)
{
    std::vector<std::string> parts;
    std::stringstream stream(text);
    std::string part;
    while (std::getline(stream, part, separator)) {
        part = trimmed(part);
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

} // namespace

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Config:
            return "config";
        case LogChannel::Discovery:
            return "discovery";
        case LogChannel::Events:
            return "events";
        case LogChannel::Install:
            return "install";
        case LogChannel::Network:
            return "network";
        case LogChannel::Session:
            return "session";
        case LogChannel::State:
            return "state";
        case LogChannel::Ui:
            return "ui";
    }
    return "default";
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    std::lock_guard<std::recursive_mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto consoleSink = makeConsoleSink(consoleToStderr);
    consoleSink->set_level(consoleLevel);

    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kDefaultLogFile, true);
    fileSink->set_level(fileLevel);

    sharedSinks_ = { consoleSink, fileSink };
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(patternFor(componentName, true));
    }

    createChannelLoggers(sharedSinks_);
    setChannelLevel(LogChannel::State, spdlog::level::debug);

    installDefaultLogger(componentName, consoleLevel, fileLevel, kDefaultLogFile, consoleToStderr);
    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_INFO("LoggingChannels initialized successfully");
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName, bool consoleToStderr)
{
    std::lock_guard<std::recursive_mutex> lock(initMutex());
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    bool loaded = false;
    const auto config = loadConfigFile(configPath, &loaded);
    applyConfig(config, componentName, consoleToStderr);

    initialized_ = true;
    return loaded;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    if (!logger) {
        return spdlog::default_logger();
    }
    return logger;
}

void LoggingChannels::configureFromString(const std::string& overrides)
{
    // "*" entries apply in order, so "*:off,session:debug" leaves only session on.
    for (const auto& entry : splitTrimmed(overrides, ',')) {
        const size_t colon = entry.find(':');
        if (colon == std::string::npos) {
            spdlog::warn("Ignoring channel override without a level: '{}'", entry);
            continue;
        }
        const std::string channel = trimmed(entry.substr(0, colon));
        const auto level = parseLevelString(trimmed(entry.substr(colon + 1)));
        if (channel == "*") {
            spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& logger) {
                logger->set_level(level);
            });
        }
        else if (!setChannelLevel(channel, level)) {
            spdlog::warn("Ignoring override for unknown channel '{}'", channel);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

bool LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        return false;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
    return true;
}

void LoggingChannels::createChannelLoggers(const std::vector<spdlog::sink_ptr>& sinks)
{
    for (const auto channel : { LogChannel::Config,
                                LogChannel::Discovery,
                                LogChannel::Events,
                                LogChannel::Install,
                                LogChannel::Network,
                                LogChannel::Session,
                                LogChannel::State,
                                LogChannel::Ui }) {
        createLogger(toString(channel), sinks, spdlog::level::info);
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

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower;
    for (const char ch : levelStr) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    // from_str() maps anything it does not know to off.
    const auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        spdlog::warn("Unknown log level '{}', using info", levelStr);
        return spdlog::level::info;
    }
    return level;
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath, bool* loaded)
{
    namespace fs = std::filesystem;
    *loaded = false;

    std::string pathToUse;
    const std::string localPath = configPath + ".local";
    std::error_code error;
    if (fs::exists(localPath, error)) {
        pathToUse = localPath;
    }
    else if (fs::exists(configPath, error)) {
        pathToUse = configPath;
    }
    else {
        return builtInDefaults();
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::warn("Cannot open logging config {}, using built-in defaults", pathToUse);
            return builtInDefaults();
        }
        auto config = nlohmann::json::parse(configFile);
        *loaded = true;
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse logging config {}: {}", pathToUse, e.what());
        spdlog::error("Fix the JSON syntax or delete the file to use the defaults.");
        return builtInDefaults();
    }
}

void LoggingChannels::applyConfig(
    const nlohmann::json& config, const std::string& componentName, bool consoleToStderr)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string filePath = kDefaultLogFile;
    int flushIntervalMs = 1000;

    std::vector<spdlog::sink_ptr> sinks;
    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            consoleLevel = parseLevelString(defaults.value("console_level", "info"));
            fileLevel = parseLevelString(defaults.value("file_level", "debug"));
            flushIntervalMs = defaults.value("flush_interval_ms", 1000);
        }

        if (config.contains("sinks")) {
            const auto& sinksConfig = config["sinks"];

            if (sinksConfig.contains("console")) {
                const auto& consoleCfg = sinksConfig["console"];
                if (consoleCfg.value("enabled", true)) {
                    auto consoleSink = makeConsoleSink(consoleToStderr);
                    consoleLevel = parseLevelString(consoleCfg.value("level", "info"));
                    consoleSink->set_level(consoleLevel);
                    sinks.push_back(consoleSink);
                }
            }

            if (sinksConfig.contains("file")) {
                const auto& fileCfg = sinksConfig["file"];
                if (fileCfg.value("enabled", true)) {
                    filePath = fileCfg.value("path", std::string(kDefaultLogFile));
                    fileLevel = parseLevelString(fileCfg.value("level", "debug"));

                    spdlog::sink_ptr fileSink;
                    if (fileCfg.contains("max_size_mb")) {
                        const size_t maxSizeMB = fileCfg.value("max_size_mb", 10);
                        const size_t maxFiles = fileCfg.value("max_files", 3);
                        fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                            filePath, maxSizeMB * 1024 * 1024, maxFiles);
                    }
                    else {
                        fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                            filePath, fileCfg.value("truncate", true));
                    }
                    fileSink->set_level(fileLevel);
                    sinks.push_back(fileSink);
                }
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        auto consoleSink = makeConsoleSink(consoleToStderr);
        consoleSink->set_level(consoleLevel);
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kDefaultLogFile, true);
        fileSink->set_level(fileLevel);
        sinks = { consoleSink, fileSink };
        filePath = kDefaultLogFile;
    }

    sharedSinks_ = sinks;
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(patternFor(componentName, true));
    }
    createChannelLoggers(sharedSinks_);

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                if (!setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()))) {
                    spdlog::warn("Logging config names unknown channel '{}'", channel);
                }
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    installDefaultLogger(componentName, consoleLevel, fileLevel, filePath, consoleToStderr);
    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));

    SLOG_INFO("LoggingChannels initialized from config successfully");
}

void LoggingChannels::installDefaultLogger(
    const std::string& componentName,
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& filePath,
    bool consoleToStderr)
{
    // Separate sinks so the default pattern (no channel name) doesn't affect channel loggers.
    auto consoleSink = makeConsoleSink(consoleToStderr);
    consoleSink->set_level(consoleLevel);
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, false);
    fileSink->set_level(fileLevel);

    std::vector<spdlog::sink_ptr> defaultSinks = { consoleSink, fileSink };
    for (auto& sink : defaultSinks) {
        sink->set_pattern(patternFor(componentName, false));
    }

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    auto defaultLogger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);
}

} // namespace BjornManager
