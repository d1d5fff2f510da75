#include "LoggingChannels.h"
#include <algorithm>
#include <sstream>

namespace ArmySearch {

namespace {
constexpr const char* kLogFile = "armysearch.log";

std::string linePattern(const std::string& componentName)
{
    const std::string prefix = componentName == "default" ? "" : "[" + componentName + "] ";
    return "[%H:%M:%S.%e] " + prefix + "[%n] [%^%l%$] [%s:%#] %v";
}

std::string trimmed(const std::string& text)
{
    const size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    return text.substr(first, text.find_last_not_of(" \t") - first + 1);
}
} // namespace

std::atomic<bool> LoggingChannels::initialized_{ false };
std::mutex LoggingChannels::initMutex_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(consoleLevel);
    auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
    fileSink->set_level(fileLevel);

    const std::vector<spdlog::sink_ptr> sinks = { consoleSink, fileSink };
    for (const auto& sink : sinks) {
        sink->set_pattern(linePattern(componentName));
    }

    for (const LogChannel channel : kAllLogChannels) {
        auto logger =
            std::make_shared<spdlog::logger>(toString(channel), sinks.begin(), sinks.end());
        logger->set_level(defaultLevel(channel));
        spdlog::register_logger(logger);
    }

    // Assertions report through the default logger; it shares the channel sinks.
    auto defaultLogger =
        std::make_shared<spdlog::logger>("armysearch", sinks.begin(), sinks.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);
    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    spdlog::debug("LoggingChannels initialized ({} channels)", kAllLogChannels.size());
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Evaluation workers may be the first callers, so first use is serialized.
    if (!initialized_) {
        std::lock_guard<std::mutex> lock(initMutex_);
        if (!initialized_) {
            initialize();
        }
    }

    auto logger = spdlog::get(toString(channel));
    assert(logger && "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trimmed(item);
        if (item.empty()) {
            continue;
        }

        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string name = trimmed(item.substr(0, colonPos));
        const auto level = parseLevelString(trimmed(item.substr(colonPos + 1)));

        if (name == "*") {
            for (const LogChannel channel : kAllLogChannels) {
                get(channel)->set_level(level);
            }
            continue;
        }

        const auto channel = parseChannel(name);
        if (!channel.has_value()) {
            spdlog::warn("Unknown log channel '{}', ignoring", name);
            continue;
        }
        get(channel.value())->set_level(level);
        spdlog::debug("Channel '{}' set to {}", name, spdlog::level::to_string_view(level));
    }
}

std::optional<LogChannel> LoggingChannels::parseChannel(const std::string& name)
{
    for (const LogChannel channel : kAllLogChannels) {
        if (name == toString(channel)) {
            return channel;
        }
    }
    return std::nullopt;
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    // Both spellings of warn and err, whichever the installed spdlog prefers.
    if (lower == "warning") {
        return spdlog::level::warn;
    }
    if (lower == "error") {
        return spdlog::level::err;
    }

    const auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
    return level;
}

} // namespace ArmySearch
