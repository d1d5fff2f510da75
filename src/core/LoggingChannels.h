#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <array>
#include <atomic>
#include <cassert>
#include <memory>
#include <mutex>
#include <optional>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace ArmySearch {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel {
    Balance,
    Config,
    Evaluation,
    Evolution,
    Island,
    Operators
};

inline constexpr std::array<LogChannel, 6> kAllLogChannels = {
    LogChannel::Balance,    LogChannel::Config, LogChannel::Evaluation,
    LogChannel::Evolution,  LogChannel::Island, LogChannel::Operators,
};

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Balance:
            return "balance";
        case LogChannel::Config:
            return "config";
        case LogChannel::Evaluation:
            return "evaluation";
        case LogChannel::Evolution:
            return "evolution";
        case LogChannel::Island:
            return "island";
        case LogChannel::Operators:
            return "operators";
    }
    assert(false && "Unhandled LogChannel in switch");
    return "";
}

// Operators log once per child, so they start quieter than the rest.
inline spdlog::level::level_enum defaultLevel(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Evolution:
            return spdlog::level::debug;
        case LogChannel::Operators:
            return spdlog::level::warn;
        default:
            return spdlog::level::info;
    }
}

/**
 * @brief Named spdlog loggers for the search subsystems.
 *
 * Every channel writes to one console sink and one file sink (armysearch.log), so
 * a long run can be traced per concern by raising a single channel's level.
 */
class LoggingChannels {
public:
    /**
     * @brief Create the shared sinks and one logger per channel.
     * @param componentName Prefix in every line, e.g. "survey"; "default" omits it.
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default");

    // Initializes with defaults on first use.
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Set channel levels from "channel:level,channel2:level2".
     * "*" addresses every channel, so "*:off,operators:trace" traces operators only.
     * Malformed entries and unknown channels are skipped with a warning.
     */
    static void configureFromString(const std::string& spec);

    static std::optional<LogChannel> parseChannel(const std::string& name);
    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    static std::atomic<bool> initialized_;
    static std::mutex initMutex_;
};

// Undefine any existing LOG_* macros.
#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::ArmySearch::LoggingChannels::get(::ArmySearch::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::ArmySearch::LoggingChannels::get(::ArmySearch::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::ArmySearch::LoggingChannels::get(::ArmySearch::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::ArmySearch::LoggingChannels::get(::ArmySearch::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::ArmySearch::LoggingChannels::get(::ArmySearch::LogChannel::channel), __VA_ARGS__)

} // namespace ArmySearch
