// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <string_view>

// All diagnostic output of the process goes through this module. The event protocol owns
// stdout, so the default sink is stderr.
namespace speechgate::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Callback type that receives all log messages.
/// @param level The log level of the message.
/// @param message The formatted log message text (without level prefix).
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Sets a callback that receives all log messages.
///
/// When set, log messages are routed to the callback instead of stderr.
/// Pass an empty/nullptr callback to revert to stderr output.
void setCallback(LogCallback callback);

/// @brief Sets the global log verbosity level.
void setLevel(Level level);

/// @brief Returns the current global log verbosity level.
[[nodiscard]] auto getLevel() -> Level;

/// @brief Maps a repeated -v count to a level (0 = Info, 1 = Debug, 2+ = Trace).
[[nodiscard]] auto levelFromVerbosity(int verbosity) -> Level;

/// @brief Returns the five-character prefix used for a level on stderr.
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Returns true if messages at @p level are currently written.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Writes a log message at the given level.
///
/// Safe to call from the capture thread and the processing thread concurrently.
void write(Level level, std::string_view message);

/// @brief Logs a failure that ends an operation.
template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Error))
        write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a recoverable problem, such as a skipped capture period.
template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Warning))
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a lifecycle message (device opened, recording started or stopped).
template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Info))
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs per-utterance detail. Enabled with -v.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs per-frame detail. Enabled with -vv.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Trace))
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace speechgate::log
