// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace speechgate
{

/// @brief Failure categories of the segmentation pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument, ///< Misuse of an API, e.g. starting a pipeline twice.
    IoError,         ///< The event stream could not be written.
    ConfigError,     ///< Unreadable config file or out-of-range setting.
    ModelLoadError,  ///< The speech model could not be loaded.
    InferenceError,  ///< The speech model failed on a frame.
    AudioError,      ///< The capture device could not be opened, started or enumerated.
};

/// @brief Returns a short lowercase name for @p code, used in log output.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::ModelLoadError: return "model-load";
        case ErrorCode::InferenceError: return "inference";
        case ErrorCode::AudioError: return "audio";
    }
    return "unknown";
}

/// @brief An error code plus a human readable message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Either a value or the Error that prevented it.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Success or an Error.
using VoidResult = std::expected<void, Error>;

/// @brief Builds the unexpected side of a Result.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace speechgate

template <>
struct std::formatter<speechgate::Error>: std::formatter<std::string>
{
    auto format(const speechgate::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("{} error: {}", speechgate::errorCodeName(error.code), error.message), ctx);
    }
};
