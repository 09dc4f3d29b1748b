// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <segmenter/SegmenterConfig.hpp>

#include <string>
#include <string_view>

namespace speechgate
{

/// @brief Capture device section.
struct CaptureConfig
{
    /// @brief Case-insensitive substring of the capture device name. Empty auto-selects.
    std::string deviceName;
};

/// @brief Speech model section.
struct ClassifierConfig
{
    /// @brief Path to a Silero-VAD GGML model. Empty uses the energy detector.
    std::string vadModelPath;
    int threads = 1;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    SegmenterConfig segmenter;
    CaptureConfig capture;
    ClassifierConfig classifier;
};

/// @brief Loads the configuration from the default config path, or defaults if it does not exist.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
/// @param path The path to the JSON config file.
/// @return The loaded configuration or a ConfigError. Values are not validated here.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the configuration to a file, creating the parent directory if needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

} // namespace speechgate
