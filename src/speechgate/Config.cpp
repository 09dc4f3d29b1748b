// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace speechgate
{

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\speechgate";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/speechgate";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/speechgate";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/speechgate";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} must contain a JSON object", path));

    auto config = AppConfig {};
    auto const defaults = SegmenterConfig {};

    // Segmenter section
    if (auto const* segmenter = json::find(root, "segmenter"))
    {
        config.segmenter.threshold = json::getFloatOr(*segmenter, "threshold", defaults.threshold);
        config.segmenter.minDurationMs = json::getIntOr(*segmenter, "minDurationMs", defaults.minDurationMs);
        config.segmenter.sampleRate = json::getIntOr(*segmenter, "sampleRate", defaults.sampleRate);
        config.segmenter.frameDurationMs =
            json::getIntOr(*segmenter, "frameDurationMs", defaults.frameDurationMs);
        config.segmenter.silenceHangoverFrames =
            json::getIntOr(*segmenter, "silenceHangoverFrames", defaults.silenceHangoverFrames);

        auto const capacity =
            json::getIntOr(*segmenter, "queueCapacity", static_cast<int>(defaults.queueCapacity));
        if (capacity < 0)
            return makeError(ErrorCode::ConfigError,
                             std::format("queueCapacity must not be negative, got {}", capacity));
        config.segmenter.queueCapacity = static_cast<std::size_t>(capacity);
    }

    // Capture section
    if (auto const* capture = json::find(root, "capture"))
        config.capture.deviceName = json::getStringOr(*capture, "deviceName", "");

    // Classifier section
    if (auto const* classifier = json::find(root, "classifier"))
    {
        config.classifier.vadModelPath = json::getStringOr(*classifier, "vadModelPath", "");
        config.classifier.threads = json::getIntOr(*classifier, "threads", 1);
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto segmenter = nlohmann::json::object();
    segmenter["threshold"] = config.segmenter.threshold;
    segmenter["minDurationMs"] = config.segmenter.minDurationMs;
    segmenter["sampleRate"] = config.segmenter.sampleRate;
    segmenter["frameDurationMs"] = config.segmenter.frameDurationMs;
    segmenter["silenceHangoverFrames"] = config.segmenter.silenceHangoverFrames;
    segmenter["queueCapacity"] = config.segmenter.queueCapacity;
    root["segmenter"] = std::move(segmenter);

    auto capture = nlohmann::json::object();
    if (!config.capture.deviceName.empty())
        capture["deviceName"] = config.capture.deviceName;
    root["capture"] = std::move(capture);

    auto classifier = nlohmann::json::object();
    if (!config.classifier.vadModelPath.empty())
        classifier["vadModelPath"] = config.classifier.vadModelPath;
    classifier["threads"] = config.classifier.threads;
    root["classifier"] = std::move(classifier);

    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::ConfigError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    auto ec = std::error_code {};
    if (!std::filesystem::exists(path, ec))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace speechgate
