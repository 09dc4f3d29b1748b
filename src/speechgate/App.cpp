// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioCapture.hpp>
#include <audio/AudioPipeline.hpp>
#include <audio/VoiceActivityDetector.hpp>
#include <core/Log.hpp>

#include <chrono>
#include <format>
#include <thread>

namespace speechgate
{

namespace
{

    /// @brief How often run() checks for an interrupt or a failed pipeline.
    constexpr auto WaitInterval = std::chrono::milliseconds { 100 };

} // namespace

struct App::Impl
{
    AppConfig config;
    std::ostream& events;
    AudioPipeline pipeline;

    Impl(AppConfig cfg, std::ostream& out): config(std::move(cfg)), events(out) {}
};

App::App(AppConfig config, std::ostream& events): _impl(std::make_unique<Impl>(std::move(config), events))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto const& config = _impl->config;

    if (auto valid = validate(config.segmenter); !valid)
        return valid;

    auto detector = std::make_unique<VoiceActivityDetector>();
    auto detectorResult = detector->initialize(VoiceActivityDetectorConfig {
        .modelPath = config.classifier.vadModelPath,
        .sampleRate = config.segmenter.sampleRate,
        .threads = config.classifier.threads,
    });
    if (!detectorResult)
        return detectorResult;
    if (!detector->usesModel())
        log::warning("No Silero-VAD model configured, speech detection falls back to signal energy");

    auto capture = std::make_unique<AudioCapture>();
    auto captureResult = capture->initialize(CaptureOptions {
        .deviceName = config.capture.deviceName,
        .sampleRate = config.segmenter.sampleRate,
        .frameSamples = config.segmenter.frameSamples(),
    });
    if (!captureResult)
        return captureResult;

    return _impl->pipeline.initialize(config.segmenter, std::move(capture), std::move(detector), _impl->events);
}

auto App::run(const std::function<bool()>& stopRequested) -> int
{
    if (auto started = _impl->pipeline.start(); !started)
    {
        log::error("Failed to start recording: {}", started.error());
        return 1;
    }

    while (!stopRequested() && !_impl->pipeline.failed())
        std::this_thread::sleep_for(WaitInterval);

    if (auto stopped = _impl->pipeline.stop(); !stopped)
    {
        log::error("Run failed: {}", stopped.error());
        return 1;
    }

    return 0;
}

auto formatDeviceList(const std::vector<std::string>& names) -> std::string
{
    if (names.empty())
        return "No capture devices found\n";

    auto text = std::string {};
    for (auto i = std::size_t { 0 }; i < names.size(); ++i)
        text += std::format("  [{}] {}\n", i, names[i]);
    return text;
}

} // namespace speechgate
