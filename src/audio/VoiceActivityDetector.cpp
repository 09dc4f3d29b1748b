// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityDetector.hpp"

#include <core/Log.hpp>

#include <whisper.h>

#include <algorithm>
#include <cmath>
#include <deque>
#include <format>
#include <vector>

namespace speechgate
{

namespace
{

    /// @brief Silero-VAD only runs at 16 kHz.
    constexpr auto SileroSampleRate = 16000;

    /// @brief whisper.cpp restarts the Silero LSTM on every detect call, so each frame is scored
    /// together with the preceding audio. Four 512-sample windows give 128 ms of context.
    constexpr auto SileroContextSamples = std::size_t { 4 * 512 };

    constexpr auto EnergyThreshold = 0.01f;

} // namespace

struct VoiceActivityDetector::Impl
{
    VoiceActivityDetectorConfig config;
    whisper_vad_context* vadContext = nullptr;
    std::deque<float> history;
    std::vector<float> window;
    bool initialized = false;

    ~Impl()
    {
        if (vadContext)
            whisper_vad_free(vadContext);
    }

    auto scoreWithModel(std::span<const float> samples) -> Result<float>
    {
        history.insert(history.end(), samples.begin(), samples.end());
        while (history.size() > SileroContextSamples)
            history.pop_front();

        window.assign(history.begin(), history.end());
        if (!whisper_vad_detect_speech(vadContext, window.data(), static_cast<int>(window.size())))
            return makeError(ErrorCode::InferenceError, "Silero-VAD failed to process frame");

        auto const count = whisper_vad_n_probs(vadContext);
        if (count <= 0)
            return makeError(ErrorCode::InferenceError, "Silero-VAD produced no probabilities");

        auto const probability = whisper_vad_probs(vadContext)[count - 1];
        if (!std::isfinite(probability))
            return makeError(ErrorCode::InferenceError, "Silero-VAD produced a non-finite probability");
        return std::clamp(probability, 0.0f, 1.0f);
    }
};

VoiceActivityDetector::VoiceActivityDetector(): _impl(std::make_unique<Impl>())
{
}

VoiceActivityDetector::~VoiceActivityDetector() = default;

auto VoiceActivityDetector::initialize(const VoiceActivityDetectorConfig& config) -> VoidResult
{
    _impl->config = config;

    if (config.modelPath.empty())
    {
        _impl->initialized = true;
        log::info("Voice activity detector initialized (energy-based, no model configured)");
        return {};
    }

    if (config.sampleRate != SileroSampleRate)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Silero-VAD requires a sample rate of {} Hz, got {} Hz",
                                     SileroSampleRate,
                                     config.sampleRate));

    auto params = whisper_vad_default_context_params();
    params.n_threads = std::max(1, config.threads);
    params.use_gpu = false;

    _impl->vadContext = whisper_vad_init_from_file_with_params(config.modelPath.c_str(), params);
    if (!_impl->vadContext)
        return makeError(ErrorCode::ModelLoadError,
                         std::format("Failed to load Silero-VAD model from '{}'", config.modelPath));

    _impl->initialized = true;
    log::info("Voice activity detector initialized (Silero-VAD: {})", config.modelPath);
    return {};
}

auto VoiceActivityDetector::score(std::span<const float> samples) -> Result<float>
{
    if (!_impl->initialized)
        return makeError(ErrorCode::InferenceError, "VAD not initialized");

    if (samples.empty())
        return 0.0f;

    if (_impl->vadContext)
        return _impl->scoreWithModel(samples);

    return energyProbability(samples);
}

auto VoiceActivityDetector::usesModel() const -> bool
{
    return _impl->vadContext != nullptr;
}

auto VoiceActivityDetector::energyProbability(std::span<const float> samples) -> float
{
    if (samples.empty())
        return 0.0f;

    auto energy = 0.0f;
    for (auto const sample: samples)
        energy += sample * sample;
    energy = std::sqrt(energy / static_cast<float>(samples.size()));

    return std::min(1.0f, energy / (EnergyThreshold * 2.0f));
}

} // namespace speechgate
