// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/SpeechScorer.hpp>
#include <core/Error.hpp>

#include <memory>
#include <span>
#include <string>

namespace speechgate
{

/// @brief Settings for the voice activity detector.
struct VoiceActivityDetectorConfig
{
    /// @brief Path to a Silero-VAD GGML model. Empty selects the energy detector.
    std::string modelPath;
    int sampleRate = 16000;
    int threads = 1;
};

/// @brief Voice Activity Detection using Silero-VAD (via whisper.cpp's GGML implementation),
/// with an RMS energy detector when no model is configured.
class VoiceActivityDetector final: public SpeechScorer
{
  public:
    VoiceActivityDetector();
    ~VoiceActivityDetector() override;

    VoiceActivityDetector(const VoiceActivityDetector&) = delete;
    VoiceActivityDetector& operator=(const VoiceActivityDetector&) = delete;

    /// @brief Loads the model, if any.
    /// @return Success or a ModelLoadError.
    [[nodiscard]] auto initialize(const VoiceActivityDetectorConfig& config) -> VoidResult;

    /// @brief Processes one frame and returns the speech probability.
    [[nodiscard]] auto score(std::span<const float> samples) -> Result<float> override;

    /// @brief Returns true if a Silero model is loaded.
    [[nodiscard]] auto usesModel() const -> bool;

    /// @brief Maps the RMS energy of @p samples to a pseudo-probability in [0, 1].
    ///
    /// An RMS of 0.01 maps to 0.5, saturating at 0.02.
    [[nodiscard]] static auto energyProbability(std::span<const float> samples) -> float;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace speechgate
