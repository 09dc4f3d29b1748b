// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioFrame.hpp>
#include <audio/SpeechScorer.hpp>
#include <core/Error.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

namespace speechgate
{

/// @brief What the classifier says about the speech region a frame belongs to.
enum class Decision : std::uint8_t
{
    None,
    SpeechStarted,
    Continuing,
};

[[nodiscard]] constexpr auto decisionToString(Decision decision) -> std::string_view
{
    switch (decision)
    {
        case Decision::None: return "none";
        case Decision::SpeechStarted: return "speech-started";
        case Decision::Continuing: return "continuing";
    }
    return "unknown";
}

/// @brief Result of classifying one frame.
struct Classification
{
    Decision decision = Decision::None;

    /// @brief Whether this frame's own score reached the threshold.
    bool isSpeechFrame = false;

    float probability = 0.0f;
};

/// @brief Turns per-frame speech probabilities into onset markers.
///
/// The onset latch follows the Silero iterator: the first frame at or above the threshold
/// reports SpeechStarted and arms the latch; while armed every frame reports Continuing;
/// the latch releases after releaseFrames consecutive frames below (threshold - 0.15).
/// The classifier never reports the end of speech; callers do their own silence accounting
/// with isSpeechFrame.
///
/// Not thread-safe: the scorer carries hidden state between frames.
class VoiceActivityClassifier
{
  public:
    /// @param scorer The model producing per-frame probabilities.
    /// @param threshold Speech probability threshold, in (0, 1).
    /// @param releaseFrames Quiet frames after which the onset latch releases by itself.
    VoiceActivityClassifier(std::unique_ptr<SpeechScorer> scorer, float threshold, int releaseFrames);

    VoiceActivityClassifier(const VoiceActivityClassifier&) = delete;
    VoiceActivityClassifier& operator=(const VoiceActivityClassifier&) = delete;

    /// @brief Scores @p frame and updates the onset latch.
    /// @return The classification or the scorer's InferenceError.
    [[nodiscard]] auto evaluate(const AudioFrame& frame) -> Result<Classification>;

    /// @brief Releases the onset latch so the next speech frame reports SpeechStarted.
    void rearm();

    [[nodiscard]] auto threshold() const -> float { return _threshold; }
    [[nodiscard]] auto negativeThreshold() const -> float { return _negativeThreshold; }
    [[nodiscard]] auto triggered() const -> bool { return _triggered; }

  private:
    std::unique_ptr<SpeechScorer> _scorer;
    float _threshold;
    float _negativeThreshold;
    int _releaseFrames;
    bool _triggered = false;
    int _quietFrames = 0;
};

} // namespace speechgate
