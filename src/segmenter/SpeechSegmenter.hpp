// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioFrame.hpp>
#include <core/Error.hpp>
#include <segmenter/EventEmitter.hpp>
#include <segmenter/SegmenterConfig.hpp>
#include <segmenter/VoiceActivityClassifier.hpp>

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace speechgate
{

enum class Phase : std::uint8_t
{
    Idle,
    Speech,
};

[[nodiscard]] constexpr auto phaseToString(Phase phase) -> std::string_view
{
    switch (phase)
    {
        case Phase::Idle: return "idle";
        case Phase::Speech: return "speech";
    }
    return "unknown";
}

/// @brief Recording state of one pipeline, owned by its segmenter.
///
/// accumulatedFrames is non-empty whenever phase is Speech.
struct SegmenterState
{
    Phase phase = Phase::Idle;
    FrameClock::time_point speechStart {};
    std::vector<AudioFrame> accumulatedFrames;
    int silenceRunLength = 0;

    void reset()
    {
        phase = Phase::Idle;
        speechStart = {};
        accumulatedFrames.clear();
        silenceRunLength = 0;
    }
};

/// @brief A closed speech region, handed to the encoder and then dropped.
struct Utterance
{
    FrameClock::time_point start;
    FrameClock::time_point end;
    std::vector<AudioFrame> frames;

    [[nodiscard]] auto duration() const -> std::chrono::milliseconds
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    }
};

/// @brief Counters reported at shutdown.
struct SegmenterStats
{
    std::uint64_t framesProcessed = 0;
    std::uint64_t utterancesOpened = 0;
    std::uint64_t utterancesEmitted = 0;
    std::uint64_t utterancesDiscarded = 0;
};

/// @brief Groups classified frames into utterances and emits the protocol events.
///
/// Idle -> Speech on the classifier's onset marker. While in Speech every frame is kept,
/// speech frames reset the silence run, and silenceHangoverFrames consecutive non-speech
/// frames close the utterance. Closing always emits SPEECH_END; AUDIO precedes it when the
/// utterance lasted at least minDurationMs.
///
/// Single-threaded: all calls must come from the processing loop.
class SpeechSegmenter
{
  public:
    SpeechSegmenter(const SegmenterConfig& config, VoiceActivityClassifier& classifier, EventEmitter& emitter);

    SpeechSegmenter(const SpeechSegmenter&) = delete;
    SpeechSegmenter& operator=(const SpeechSegmenter&) = delete;

    /// @brief Classifies @p frame and advances the state machine.
    /// @return Success, the classifier's InferenceError, or an IoError from the emitter.
    ///         A classifier error leaves the state untouched.
    [[nodiscard]] auto process(AudioFrame frame) -> VoidResult;

    /// @brief Closes an open utterance as if the hangover had elapsed at @p now.
    ///
    /// Used on shutdown so that every SPEECH_START gets its SPEECH_END. No-op when idle.
    [[nodiscard]] auto finish(FrameClock::time_point now) -> VoidResult;

    [[nodiscard]] auto state() const -> const SegmenterState& { return _state; }
    [[nodiscard]] auto stats() const -> const SegmenterStats& { return _stats; }

  private:
    auto open(FrameClock::time_point timestamp) -> VoidResult;
    auto close(FrameClock::time_point now) -> VoidResult;

    SegmenterConfig _config;
    VoiceActivityClassifier& _classifier;
    EventEmitter& _emitter;
    SegmenterState _state;
    SegmenterStats _stats;
};

} // namespace speechgate
