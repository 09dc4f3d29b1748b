// SPDX-License-Identifier: Apache-2.0
#include "SpeechSegmenter.hpp"

#include <core/Log.hpp>
#include <segmenter/UtteranceEncoder.hpp>

namespace speechgate
{

SpeechSegmenter::SpeechSegmenter(const SegmenterConfig& config,
                                 VoiceActivityClassifier& classifier,
                                 EventEmitter& emitter):
    _config(config), _classifier(classifier), _emitter(emitter)
{
}

auto SpeechSegmenter::process(AudioFrame frame) -> VoidResult
{
    auto classification = _classifier.evaluate(frame);
    if (!classification)
        return std::unexpected(classification.error());

    ++_stats.framesProcessed;

    // Onset markers only matter when idle; a re-entrant onset never resets the buffer.
    auto opened = VoidResult {};
    if (classification->decision == Decision::SpeechStarted && _state.phase == Phase::Idle)
        opened = open(frame.timestamp);

    if (_state.phase == Phase::Idle)
        return {};

    auto const timestamp = frame.timestamp;
    _state.accumulatedFrames.push_back(std::move(frame));

    if (classification->isSpeechFrame)
    {
        _state.silenceRunLength = 0;
        return opened;
    }

    if (++_state.silenceRunLength >= _config.silenceHangoverFrames)
    {
        auto closed = close(timestamp);
        if (!opened)
            return opened;
        return closed;
    }

    return opened;
}

auto SpeechSegmenter::finish(FrameClock::time_point now) -> VoidResult
{
    if (_state.phase != Phase::Speech)
        return {};

    log::debug("Force-closing utterance in phase {} ({} frames)",
               phaseToString(_state.phase),
               _state.accumulatedFrames.size());
    return close(now);
}

auto SpeechSegmenter::open(FrameClock::time_point timestamp) -> VoidResult
{
    _state.phase = Phase::Speech;
    _state.speechStart = timestamp;
    _state.accumulatedFrames.clear();
    _state.silenceRunLength = 0;
    ++_stats.utterancesOpened;

    return _emitter.speechStart();
}

auto SpeechSegmenter::close(FrameClock::time_point now) -> VoidResult
{
    auto utterance = Utterance {
        .start = _state.speechStart,
        .end = now,
        .frames = std::move(_state.accumulatedFrames),
    };
    _state.reset();
    _classifier.rearm();

    auto const durationMs = utterance.duration().count();
    auto audioResult = VoidResult {};

    if (durationMs >= _config.minDurationMs && !utterance.frames.empty())
    {
        log::debug("Utterance closed after {} ms ({} frames)", durationMs, utterance.frames.size());
        audioResult = _emitter.audio(encoder::encode(utterance.frames));
        ++_stats.utterancesEmitted;
    }
    else
    {
        log::debug("Utterance of {} ms is shorter than {} ms, discarding", durationMs, _config.minDurationMs);
        ++_stats.utterancesDiscarded;
    }

    auto endResult = _emitter.speechEnd();
    if (!audioResult)
        return audioResult;
    return endResult;
}

} // namespace speechgate
