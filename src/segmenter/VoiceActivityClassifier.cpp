// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityClassifier.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace speechgate
{

VoiceActivityClassifier::VoiceActivityClassifier(std::unique_ptr<SpeechScorer> scorer,
                                                 float threshold,
                                                 int releaseFrames):
    _scorer(std::move(scorer)),
    _threshold(threshold),
    _negativeThreshold(std::max(threshold - 0.15f, 0.01f)),
    _releaseFrames(std::max(1, releaseFrames))
{
}

auto VoiceActivityClassifier::evaluate(const AudioFrame& frame) -> Result<Classification>
{
    if (!_scorer)
        return makeError(ErrorCode::InferenceError, "No speech scorer attached to the classifier");

    auto probability = _scorer->score(frame.view());
    if (!probability)
        return makeError(ErrorCode::InferenceError,
                         std::format("Scoring frame {} failed: {}", frame.sequence, probability.error().message));

    auto result = Classification {
        .decision = Decision::None,
        .isSpeechFrame = *probability >= _threshold,
        .probability = *probability,
    };

    if (!_triggered)
    {
        if (result.isSpeechFrame)
        {
            _triggered = true;
            _quietFrames = 0;
            result.decision = Decision::SpeechStarted;
        }
    }
    else
    {
        result.decision = Decision::Continuing;
        if (*probability < _negativeThreshold)
        {
            if (++_quietFrames >= _releaseFrames)
            {
                _triggered = false;
                _quietFrames = 0;
            }
        }
        else
        {
            _quietFrames = 0;
        }
    }

    log::trace("frame {}: p={:.3f} {}", frame.sequence, result.probability, decisionToString(result.decision));
    return result;
}

void VoiceActivityClassifier::rearm()
{
    _triggered = false;
    _quietFrames = 0;
}

} // namespace speechgate
