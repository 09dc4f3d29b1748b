// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <span>

namespace speechgate
{

/// @brief Opaque per-frame speech model.
///
/// Implementations may carry hidden state across calls and are not safe for concurrent use.
class SpeechScorer
{
  public:
    virtual ~SpeechScorer() = default;

    /// @brief Scores one frame.
    /// @param samples Mono float32 PCM.
    /// @return Speech probability in [0, 1] or an InferenceError.
    [[nodiscard]] virtual auto score(std::span<const float> samples) -> Result<float> = 0;
};

} // namespace speechgate
