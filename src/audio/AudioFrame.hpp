// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

namespace speechgate
{

/// @brief Clock used for frame timestamps and utterance durations.
using FrameClock = std::chrono::steady_clock;

/// @brief One capture period of mono float32 PCM audio.
///
/// Frames are moved from stage to stage (capture callback, queue, segmenter) and never shared.
struct AudioFrame
{
    std::vector<float> samples;

    /// @brief Arrival order, assigned by the capture side starting at 0.
    std::uint64_t sequence = 0;

    /// @brief Time at which the capture callback delivered the period.
    FrameClock::time_point timestamp {};

    [[nodiscard]] auto view() const -> std::span<const float> { return samples; }
    [[nodiscard]] auto size() const -> std::size_t { return samples.size(); }
};

} // namespace speechgate
