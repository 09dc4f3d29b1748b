// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <cstdint>

namespace speechgate
{

/// @brief Parameters of one segmentation run. Fixed once the pipeline starts.
struct SegmenterConfig
{
    /// @brief Probability at or above which a frame counts as speech. Must be in (0, 1).
    float threshold = 0.5f;

    /// @brief Utterances shorter than this (wall clock, onset to close) produce no AUDIO line.
    int minDurationMs = 250;

    int sampleRate = 16000;
    int frameDurationMs = 10;

    /// @brief Consecutive non-speech frames that close an open utterance.
    int silenceHangoverFrames = 10;

    /// @brief Frames buffered between capture and processing before new frames are dropped.
    std::size_t queueCapacity = 100;

    /// @brief Samples delivered per frame.
    [[nodiscard]] auto frameSamples() const -> int
    {
        return static_cast<int>(static_cast<std::int64_t>(sampleRate) * frameDurationMs / 1000);
    }
};

/// @brief Highest capture rate accepted by validate().
constexpr auto MaxSampleRate = 384000;

/// @brief Longest frame accepted by validate().
constexpr auto MaxFrameDurationMs = 1000;

/// @brief Checks that @p config describes a runnable pipeline.
/// @return Success or a ConfigError naming the offending field.
[[nodiscard]] auto validate(const SegmenterConfig& config) -> VoidResult;

} // namespace speechgate
