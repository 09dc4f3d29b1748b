// SPDX-License-Identifier: Apache-2.0
#include "SegmenterConfig.hpp"

#include <cmath>
#include <format>

namespace speechgate
{

auto validate(const SegmenterConfig& config) -> VoidResult
{
    if (!std::isfinite(config.threshold) || config.threshold <= 0.0f || config.threshold >= 1.0f)
        return makeError(ErrorCode::ConfigError,
                         std::format("threshold must be strictly between 0 and 1, got {}", config.threshold));

    if (config.minDurationMs <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("minDurationMs must be positive, got {}", config.minDurationMs));

    if (config.sampleRate <= 0 || config.sampleRate > MaxSampleRate)
        return makeError(
            ErrorCode::ConfigError,
            std::format("sampleRate must be between 1 and {} Hz, got {}", MaxSampleRate, config.sampleRate));

    if (config.frameDurationMs <= 0 || config.frameDurationMs > MaxFrameDurationMs)
        return makeError(ErrorCode::ConfigError,
                         std::format("frameDurationMs must be between 1 and {} ms, got {}",
                                     MaxFrameDurationMs,
                                     config.frameDurationMs));

    if (config.frameSamples() <= 0)
        return makeError(ErrorCode::ConfigError,
                         std::format("a {} ms frame at {} Hz contains no samples",
                                     config.frameDurationMs,
                                     config.sampleRate));

    if (config.silenceHangoverFrames <= 0)
        return makeError(
            ErrorCode::ConfigError,
            std::format("silenceHangoverFrames must be positive, got {}", config.silenceHangoverFrames));

    if (config.queueCapacity == 0)
        return makeError(ErrorCode::ConfigError, "queueCapacity must be positive");

    return {};
}

} // namespace speechgate
