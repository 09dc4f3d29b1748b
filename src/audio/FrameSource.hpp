// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioFrame.hpp>
#include <core/Error.hpp>

#include <functional>
#include <span>

namespace speechgate
{

/// @brief Callback invoked once per capture period.
/// @param samples Mono float32 PCM of exactly one frame. Only valid during the call.
/// @param timestamp When the period was delivered.
using FrameCallback = std::function<void(std::span<const float> samples, FrameClock::time_point timestamp)>;

/// @brief A producer of fixed-size audio frames at a fixed sample rate.
///
/// The callback runs on the source's own (real-time) thread and must return quickly.
class FrameSource
{
  public:
    virtual ~FrameSource() = default;

    /// @brief Starts delivering frames to @p callback.
    [[nodiscard]] virtual auto start(FrameCallback callback) -> VoidResult = 0;

    /// @brief Stops delivery. No callback is running or will run once this returns.
    virtual void stop() = 0;
};

} // namespace speechgate
