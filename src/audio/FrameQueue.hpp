// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioFrame.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace speechgate
{

/// @brief Bounded single-producer/single-consumer hand-off between the capture callback and
/// the processing loop.
///
/// push() never waits for space. When the queue is full the incoming frame is dropped and
/// counted; frames already queued are kept, so the consumer sees a gap rather than a reorder.
class FrameQueue
{
  public:
    explicit FrameQueue(std::size_t capacity);

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    /// @brief Enqueues a frame without waiting.
    /// @return false if the queue was full and the frame was dropped.
    auto push(AudioFrame frame) -> bool;

    /// @brief Waits up to @p timeout for a frame.
    /// @return The oldest frame, or std::nullopt if none arrived in time.
    [[nodiscard]] auto pop(std::chrono::milliseconds timeout) -> std::optional<AudioFrame>;

    /// @brief Returns the oldest frame if one is queued, without waiting.
    [[nodiscard]] auto tryPop() -> std::optional<AudioFrame>;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _capacity; }

    /// @brief Number of frames accepted since construction.
    [[nodiscard]] auto pushedFrames() const noexcept -> std::uint64_t;

    /// @brief Number of frames rejected because the queue was full.
    [[nodiscard]] auto droppedFrames() const noexcept -> std::uint64_t;

  private:
    std::size_t _capacity;
    mutable std::mutex _mutex;
    std::condition_variable _available;
    std::deque<AudioFrame> _frames;
    std::atomic<std::uint64_t> _pushed { 0 };
    std::atomic<std::uint64_t> _dropped { 0 };
};

} // namespace speechgate
