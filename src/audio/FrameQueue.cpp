// SPDX-License-Identifier: Apache-2.0
#include "FrameQueue.hpp"

#include <algorithm>

namespace speechgate
{

FrameQueue::FrameQueue(std::size_t capacity): _capacity(std::max<std::size_t>(capacity, 1))
{
}

auto FrameQueue::push(AudioFrame frame) -> bool
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_frames.size() >= _capacity)
        {
            _dropped.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        _frames.push_back(std::move(frame));
    }

    _pushed.fetch_add(1, std::memory_order_relaxed);
    _available.notify_one();
    return true;
}

auto FrameQueue::pop(std::chrono::milliseconds timeout) -> std::optional<AudioFrame>
{
    auto lock = std::unique_lock(_mutex);
    if (!_available.wait_for(lock, timeout, [this] { return !_frames.empty(); }))
        return std::nullopt;

    auto frame = std::move(_frames.front());
    _frames.pop_front();
    return frame;
}

auto FrameQueue::tryPop() -> std::optional<AudioFrame>
{
    auto lock = std::lock_guard(_mutex);
    if (_frames.empty())
        return std::nullopt;

    auto frame = std::move(_frames.front());
    _frames.pop_front();
    return frame;
}

auto FrameQueue::size() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _frames.size();
}

auto FrameQueue::pushedFrames() const noexcept -> std::uint64_t
{
    return _pushed.load(std::memory_order_relaxed);
}

auto FrameQueue::droppedFrames() const noexcept -> std::uint64_t
{
    return _dropped.load(std::memory_order_relaxed);
}

} // namespace speechgate
