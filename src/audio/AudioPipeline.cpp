// SPDX-License-Identifier: Apache-2.0
#include "AudioPipeline.hpp"

#include <audio/FrameQueue.hpp>
#include <core/Log.hpp>
#include <segmenter/EventEmitter.hpp>
#include <segmenter/VoiceActivityClassifier.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace speechgate
{

namespace
{

    /// @brief How long the processing thread waits for a frame before re-checking for stop.
    constexpr auto PollInterval = std::chrono::milliseconds { 100 };

    /// @brief Quiet time after which the classifier's onset latch releases on its own.
    constexpr auto LatchReleaseMs = 100;

} // namespace

struct AudioPipeline::Impl
{
    SegmenterConfig config;
    std::unique_ptr<FrameSource> source;
    std::unique_ptr<FrameQueue> queue;
    std::unique_ptr<VoiceActivityClassifier> classifier;
    std::unique_ptr<EventEmitter> emitter;
    std::unique_ptr<SpeechSegmenter> segmenter;

    std::jthread worker;
    std::atomic<bool> active { false };
    std::atomic<bool> workerDone { false };
    std::atomic<bool> fatal { false };
    bool initialized = false;

    mutable std::mutex failureMutex;
    std::optional<Error> failure;

    // Touched only by the source's callback thread.
    std::uint64_t nextSequence = 0;

    /// @brief Capture glue: copies the period into a frame and hands it over without waiting.
    /// Runs on the device thread, so it never logs.
    void onFrame(std::span<const float> samples, FrameClock::time_point timestamp)
    {
        auto frame = AudioFrame {
            .samples = std::vector<float>(samples.begin(), samples.end()),
            .sequence = nextSequence++,
            .timestamp = timestamp,
        };
        // A full queue drops the frame and counts it; stop() reports the total.
        queue->push(std::move(frame));
    }

    void fail(Error error)
    {
        log::error("Processing stopped: {}", error);
        {
            auto lock = std::lock_guard(failureMutex);
            if (!failure)
                failure = std::move(error);
        }
        fatal.store(true, std::memory_order_release);
    }

    /// @brief Processing loop. The only thread that touches the classifier and segmenter.
    void run(const std::stop_token& stopToken)
    {
        auto healthy = true;

        while (healthy && !stopToken.stop_requested())
        {
            auto frame = queue->pop(PollInterval);
            if (!frame)
                continue;

            if (auto result = segmenter->process(std::move(*frame)); !result)
            {
                fail(std::move(result.error()));
                healthy = false;
            }
        }

        // The source is stopped before stop is requested, so the queue only shrinks now.
        while (healthy)
        {
            auto frame = queue->tryPop();
            if (!frame)
                break;

            if (auto result = segmenter->process(std::move(*frame)); !result)
            {
                fail(std::move(result.error()));
                healthy = false;
            }
        }

        if (auto result = segmenter->finish(FrameClock::now()); !result)
            fail(std::move(result.error()));

        workerDone.store(true, std::memory_order_release);
    }
};

AudioPipeline::AudioPipeline(): _impl(std::make_unique<Impl>())
{
}

AudioPipeline::~AudioPipeline()
{
    stop();
}

auto AudioPipeline::initialize(const SegmenterConfig& config,
                               std::unique_ptr<FrameSource> source,
                               std::unique_ptr<SpeechScorer> scorer,
                               std::ostream& events) -> VoidResult
{
    if (_impl->initialized)
        return makeError(ErrorCode::InvalidArgument, "Audio pipeline already initialized");

    if (auto valid = validate(config); !valid)
        return valid;

    if (!source)
        return makeError(ErrorCode::InvalidArgument, "Audio pipeline needs a frame source");
    if (!scorer)
        return makeError(ErrorCode::InvalidArgument, "Audio pipeline needs a speech scorer");

    auto const releaseFrames = std::max(1, LatchReleaseMs / config.frameDurationMs);

    _impl->config = config;
    _impl->source = std::move(source);
    _impl->queue = std::make_unique<FrameQueue>(config.queueCapacity);
    _impl->classifier =
        std::make_unique<VoiceActivityClassifier>(std::move(scorer), config.threshold, releaseFrames);
    _impl->emitter = std::make_unique<EventEmitter>(events);
    _impl->segmenter = std::make_unique<SpeechSegmenter>(config, *_impl->classifier, *_impl->emitter);
    _impl->initialized = true;

    log::info("Audio pipeline initialized (threshold {}, min duration {} ms, {} Hz, {} ms frames, hangover {} "
              "frames, queue {} frames)",
              config.threshold,
              config.minDurationMs,
              config.sampleRate,
              config.frameDurationMs,
              config.silenceHangoverFrames,
              _impl->queue->capacity());
    return {};
}

auto AudioPipeline::start() -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::InvalidArgument, "Audio pipeline not initialized");

    if (_impl->active || _impl->workerDone)
        return makeError(ErrorCode::InvalidArgument, "Audio pipeline can only be started once");

    _impl->worker = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->run(token); });

    auto result = _impl->source->start([impl = _impl.get()](std::span<const float> samples,
                                                            FrameClock::time_point timestamp) {
        impl->onFrame(samples, timestamp);
    });
    if (!result)
    {
        _impl->worker.request_stop();
        _impl->worker.join();
        return result;
    }

    _impl->active = true;
    log::info("Recording started");
    return {};
}

auto AudioPipeline::stop() -> VoidResult
{
    if (!_impl->active.exchange(false))
        return {};

    // Order matters: no producer, then drain and force-close on the processing thread, then join.
    _impl->source->stop();
    _impl->worker.request_stop();
    _impl->worker.join();

    auto const stats = this->stats();
    log::info("Recording stopped ({} frames captured, {} dropped, {} utterances emitted, {} discarded)",
              stats.framesCaptured,
              stats.framesDropped,
              stats.segmenter.utterancesEmitted,
              stats.segmenter.utterancesDiscarded);

    if (auto error = failure(); error)
        return std::unexpected(std::move(*error));
    return {};
}

auto AudioPipeline::isActive() const -> bool
{
    return _impl->active;
}

auto AudioPipeline::failed() const -> bool
{
    return _impl->fatal.load(std::memory_order_acquire);
}

auto AudioPipeline::failure() const -> std::optional<Error>
{
    auto lock = std::lock_guard(_impl->failureMutex);
    return _impl->failure;
}

auto AudioPipeline::stats() const -> PipelineStats
{
    auto stats = PipelineStats {};
    if (!_impl->queue)
        return stats;

    stats.framesCaptured = _impl->queue->pushedFrames() + _impl->queue->droppedFrames();
    stats.framesDropped = _impl->queue->droppedFrames();
    if (_impl->workerDone.load(std::memory_order_acquire))
        stats.segmenter = _impl->segmenter->stats();
    return stats;
}

} // namespace speechgate
