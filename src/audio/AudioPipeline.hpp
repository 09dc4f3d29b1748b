// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/FrameSource.hpp>
#include <audio/SpeechScorer.hpp>
#include <core/Error.hpp>
#include <segmenter/SegmenterConfig.hpp>
#include <segmenter/SpeechSegmenter.hpp>

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>

namespace speechgate
{

/// @brief Counters of a pipeline run.
struct PipelineStats
{
    std::uint64_t framesCaptured = 0;
    std::uint64_t framesDropped = 0;
    SegmenterStats segmenter;
};

/// @brief Orchestrates capture, classification, segmentation and event output.
///
/// The frame source pushes into a bounded FrameQueue from its own thread; a single
/// processing thread pops frames, runs the classifier and the segmenter, and writes events.
/// stop() stops the source, processes the frames still queued, force-closes any open
/// utterance and joins the processing thread.
class AudioPipeline
{
  public:
    AudioPipeline();
    ~AudioPipeline();

    AudioPipeline(const AudioPipeline&) = delete;
    AudioPipeline& operator=(const AudioPipeline&) = delete;

    /// @brief Wires the pipeline components together.
    /// @param config Segmentation parameters; validated here.
    /// @param source Producer of capture frames.
    /// @param scorer Speech model used by the classifier.
    /// @param events Stream receiving protocol lines. Must outlive the pipeline.
    /// @return Success or a ConfigError.
    [[nodiscard]] auto initialize(const SegmenterConfig& config,
                                  std::unique_ptr<FrameSource> source,
                                  std::unique_ptr<SpeechScorer> scorer,
                                  std::ostream& events) -> VoidResult;

    /// @brief Starts the processing thread and the frame source.
    /// @return Success or the source's error.
    [[nodiscard]] auto start() -> VoidResult;

    /// @brief Stops the pipeline and closes any open utterance.
    /// @return Success, or the error that ended the run early.
    auto stop() -> VoidResult;

    /// @brief Returns true between a successful start() and stop().
    [[nodiscard]] auto isActive() const -> bool;

    /// @brief Returns true once the processing thread has given up on a fatal error.
    [[nodiscard]] auto failed() const -> bool;

    /// @brief Returns the fatal error of the run, if any.
    [[nodiscard]] auto failure() const -> std::optional<Error>;

    /// @brief Returns the run counters. Segmenter counters are final only after stop().
    [[nodiscard]] auto stats() const -> PipelineStats;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace speechgate
