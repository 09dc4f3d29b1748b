// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioPipeline.hpp>
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "TestSupport.hpp"

using namespace speechgate;
using namespace std::chrono_literals;

namespace
{

constexpr auto Silence = 0.1f;
constexpr auto Speech = 0.9f;

auto waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5s) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate())
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

/// @brief A pipeline wired to a ManualFrameSource and a SampleValueScorer.
///
/// Each delivered frame carries its own speech probability as sample value, so the test
/// thread never touches scorer state while the processing thread is scoring.
struct Rig
{
    std::ostringstream out;
    std::shared_ptr<test::ManualFrameSource::Shared> shared = std::make_shared<test::ManualFrameSource::Shared>();
    AudioPipeline pipeline;
    std::uint64_t sequence = 0;

    auto initialize(const SegmenterConfig& config = {}, std::optional<int> failAt = std::nullopt) -> VoidResult
    {
        return pipeline.initialize(config,
                                   std::make_unique<test::ManualFrameSource>(shared),
                                   std::make_unique<test::SampleValueScorer>(failAt),
                                   out);
    }

    void deliver(int count, float probability) { test::deliver(*shared, sequence, count, probability); }
};

/// @brief Captures log output, and the thread that wrote it, for the lifetime of the object.
class LogCapture
{
  public:
    explicit LogCapture(log::Level level = log::Level::Info): _previousLevel(log::getLevel())
    {
        log::setLevel(level);
        log::setCallback([this](log::Level /*level*/, std::string_view message) {
            auto lock = std::lock_guard(_mutex);
            _messages.emplace_back(message);
            _threads.push_back(std::this_thread::get_id());
        });
    }

    ~LogCapture()
    {
        log::setCallback({});
        log::setLevel(_previousLevel);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] auto contains(std::string_view needle) const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        for (auto const& message: _messages)
            if (message.find(needle) != std::string::npos)
                return true;
        return false;
    }

    /// @brief Number of messages captured so far.
    [[nodiscard]] auto size() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _messages.size();
    }

    /// @brief Number of messages from index @p first on that @p thread wrote.
    [[nodiscard]] auto countFrom(std::thread::id thread, std::size_t first) const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        auto n = std::size_t { 0 };
        for (auto i = first; i < _threads.size(); ++i)
            if (_threads[i] == thread)
                ++n;
        return n;
    }

  private:
    log::Level _previousLevel;
    mutable std::mutex _mutex;
    std::vector<std::string> _messages;
    std::vector<std::thread::id> _threads;
};

} // namespace

TEST_CASE("AudioPipeline segments frames delivered by the source", "[pipeline]")
{
    auto rig = Rig();
    REQUIRE(rig.initialize().has_value());
    REQUIRE(rig.pipeline.start().has_value());
    CHECK(rig.pipeline.isActive());
    CHECK(rig.shared->started);

    rig.deliver(5, Silence);
    rig.deliver(40, Speech);
    rig.deliver(15, Silence);

    REQUIRE(rig.pipeline.stop().has_value());
    CHECK(!rig.pipeline.isActive());
    CHECK(rig.shared->stopped);

    auto const events = test::lines(rig.out);
    REQUIRE(events.size() == 3);
    CHECK(events[0] == "SPEECH_START");
    CHECK(test::decodeAudioLine(events[1]).size() == 50 * test::FrameSamples);
    CHECK(events[2] == "SPEECH_END");

    auto const stats = rig.pipeline.stats();
    CHECK(stats.framesCaptured == 60);
    CHECK(stats.framesDropped == 0);
    CHECK(stats.segmenter.framesProcessed == 60);
    CHECK(stats.segmenter.utterancesEmitted == 1);
}

TEST_CASE("AudioPipeline stop closes an utterance that is still open", "[pipeline]")
{
    auto rig = Rig();
    REQUIRE(rig.initialize().has_value());
    REQUIRE(rig.pipeline.start().has_value());

    rig.deliver(5, Silence);
    rig.deliver(30, Speech);

    REQUIRE(rig.pipeline.stop().has_value());

    // Whether AUDIO is written depends on the wall clock at stop; the pair is always closed.
    auto const events = test::lines(rig.out);
    REQUIRE(events.size() >= 2);
    CHECK(events.front() == "SPEECH_START");
    CHECK(events.back() == "SPEECH_END");

    auto const stats = rig.pipeline.stats();
    CHECK(stats.segmenter.framesProcessed == 35);
    CHECK(stats.segmenter.utterancesOpened == 1);
    CHECK(stats.segmenter.utterancesEmitted + stats.segmenter.utterancesDiscarded == 1);
}

TEST_CASE("AudioPipeline reports a scoring failure", "[pipeline]")
{
    auto rig = Rig();
    REQUIRE(rig.initialize(SegmenterConfig {}, 3).has_value());
    REQUIRE(rig.pipeline.start().has_value());

    rig.deliver(5, Silence);
    REQUIRE(waitUntil([&] { return rig.pipeline.failed(); }));

    auto const failure = rig.pipeline.failure();
    REQUIRE(failure.has_value());
    CHECK(failure->code == ErrorCode::InferenceError);

    auto const stopped = rig.pipeline.stop();
    REQUIRE(!stopped.has_value());
    CHECK(stopped.error().code == ErrorCode::InferenceError);
    CHECK(test::lines(rig.out).empty());
}

TEST_CASE("AudioPipeline propagates a source start failure", "[pipeline]")
{
    auto rig = Rig();
    rig.shared->startError = Error { ErrorCode::AudioError, "no microphone" };
    REQUIRE(rig.initialize().has_value());

    auto const started = rig.pipeline.start();
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::AudioError);
    CHECK(started.error().message == "no microphone");
    CHECK(!rig.pipeline.isActive());
    CHECK(rig.pipeline.stop().has_value());
}

TEST_CASE("AudioPipeline rejects an invalid configuration", "[pipeline]")
{
    auto config = SegmenterConfig {};
    config.threshold = 1.5f;

    auto rig = Rig();
    auto const result = rig.initialize(config);
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    auto const started = rig.pipeline.start();
    REQUIRE(!started.has_value());
    CHECK(started.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("AudioPipeline requires a source and a scorer", "[pipeline]")
{
    auto out = std::ostringstream {};
    auto shared = std::make_shared<test::ManualFrameSource::Shared>();

    SECTION("missing source")
    {
        auto pipeline = AudioPipeline();
        auto const result =
            pipeline.initialize(SegmenterConfig {}, nullptr, std::make_unique<test::SampleValueScorer>(), out);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("missing scorer")
    {
        auto pipeline = AudioPipeline();
        auto const result = pipeline.initialize(
            SegmenterConfig {}, std::make_unique<test::ManualFrameSource>(shared), nullptr, out);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("AudioPipeline can only be started once", "[pipeline]")
{
    auto rig = Rig();
    REQUIRE(rig.initialize().has_value());
    REQUIRE(rig.pipeline.start().has_value());
    CHECK(!rig.pipeline.start().has_value());
    REQUIRE(rig.pipeline.stop().has_value());
    CHECK(!rig.pipeline.start().has_value());
}

TEST_CASE("AudioPipeline keeps diagnostics off the event stream", "[pipeline]")
{
    auto const capture = LogCapture();

    auto rig = Rig();
    REQUIRE(rig.initialize().has_value());
    REQUIRE(rig.pipeline.start().has_value());
    rig.deliver(30, Speech);
    rig.deliver(10, Silence);
    REQUIRE(rig.pipeline.stop().has_value());

    CHECK(capture.contains("Recording started"));
    CHECK(capture.contains("Recording stopped"));

    for (auto const& line: test::lines(rig.out))
        CHECK((line == "SPEECH_START" || line == "SPEECH_END" || line.starts_with("AUDIO:")));
}

TEST_CASE("AudioPipeline accounts for every captured frame", "[pipeline]")
{
    auto config = SegmenterConfig {};
    config.queueCapacity = 2;

    auto rig = Rig();
    REQUIRE(rig.initialize(config).has_value());
    REQUIRE(rig.pipeline.start().has_value());
    rig.deliver(200, Silence);
    REQUIRE(rig.pipeline.stop().has_value());

    auto const stats = rig.pipeline.stats();
    CHECK(stats.framesCaptured == 200);
    CHECK(stats.segmenter.framesProcessed + stats.framesDropped == 200);
}

TEST_CASE("AudioPipeline does not log from the capture callback", "[pipeline]")
{
    auto const capture = LogCapture(log::Level::Trace);

    auto config = SegmenterConfig {};
    config.queueCapacity = 1;

    auto rig = Rig();
    REQUIRE(rig.initialize(config).has_value());
    REQUIRE(rig.pipeline.start().has_value());

    // Frames are delivered on this thread, standing in for the device thread.
    auto const first = capture.size();
    rig.deliver(100, Speech);
    rig.deliver(100, Silence);
    auto const deliveringThreadMessages = capture.countFrom(std::this_thread::get_id(), first);

    REQUIRE(rig.pipeline.stop().has_value());

    CHECK(deliveringThreadMessages == 0);
    CHECK(capture.contains("dropped"));
    CHECK(rig.pipeline.stats().framesCaptured == 200);
}
