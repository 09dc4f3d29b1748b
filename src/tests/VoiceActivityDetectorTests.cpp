// SPDX-License-Identifier: Apache-2.0
#include <audio/VoiceActivityDetector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <vector>

using namespace speechgate;

namespace
{

auto constant(float value, std::size_t count = 160) -> std::vector<float>
{
    return std::vector<float>(count, value);
}

auto near(float a, float b) -> bool
{
    return std::abs(a - b) < 1e-4f;
}

} // namespace

TEST_CASE("VoiceActivityDetector::energyProbability maps RMS energy to [0, 1]", "[vad]")
{
    CHECK(VoiceActivityDetector::energyProbability(constant(0.0f)) == 0.0f);
    CHECK(near(VoiceActivityDetector::energyProbability(constant(0.01f)), 0.5f));
    CHECK(near(VoiceActivityDetector::energyProbability(constant(-0.01f)), 0.5f));
    CHECK(near(VoiceActivityDetector::energyProbability(constant(0.005f)), 0.25f));
    CHECK(VoiceActivityDetector::energyProbability(constant(0.5f)) == 1.0f);
    CHECK(VoiceActivityDetector::energyProbability({}) == 0.0f);
}

TEST_CASE("VoiceActivityDetector refuses to score before initialization", "[vad]")
{
    auto detector = VoiceActivityDetector();
    auto const result = detector.score(constant(0.1f));
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::InferenceError);
}

TEST_CASE("VoiceActivityDetector falls back to energy without a model", "[vad]")
{
    auto detector = VoiceActivityDetector();
    REQUIRE(detector.initialize(VoiceActivityDetectorConfig {}).has_value());
    CHECK(!detector.usesModel());

    auto const quiet = detector.score(constant(0.0f));
    REQUIRE(quiet.has_value());
    CHECK(*quiet == 0.0f);

    auto const loud = detector.score(constant(0.3f));
    REQUIRE(loud.has_value());
    CHECK(*loud == 1.0f);

    auto const empty = detector.score({});
    REQUIRE(empty.has_value());
    CHECK(*empty == 0.0f);
}

TEST_CASE("VoiceActivityDetector rejects a model at an unsupported sample rate", "[vad]")
{
    auto detector = VoiceActivityDetector();
    auto const result = detector.initialize(VoiceActivityDetectorConfig {
        .modelPath = "/tmp/silero-vad.ggml",
        .sampleRate = 8000,
    });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ModelLoadError);
    CHECK(!detector.usesModel());
}

TEST_CASE("VoiceActivityDetector reports a missing model file", "[vad]")
{
    auto detector = VoiceActivityDetector();
    auto const result = detector.initialize(VoiceActivityDetectorConfig {
        .modelPath = "/nonexistent/path/silero-vad.ggml",
    });
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ModelLoadError);

    auto const scored = detector.score(constant(0.1f));
    REQUIRE(!scored.has_value());
    CHECK(scored.error().code == ErrorCode::InferenceError);
}
