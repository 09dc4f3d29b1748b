// SPDX-License-Identifier: Apache-2.0
#include <core/Error.hpp>
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <string>
#include <utility>
#include <vector>

using namespace speechgate;

namespace
{

struct CapturedLog
{
    std::vector<std::pair<log::Level, std::string>> messages;
    log::Level previousLevel = log::getLevel();

    CapturedLog()
    {
        log::setCallback([this](log::Level level, std::string_view message) {
            messages.emplace_back(level, std::string(message));
        });
    }

    ~CapturedLog()
    {
        log::setCallback({});
        log::setLevel(previousLevel);
    }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;
};

} // namespace

TEST_CASE("levelFromVerbosity maps -v counts to levels", "[log]")
{
    CHECK(log::levelFromVerbosity(0) == log::Level::Info);
    CHECK(log::levelFromVerbosity(1) == log::Level::Debug);
    CHECK(log::levelFromVerbosity(2) == log::Level::Trace);
    CHECK(log::levelFromVerbosity(7) == log::Level::Trace);
    CHECK(log::levelFromVerbosity(-1) == log::Level::Info);
}

TEST_CASE("levelName returns fixed-width prefixes", "[log]")
{
    CHECK(log::levelName(log::Level::Error) == "ERROR");
    CHECK(log::levelName(log::Level::Warning) == "WARN ");
    CHECK(log::levelName(log::Level::Info) == "INFO ");
    CHECK(log::levelName(log::Level::Debug) == "DEBUG");
    CHECK(log::levelName(log::Level::Trace) == "TRACE");
}

TEST_CASE("log routes formatted messages to the callback", "[log]")
{
    auto captured = CapturedLog();
    log::setLevel(log::Level::Info);

    log::info("Recording {} at {} Hz", "started", 16000);
    log::error("boom");

    REQUIRE(captured.messages.size() == 2);
    CHECK(captured.messages[0].first == log::Level::Info);
    CHECK(captured.messages[0].second == "Recording started at 16000 Hz");
    CHECK(captured.messages[1].first == log::Level::Error);
    CHECK(captured.messages[1].second == "boom");
}

TEST_CASE("log drops messages above the current level", "[log]")
{
    auto captured = CapturedLog();

    log::setLevel(log::Level::Warning);
    log::info("hidden");
    log::debug("hidden");
    log::warning("shown");
    CHECK(captured.messages.size() == 1);

    log::setLevel(log::Level::Trace);
    log::debug("now shown");
    log::trace("also shown");
    CHECK(captured.messages.size() == 3);
}

TEST_CASE("Error formats with the name of its code", "[log]")
{
    auto const error = Error { ErrorCode::InferenceError, "Scoring frame 3 failed" };
    CHECK(std::format("{}", error) == "inference error: Scoring frame 3 failed");
    CHECK(errorCodeName(ErrorCode::AudioError) == "audio");
    CHECK(errorCodeName(ErrorCode::ConfigError) == "config");
}
