// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string_view>

namespace speechgate
{

/// @brief Protocol event kinds, one per output line.
enum class EventKind : std::uint8_t
{
    SpeechStart,
    SpeechEnd,
    Audio,
};

/// @brief Returns the line text of a boundary event, or the "AUDIO:" prefix.
[[nodiscard]] constexpr auto eventKindToString(EventKind kind) -> std::string_view
{
    switch (kind)
    {
        case EventKind::SpeechStart: return "SPEECH_START";
        case EventKind::SpeechEnd: return "SPEECH_END";
        case EventKind::Audio: return "AUDIO:";
    }
    return "";
}

/// @brief Writes protocol lines to the event stream, flushing after every line.
///
/// The stream carries nothing but events; diagnostics go through log::.
class EventEmitter
{
  public:
    explicit EventEmitter(std::ostream& out);

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    [[nodiscard]] auto speechStart() -> VoidResult;
    [[nodiscard]] auto speechEnd() -> VoidResult;

    /// @brief Writes "AUDIO:<payload>".
    [[nodiscard]] auto audio(std::string_view payload) -> VoidResult;

    /// @brief Number of lines of @p kind written so far.
    [[nodiscard]] auto count(EventKind kind) const -> std::uint64_t;

  private:
    auto writeLine(EventKind kind, std::string_view payload) -> VoidResult;

    std::ostream& _out;
    mutable std::mutex _mutex;
    std::uint64_t _counts[3] {};
};

} // namespace speechgate
