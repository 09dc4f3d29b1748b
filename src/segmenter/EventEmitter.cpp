// SPDX-License-Identifier: Apache-2.0
#include "EventEmitter.hpp"

#include <core/Log.hpp>

#include <format>
#include <ostream>

namespace speechgate
{

EventEmitter::EventEmitter(std::ostream& out): _out(out)
{
}

auto EventEmitter::speechStart() -> VoidResult
{
    return writeLine(EventKind::SpeechStart, {});
}

auto EventEmitter::speechEnd() -> VoidResult
{
    return writeLine(EventKind::SpeechEnd, {});
}

auto EventEmitter::audio(std::string_view payload) -> VoidResult
{
    return writeLine(EventKind::Audio, payload);
}

auto EventEmitter::count(EventKind kind) const -> std::uint64_t
{
    auto lock = std::lock_guard(_mutex);
    return _counts[static_cast<std::size_t>(kind)];
}

auto EventEmitter::writeLine(EventKind kind, std::string_view payload) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);

    _out << eventKindToString(kind) << payload << '\n';
    _out.flush();
    if (!_out)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to write {} event to the output stream", eventKindToString(kind)));

    ++_counts[static_cast<std::size_t>(kind)];
    if (kind == EventKind::Audio)
        log::debug("Emitted AUDIO ({} base64 characters)", payload.size());
    else
        log::debug("Emitted {}", eventKindToString(kind));
    return {};
}

} // namespace speechgate
