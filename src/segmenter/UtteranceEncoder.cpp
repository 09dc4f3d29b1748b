// SPDX-License-Identifier: Apache-2.0
#include "UtteranceEncoder.hpp"

#include <ixwebsocket/IXBase64.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace speechgate::encoder
{

auto toInt16(float sample) -> std::int16_t
{
    if (std::isnan(sample))
        return 0;

    constexpr auto Lowest = static_cast<double>(std::numeric_limits<std::int16_t>::min());
    constexpr auto Highest = static_cast<double>(std::numeric_limits<std::int16_t>::max());

    auto const scaled = std::round(static_cast<double>(sample) * 32767.0);
    return static_cast<std::int16_t>(std::clamp(scaled, Lowest, Highest));
}

auto encodePcm16(std::span<const AudioFrame> frames) -> std::string
{
    auto total = std::size_t { 0 };
    for (auto const& frame: frames)
        total += frame.size();

    auto bytes = std::string {};
    bytes.reserve(total * 2);

    for (auto const& frame: frames)
    {
        for (auto const sample: frame.samples)
        {
            auto const value = static_cast<std::uint16_t>(toInt16(sample));
            bytes.push_back(static_cast<char>(value & 0xFF));
            bytes.push_back(static_cast<char>((value >> 8) & 0xFF));
        }
    }

    return bytes;
}

auto encode(std::span<const AudioFrame> frames) -> std::string
{
    return macaron::Base64::Encode(encodePcm16(frames));
}

} // namespace speechgate::encoder
