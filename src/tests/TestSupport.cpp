// SPDX-License-Identifier: Apache-2.0
#include "TestSupport.hpp"

#include <ixwebsocket/IXBase64.h>

namespace speechgate::test
{

auto decodeAudioLine(const std::string& line) -> std::vector<std::int16_t>
{
    constexpr auto Prefix = std::string_view { "AUDIO:" };
    if (!line.starts_with(Prefix))
        return {};

    auto bytes = std::string {};
    auto const error = macaron::Base64::Decode(line.substr(Prefix.size()), bytes);
    if (!error.empty())
        return {};

    auto samples = std::vector<std::int16_t> {};
    samples.reserve(bytes.size() / 2);
    for (auto i = std::size_t { 0 }; i + 1 < bytes.size(); i += 2)
    {
        auto const lo = static_cast<std::uint16_t>(static_cast<unsigned char>(bytes[i]));
        auto const hi = static_cast<std::uint16_t>(static_cast<unsigned char>(bytes[i + 1]));
        samples.push_back(static_cast<std::int16_t>(lo | (hi << 8)));
    }
    return samples;
}

} // namespace speechgate::test
