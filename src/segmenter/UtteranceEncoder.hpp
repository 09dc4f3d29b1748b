// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioFrame.hpp>

#include <cstdint>
#include <span>
#include <string>

/// Conversion of an utterance into the AUDIO payload: little-endian int16 PCM, base64-encoded.
namespace speechgate::encoder
{

/// @brief Converts a float sample to int16 as round(sample * 32767), saturating.
/// NaN maps to 0.
[[nodiscard]] auto toInt16(float sample) -> std::int16_t;

/// @brief Concatenates the samples of @p frames in order as little-endian int16 PCM.
/// @return The raw PCM bytes, two per sample.
[[nodiscard]] auto encodePcm16(std::span<const AudioFrame> frames) -> std::string;

/// @brief Encodes @p frames as base64 of little-endian int16 PCM.
[[nodiscard]] auto encode(std::span<const AudioFrame> frames) -> std::string;

} // namespace speechgate::encoder
