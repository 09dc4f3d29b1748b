// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/FrameSource.hpp>
#include <core/Error.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace speechgate
{

/// @brief Settings for opening the capture device.
struct CaptureOptions
{
    /// @brief Case-insensitive substring of the device name; empty selects automatically.
    std::string deviceName;
    int sampleRate = 16000;
    int frameSamples = 160;
};

/// @brief Captures mono float32 audio from a microphone using miniaudio.
///
/// The device is opened with a fixed period of CaptureOptions::frameSamples, so every
/// callback delivers exactly one frame.
class AudioCapture final: public FrameSource
{
  public:
    AudioCapture();
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    /// @brief Opens the capture device.
    /// @param options Device selection and format.
    /// @return Success or an AudioError.
    [[nodiscard]] auto initialize(const CaptureOptions& options) -> VoidResult;

    [[nodiscard]] auto start(FrameCallback callback) -> VoidResult override;
    void stop() override;

    /// @brief Returns the names of all capture devices known to the default backend.
    [[nodiscard]] static auto listDevices() -> Result<std::vector<std::string>>;

    // Impl must be accessible from the C audio callbacks
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace speechgate
