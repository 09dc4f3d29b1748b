// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <format>
#include <optional>
#include <string>

namespace speechgate
{

struct AudioCapture::Impl
{
    ma_context context {};
    ma_device device {};
    CaptureOptions options;
    FrameCallback callback;
    std::atomic<bool> delivering { false };
    std::atomic<std::uint64_t> missingInputs { 0 };
    std::atomic<std::uint64_t> mismatchedPeriods { 0 };
    bool contextInitialized = false;
    bool capturing = false;
    bool initialized = false;
};

namespace
{

    auto toLower(std::string s) -> std::string
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (!impl || !impl->delivering.load(std::memory_order_acquire))
            return;

        auto const timestamp = FrameClock::now();

        // Real-time thread: problems are only counted here and reported by stop().
        if (!input)
        {
            impl->missingInputs.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        // The device runs with a fixed period, anything else means the backend misbehaved.
        if (frameCount != static_cast<ma_uint32>(impl->options.frameSamples))
        {
            impl->mismatchedPeriods.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        auto const* samples = static_cast<const float*>(input);
        impl->callback(std::span<const float>(samples, frameCount), timestamp);
    }

    void deviceNotificationCallback(const ma_device_notification* notification)
    {
        switch (notification->type)
        {
            case ma_device_notification_type_started: log::debug("Capture device started"); break;
            case ma_device_notification_type_stopped: log::debug("Capture device stopped"); break;
            case ma_device_notification_type_rerouted: log::warning("Capture device was rerouted"); break;
            case ma_device_notification_type_interruption_began:
                log::warning("Capture device interrupted");
                break;
            case ma_device_notification_type_interruption_ended:
                log::warning("Capture device interruption ended");
                break;
            default: break;
        }
    }

    /// @brief Picks the device to open: a name match if requested, otherwise the first
    /// capture device that is not a loopback monitor source.
    auto selectDevice(ma_device_info* devices, ma_uint32 count, std::string_view deviceName)
        -> std::optional<ma_device_id>
    {
        if (!deviceName.empty())
        {
            auto const lowerTarget = toLower(std::string(deviceName));
            for (auto i = ma_uint32 { 0 }; i < count; ++i)
            {
                if (toLower(devices[i].name).find(lowerTarget) != std::string::npos)
                {
                    log::info("Matched capture device '{}' for filter '{}'", devices[i].name, deviceName);
                    return devices[i].id;
                }
            }
            log::warning("No capture device matching '{}' found, falling back to auto-select", deviceName);
        }

        for (auto i = ma_uint32 { 0 }; i < count; ++i)
        {
            if (!toLower(devices[i].name).starts_with("monitor"))
            {
                log::info("Auto-selected capture device '{}' (skipping monitor sources)", devices[i].name);
                return devices[i].id;
            }
        }

        return std::nullopt;
    }

} // namespace

AudioCapture::AudioCapture(): _impl(std::make_unique<Impl>())
{
}

AudioCapture::~AudioCapture()
{
    stop();
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto AudioCapture::initialize(const CaptureOptions& options) -> VoidResult
{
    if (_impl->initialized)
        return makeError(ErrorCode::AudioError, "Audio capture already initialized");

    _impl->options = options;

    // The context must outlive the device
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio context: {}", ma_result_description(ctxResult)));
    _impl->contextInitialized = true;

    ma_device_info* captureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult =
        ma_context_get_devices(&_impl->context, nullptr, nullptr, &captureDevices, &captureCount);

    auto matchedDeviceId = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
        matchedDeviceId = selectDevice(captureDevices, captureCount, options.deviceName);
    else
        log::warning("Failed to enumerate capture devices ({}), using default",
                     ma_result_description(enumResult));

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = static_cast<ma_uint32>(options.sampleRate);
    deviceConfig.periodSizeInFrames = static_cast<ma_uint32>(options.frameSamples);
    deviceConfig.noFixedSizedCallback = MA_FALSE;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.notificationCallback = deviceNotificationCallback;
    deviceConfig.pUserData = _impl.get();

    if (matchedDeviceId)
        deviceConfig.capture.pDeviceID = &*matchedDeviceId;

    auto const result = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio device: {}", ma_result_description(result)));

    _impl->initialized = true;
    log::info("Audio capture initialized on '{}' ({} Hz, mono, float32, {} samples per frame)",
              _impl->device.capture.name,
              options.sampleRate,
              options.frameSamples);
    return {};
}

auto AudioCapture::start(FrameCallback callback) -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::AudioError, "Audio device not initialized");

    if (_impl->capturing)
        return makeError(ErrorCode::AudioError, "Audio capture already running");

    _impl->callback = std::move(callback);
    _impl->delivering.store(true, std::memory_order_release);

    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
    {
        _impl->delivering.store(false, std::memory_order_release);
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start audio capture: {}", ma_result_description(result)));
    }

    _impl->capturing = true;
    return {};
}

void AudioCapture::stop()
{
    if (!_impl->capturing)
        return;

    _impl->delivering.store(false, std::memory_order_release);
    if (auto const result = ma_device_stop(&_impl->device); result != MA_SUCCESS)
        log::warning("Failed to stop audio capture cleanly: {}", ma_result_description(result));
    _impl->capturing = false;

    if (auto const missing = _impl->missingInputs.load(std::memory_order_relaxed); missing > 0)
        log::warning("{} capture periods arrived without an input buffer and were skipped", missing);
    if (auto const mismatched = _impl->mismatchedPeriods.load(std::memory_order_relaxed); mismatched > 0)
        log::warning("{} capture periods did not match the frame size of {} samples and were skipped",
                     mismatched,
                     _impl->options.frameSamples);
}

auto AudioCapture::listDevices() -> Result<std::vector<std::string>>
{
    auto context = ma_context {};
    if (auto const result = ma_context_init(nullptr, 0, nullptr, &context); result != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to initialize audio context: {}", ma_result_description(result)));

    ma_device_info* captureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const result = ma_context_get_devices(&context, nullptr, nullptr, &captureDevices, &captureCount);
    if (result != MA_SUCCESS)
    {
        ma_context_uninit(&context);
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to enumerate capture devices: {}", ma_result_description(result)));
    }

    auto names = std::vector<std::string> {};
    names.reserve(captureCount);
    for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
        names.emplace_back(captureDevices[i].name);

    ma_context_uninit(&context);
    return names;
}

} // namespace speechgate
