// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioCapture.hpp>
#include <core/Log.hpp>
#include <speechgate/App.hpp>
#include <speechgate/Config.hpp>

#include <CLI/CLI.hpp>

#include <csignal>
#include <iostream>
#include <optional>
#include <print>

namespace
{

volatile std::sig_atomic_t interrupted = 0;

void handleInterrupt(int /*signal*/)
{
    interrupted = 1;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "speechgate: segments live microphone audio into speech utterances" };

    auto configPath = std::string {};
    auto threshold = std::optional<float> {};
    auto minDurationMs = std::optional<int> {};
    auto sampleRate = std::optional<int> {};
    auto deviceName = std::optional<std::string> {};
    auto vadModelPath = std::optional<std::string> {};
    auto listDevices = false;
    auto verbosity = 0;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--threshold", threshold, "Speech probability threshold (0-1)");
    app.add_option("--min-duration", minDurationMs, "Minimum utterance duration in ms for an AUDIO line");
    app.add_option("--sample-rate", sampleRate, "Capture sample rate in Hz");
    app.add_option("--device", deviceName, "Capture device name (case-insensitive substring)");
    app.add_option("--vad-model", vadModelPath, "Path to a Silero-VAD GGML model (energy detector if unset)");
    app.add_flag("--list-devices", listDevices, "List capture devices and exit");
    app.add_flag("-v,--verbose", verbosity, "Increase logging verbosity (repeatable)");

    CLI11_PARSE(app, argc, argv);

    speechgate::log::setLevel(speechgate::log::levelFromVerbosity(verbosity));

    if (listDevices)
    {
        auto devices = speechgate::AudioCapture::listDevices();
        if (!devices)
        {
            speechgate::log::error("{}", devices.error().message);
            return 1;
        }
        // Printed directly so that log level and log callback cannot hide the listing.
        std::print(stderr, "{}", speechgate::formatDeviceList(*devices));
        return 0;
    }

    auto configResult =
        configPath.empty() ? speechgate::loadConfig() : speechgate::loadConfigFromFile(configPath);
    if (!configResult)
    {
        speechgate::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (threshold)
        config.segmenter.threshold = *threshold;
    if (minDurationMs)
        config.segmenter.minDurationMs = *minDurationMs;
    if (sampleRate)
        config.segmenter.sampleRate = *sampleRate;
    if (deviceName)
        config.capture.deviceName = *deviceName;
    if (vadModelPath)
        config.classifier.vadModelPath = *vadModelPath;

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);
#ifndef _WIN32
    // A closed event consumer must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
#endif

    auto application = speechgate::App(std::move(config), std::cout);
    if (auto initResult = application.initialize(); !initResult)
    {
        speechgate::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    return application.run([] { return interrupted != 0; });
}
