// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <speechgate/Config.hpp>

#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace speechgate
{

/// @brief Wires the microphone, the speech model and the pipeline together and runs until
/// interrupted.
class App
{
  public:
    /// @param config The application configuration (already validated or not; initialize checks).
    /// @param events Stream receiving the protocol lines, normally std::cout.
    App(AppConfig config, std::ostream& events);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Validates the configuration, opens the capture device and loads the model.
    /// @return Success or an error. The pipeline is not running yet.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the pipeline until @p stopRequested returns true or processing fails.
    /// @return Exit code: 0 after a clean stop, 1 if the run failed.
    [[nodiscard]] auto run(const std::function<bool()>& stopRequested) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Renders the capture devices for --list-devices, one "  [index] name" line each.
[[nodiscard]] auto formatDeviceList(const std::vector<std::string>& names) -> std::string;

} // namespace speechgate
