// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <agentstream/Config.hpp>
#include <core/Error.hpp>

#include <istream>
#include <memory>
#include <ostream>

namespace agentstream
{

/// @brief Wires input, raw log, Processor and Formatter for one agent transcript.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    /// @param out Where the transcript is rendered.
    explicit App(AppConfig config, std::ostream& out);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Opens the input and the raw log and sets up the decoder.
    /// @return Success or an IoError.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Renders the configured input until end of file.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

    /// @brief Renders @p input until end of file.
    [[nodiscard]] auto run(std::istream& input) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace agentstream
