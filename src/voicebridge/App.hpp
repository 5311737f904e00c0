// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <voicebridge/Config.hpp>

#include <memory>

namespace voicebridge
{

/// @brief The text-insertion bridge: command socket, dispatcher and IBus engine.
class App
{
  public:
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Connects to IBus and binds the command socket.
    /// @return Success, or the first fatal startup error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the IBus main loop until shutdown, then releases the runtime files.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicebridge
