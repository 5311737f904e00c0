// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/CapabilityFile.hpp>
#include <bridge/Dispatcher.hpp>
#include <core/Error.hpp>

#include <memory>
#include <string>

namespace voicebridge
{

/// @brief Names under which the engine is registered with the IBus daemon.
struct IBusHostConfig
{
    std::string componentName = "org.freedesktop.IBus.VoiceBridge";
    std::string engineName = "voicebridge";
    std::string engineLongName = "Voice Bridge";
    std::string description = "Voice-to-text input via streaming speech recognition";
    std::string language = "en";
    std::string layout = "us";
};

/// @brief Connection to the IBus daemon and the GLib main loop the engines live on.
///
/// The main loop is the dispatcher's consumer context: connect() installs a drain
/// scheduler that posts Dispatcher::drain() as a GLib idle callback.
class IBusHost
{
  public:
    IBusHost(Dispatcher& dispatcher, CapabilityFile& capabilityFile);
    ~IBusHost();

    IBusHost(const IBusHost&) = delete;
    IBusHost& operator=(const IBusHost&) = delete;

    /// @brief Connects to the daemon and registers the component and engine factory.
    /// @return Success or a HostServiceError when the daemon cannot be reached.
    [[nodiscard]] auto connect(const IBusHostConfig& config) -> VoidResult;

    /// @brief Runs the main loop until quit(), SIGINT, SIGTERM or daemon disconnect.
    void run();

    /// @brief Stops run(). Safe to call from any thread.
    void quit();

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicebridge
