// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <bridge/CapabilityFile.hpp>
#include <bridge/CommandListener.hpp>
#include <bridge/Dispatcher.hpp>
#include <bridge/Protocol.hpp>
#include <core/Log.hpp>
#include <ibus/IBusHost.hpp>

namespace voicebridge
{

struct App::Impl
{
    // Declaration order matters: engines created by the host point into the
    // dispatcher and the capability file, and the listener submits into the
    // dispatcher, so both are torn down first.
    AppConfig config;
    Dispatcher dispatcher;
    CapabilityFile capabilityFile;
    IBusHost host;
    CommandListener listener;

    explicit Impl(AppConfig appConfig):
        config(std::move(appConfig)),
        capabilityFile(resolvedCapabilityPath(config)),
        host(dispatcher, capabilityFile)
    {
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto hostResult = _impl->host.connect(IBusHostConfig {});
    if (!hostResult)
        return hostResult;

    auto listenerConfig = CommandListenerConfig {
        .socketPath = resolvedSocketPath(_impl->config),
    };
    auto listenResult = _impl->listener.start(listenerConfig, [this](Command command) {
        _impl->dispatcher.submit(translateCommand(std::move(command)));
    });
    if (!listenResult)
        return listenResult;

    log::info("voicebridge running (socket: {}, capabilities: {})",
              listenerConfig.socketPath.string(),
              _impl->capabilityFile.path().string());
    return {};
}

auto App::run() -> int
{
    _impl->host.run();

    _impl->listener.stop();
    _impl->capabilityFile.remove();
    return 0;
}

} // namespace voicebridge
