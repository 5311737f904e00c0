// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <voicebridge/App.hpp>
#include <voicebridge/Config.hpp>

#include <CLI/CLI.hpp>

int main(int argc, char** argv)
{
    auto app = CLI::App { "voicebridge - IBus text-insertion bridge for streaming voice typing" };

    auto configPath = std::string {};
    auto socketPath = std::string {};
    auto capabilityPath = std::string {};
    auto logLevel = std::string {};
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--socket", socketPath, "Command socket path");
    app.add_option("--caps-file", capabilityPath, "Capability side-channel file path");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        voicebridge::log::setLevel(voicebridge::log::Level::Debug);
    if (!logLevel.empty())
    {
        auto const level = voicebridge::log::parseLevel(logLevel);
        if (!level)
        {
            voicebridge::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        voicebridge::log::setLevel(*level);
    }

    auto configResult =
        configPath.empty() ? voicebridge::loadConfig() : voicebridge::loadConfigFromFile(configPath);
    if (!configResult)
    {
        voicebridge::log::error("Failed to load config: {}", configResult.error());
        return 1;
    }

    auto& config = *configResult;
    if (!socketPath.empty())
        config.bridge.socketPath = socketPath;
    if (!capabilityPath.empty())
        config.bridge.capabilityPath = capabilityPath;

    auto bridge = voicebridge::App(std::move(config));
    auto initResult = bridge.initialize();
    if (!initResult)
    {
        voicebridge::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    return bridge.run();
}
