// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace voicebridge
{

namespace
{

    constexpr auto DefaultWhisperModelFilename = std::string_view { "ggml-base.en.bin" };

    auto loadEndpointRules(const nlohmann::json& endpoint, EndpointConfig rules) -> EndpointConfig
    {
        rules.rule1.minTrailingSilence =
            json::valueOr(endpoint, "rule1MinTrailingSilence", rules.rule1.minTrailingSilence);
        rules.rule2.minTrailingSilence =
            json::valueOr(endpoint, "rule2MinTrailingSilence", rules.rule2.minTrailingSilence);
        rules.rule3.minUtteranceLength =
            json::valueOr(endpoint, "rule3MinUtteranceLength", rules.rule3.minUtteranceLength);
        return rules;
    }

} // namespace

auto defaultConfigDir() -> std::string
{
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/voicebridge";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/voicebridge";
    return ".";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto runtimeDir() -> std::string
{
    auto const* const xdgRuntime = std::getenv("XDG_RUNTIME_DIR");
    if (xdgRuntime && *xdgRuntime)
        return xdgRuntime;
    return "/tmp";
}

auto defaultSocketPath() -> std::string
{
    return std::format("{}/voicebridge-{}.sock", runtimeDir(), ::getuid());
}

auto defaultCapabilityPath() -> std::string
{
    return std::format("{}/voicebridge-caps-{}", runtimeDir(), ::getuid());
}

auto defaultWhisperModelPath() -> std::string
{
    auto dataDir = std::string { "." };
    if (auto const* const xdgData = std::getenv("XDG_DATA_HOME"); xdgData && *xdgData)
        dataDir = std::string(xdgData) + "/voicebridge";
    else if (auto const* const home = std::getenv("HOME"); home)
        dataDir = std::string(home) + "/.local/share/voicebridge";
    return std::format("{}/models/{}", dataDir, DefaultWhisperModelFilename);
}

auto resolvedSocketPath(const AppConfig& config) -> std::string
{
    return config.bridge.socketPath.empty() ? defaultSocketPath() : config.bridge.socketPath;
}

auto resolvedCapabilityPath(const AppConfig& config) -> std::string
{
    return config.bridge.capabilityPath.empty() ? defaultCapabilityPath() : config.bridge.capabilityPath;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str(), path);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config root must be an object: {}", path));

    auto config = AppConfig {};

    if (auto const* bridge = json::section(root, "bridge"))
    {
        config.bridge.socketPath = json::valueOr<std::string>(*bridge, "socketPath", {});
        config.bridge.capabilityPath = json::valueOr<std::string>(*bridge, "capabilityPath", {});
    }

    if (auto const* stt = json::section(root, "stt"))
    {
        auto& out = config.stt;
        out.modelPath = json::valueOr<std::string>(*stt, "modelPath", {});
        out.language = json::valueOr(*stt, "language", out.language);
        out.threads = json::valueOr(*stt, "threads", out.threads);
        out.sampleRate = json::valueOr(*stt, "sampleRate", out.sampleRate);
        out.featureDim = json::valueOr(*stt, "featureDim", out.featureDim);
        out.decodeStepMs = json::valueOr(*stt, "decodeStepMs", out.decodeStepMs);
        out.energyThreshold = json::valueOr(*stt, "energyThreshold", out.energyThreshold);
        if (auto const* endpoint = json::section(*stt, "endpoint"))
            out.endpoint = loadEndpointRules(*endpoint, out.endpoint);

        if (out.sampleRate <= 0 || out.decodeStepMs <= 0 || out.threads <= 0)
            return makeError(ErrorCode::ConfigError,
                             std::format("{}: stt.sampleRate, stt.decodeStepMs and stt.threads must be positive", path));
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    auto bridge = nlohmann::json::object();
    if (!config.bridge.socketPath.empty())
        bridge["socketPath"] = config.bridge.socketPath;
    if (!config.bridge.capabilityPath.empty())
        bridge["capabilityPath"] = config.bridge.capabilityPath;
    root["bridge"] = std::move(bridge);

    auto stt = nlohmann::json::object();
    if (!config.stt.modelPath.empty())
        stt["modelPath"] = config.stt.modelPath;
    stt["language"] = config.stt.language;
    stt["threads"] = config.stt.threads;
    stt["sampleRate"] = config.stt.sampleRate;
    stt["featureDim"] = config.stt.featureDim;
    stt["decodeStepMs"] = config.stt.decodeStepMs;
    stt["energyThreshold"] = config.stt.energyThreshold;
    stt["endpoint"] = {
        { "rule1MinTrailingSilence", config.stt.endpoint.rule1.minTrailingSilence },
        { "rule2MinTrailingSilence", config.stt.endpoint.rule2.minTrailingSilence },
        { "rule3MinUtteranceLength", config.stt.endpoint.rule3.minUtteranceLength },
    };
    root["stt"] = std::move(stt);

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace voicebridge
