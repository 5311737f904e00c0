// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <stt/Endpoint.hpp>

#include <string>
#include <string_view>

namespace voicebridge
{

/// @brief Bridge configuration section: the two process-wide runtime files.
struct BridgeConfig
{
    /// @brief Rendezvous socket producers connect to. Empty selects defaultSocketPath().
    std::string socketPath;

    /// @brief Capability side-channel file. Empty selects defaultCapabilityPath().
    std::string capabilityPath;
};

/// @brief Speech-to-text configuration section.
struct SttConfig
{
    std::string modelPath;
    std::string language = "en";
    int threads = 2;
    int sampleRate = 16000;
    int featureDim = 80;
    int decodeStepMs = 500;
    float energyThreshold = 0.01f;
    EndpointConfig endpoint;
};

/// @brief Top-level configuration shared by voicebridge and voicebridge-stream.
struct AppConfig
{
    BridgeConfig bridge;
    SttConfig stt;
};

/// @brief Loads the configuration from the default config path; a missing file yields defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the configuration to a file, creating its directory if needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief $XDG_CONFIG_HOME/voicebridge, or ~/.config/voicebridge.
[[nodiscard]] auto defaultConfigDir() -> std::string;

[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief $XDG_RUNTIME_DIR, or /tmp when unset.
[[nodiscard]] auto runtimeDir() -> std::string;

/// @brief <runtimeDir>/voicebridge-<uid>.sock
[[nodiscard]] auto defaultSocketPath() -> std::string;

/// @brief <runtimeDir>/voicebridge-caps-<uid>
[[nodiscard]] auto defaultCapabilityPath() -> std::string;

/// @brief $XDG_DATA_HOME/voicebridge/models/ggml-base.en.bin, or under ~/.local/share.
[[nodiscard]] auto defaultWhisperModelPath() -> std::string;

/// @brief Socket path from the config, or the default.
[[nodiscard]] auto resolvedSocketPath(const AppConfig& config) -> std::string;

/// @brief Capability file path from the config, or the default.
[[nodiscard]] auto resolvedCapabilityPath(const AppConfig& config) -> std::string;

} // namespace voicebridge
