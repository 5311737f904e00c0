// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <stt/StreamingDecoder.hpp>

#include <memory>
#include <string>

namespace voicebridge
{

/// @brief Configuration for the whisper.cpp streaming decoder.
struct WhisperDecoderConfig
{
    std::string modelPath;
    std::string language = "en";
    int threads = 2;
    int sampleRate = 16000;

    /// @brief Audio consumed per decode step.
    int decodeStepMs = 500;

    /// @brief Longest utterance window passed to whisper; older audio is dropped.
    float maxWindowSeconds = 30.0f;

    /// @brief RMS energy at which a 10 ms frame counts as voiced.
    float energyThreshold = 0.01f;
};

/// @brief Streaming decoder built on whisper.cpp.
///
/// Whisper itself is not incremental, so every decode step that contains speech
/// re-transcribes the utterance audio so far; trailing silence is tracked per
/// 10 ms frame with the energy voice activity detector.
class WhisperDecoder: public StreamingDecoder
{
  public:
    WhisperDecoder();
    ~WhisperDecoder() override;

    WhisperDecoder(const WhisperDecoder&) = delete;
    WhisperDecoder& operator=(const WhisperDecoder&) = delete;

    /// @brief Loads the whisper model.
    /// @return Success or a ModelLoadError.
    [[nodiscard]] auto load(const WhisperDecoderConfig& config) -> VoidResult;

    [[nodiscard]] auto isLoaded() const -> bool;

    [[nodiscard]] auto createStream() -> std::unique_ptr<DecodeStream> override;
    [[nodiscard]] auto sampleRate() const -> int override;
    [[nodiscard]] auto frameShiftSeconds() const -> float override;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicebridge
