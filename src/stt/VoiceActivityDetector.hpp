// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace voicebridge
{

/// @brief Configuration for the energy-based voice activity detector.
struct VoiceActivityConfig
{
    int sampleRate = 16000;

    /// @brief Samples per classified frame (10 ms at 16 kHz).
    int frameSamples = 160;

    /// @brief RMS energy at which a frame counts as fully voiced.
    float energyThreshold = 0.01f;

    /// @brief Speech probability at or above which a frame is speech.
    float speechThreshold = 0.5f;
};

/// @brief Frame-level speech/silence classifier based on RMS energy.
///
/// Keeps running counters for the current utterance: frames classified, frames of
/// speech and the run of silent frames at the end.
class VoiceActivityDetector
{
  public:
    explicit VoiceActivityDetector(VoiceActivityConfig config = {});

    /// @brief Classifies every complete frame in samples; a trailing partial frame is kept
    ///        and completed by the next call.
    /// @return Number of frames classified as speech by this call.
    auto process(std::span<const float> samples) -> int;

    /// @brief Speech probability (0.0 to 1.0) of a single frame.
    [[nodiscard]] auto probability(std::span<const float> frame) const -> float;

    [[nodiscard]] static auto isSpeech(float probability, float threshold = 0.5f) -> bool;

    [[nodiscard]] auto framesProcessed() const noexcept -> int { return _framesProcessed; }
    [[nodiscard]] auto speechFrames() const noexcept -> int { return _speechFrames; }
    [[nodiscard]] auto trailingSilenceFrames() const noexcept -> int { return _trailingSilenceFrames; }

    /// @brief Duration of one frame in seconds.
    [[nodiscard]] auto frameShiftSeconds() const noexcept -> float;

    /// @brief Clears the counters and any partial frame (call between utterances).
    void reset();

  private:
    VoiceActivityConfig _config;
    std::vector<float> _partialFrame;
    int _framesProcessed = 0;
    int _speechFrames = 0;
    int _trailingSilenceFrames = 0;
};

} // namespace voicebridge
