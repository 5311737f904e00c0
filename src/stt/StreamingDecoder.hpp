// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <memory>
#include <span>
#include <string>
#include <vector>

namespace voicebridge
{

/// @brief Normalized decoder output for the current utterance.
struct RecognitionResult
{
    /// @brief Best hypothesis so far, as produced by the decoder (not yet trimmed).
    std::string text;

    /// @brief Decoder-specific pieces the text was assembled from, in order.
    std::vector<std::string> segments;
};

/// @brief Decoding state of one utterance.
///
/// Not thread-safe; a stream is driven by exactly one thread.
class DecodeStream
{
  public:
    virtual ~DecodeStream() = default;

    /// @brief Appends normalized samples in [-1, 1] to the stream.
    virtual void acceptWaveform(int sampleRate, std::span<const float> samples) = 0;

    /// @brief True while enough audio is buffered for another decode step.
    [[nodiscard]] virtual auto isReady() const -> bool = 0;

    /// @brief Runs a single decode step.
    virtual void decode() = 0;

    [[nodiscard]] virtual auto result() const -> RecognitionResult = 0;

    /// @brief Frames decoded since the stream was created.
    [[nodiscard]] virtual auto framesDecoded() const -> int = 0;

    /// @brief Consecutive non-speech frames at the end of the decoded audio.
    [[nodiscard]] virtual auto trailingSilenceFrames() const -> int = 0;
};

/// @brief A loaded streaming recognizer that hands out per-utterance streams.
class StreamingDecoder
{
  public:
    virtual ~StreamingDecoder() = default;

    [[nodiscard]] virtual auto createStream() -> std::unique_ptr<DecodeStream> = 0;

    [[nodiscard]] virtual auto sampleRate() const -> int = 0;

    /// @brief Duration of one decoded frame in seconds.
    [[nodiscard]] virtual auto frameShiftSeconds() const -> float = 0;
};

} // namespace voicebridge
