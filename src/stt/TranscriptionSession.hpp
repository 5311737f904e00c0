// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <stt/Endpoint.hpp>
#include <stt/StreamingDecoder.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace voicebridge
{

/// @brief Fixed parameters of a transcription session.
struct TranscriptionSessionConfig
{
    int sampleRate = 16000;
    int featureDim = 80;
    bool enableEndpoint = true;
    EndpointConfig endpoint;
};

/// @brief Outcome of an endpoint check.
struct EndpointResult
{
    bool isEndpoint = false;

    /// @brief Text of the finished utterance; empty unless isEndpoint.
    std::string finalText;
};

/// @brief Turns PCM16 audio chunks into streaming partial and final text.
///
/// Owns one decode stream per utterance. Not thread-safe: feed(), checkEndpoint()
/// and reset() must all be called from the same thread.
class TranscriptionSession
{
  public:
    explicit TranscriptionSession(TranscriptionSessionConfig config = {});
    ~TranscriptionSession();

    TranscriptionSession(const TranscriptionSession&) = delete;
    TranscriptionSession& operator=(const TranscriptionSession&) = delete;

    /// @brief Takes ownership of a loaded decoder and opens the first utterance.
    /// @return Success, or InvalidArgument when the decoder's sample rate differs from the session's.
    [[nodiscard]] auto initialize(std::unique_ptr<StreamingDecoder> decoder) -> VoidResult;

    [[nodiscard]] auto isInitialized() const noexcept -> bool;

    /// @brief Feeds mono PCM16 samples and decodes as far as the audio allows.
    /// @return The current partial text, trimmed; empty before initialize().
    auto feed(std::span<const std::int16_t> chunk) -> std::string;

    /// @brief Checks whether the current utterance has ended.
    ///
    /// On an endpoint the final text is captured and a fresh utterance is started.
    auto checkEndpoint() -> EndpointResult;

    /// @brief Discards the current utterance and starts a fresh one. Idempotent.
    void reset();

    /// @brief Last partial text returned by feed().
    [[nodiscard]] auto partialText() const noexcept -> const std::string& { return _partialText; }

    [[nodiscard]] auto sampleRate() const noexcept -> int { return _config.sampleRate; }
    [[nodiscard]] auto featureDim() const noexcept -> int { return _config.featureDim; }

  private:
    const TranscriptionSessionConfig _config;
    Endpoint _endpoint;
    std::unique_ptr<StreamingDecoder> _decoder;
    std::unique_ptr<DecodeStream> _stream;
    std::string _partialText;
    std::vector<float> _samples;
};

/// @brief Normalizes decoder output to the text handed to callers.
[[nodiscard]] auto extractText(const RecognitionResult& result) -> std::string;

} // namespace voicebridge
