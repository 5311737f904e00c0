// SPDX-License-Identifier: Apache-2.0
#include "TranscriptionSession.hpp"

#include <core/Log.hpp>

#include <format>

namespace voicebridge
{

auto extractText(const RecognitionResult& result) -> std::string
{
    constexpr auto whitespace = std::string_view { " \t\n\r" };

    auto const start = result.text.find_first_not_of(whitespace);
    if (start == std::string::npos)
        return {};
    auto const end = result.text.find_last_not_of(whitespace);
    return result.text.substr(start, end - start + 1);
}

TranscriptionSession::TranscriptionSession(TranscriptionSessionConfig config):
    _config(std::move(config)), _endpoint(_config.endpoint)
{
}

TranscriptionSession::~TranscriptionSession() = default;

auto TranscriptionSession::initialize(std::unique_ptr<StreamingDecoder> decoder) -> VoidResult
{
    if (!decoder)
        return makeError(ErrorCode::InvalidArgument, "No decoder given");

    if (decoder->sampleRate() != _config.sampleRate)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Decoder expects {} Hz audio, session is configured for {} Hz",
                                     decoder->sampleRate(),
                                     _config.sampleRate));

    auto stream = decoder->createStream();
    if (!stream)
        return makeError(ErrorCode::ModelLoadError, "Decoder has no model loaded");

    _decoder = std::move(decoder);
    _stream = std::move(stream);
    _partialText.clear();
    log::debug("Transcription session ready ({} Hz, feature dim {})", _config.sampleRate, _config.featureDim);
    return {};
}

auto TranscriptionSession::isInitialized() const noexcept -> bool
{
    return _decoder && _stream;
}

auto TranscriptionSession::feed(std::span<const std::int16_t> chunk) -> std::string
{
    if (!isInitialized())
        return {};

    _samples.resize(chunk.size());
    for (auto i = std::size_t { 0 }; i < chunk.size(); ++i)
        _samples[i] = static_cast<float>(chunk[i]) / 32768.0f;

    _stream->acceptWaveform(_config.sampleRate, _samples);

    // One chunk may be worth zero or many decode steps.
    while (_stream->isReady())
        _stream->decode();

    _partialText = extractText(_stream->result());
    return _partialText;
}

auto TranscriptionSession::checkEndpoint() -> EndpointResult
{
    if (!isInitialized() || !_config.enableEndpoint)
        return {};

    if (!_endpoint.isEndpoint(
            _stream->framesDecoded(), _stream->trailingSilenceFrames(), _decoder->frameShiftSeconds()))
        return {};

    // The final text lives in the stream being replaced; read it first.
    auto finalText = extractText(_stream->result());
    _stream = _decoder->createStream();
    _partialText.clear();

    log::debug("Endpoint detected: \"{}\"", finalText);
    return EndpointResult { .isEndpoint = true, .finalText = std::move(finalText) };
}

void TranscriptionSession::reset()
{
    _partialText.clear();
    if (_decoder)
        _stream = _decoder->createStream();
}

} // namespace voicebridge
