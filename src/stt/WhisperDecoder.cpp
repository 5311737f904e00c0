// SPDX-License-Identifier: Apache-2.0
#include "WhisperDecoder.hpp"

#include <core/Log.hpp>
#include <stt/VoiceActivityDetector.hpp>

#include <whisper.h>

#include <algorithm>
#include <array>
#include <format>
#include <optional>
#include <string>
#include <vector>

namespace voicebridge
{

namespace
{

    constexpr auto FrameShiftMs = 10;

    /// @brief Line buffer for whisper.cpp log continuation messages.
    auto whisperLineBuffer = std::string {};

    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards whisper.cpp log output to voicebridge::log one complete line at a time.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        whisperLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = whisperLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = whisperLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
            {
                line.resize(end + 1);
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);
            }

            whisperLineBuffer.erase(0, nlPos + 1);
        }
    }

    /// @brief A loaded whisper context, shared by the decoder and its streams.
    struct WhisperModel
    {
        whisper_context* ctx = nullptr;
        WhisperDecoderConfig config;

        ~WhisperModel()
        {
            if (ctx)
                whisper_free(ctx);
        }

        auto transcribe(std::span<const float> samples) -> Result<RecognitionResult>
        {
            auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
            params.language = config.language.c_str();
            params.n_threads = config.threads;
            params.print_progress = false;
            params.print_special = false;
            params.print_realtime = false;
            params.print_timestamps = false;
            params.no_context = true;
            params.single_segment = true;
            params.suppress_blank = true;

            // whisper rejects inputs shorter than one second; pad with silence.
            auto padded = std::vector<float> {};
            auto const minSamples = static_cast<std::size_t>(config.sampleRate);
            if (samples.size() < minSamples)
            {
                padded.assign(samples.begin(), samples.end());
                padded.resize(minSamples + minSamples / 10, 0.0f);
                samples = padded;
            }

            auto const rc = whisper_full(ctx, params, samples.data(), static_cast<int>(samples.size()));
            if (rc != 0)
                return makeError(ErrorCode::TranscriptionError,
                                 std::format("Whisper transcription failed with code: {}", rc));

            auto result = RecognitionResult {};
            auto const nSegments = whisper_full_n_segments(ctx);
            for (auto i = 0; i < nSegments; ++i)
            {
                auto const* segmentText = whisper_full_get_segment_text(ctx, i);
                if (!segmentText)
                    continue;
                result.segments.emplace_back(segmentText);
                result.text += segmentText;
            }

            // whisper hallucinates markers like "[BLANK_AUDIO]" for non-speech.
            static constexpr auto NonSpeechMarkers = std::array {
                std::string_view { "[BLANK_AUDIO]" }, std::string_view { "(blank audio)" },
                std::string_view { "[SOUND]" },       std::string_view { "[MUSIC]" },
                std::string_view { "[NOISE]" },
            };
            auto const trimmedStart = result.text.find_first_not_of(' ');
            if (trimmedStart != std::string::npos)
            {
                auto const body = std::string_view(result.text).substr(trimmedStart);
                for (auto const marker: NonSpeechMarkers)
                    if (body.starts_with(marker) && body.find_first_not_of(" \n", marker.size()) == std::string_view::npos)
                        return RecognitionResult {};
            }

            return result;
        }
    };

    /// @brief One utterance decoded by re-transcribing its audio window.
    class WhisperStream: public DecodeStream
    {
      public:
        explicit WhisperStream(std::shared_ptr<WhisperModel> model):
            _model(std::move(model)),
            _vad(VoiceActivityConfig {
                .sampleRate = _model->config.sampleRate,
                .frameSamples = _model->config.sampleRate * FrameShiftMs / 1000,
                .energyThreshold = _model->config.energyThreshold,
            }),
            _stepSamples(static_cast<std::size_t>(
                std::max(1, _model->config.sampleRate * _model->config.decodeStepMs / 1000))),
            _maxWindowSamples(static_cast<std::size_t>(
                _model->config.maxWindowSeconds * static_cast<float>(_model->config.sampleRate)))
        {
        }

        void acceptWaveform(int sampleRate, std::span<const float> samples) override
        {
            if (sampleRate != _model->config.sampleRate)
            {
                log::warning("Dropping {} samples at {} Hz, decoder expects {} Hz",
                             samples.size(),
                             sampleRate,
                             _model->config.sampleRate);
                return;
            }
            _pending.insert(_pending.end(), samples.begin(), samples.end());
        }

        auto isReady() const -> bool override { return _pending.size() >= _stepSamples; }

        void decode() override
        {
            if (!isReady())
                return;

            auto const step = std::span<const float>(_pending).first(_stepSamples);
            auto const speechFrames = _vad.process(step);
            _utterance.insert(_utterance.end(), step.begin(), step.end());
            _pending.erase(_pending.begin(), _pending.begin() + static_cast<std::ptrdiff_t>(_stepSamples));

            if (_utterance.size() > _maxWindowSamples)
                _utterance.erase(_utterance.begin(),
                                 _utterance.begin()
                                     + static_cast<std::ptrdiff_t>(_utterance.size() - _maxWindowSamples));

            if (speechFrames == 0)
                return;

            auto transcription = _model->transcribe(_utterance);
            if (!transcription)
            {
                log::warning("{}", transcription.error());
                return;
            }
            _result = std::move(*transcription);
        }

        auto result() const -> RecognitionResult override { return _result; }
        auto framesDecoded() const -> int override { return _vad.framesProcessed(); }
        auto trailingSilenceFrames() const -> int override { return _vad.trailingSilenceFrames(); }

      private:
        std::shared_ptr<WhisperModel> _model;
        VoiceActivityDetector _vad;
        std::size_t _stepSamples;
        std::size_t _maxWindowSamples;
        std::vector<float> _pending;
        std::vector<float> _utterance;
        RecognitionResult _result;
    };

} // namespace

struct WhisperDecoder::Impl
{
    std::shared_ptr<WhisperModel> model;
};

WhisperDecoder::WhisperDecoder(): _impl(std::make_unique<Impl>())
{
}

WhisperDecoder::~WhisperDecoder() = default;

auto WhisperDecoder::load(const WhisperDecoderConfig& config) -> VoidResult
{
    if (config.sampleRate != WHISPER_SAMPLE_RATE)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("whisper requires {} Hz audio, got {} Hz", WHISPER_SAMPLE_RATE, config.sampleRate));

    whisper_log_set(whisperLogCallback, nullptr);

    auto model = std::make_shared<WhisperModel>();
    model->config = config;

    auto params = whisper_context_default_params();
    model->ctx = whisper_init_from_file_with_params(config.modelPath.c_str(), params);
    if (!model->ctx)
        return makeError(ErrorCode::ModelLoadError, std::format("Failed to load whisper model: {}", config.modelPath));

    _impl->model = std::move(model);
    log::info("Whisper model loaded: {} (step {} ms, {} threads)", config.modelPath, config.decodeStepMs, config.threads);
    return {};
}

auto WhisperDecoder::isLoaded() const -> bool
{
    return _impl->model != nullptr;
}

auto WhisperDecoder::createStream() -> std::unique_ptr<DecodeStream>
{
    if (!_impl->model)
        return nullptr;
    return std::make_unique<WhisperStream>(_impl->model);
}

auto WhisperDecoder::sampleRate() const -> int
{
    return _impl->model ? _impl->model->config.sampleRate : WHISPER_SAMPLE_RATE;
}

auto WhisperDecoder::frameShiftSeconds() const -> float
{
    return static_cast<float>(FrameShiftMs) / 1000.0f;
}

} // namespace voicebridge
