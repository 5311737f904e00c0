// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stt/StreamingDecoder.hpp>
#include <stt/VoiceActivityDetector.hpp>

#include <cmath>
#include <cstdint>
#include <memory>
#include <numbers>
#include <span>
#include <vector>

namespace voicebridge::test
{

/// Observable decoding progress, shared by a ScriptedDecoder and the streams it creates.
struct DecodeStats
{
    int decodeSteps = 0;
    std::size_t pendingSamples = 0;
};

/// Deterministic stand-in for a speech decoder.
///
/// Frames are classified by energy. Any speech yields "hello", half a second of
/// speech yields "hello world". Decoding happens in 100 ms steps.
class ScriptedStream: public DecodeStream
{
  public:
    static constexpr auto StepSamples = std::size_t { 1600 };

    explicit ScriptedStream(std::shared_ptr<DecodeStats> stats = std::make_shared<DecodeStats>()):
        _stats(std::move(stats))
    {
    }

    void acceptWaveform(int /*sampleRate*/, std::span<const float> samples) override
    {
        _pending.insert(_pending.end(), samples.begin(), samples.end());
        _stats->pendingSamples = _pending.size();
    }

    [[nodiscard]] auto isReady() const -> bool override { return _pending.size() >= StepSamples; }

    void decode() override
    {
        _vad.process(std::span<const float>(_pending).first(StepSamples));
        _pending.erase(_pending.begin(), _pending.begin() + static_cast<std::ptrdiff_t>(StepSamples));
        ++_stats->decodeSteps;
        _stats->pendingSamples = _pending.size();
    }

    [[nodiscard]] auto result() const -> RecognitionResult override
    {
        if (_vad.speechFrames() >= 50)
            return { .text = " hello world", .segments = { " hello", " world" } };
        if (_vad.speechFrames() > 0)
            return { .text = " hello", .segments = { " hello" } };
        return {};
    }

    [[nodiscard]] auto framesDecoded() const -> int override { return _vad.framesProcessed(); }
    [[nodiscard]] auto trailingSilenceFrames() const -> int override { return _vad.trailingSilenceFrames(); }

  private:
    std::shared_ptr<DecodeStats> _stats;
    VoiceActivityDetector _vad;
    std::vector<float> _pending;
};

class ScriptedDecoder: public StreamingDecoder
{
  public:
    explicit ScriptedDecoder(int sampleRate = 16000): _sampleRate(sampleRate) {}

    [[nodiscard]] auto createStream() -> std::unique_ptr<DecodeStream> override
    {
        ++streamsCreated;
        *stats = DecodeStats {};
        return std::make_unique<ScriptedStream>(stats);
    }

    [[nodiscard]] auto sampleRate() const -> int override { return _sampleRate; }
    [[nodiscard]] auto frameShiftSeconds() const -> float override { return 0.01f; }

    int streamsCreated = 0;
    std::shared_ptr<DecodeStats> stats = std::make_shared<DecodeStats>();

  private:
    int _sampleRate;
};

/// count samples of a loud 440 Hz tone at 16 kHz.
inline auto speechSamples(std::size_t count) -> std::vector<std::int16_t>
{
    auto samples = std::vector<std::int16_t>(count);
    for (auto i = std::size_t { 0 }; i < samples.size(); ++i)
        samples[i] = static_cast<std::int16_t>(
            10000.0 * std::sin(2.0 * std::numbers::pi * 440.0 * static_cast<double>(i) / 16000.0));
    return samples;
}

/// 100 ms of a loud 440 Hz tone at 16 kHz.
inline auto speechChunk() -> std::vector<std::int16_t>
{
    return speechSamples(ScriptedStream::StepSamples);
}

/// 100 ms of digital silence at 16 kHz.
inline auto silenceChunk() -> std::vector<std::int16_t>
{
    return std::vector<std::int16_t>(ScriptedStream::StepSamples, 0);
}

} // namespace voicebridge::test
