// SPDX-License-Identifier: Apache-2.0
#include "VoiceActivityDetector.hpp"

#include <algorithm>
#include <cmath>

namespace voicebridge
{

VoiceActivityDetector::VoiceActivityDetector(VoiceActivityConfig config): _config(config)
{
    _config.frameSamples = std::max(1, _config.frameSamples);
    _partialFrame.reserve(static_cast<std::size_t>(_config.frameSamples));
}

auto VoiceActivityDetector::process(std::span<const float> samples) -> int
{
    auto const frameSize = static_cast<std::size_t>(_config.frameSamples);
    auto speech = 0;

    auto classify = [&](std::span<const float> frame) {
        ++_framesProcessed;
        if (isSpeech(probability(frame), _config.speechThreshold))
        {
            ++_speechFrames;
            _trailingSilenceFrames = 0;
            ++speech;
        }
        else
        {
            ++_trailingSilenceFrames;
        }
    };

    // Complete a frame left over from the previous call first.
    if (!_partialFrame.empty())
    {
        auto const take = std::min(frameSize - _partialFrame.size(), samples.size());
        _partialFrame.insert(_partialFrame.end(), samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(take));
        samples = samples.subspan(take);
        if (_partialFrame.size() < frameSize)
            return speech;
        classify(_partialFrame);
        _partialFrame.clear();
    }

    while (samples.size() >= frameSize)
    {
        classify(samples.first(frameSize));
        samples = samples.subspan(frameSize);
    }

    _partialFrame.assign(samples.begin(), samples.end());
    return speech;
}

auto VoiceActivityDetector::probability(std::span<const float> frame) const -> float
{
    if (frame.empty())
        return 0.0f;

    auto energy = 0.0f;
    for (auto const sample: frame)
        energy += sample * sample;
    energy = std::sqrt(energy / static_cast<float>(frame.size()));

    // Normalize so that energyThreshold maps to a probability of 0.5.
    return std::min(1.0f, energy / (_config.energyThreshold * 2.0f));
}

auto VoiceActivityDetector::isSpeech(float probability, float threshold) -> bool
{
    return probability >= threshold;
}

auto VoiceActivityDetector::frameShiftSeconds() const noexcept -> float
{
    return static_cast<float>(_config.frameSamples) / static_cast<float>(_config.sampleRate);
}

void VoiceActivityDetector::reset()
{
    _partialFrame.clear();
    _framesProcessed = 0;
    _speechFrames = 0;
    _trailingSilenceFrames = 0;
}

} // namespace voicebridge
