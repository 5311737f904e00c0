// SPDX-License-Identifier: Apache-2.0
#include "Endpoint.hpp"

#include <core/Log.hpp>

namespace voicebridge
{

namespace
{

    auto ruleActivated(const EndpointRule& rule, bool containsNonSilence, float trailingSilence, float utteranceLength)
        -> bool
    {
        return (containsNonSilence || !rule.mustContainNonSilence) && trailingSilence >= rule.minTrailingSilence
               && utteranceLength >= rule.minUtteranceLength;
    }

} // namespace

auto Endpoint::check(int framesDecoded, int trailingSilenceFrames, float frameShiftSeconds) const
    -> std::optional<int>
{
    if (framesDecoded <= 0)
        return std::nullopt;

    auto const utteranceLength = static_cast<float>(framesDecoded) * frameShiftSeconds;
    auto const trailingSilence = static_cast<float>(trailingSilenceFrames) * frameShiftSeconds;
    auto const containsNonSilence = framesDecoded > trailingSilenceFrames;

    if (ruleActivated(_config.rule1, containsNonSilence, trailingSilence, utteranceLength))
    {
        log::trace("Endpoint rule 1 fired (trailing silence {:.2f}s)", trailingSilence);
        return 1;
    }
    if (ruleActivated(_config.rule2, containsNonSilence, trailingSilence, utteranceLength))
    {
        log::trace("Endpoint rule 2 fired (trailing silence {:.2f}s)", trailingSilence);
        return 2;
    }
    if (ruleActivated(_config.rule3, containsNonSilence, trailingSilence, utteranceLength))
    {
        log::trace("Endpoint rule 3 fired (utterance length {:.2f}s)", utteranceLength);
        return 3;
    }
    return std::nullopt;
}

} // namespace voicebridge
