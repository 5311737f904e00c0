// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>

namespace voicebridge
{

/// @brief One endpoint rule. It fires when all of its conditions hold.
struct EndpointRule
{
    /// @brief Only fire once the utterance contains something other than silence.
    bool mustContainNonSilence = false;

    /// @brief Seconds of silence required at the end of the utterance.
    float minTrailingSilence = 0.0f;

    /// @brief Minimum utterance length in seconds.
    float minUtteranceLength = 0.0f;
};

/// @brief The three OR'ed endpoint rules.
struct EndpointConfig
{
    /// @brief Nothing but silence for a while.
    EndpointRule rule1 { .mustContainNonSilence = false, .minTrailingSilence = 2.4f, .minUtteranceLength = 0.0f };

    /// @brief Speech followed by a shorter trailing silence.
    EndpointRule rule2 { .mustContainNonSilence = true, .minTrailingSilence = 1.2f, .minUtteranceLength = 0.0f };

    /// @brief Hard cap on utterance length, regardless of silence.
    EndpointRule rule3 { .mustContainNonSilence = false, .minTrailingSilence = 0.0f, .minUtteranceLength = 20.0f };
};

/// @brief Decides utterance boundaries from decoded frame counters.
class Endpoint
{
  public:
    explicit Endpoint(EndpointConfig config = {}): _config(config) {}

    /// @brief Evaluates the rules in order.
    /// @param framesDecoded Frames decoded since the utterance started.
    /// @param trailingSilenceFrames Consecutive silent frames at the end of the utterance.
    /// @param frameShiftSeconds Duration of one frame.
    /// @return The number (1-3) of the first rule that fires, or std::nullopt.
    [[nodiscard]] auto check(int framesDecoded, int trailingSilenceFrames, float frameShiftSeconds) const
        -> std::optional<int>;

    [[nodiscard]] auto isEndpoint(int framesDecoded, int trailingSilenceFrames, float frameShiftSeconds) const
        -> bool
    {
        return check(framesDecoded, trailingSilenceFrames, frameShiftSeconds).has_value();
    }

    [[nodiscard]] auto config() const noexcept -> const EndpointConfig& { return _config; }

  private:
    EndpointConfig _config;
};

} // namespace voicebridge
