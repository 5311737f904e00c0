// SPDX-License-Identifier: Apache-2.0
#include <stt/VoiceActivityDetector.hpp>

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace voicebridge;

TEST_CASE("VoiceActivityDetector classifies silence and speech frames", "[vad]")
{
    auto vad = VoiceActivityDetector {};
    auto const silence = std::vector<float>(1600, 0.0f);
    auto const speech = std::vector<float>(800, 0.2f);

    CHECK(vad.process(silence) == 0);
    CHECK(vad.framesProcessed() == 10);
    CHECK(vad.trailingSilenceFrames() == 10);

    CHECK(vad.process(speech) == 5);
    CHECK(vad.speechFrames() == 5);
    CHECK(vad.trailingSilenceFrames() == 0);

    vad.process(silence);
    CHECK(vad.framesProcessed() == 25);
    CHECK(vad.trailingSilenceFrames() == 10);
}

TEST_CASE("VoiceActivityDetector carries partial frames across calls", "[vad]")
{
    auto vad = VoiceActivityDetector {};
    auto const part = std::vector<float>(100, 0.2f);

    CHECK(vad.process(part) == 0);
    CHECK(vad.framesProcessed() == 0);
    CHECK(vad.process(part) == 1);
    CHECK(vad.framesProcessed() == 1);
}

TEST_CASE("VoiceActivityDetector probability scales with energy", "[vad]")
{
    auto const vad = VoiceActivityDetector {};
    auto const quiet = std::vector<float>(160, 0.005f);
    auto const loud = std::vector<float>(160, 0.5f);

    CHECK(vad.probability(quiet) < 0.5f);
    CHECK(vad.probability(loud) == 1.0f);
    CHECK(vad.probability({}) == 0.0f);
    CHECK(VoiceActivityDetector::isSpeech(0.5f));
    CHECK_FALSE(VoiceActivityDetector::isSpeech(0.49f));
}

TEST_CASE("VoiceActivityDetector reset clears counters", "[vad]")
{
    auto vad = VoiceActivityDetector {};
    vad.process(std::vector<float>(250, 0.2f));
    vad.reset();

    CHECK(vad.framesProcessed() == 0);
    CHECK(vad.speechFrames() == 0);
    CHECK(vad.trailingSilenceFrames() == 0);
    CHECK(vad.frameShiftSeconds() == 0.01f);

    // The 90 leftover samples were discarded as well.
    CHECK(vad.process(std::vector<float>(70, 0.2f)) == 0);
}
