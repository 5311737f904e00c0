// SPDX-License-Identifier: Apache-2.0
#include <bridge/CapabilityFile.hpp>
#include <bridge/CommandSender.hpp>
#include <core/Log.hpp>
#include <stream/StreamingWorker.hpp>
#include <stt/TranscriptionSession.hpp>
#include <stt/WhisperDecoder.hpp>
#include <voicebridge/Config.hpp>

#include <CLI/CLI.hpp>

#include <cstdio>

using namespace voicebridge;

namespace
{

auto readChunk(std::FILE* input, std::size_t samples) -> std::vector<std::int16_t>
{
    auto chunk = std::vector<std::int16_t>(samples);
    auto const count = std::fread(chunk.data(), sizeof(std::int16_t), samples, input);
    chunk.resize(count);
    return chunk;
}

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "voicebridge-stream - transcribe PCM16 from stdin into the voicebridge socket" };

    auto configPath = std::string {};
    auto modelPath = std::string {};
    auto socketPath = std::string {};
    auto chunkMs = 100;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("-m,--model", modelPath, "Whisper model path");
    app.add_option("--socket", socketPath, "Command socket path");
    app.add_option("--chunk-ms", chunkMs, "Milliseconds of audio per chunk")->check(CLI::PositiveNumber);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        log::setLevel(log::Level::Debug);

    auto configResult = configPath.empty() ? loadConfig() : loadConfigFromFile(configPath);
    if (!configResult)
    {
        log::error("Failed to load config: {}", configResult.error());
        return 1;
    }

    auto& config = *configResult;
    if (!modelPath.empty())
        config.stt.modelPath = modelPath;
    if (!socketPath.empty())
        config.bridge.socketPath = socketPath;
    if (config.stt.modelPath.empty())
        config.stt.modelPath = defaultWhisperModelPath();

    auto decoder = std::make_unique<WhisperDecoder>();
    auto loadResult = decoder->load(WhisperDecoderConfig {
        .modelPath = config.stt.modelPath,
        .language = config.stt.language,
        .threads = config.stt.threads,
        .sampleRate = config.stt.sampleRate,
        .decodeStepMs = config.stt.decodeStepMs,
        .energyThreshold = config.stt.energyThreshold,
    });
    if (!loadResult)
    {
        log::error("Failed to load model: {}", loadResult.error());
        return 1;
    }

    auto session = std::make_unique<TranscriptionSession>(TranscriptionSessionConfig {
        .sampleRate = config.stt.sampleRate,
        .featureDim = config.stt.featureDim,
        .endpoint = config.stt.endpoint,
    });
    if (auto result = session->initialize(std::move(decoder)); !result)
    {
        log::error("Failed to initialize transcription: {}", result.error());
        return 1;
    }

    auto sender = CommandSender {};
    if (auto result = sender.connect(resolvedSocketPath(config)); !result)
    {
        log::error("{}", result.error());
        return 1;
    }

    auto const capability = readTargetCapability(resolvedCapabilityPath(config));
    log::info("Text target capability: {}", capabilityToString(capability));

    auto worker = StreamingWorker(std::move(session), [&sender](Command command) {
        if (!sender.isConnected())
            return;
        if (auto result = sender.send(command); !result)
            log::warning("Dropping further commands: {}", result.error());
    });
    worker.start();

    auto const chunkSamples = static_cast<std::size_t>(config.stt.sampleRate) * chunkMs / 1000;
    log::info("Reading {} Hz PCM16 from stdin in {} ms chunks", config.stt.sampleRate, chunkMs);

    while (true)
    {
        auto chunk = readChunk(stdin, chunkSamples);
        if (chunk.empty())
            break;
        worker.pushAudio(std::move(chunk));
    }

    worker.finish();
    worker.wait();
    log::info("Committed {} utterance(s)", worker.committedUtterances());
    return 0;
}
