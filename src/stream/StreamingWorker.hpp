// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/Command.hpp>
#include <stt/TranscriptionSession.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace voicebridge
{

/// @brief Receives the commands the worker produces, on the worker thread.
using CommandSink = std::function<void(Command command)>;

/// @brief Drives a TranscriptionSession from a dedicated thread and turns its output
///        into protocol commands.
///
/// The session is touched by the worker thread only. A changed partial becomes a
/// `preedit`, an endpoint becomes a `commit` of the final text followed by a space
/// (or a cleared preview when nothing was recognized).
class StreamingWorker
{
  public:
    StreamingWorker(std::unique_ptr<TranscriptionSession> session, CommandSink sink);
    ~StreamingWorker();

    StreamingWorker(const StreamingWorker&) = delete;
    StreamingWorker& operator=(const StreamingWorker&) = delete;

    void start();

    /// @brief Queues a chunk of mono PCM16 audio. Thread-safe.
    void pushAudio(std::vector<std::int16_t> chunk);

    /// @brief Queues an explicit utterance reset, ordered with the audio. Thread-safe.
    void requestReset();

    /// @brief Marks the end of input; pending audio is still processed and the
    ///        utterance in progress is committed.
    void finish();

    /// @brief Blocks until the worker has processed everything up to finish().
    void wait();

    /// @brief Stops the worker without processing the remaining queue.
    void stop();

    /// @brief Number of commit commands emitted so far. Thread-safe.
    [[nodiscard]] auto committedUtterances() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace voicebridge
