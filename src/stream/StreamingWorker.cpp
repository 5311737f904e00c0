// SPDX-License-Identifier: Apache-2.0
#include "StreamingWorker.hpp"

#include <core/Log.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <variant>

namespace voicebridge
{

namespace
{

    struct ResetRequest
    {
    };

    struct EndOfInput
    {
    };

    using WorkItem = std::variant<std::vector<std::int16_t>, ResetRequest, EndOfInput>;

} // namespace

struct StreamingWorker::Impl
{
    std::unique_ptr<TranscriptionSession> session;
    CommandSink sink;

    std::jthread worker;
    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<WorkItem> queue;
    bool finished = false;
    std::atomic<int> commits = 0;

    // Worker thread only.
    std::string shownPreview;

    void run(const std::stop_token& stopToken)
    {
        log::setThreadName("decoder");
        while (!stopToken.stop_requested())
        {
            auto item = WorkItem {};
            {
                auto lock = std::unique_lock(mutex);
                if (!cv.wait(lock, stopToken, [this] { return !queue.empty(); }))
                    return;
                item = std::move(queue.front());
                queue.pop_front();
            }

            if (auto* chunk = std::get_if<std::vector<std::int16_t>>(&item))
                processChunk(*chunk);
            else if (std::holds_alternative<ResetRequest>(item))
                resetUtterance();
            else
            {
                flushUtterance();
                auto lock = std::lock_guard(mutex);
                finished = true;
                cv.notify_all();
                return;
            }
        }
    }

    void processChunk(const std::vector<std::int16_t>& chunk)
    {
        auto partial = session->feed(chunk);
        if (partial != shownPreview)
        {
            sink(PreviewCommand { partial });
            shownPreview = std::move(partial);
        }

        auto endpoint = session->checkEndpoint();
        if (!endpoint.isEndpoint)
            return;

        if (!endpoint.finalText.empty())
            commit(std::move(endpoint.finalText));
        else
            clearPreview();
    }

    void resetUtterance()
    {
        session->reset();
        clearPreview();
    }

    void flushUtterance()
    {
        auto text = session->partialText();
        session->reset();
        if (!text.empty())
            commit(std::move(text));
        else
            clearPreview();
    }

    void commit(std::string text)
    {
        log::info("Utterance: {}", text);
        text += ' ';
        sink(CommitCommand { std::move(text) });
        shownPreview.clear();
        ++commits;
    }

    void clearPreview()
    {
        if (shownPreview.empty())
            return;
        sink(PreviewCommand {});
        shownPreview.clear();
    }

    void enqueue(WorkItem item)
    {
        auto lock = std::lock_guard(mutex);
        queue.push_back(std::move(item));
        cv.notify_one();
    }
};

StreamingWorker::StreamingWorker(std::unique_ptr<TranscriptionSession> session, CommandSink sink):
    _impl(std::make_unique<Impl>())
{
    _impl->session = std::move(session);
    _impl->sink = std::move(sink);
}

StreamingWorker::~StreamingWorker()
{
    stop();
}

void StreamingWorker::start()
{
    if (_impl->worker.joinable())
        return;
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

void StreamingWorker::pushAudio(std::vector<std::int16_t> chunk)
{
    _impl->enqueue(std::move(chunk));
}

void StreamingWorker::requestReset()
{
    _impl->enqueue(ResetRequest {});
}

void StreamingWorker::finish()
{
    _impl->enqueue(EndOfInput {});
}

void StreamingWorker::wait()
{
    {
        auto lock = std::unique_lock(_impl->mutex);
        _impl->cv.wait(lock, [this] { return _impl->finished || !_impl->worker.joinable(); });
    }
    if (_impl->worker.joinable())
        _impl->worker.join();
}

void StreamingWorker::stop()
{
    if (!_impl->worker.joinable())
        return;
    _impl->worker.request_stop();
    _impl->worker.join();
}

auto StreamingWorker::committedUtterances() const -> int
{
    return _impl->commits;
}

} // namespace voicebridge
