// SPDX-License-Identifier: Apache-2.0
#include "Dispatcher.hpp"

#include <core/Log.hpp>

#include <variant>

namespace voicebridge
{

Dispatcher::Dispatcher(DrainScheduler scheduler): _scheduler(std::move(scheduler))
{
}

void Dispatcher::setScheduler(DrainScheduler scheduler)
{
    auto wakeUp = DrainScheduler {};
    {
        auto lock = std::lock_guard(_queueMutex);
        _scheduler = std::move(scheduler);
        if (!_queue.empty() && !_drainRequested && _scheduler)
        {
            _drainRequested = true;
            wakeUp = _scheduler;
        }
    }

    if (wakeUp)
        wakeUp();
}

void Dispatcher::submit(EditBatch batch)
{
    if (batch.empty())
        return;

    if (!_targetPresent.load(std::memory_order_acquire))
    {
        log::trace("No active text target, dropping batch of {} operations", batch.size());
        return;
    }

    auto scheduler = DrainScheduler {};
    {
        auto lock = std::lock_guard(_queueMutex);
        for (auto& operation: batch)
            _queue.push_back(std::move(operation));

        // One outstanding wake-up is enough: the drain it triggers takes everything queued so far.
        if (!_drainRequested && _scheduler)
        {
            _drainRequested = true;
            scheduler = _scheduler;
        }
    }

    if (scheduler)
        scheduler();
}

auto Dispatcher::drain() -> std::size_t
{
    auto pending = std::deque<EditOperation> {};
    {
        auto lock = std::lock_guard(_queueMutex);
        pending.swap(_queue);
        _drainRequested = false;
    }

    for (auto const& operation: pending)
        execute(operation);

    if (!pending.empty())
        log::trace("Dispatcher drained {} operations", pending.size());
    return pending.size();
}

void Dispatcher::attachTarget(InputTarget& target)
{
    if (_target == &target)
        return;
    _target = &target;
    _targetPresent.store(true, std::memory_order_release);
    log::debug("Active text target acquired");
}

void Dispatcher::detachTarget(const InputTarget& target)
{
    if (_target != &target)
        return;
    _target = nullptr;
    _targetPresent.store(false, std::memory_order_release);
    log::debug("Active text target lost");
}

auto Dispatcher::pendingOperations() const -> std::size_t
{
    auto lock = std::lock_guard(_queueMutex);
    return _queue.size();
}

void Dispatcher::execute(const EditOperation& operation)
{
    if (!_target)
    {
        log::trace("No active text target, dropping operation");
        return;
    }

    struct Executor
    {
        Dispatcher& dispatcher;

        void operator()(const ShowPreview& op) const { dispatcher.onPreview(op.text); }
        void operator()(const ClearPreview&) const { dispatcher.onClearPreview(); }
        void operator()(const CommitText& op) const { dispatcher.onCommit(op.text); }
        void operator()(const DeleteBeforeCursor& op) const { dispatcher.onDelete(op.count); }
        void operator()(const ReplaceBeforeCursor& op) const { dispatcher.onReplace(op.count, op.text); }
    };
    std::visit(Executor { *this }, operation);
}

void Dispatcher::onPreview(const std::string& text)
{
    if (!_target)
        return;

    if (text.empty())
    {
        _target->hidePreview();
        return;
    }

    // Terminals cannot tell a preview from committed text unless it is marked.
    auto const underline = !_target->capabilities().supportsSurroundingText;
    _target->showPreview(text, underline);
}

void Dispatcher::onClearPreview()
{
    if (_target)
        _target->hidePreview();
}

void Dispatcher::onCommit(const std::string& text)
{
    if (_target && !text.empty())
        _target->commit(text);
}

void Dispatcher::onDelete(int count)
{
    if (_target && count > 0)
        _target->deleteBeforeCursor(count);
}

void Dispatcher::onReplace(int count, const std::string& text)
{
    onDelete(count);
    onCommit(text);
}

} // namespace voicebridge
