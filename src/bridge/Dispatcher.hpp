// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/Command.hpp>
#include <bridge/InputTarget.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace voicebridge
{

/// @brief Requests that Dispatcher::drain() run soon on the consumer context.
///
/// Called from producer threads; must not block. Several requests may be coalesced
/// into a single drain.
using DrainScheduler = std::function<void()>;

/// @brief Serializes edit operations from any number of producer threads onto the
///        single consumer context that owns the active text target.
///
/// Producers call submit(); the consumer context calls drain() and the target
/// lifecycle methods. drain() executes batches strictly in submission order, and a
/// batch is never interleaved with another. Batches submitted while no target is
/// active are dropped rather than queued, and operations executed while no target
/// is active are dropped as well.
class Dispatcher
{
  public:
    explicit Dispatcher(DrainScheduler scheduler = {});

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// @brief Sets the scheduler used to wake the consumer context.
    ///
    /// Posts a wake-up right away if operations are already waiting.
    void setScheduler(DrainScheduler scheduler);

    /// @brief Enqueues a batch of operations. Thread-safe and non-blocking.
    ///
    /// The batch is discarded when no target is active at submission time.
    void submit(EditBatch batch);

    /// @brief Executes every queued batch against the active target.
    ///
    /// Consumer context only.
    /// @return The number of operations taken from the queue (executed or dropped).
    auto drain() -> std::size_t;

    /// @brief Makes target the active target. Consumer context only.
    void attachTarget(InputTarget& target);

    /// @brief Clears the slot if target is the active one. Consumer context only.
    void detachTarget(const InputTarget& target);

    [[nodiscard]] auto hasTarget() const noexcept -> bool { return _target != nullptr; }

    /// @brief Number of operations waiting for the next drain. Thread-safe.
    [[nodiscard]] auto pendingOperations() const -> std::size_t;

  private:
    void execute(const EditOperation& operation);

    void onPreview(const std::string& text);
    void onClearPreview();
    void onCommit(const std::string& text);
    void onDelete(int count);
    void onReplace(int count, const std::string& text);

    DrainScheduler _scheduler;

    mutable std::mutex _queueMutex;
    std::deque<EditOperation> _queue;
    bool _drainRequested = false;

    // Written only on the consumer context; read by producers in submit().
    std::atomic<bool> _targetPresent = false;

    // Touched only on the consumer context.
    InputTarget* _target = nullptr;
};

} // namespace voicebridge
