// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <qoms/config/QomsConfig.h>
#include <qoms/core/types.h>
#include <qoms/scheduler/AdmissionPolicy.h>
#include <qoms/scheduler/DeadLetterQueue.h>
#include <qoms/scheduler/PriorityLanes.h>
#include <qoms/scheduler/PriorityTier.h>
#include <qoms/scheduler/QueueItem.h>
#include <qoms/scheduler/ResourceMonitor.h>

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace qoms {

/// Point-in-time view of the scheduler, returned by OperationQueue::getStats().
struct QueueStats {
    std::array<std::size_t, kTierCount> laneLengths{};
    std::size_t totalQueued{0};
    std::size_t inFlight{0};
    std::size_t pendingRetries{0};
    std::uint64_t totalRetries{0};
    std::size_t dlqSize{0};
    std::size_t dlqEvicted{0};
    bool dispatcherRunning{false};
    double avgWaitMs{0.0};
    std::uint64_t totalProcessed{0};
    std::uint64_t promotions{0};
    std::uint64_t fastPathExecutions{0};
    std::uint64_t leaseExpirations{0};
    std::uint64_t resourceTimeouts{0};
    ResourceSnapshot resources;
    QomsConfig config;
};

/**
 * @brief Resource-aware priority queue that gates operations on host load.
 *
 * Callers submit zero-argument operations tagged with a PriorityTier and get
 * a std::future<Result<T>> back. A single dispatcher coroutine, serialized on
 * a strand of the supplied executor, picks the highest-priority eligible item,
 * waits until the host has CPU/RAM headroom for its tier, and runs it on the
 * executor under a lease.
 *
 * ## Lifecycle of an item
 * - pending: in its tier lane, possibly retry-delayed
 * - processing: admitted, in the in-flight map, lease running
 * - completed: ACKed, future resolved
 * - dlq: failed maxRetries times, future rejected with RetriesExhausted
 *
 * A failed attempt (error result, thrown exception, lease expiry, or
 * resource timeout) is NACKed: the item goes back to its lane with an
 * exponential backoff, or to the dead-letter queue once its retries are
 * spent.
 *
 * Lease expiry preempts the dispatcher: it stops waiting for the operation
 * and moves on, while the operation itself may keep running on a worker.
 * Its late result is discarded.
 *
 * ## Fast path
 * When nothing is queued or in flight, the dispatcher is idle, and the tier
 * is admitted right now, enqueue() runs the operation inline on the calling
 * thread. Fast-path failures are returned directly and are not retried.
 *
 * ## Thread safety
 * All public methods may be called from any thread. Call stop() (or destroy
 * the queue) before stopping the executor's io_context.
 */
class OperationQueue {
public:
    OperationQueue(QomsConfig config, boost::asio::any_io_executor executor,
                   std::shared_ptr<ResourceProbe> probe = nullptr);

    /// Calls stop().
    ~OperationQueue();

    OperationQueue(const OperationQueue&) = delete;
    OperationQueue& operator=(const OperationQueue&) = delete;

    /// Accept submissions. Safe to call again after stop().
    void start();

    /**
     * @brief Stops dispatching and rejects queued items with SystemShutdown.
     *
     * An attempt still in flight is abandoned and its caller rejected as
     * well. Blocks until the dispatcher has exited. Idempotent.
     */
    void stop();

    [[nodiscard]] bool isRunning() const;

    /**
     * @brief Submits an operation at the given tier.
     *
     * @param fn Callable returning Result<T>; a thrown exception counts as a
     *           failed attempt
     * @return Future that yields the operation's value, or the error that
     *         ended it (RetriesExhausted, QueueCleared, SystemShutdown, or a
     *         fast-path failure)
     */
    template <typename Fn> auto enqueue(Fn&& fn, PriorityTier tier = PriorityTier::Medium) {
        using R = std::invoke_result_t<std::decay_t<Fn>&>;
        using T = typename R::value_type;
        auto op = std::make_shared<TypedOperation<T>>(
            typename TypedOperation<T>::Fn(std::forward<Fn>(fn)));
        auto future = op->future();
        submit(std::move(op), tier);
        return future;
    }

    template <typename Fn> auto critical(Fn&& fn) {
        return enqueue(std::forward<Fn>(fn), PriorityTier::Critical);
    }
    template <typename Fn> auto high(Fn&& fn) {
        return enqueue(std::forward<Fn>(fn), PriorityTier::High);
    }
    template <typename Fn> auto medium(Fn&& fn) {
        return enqueue(std::forward<Fn>(fn), PriorityTier::Medium);
    }
    template <typename Fn> auto low(Fn&& fn) {
        return enqueue(std::forward<Fn>(fn), PriorityTier::Low);
    }
    template <typename Fn> auto idle(Fn&& fn) {
        return enqueue(std::forward<Fn>(fn), PriorityTier::Idle);
    }

    /// Type-erased submission. Returns the assigned item id.
    std::string submit(std::shared_ptr<QueuedOperation> op, PriorityTier tier);

    QueueStats getStats();

    /**
     * @brief Rejects every pending item with QueueCleared.
     *
     * In-flight items are not affected.
     * @return number of items rejected
     */
    std::size_t clearQueue();

    std::vector<DLQEntry> getDLQ();
    std::size_t clearDLQ();
    bool dismissDLQEntry(std::string_view id);

    /// Backoff before retry number retryCount (1-based), capped at maxRetryDelay.
    static std::chrono::milliseconds retryDelayFor(const QomsConfig& config,
                                                   std::uint32_t retryCount);

    [[nodiscard]] const QomsConfig& config() const noexcept { return config_; }

private:
    using ItemPtr = std::shared_ptr<QueueItem>;

    enum class NackOutcome { Retry, DeadLettered, Shutdown, NotFound };

    // A rejection decided under the lock, delivered after it is released.
    struct Rejection {
        std::shared_ptr<QueuedOperation> operation;
        Error error;
    };

    // Outcome slot for one dispatched attempt. The worker posts the result to
    // the strand and cancels the timer; an expired timer means lease timeout.
    struct AttemptState {
        explicit AttemptState(const boost::asio::any_io_executor& ex) : timer(ex) {}
        boost::asio::steady_timer timer;
        bool done{false};
        std::optional<Result<std::shared_ptr<void>>> outcome;
    };

    std::string nextId(std::uint64_t seq) const;
    void warnHighWaterLocked();

    void spawnTracked(boost::asio::awaitable<void> task);
    boost::asio::awaitable<void> dispatchLoop();
    boost::asio::awaitable<void> retryWake(std::shared_ptr<boost::asio::steady_timer> timer);
    void scheduleWake(SteadyTime at);

    bool ackLocked(const ItemPtr& item);
    std::optional<Rejection> nackLocked(const ItemPtr& item, Error error);
    NackOutcome nackById(const std::string& id, Error error, std::vector<Rejection>& out);
    // NACKs every in-flight item whose lease has expired.
    std::size_t sweepExpiredLeasesLocked(SteadyTime now, std::vector<Rejection>& out);

    static void deliver(std::vector<Rejection>& rejections);

    const QomsConfig config_;
    boost::asio::any_io_executor executor_;
    boost::asio::strand<boost::asio::any_io_executor> strand_;
    ResourceMonitor monitor_;
    AdmissionPolicy admission_;

    mutable std::mutex mutex_;
    PriorityLanes lanes_;
    std::unordered_map<std::string, ItemPtr> inFlight_;
    DeadLetterQueue dlq_;
    bool running_{false};
    bool dispatcherActive_{false};
    bool inlineActive_{false};
    bool highWaterWarned_{false};
    std::uint64_t nextSeq_{0};
    std::uint64_t totalProcessed_{0};
    std::uint64_t totalRetries_{0};
    std::uint64_t fastPathExecutions_{0};
    std::uint64_t leaseExpirations_{0};
    std::uint64_t resourceTimeouts_{0};
    double totalWaitMs_{0.0};

    // Strand-only state
    std::shared_ptr<AttemptState> currentAttempt_;
    std::shared_ptr<boost::asio::steady_timer> wakeTimer_;

    // Coroutines and posted handlers that still reference this queue
    std::mutex taskMutex_;
    std::condition_variable tasksDone_;
    std::size_t liveTasks_{0};
};

} // namespace qoms
