// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <qoms/scheduler/OperationQueue.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace qoms {

namespace {

double millisBetween(SteadyTime from, SteadyTime to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

OperationQueue::OperationQueue(QomsConfig config, boost::asio::any_io_executor executor,
                               std::shared_ptr<ResourceProbe> probe)
    : config_(std::move(config)), executor_(std::move(executor)),
      strand_(boost::asio::make_strand(executor_)), monitor_(std::move(probe), config_.metricsCache),
      admission_(config_, monitor_), lanes_(config_.agePromotion),
      dlq_(config_.dlqMaxSize, config_.dlqRetention) {
    spdlog::debug("[OperationQueue] Created: cpu<={}% ram<={}% maxWait={}ms maxRetries={} "
                  "lease={}ms",
                  config_.maxCpuPercent, config_.maxRamPercent, config_.maxWait.count(),
                  config_.maxRetries, config_.leaseTimeout.count());
}

OperationQueue::~OperationQueue() {
    stop();
}

void OperationQueue::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        spdlog::debug("[OperationQueue] Already running, skipping start");
        return;
    }
    running_ = true;
    spdlog::info("[OperationQueue] Started (fast path {})",
                 config_.enableFastPath ? "enabled" : "disabled");
}

void OperationQueue::stop() {
    std::vector<ItemPtr> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        drained = lanes_.drain();
    }

    spdlog::info("[OperationQueue] Stopping, rejecting {} queued item(s)", drained.size());
    for (auto& item : drained) {
        item->operation->reject(Error{ErrorCode::SystemShutdown, "operation queue shut down"});
    }

    std::unique_lock<std::mutex> lk(taskMutex_);
    if (liveTasks_ == 0) {
        return;
    }
    // Timers are strand-only state; cancel them from the strand. The posted
    // handler is tracked like a task so we do not return before it has run.
    ++liveTasks_;
    lk.unlock();
    boost::asio::post(strand_, [this]() {
        if (wakeTimer_) {
            wakeTimer_->cancel();
        }
        if (currentAttempt_) {
            currentAttempt_->timer.cancel();
        }
        std::lock_guard<std::mutex> g(taskMutex_);
        --liveTasks_;
        tasksDone_.notify_all();
    });
    lk.lock();
    tasksDone_.wait(lk, [this] { return liveTasks_ == 0; });
    spdlog::debug("[OperationQueue] Dispatcher stopped");
}

bool OperationQueue::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::string OperationQueue::nextId(std::uint64_t seq) const {
    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::system_clock::now().time_since_epoch())
                             .count();
    return "qoms_" + std::to_string(seq) + "_" + std::to_string(epochMs);
}

std::string OperationQueue::submit(std::shared_ptr<QueuedOperation> op, PriorityTier tier) {
    std::string id;
    bool inlineRun = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto seq = ++nextSeq_;
        id = nextId(seq);

        if (!running_) {
            spdlog::debug("[OperationQueue] Rejecting {}: queue not running", id);
            op->reject(Error{ErrorCode::SystemShutdown, "operation queue is not running"});
            return id;
        }

        if (config_.enableFastPath && !inlineActive_ && !dispatcherActive_ && lanes_.empty() &&
            inFlight_.empty() && admission_.canExecute(tier, id)) {
            inlineActive_ = true;
            inlineRun = true;
        } else {
            auto item = std::make_shared<QueueItem>();
            item->id = id;
            item->seq = seq;
            item->priority = tier;
            item->originalPriority = tier;
            item->operation = op;
            item->enqueuedAt = SteadyClock::now();
            item->enqueuedWall = std::chrono::system_clock::now();
            lanes_.push(item);
            spdlog::debug("[OperationQueue] Queued {} at {} (depth {})", id, tierName(tier),
                          lanes_.totalSize());
            warnHighWaterLocked();

            if (!dispatcherActive_) {
                dispatcherActive_ = true;
                spawnTracked(dispatchLoop());
            }
        }
    }

    if (inlineRun) {
        spdlog::trace("[OperationQueue] Fast path for {} ({})", id, tierName(tier));
        auto r = op->attempt();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inlineActive_ = false;
            if (r) {
                ++totalProcessed_;
                ++fastPathExecutions_;
            }
        }
        if (r) {
            op->resolve(std::move(r).value());
        } else {
            spdlog::debug("[OperationQueue] Fast path {} failed: {}", id, r.error().message);
            op->reject(r.error());
        }
    }
    return id;
}

void OperationQueue::warnHighWaterLocked() {
    const auto depth = lanes_.totalSize();
    if (depth > config_.queueHighWaterMark) {
        if (!highWaterWarned_) {
            highWaterWarned_ = true;
            spdlog::warn("[OperationQueue] Queue depth {} exceeds high-water mark {}", depth,
                         config_.queueHighWaterMark);
        }
    } else {
        highWaterWarned_ = false;
    }
}

void OperationQueue::spawnTracked(boost::asio::awaitable<void> task) {
    {
        std::lock_guard<std::mutex> g(taskMutex_);
        ++liveTasks_;
    }
    boost::asio::co_spawn(strand_, std::move(task), [this](std::exception_ptr ep) {
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                spdlog::error("[OperationQueue] Dispatcher task failed: {}", e.what());
            }
            // Let the next submission start a fresh dispatcher.
            std::lock_guard<std::mutex> lock(mutex_);
            dispatcherActive_ = false;
        }
        std::lock_guard<std::mutex> g(taskMutex_);
        --liveTasks_;
        tasksDone_.notify_all();
    });
}

boost::asio::awaitable<void> OperationQueue::dispatchLoop() {
    auto exec = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer pause(exec);
    std::optional<SteadyTime> wakeAt;

    spdlog::trace("[OperationQueue] Dispatcher started");
    std::vector<Rejection> rejections;
    for (;;) {
        ItemPtr item;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = SteadyClock::now();
            sweepExpiredLeasesLocked(now, rejections);
            if (!running_) {
                dispatcherActive_ = false;
                break;
            }
            item = lanes_.nextItem(now);
            if (!item) {
                dispatcherActive_ = false;
                wakeAt = lanes_.earliestRetryAt();
                break;
            }
        }
        deliver(rejections);

        // Aging keeps running while we wait. Stop waiting as soon as this item
        // is no longer the one to run next at this tier (cleared, promoted,
        // shut down, or overtaken by a higher-priority submission).
        const auto waitTier = item->priority;
        auto stillNext = [this, item, waitTier]() {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = SteadyClock::now();
            lanes_.agePending(now);
            return running_ && item->priority == waitTier && lanes_.selectNext(now) == item;
        };
        const bool admitted =
            co_await admission_.waitForResources(waitTier, config_.maxWait, stillNext, item->id);

        std::shared_ptr<AttemptState> state;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_ || item->priority != waitTier ||
                lanes_.selectNext(SteadyClock::now()) != item) {
                continue;
            }
            lanes_.remove(*item);
            if (!admitted) {
                ++resourceTimeouts_;
                spdlog::warn("[OperationQueue] {} ({}) not admitted within {}ms", item->id,
                             tierName(item->priority), config_.maxWait.count());
                if (auto r = nackLocked(item, Error{ErrorCode::Timeout,
                                                    "Resource timeout after " +
                                                        std::to_string(config_.maxWait.count()) +
                                                        "ms"})) {
                    rejections.push_back(std::move(*r));
                }
            } else {
                const auto now = SteadyClock::now();
                item->status = ItemStatus::Processing;
                item->startedAt = now;
                item->leaseExpiresAt = now + config_.leaseTimeout;
                item->nextRetryAt.reset();
                item->agingFrozen = false;
                ++item->attempt;
                inFlight_[item->id] = item;
                spdlog::debug("[OperationQueue] Dispatching {} ({}, attempt {}) after {:.0f}ms",
                              item->id, tierName(item->priority), item->attempt,
                              millisBetween(item->enqueuedAt, now));

                state = std::make_shared<AttemptState>(exec);
                state->timer.expires_at(*item->leaseExpiresAt);
            }
        }

        if (state) {
            currentAttempt_ = state;
            boost::asio::post(executor_,
                              [state, op = item->operation, strand = strand_]() mutable {
                                  auto r = op->attempt();
                                  boost::asio::post(strand, [state, r = std::move(r)]() mutable {
                                      state->outcome = std::move(r);
                                      state->done = true;
                                      state->timer.cancel();
                                  });
                              });

            boost::system::error_code ec;
            co_await state->timer.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            currentAttempt_.reset();

            bool acked = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state->done) {
                    if (state->outcome->has_value()) {
                        acked = ackLocked(item);
                    } else {
                        spdlog::debug("[OperationQueue] {} failed: {}", item->id,
                                      state->outcome->error().message);
                        nackById(item->id, state->outcome->error(), rejections);
                    }
                } else if (!running_) {
                    if (inFlight_.erase(item->id) > 0) {
                        rejections.push_back(Rejection{
                            item->operation,
                            Error{ErrorCode::SystemShutdown, "operation queue shut down"}});
                    }
                } else {
                    sweepExpiredLeasesLocked(SteadyClock::now(), rejections);
                }
            }
            // Not acked means the lease was already swept; the late value is dropped.
            if (acked) {
                item->operation->resolve(state->outcome->value());
            }
        }
        deliver(rejections);

        if (config_.interItemDelay.count() > 0) {
            pause.expires_after(config_.interItemDelay);
            boost::system::error_code ec;
            co_await pause.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
    }
    deliver(rejections);

    spdlog::trace("[OperationQueue] Dispatcher idle");
    if (wakeAt) {
        scheduleWake(*wakeAt);
    }
}

void OperationQueue::scheduleWake(SteadyTime at) {
    if (wakeTimer_) {
        wakeTimer_->cancel();
    }
    wakeTimer_ = std::make_shared<boost::asio::steady_timer>(strand_, at);
    spawnTracked(retryWake(wakeTimer_));
}

boost::asio::awaitable<void>
OperationQueue::retryWake(std::shared_ptr<boost::asio::steady_timer> timer) {
    boost::system::error_code ec;
    co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return; // superseded or stopping
    }

    bool resume = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ && !dispatcherActive_) {
            dispatcherActive_ = true;
            resume = true;
        }
    }
    if (resume) {
        spdlog::trace("[OperationQueue] Retry delay elapsed, resuming dispatcher");
        co_await dispatchLoop();
    }
}

bool OperationQueue::ackLocked(const ItemPtr& item) {
    if (inFlight_.erase(item->id) == 0) {
        return false;
    }
    const auto now = SteadyClock::now();
    item->status = ItemStatus::Completed;
    item->leaseExpiresAt.reset();
    ++totalProcessed_;
    totalWaitMs_ += millisBetween(item->enqueuedAt, now);
    spdlog::debug("[OperationQueue] Completed {} in {:.0f}ms", item->id,
                  millisBetween(item->startedAt.value_or(now), now));
    return true;
}

std::chrono::milliseconds OperationQueue::retryDelayFor(const QomsConfig& config,
                                                        std::uint32_t retryCount) {
    const auto exponent = retryCount > 0 ? retryCount - 1 : 0;
    const double raw = static_cast<double>(config.baseRetryDelay.count()) *
                       std::pow(config.backoffMultiplier, static_cast<double>(exponent));
    const double capped = std::min(raw, static_cast<double>(config.maxRetryDelay.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

std::optional<OperationQueue::Rejection> OperationQueue::nackLocked(const ItemPtr& item,
                                                                    Error error) {
    // Lanes were already drained by stop(); a retry would never be dispatched.
    if (!running_) {
        spdlog::debug("[OperationQueue] {} failed during shutdown: {}", item->id, error.message);
        item->startedAt.reset();
        item->leaseExpiresAt.reset();
        return Rejection{item->operation,
                         Error{ErrorCode::SystemShutdown, "operation queue shut down"}};
    }

    const auto now = SteadyClock::now();
    ++item->retryCount;
    ++totalRetries_;
    item->lastError = error.message;
    item->startedAt.reset();
    item->leaseExpiresAt.reset();

    if (item->retryCount >= config_.maxRetries) {
        item->status = ItemStatus::Dlq;
        const auto evicted = dlq_.push(DLQEntry{item->id, item->originalPriority,
                                                item->enqueuedWall,
                                                std::chrono::system_clock::now(),
                                                item->retryCount, item->lastError});
        spdlog::info("[OperationQueue] {} moved to dead-letter queue after {} attempt(s): {}",
                     item->id, item->retryCount, item->lastError);
        if (evicted > 0) {
            spdlog::debug("[OperationQueue] Dead-letter queue full, evicted {} entr{}", evicted,
                          evicted == 1 ? "y" : "ies");
        }
        return Rejection{item->operation,
                         Error{ErrorCode::RetriesExhausted,
                               "Operation failed after " + std::to_string(item->retryCount) +
                                   " retries. Last error: " + item->lastError}};
    }

    const auto delay = retryDelayFor(config_, item->retryCount);
    item->status = ItemStatus::Pending;
    item->nextRetryAt = now + delay;
    lanes_.reinsert(item);
    spdlog::debug("[OperationQueue] {} retry {}/{} in {}ms: {}", item->id, item->retryCount,
                  config_.maxRetries, delay.count(), item->lastError);
    return std::nullopt;
}

OperationQueue::NackOutcome OperationQueue::nackById(const std::string& id, Error error,
                                     std::vector<Rejection>& out) {
    auto it = inFlight_.find(id);
    if (it == inFlight_.end()) {
        return NackOutcome::NotFound;
    }
    auto item = it->second;
    inFlight_.erase(it);
    if (auto r = nackLocked(item, std::move(error))) {
        const bool shutdown = r->error.code == ErrorCode::SystemShutdown;
        out.push_back(std::move(*r));
        return shutdown ? NackOutcome::Shutdown : NackOutcome::DeadLettered;
    }
    return NackOutcome::Retry;
}

std::size_t OperationQueue::sweepExpiredLeasesLocked(SteadyTime now,
                                                     std::vector<Rejection>& out) {
    std::vector<std::string> expired;
    for (const auto& [id, item] : inFlight_) {
        if (item->leaseExpiresAt && now >= *item->leaseExpiresAt) {
            expired.push_back(id);
        }
    }
    for (const auto& id : expired) {
        ++leaseExpirations_;
        spdlog::warn("[OperationQueue] Lease expired for {} after {}ms", id,
                     config_.leaseTimeout.count());
        nackById(id, Error{ErrorCode::LeaseExpired, "Lease timeout - operation took too long"},
                 out);
    }
    return expired.size();
}

void OperationQueue::deliver(std::vector<Rejection>& rejections) {
    for (auto& r : rejections) {
        r.operation->reject(std::move(r.error));
    }
    rejections.clear();
}

QueueStats OperationQueue::getStats() {
    QueueStats stats;
    stats.resources = monitor_.sample();
    stats.config = config_;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto tier : kAllTiers) {
        stats.laneLengths[tierIndex(tier)] = lanes_.laneSize(tier);
    }
    stats.totalQueued = lanes_.totalSize();
    stats.inFlight = inFlight_.size();
    stats.pendingRetries = lanes_.pendingRetries();
    stats.totalRetries = totalRetries_;
    stats.dlqSize = dlq_.size();
    stats.dlqEvicted = dlq_.evictedTotal();
    stats.dispatcherRunning = dispatcherActive_;
    stats.totalProcessed = totalProcessed_;
    stats.avgWaitMs =
        totalProcessed_ > 0 ? totalWaitMs_ / static_cast<double>(totalProcessed_) : 0.0;
    stats.promotions = lanes_.promotions();
    stats.fastPathExecutions = fastPathExecutions_;
    stats.leaseExpirations = leaseExpirations_;
    stats.resourceTimeouts = resourceTimeouts_;
    return stats;
}

std::size_t OperationQueue::clearQueue() {
    std::vector<ItemPtr> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained = lanes_.drain();
        highWaterWarned_ = false;
    }
    for (auto& item : drained) {
        item->operation->reject(Error{ErrorCode::QueueCleared, "queue cleared"});
    }
    if (!drained.empty()) {
        spdlog::info("[OperationQueue] Cleared {} pending item(s)", drained.size());
    }
    return drained.size();
}

std::vector<DLQEntry> OperationQueue::getDLQ() {
    std::lock_guard<std::mutex> lock(mutex_);
    return dlq_.entries();
}

std::size_t OperationQueue::clearDLQ() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto n = dlq_.clear();
    spdlog::debug("[OperationQueue] Cleared {} dead-letter entr{}", n, n == 1 ? "y" : "ies");
    return n;
}

bool OperationQueue::dismissDLQEntry(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return dlq_.dismiss(id);
}

} // namespace qoms
