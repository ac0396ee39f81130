// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <qoms/core/types.h>
#include <qoms/scheduler/PriorityTier.h>

#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace qoms {

enum class ItemStatus : std::uint8_t { Pending, Processing, Completed, Dlq };

/**
 * @brief Type-erased unit of work plus the caller's completion handle.
 *
 * attempt() may be called more than once (retries) and, after a lease
 * expiry, concurrently with a still-running earlier attempt. It therefore
 * returns the produced value instead of storing it; the scheduler hands that
 * value back through resolve() only for the attempt it acknowledges.
 */
class QueuedOperation {
public:
    virtual ~QueuedOperation() = default;

    /// Runs one attempt. Exceptions are converted to OperationFailed.
    virtual Result<std::shared_ptr<void>> attempt() = 0;

    /// Completes the caller's future with a value returned by attempt().
    virtual void resolve(std::shared_ptr<void> value) = 0;

    /// Completes the caller's future with an error.
    virtual void reject(Error error) = 0;
};

template <typename T> class TypedOperation final : public QueuedOperation {
public:
    using Fn = std::function<Result<T>()>;

    explicit TypedOperation(Fn fn) : fn_(std::move(fn)) {}

    std::future<Result<T>> future() { return promise_.get_future(); }

    Result<std::shared_ptr<void>> attempt() override {
        try {
            auto r = fn_();
            if (!r) {
                return r.error();
            }
            if constexpr (std::is_void_v<T>) {
                return std::shared_ptr<void>{};
            } else {
                return std::shared_ptr<void>(std::make_shared<T>(std::move(r).value()));
            }
        } catch (const std::exception& e) {
            return Error{ErrorCode::OperationFailed, e.what()};
        } catch (...) {
            return Error{ErrorCode::OperationFailed, "non-standard exception thrown"};
        }
    }

    void resolve(std::shared_ptr<void> value) override {
        if constexpr (std::is_void_v<T>) {
            (void)value;
            promise_.set_value(Result<void>{});
        } else {
            promise_.set_value(Result<T>(std::move(*std::static_pointer_cast<T>(value))));
        }
    }

    void reject(Error error) override { promise_.set_value(Result<T>(std::move(error))); }

private:
    Fn fn_;
    std::promise<Result<T>> promise_;
};

/**
 * @brief A queued unit of work and its scheduling state.
 *
 * Owned by the scheduler through shared_ptr; it sits in exactly one lane
 * while pending and is referenced from the in-flight map while processing.
 */
struct QueueItem {
    std::string id;
    std::uint64_t seq{0}; ///< Submission order, keeps lane position across retries
    PriorityTier priority{PriorityTier::Medium};         ///< Current tier (aging may raise it)
    PriorityTier originalPriority{PriorityTier::Medium}; ///< Tier at submission
    std::shared_ptr<QueuedOperation> operation; ///< Shared with a running attempt
    SteadyTime enqueuedAt{};
    WallTime enqueuedWall{};
    ItemStatus status{ItemStatus::Pending};
    std::uint32_t retryCount{0};
    std::string lastError;
    std::optional<SteadyTime> nextRetryAt;
    std::optional<SteadyTime> startedAt;
    std::optional<SteadyTime> leaseExpiresAt;
    bool agingFrozen{false};   ///< Set once promoted; cleared when dispatched
    std::uint64_t attempt{0};  ///< Number of times dispatched
};

/// Terminal failure record kept in the dead-letter queue.
struct DLQEntry {
    std::string id;
    PriorityTier priority{PriorityTier::Medium}; ///< Original tier
    WallTime enqueuedAt{};
    WallTime failedAt{};
    std::uint32_t retryCount{0};
    std::string lastError;
};

} // namespace qoms
