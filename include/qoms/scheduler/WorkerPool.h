// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace qoms {

/**
 * @brief Thread pool hosting OperationQueue dispatchers and their operations.
 *
 * Workers start in the constructor and run until shutdown(). A dispatcher
 * parks on its lease timer while the operation it dispatched occupies another
 * worker, so the pool never runs with fewer than kMinWorkers threads;
 * smaller requests are raised with a warning.
 *
 * ```cpp
 * WorkerPool pool(4);
 * OperationQueue queue(config, pool.executor());
 * queue.start();
 * ...
 * queue.stop();
 * pool.shutdown();
 * ```
 */
class WorkerPool {
public:
    static constexpr std::size_t kMinWorkers = 2;

    /// @param workers thread count; 0 picks hardware_concurrency
    /// @throws std::runtime_error if a worker thread cannot be created
    explicit WorkerPool(std::size_t workers = 0);

    /// Calls shutdown().
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Stops the io_context and joins every worker. Idempotent.
     *
     * Stop the queues using this pool first; handlers still queued are
     * dropped.
     */
    void shutdown();

    [[nodiscard]] boost::asio::any_io_executor executor() noexcept;

    [[nodiscard]] bool running() const noexcept { return !workers_.empty(); }

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

    /// Thread count the pool uses for a requested size.
    static std::size_t effectiveSize(std::size_t requested) noexcept;

private:
    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> guard_;
    std::vector<std::thread> workers_;
};

} // namespace qoms
