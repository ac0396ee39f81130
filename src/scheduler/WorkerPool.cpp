// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <qoms/scheduler/WorkerPool.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>

namespace qoms {

std::size_t WorkerPool::effectiveSize(std::size_t requested) noexcept {
    const std::size_t wanted = requested > 0 ? requested : std::thread::hardware_concurrency();
    return std::max(kMinWorkers, wanted);
}

WorkerPool::WorkerPool(std::size_t workers) : guard_(boost::asio::make_work_guard(io_)) {
    const auto count = effectiveSize(workers);
    if (workers > 0 && count != workers) {
        spdlog::warn("[WorkerPool] {} worker(s) requested, using {} so lease timers can fire "
                     "while an operation runs",
                     workers, count);
    }

    workers_.reserve(count);
    try {
        for (std::size_t i = 0; i < count; ++i) {
            workers_.emplace_back([this]() { io_.run(); });
        }
    } catch (const std::system_error& e) {
        spdlog::error("[WorkerPool] Could not create worker {}: {}", workers_.size(), e.what());
        shutdown();
        throw std::runtime_error(std::string("WorkerPool: ") + e.what());
    }
    spdlog::debug("[WorkerPool] Running {} worker(s)", count);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    if (workers_.empty()) {
        return;
    }
    guard_.reset();
    io_.stop();
    for (auto& t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
    spdlog::debug("[WorkerPool] Joined {} worker(s)", workers_.size());
    workers_.clear();
}

boost::asio::any_io_executor WorkerPool::executor() noexcept {
    return io_.get_executor();
}

} // namespace qoms
