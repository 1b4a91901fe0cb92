/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "volbatch/executor.hpp"
#include "volbatch/types.hpp"

namespace volbatch {

using JobProcessor = std::function<JobOutcome(const JobName&, int jobIndex)>;

// Counting semaphore with a fixed number of tokens.
class TokenPool final {
public:
    explicit TokenPool(int capacity) noexcept;

    TokenPool(const TokenPool&) = delete;
    TokenPool& operator=(const TokenPool&) = delete;

    void acquire();
    void release() noexcept;

    [[nodiscard]] int capacity() const noexcept { return capacity_; }
    [[nodiscard]] int available() const noexcept;

private:
    int capacity_;
    int available_;
    mutable std::mutex mutex_;
    std::condition_variable released_;
};

// Starts one thread per job in list order, never more than `workers`
// executing at once.
class Dispatcher final {
public:
    explicit Dispatcher(int workers) noexcept;
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    // Blocks until every job has started and finished. Outcomes are returned
    // in job-list order.
    [[nodiscard]] std::vector<JobOutcome> runAll(const std::vector<JobName>& jobs, JobProcessor processor);

    [[nodiscard]] int workerCount() const noexcept { return tokens_.capacity(); }

private:
    void joinAll() noexcept;

    TokenPool tokens_;
    std::vector<std::thread> jobThreads_;
};

}
