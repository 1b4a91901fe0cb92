/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "volbatch/registry.hpp"
#include "volbatch/types.hpp"

namespace volbatch {

class Console;

// Prints the jobs currently in flight each time a line arrives on the
// control descriptor. Read-only with respect to the batch.
class StatusMonitor final {
public:
    StatusMonitor(const RunRegistry& registry, Console& console, int controlFd) noexcept;
    ~StatusMonitor();

    StatusMonitor(const StatusMonitor&) = delete;
    StatusMonitor& operator=(const StatusMonitor&) = delete;
    StatusMonitor(StatusMonitor&&) = delete;
    StatusMonitor& operator=(StatusMonitor&&) = delete;

    bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    void printSnapshot() const;

    [[nodiscard]] static std::string render(const std::vector<RunEntry>& entries, TimePoint now);

private:
    void listenLoop();

    const RunRegistry& registry_;
    Console& console_;
    int controlFd_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::thread listenerThread_;
};

}
