/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "volbatch/types.hpp"

namespace volbatch {

struct RunEntry {
    JobName name;
    TimePoint started;
};

// Jobs currently executing, keyed by name. An entry exists only while its
// job runs. A duplicate name overwrites the earlier entry's start time.
class RunRegistry final {
public:
    RunRegistry() = default;

    RunRegistry(const RunRegistry&) = delete;
    RunRegistry& operator=(const RunRegistry&) = delete;
    RunRegistry(RunRegistry&&) = delete;
    RunRegistry& operator=(RunRegistry&&) = delete;

    void record(const JobName& name, TimePoint started);
    void forget(const JobName& name) noexcept;

    // Point-in-time copy; the lock is held only while copying.
    [[nodiscard]] std::vector<RunEntry> snapshot() const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

private:
    mutable std::mutex mutex_;
    std::unordered_map<JobName, TimePoint> running_;
};

}
