/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/registry.hpp"
#include "volbatch/logger.hpp"

namespace volbatch {

void RunRegistry::record(const JobName& name, TimePoint started) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = running_.insert_or_assign(name, started);
    (void)it;
    if (!inserted) {
        LOG_WARN("Job already running under the same name, start time replaced: " + name);
    }
}

void RunRegistry::forget(const JobName& name) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.erase(name);
}

std::vector<RunEntry> RunRegistry::snapshot() const {
    std::vector<RunEntry> entries;
    std::lock_guard<std::mutex> lock(mutex_);
    entries.reserve(running_.size());
    for (const auto& [name, started] : running_) {
        entries.push_back(RunEntry{name, started});
    }
    return entries;
}

std::size_t RunRegistry::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.size();
}

}
