/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <mutex>
#include <ostream>
#include <string>

namespace volbatch {

// Operator-facing output. Whole lines are written under one lock so job
// threads and the status monitor interleave line by line, never mid-line.
class Console final {
public:
    explicit Console(std::ostream& out) noexcept : out_(out) {}

    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    void line(const std::string& text) noexcept;
    void block(const std::string& text) noexcept;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

}
