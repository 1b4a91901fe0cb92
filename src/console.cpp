/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/console.hpp"

namespace volbatch {

void Console::line(const std::string& text) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << text << '\n' << std::flush;
    } catch (...) {
        // Console output is best effort
    }
}

void Console::block(const std::string& text) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << text << std::flush;
    } catch (...) {
        // Console output is best effort
    }
}

}
