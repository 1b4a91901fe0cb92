/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/monitor.hpp"
#include "volbatch/console.hpp"
#include "volbatch/logger.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace volbatch {

namespace {
constexpr int kPollIntervalMs = 100;
}

StatusMonitor::StatusMonitor(const RunRegistry& registry, Console& console, int controlFd) noexcept
    : registry_(registry), console_(console), controlFd_(controlFd) {}

StatusMonitor::~StatusMonitor() {
    stop();
}

bool StatusMonitor::start() {
    if (running_.load()) {
        LOG_WARN("Status monitor already running");
        return false;
    }

    shutdown_.store(false);
    running_.store(true);
    try {
        listenerThread_ = std::thread(&StatusMonitor::listenLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start status monitor: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
    return true;
}

void StatusMonitor::stop() noexcept {
    shutdown_.store(true);
    if (listenerThread_.joinable()) {
        listenerThread_.join();
    }
    running_.store(false);
}

std::string StatusMonitor::render(const std::vector<RunEntry>& entries, TimePoint now) {
    std::string text = "\n---- Currently running jobs ----\n";
    char buf[32];
    for (const auto& entry : entries) {
        double seconds = std::chrono::duration<double>(now - entry.started).count();
        std::snprintf(buf, sizeof(buf), "%.2f", seconds);
        text += entry.name + ", " + buf + " seconds\n";
    }
    text += "---- End ----\n\n";
    return text;
}

void StatusMonitor::printSnapshot() const {
    auto entries = registry_.snapshot();
    auto now = Clock::now();
    // Oldest first reads better than hash order
    std::sort(entries.begin(), entries.end(), [](const RunEntry& a, const RunEntry& b) {
        return a.started < b.started;
    });
    console_.block(render(entries, now));
}

void StatusMonitor::listenLoop() {
    setThreadName("Monitor");
    LOG_DEBUG("Status monitor listening on fd " + std::to_string(controlFd_));

    std::array<char, 256> buf{};
    try {
        while (!shutdown_.load()) {
            pollfd pfd{controlFd_, POLLIN, 0};
            int ready = ::poll(&pfd, 1, kPollIntervalMs);
            if (ready < 0) {
                if (errno == EINTR) continue;
                LOG_WARN("Status monitor poll failed: " + std::string(std::strerror(errno)));
                break;
            }
            if (ready == 0) {
                continue;
            }

            ssize_t n = ::read(controlFd_, buf.data(), buf.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                LOG_WARN("Status monitor read failed: " + std::string(std::strerror(errno)));
                break;
            }
            if (n == 0) {
                LOG_DEBUG("Control input closed");
                break;
            }

            // A read without a newline (raw key, input ending early) still counts once
            auto presses = std::max<std::ptrdiff_t>(1, std::count(buf.begin(), buf.begin() + n, '\n'));
            for (std::ptrdiff_t i = 0; i < presses; ++i) {
                printSnapshot();
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Status monitor error: " + std::string(e.what()));
    }

    running_.store(false);
    LOG_DEBUG("Status monitor stopped");
}

}
