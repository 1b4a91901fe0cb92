#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace volbatch {

// Job lifecycle as seen by the console and the batch summary.
enum class Status : std::uint8_t { Pending, Running, Done, Failed, Skipped };

// Module name passed to the external tool. Not unique across a batch.
using JobName = std::string;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

inline double secondsSince(TimePoint start) noexcept {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

} // namespace volbatch
