/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include "volbatch/types.hpp"

namespace volbatch {

struct JobListResult {
    bool ok = false;
    std::vector<JobName> jobs;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// One job per non-empty line, in file order. Duplicates are kept.
[[nodiscard]] JobListResult parseJobList(std::istream& in);
[[nodiscard]] JobListResult loadJobList(const std::filesystem::path& path);

}
