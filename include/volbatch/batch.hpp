/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "volbatch/executor.hpp"
#include "volbatch/registry.hpp"

namespace volbatch {

class Console;

struct BatchConfig {
    std::string toolPath;
    std::string imagePath;
    std::filesystem::path jobListPath;
    std::filesystem::path outputDir;
    int workers = 1;
    int controlFd = -1; // -1 = no status monitor
};

enum class BatchError : uint8_t {
    None = 0,
    OutputDir,
    JobList
};

struct BatchResult {
    bool ok = false;
    BatchError error = BatchError::None;
    std::string message;
    std::vector<JobOutcome> outcomes;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    double elapsedSeconds = 0.0;
    explicit operator bool() const noexcept { return ok; }
};

class Batch final {
public:
    Batch(BatchConfig config, Console& console);

    Batch(const Batch&) = delete;
    Batch& operator=(const Batch&) = delete;
    Batch(Batch&&) = delete;
    Batch& operator=(Batch&&) = delete;

    // Runs the whole job list. Fails before any job starts if the output
    // directory or the job list is unusable.
    [[nodiscard]] BatchResult run();

    [[nodiscard]] const RunRegistry& registry() const noexcept { return registry_; }

private:
    [[nodiscard]] bool createOutputDir(std::string& error) noexcept;

    BatchConfig config_;
    Console& console_;
    RunRegistry registry_;
};

}
