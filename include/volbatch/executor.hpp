/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

#include "volbatch/types.hpp"

namespace volbatch {

class RunRegistry;
class Console;

enum class JobError : uint8_t {
    None = 0,
    OutputOpen,   // output file could not be created; job never registered
    Launch,
    ExitStatus,
    Signaled,
    Internal
};

struct JobOutcome {
    JobName name;
    Status status = Status::Pending;
    JobError error = JobError::None;
    std::string message;
    std::filesystem::path outputPath;
    double elapsedSeconds = 0.0;

    [[nodiscard]] bool succeeded() const noexcept { return status == Status::Done; }
};

struct ExecutorConfig {
    std::string toolPath;
    std::string imagePath;
    std::filesystem::path outputDir;
};

// Runs one job: `{tool} -f {image} -r csv {name}` with stdout written to
// `{outputDir}/{imageBase}_{name}.csv`. Registers the job while it runs.
class Executor final {
public:
    Executor(ExecutorConfig config, RunRegistry& registry, Console& console);

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(Executor&&) = delete;

    [[nodiscard]] JobOutcome run(const JobName& name) noexcept;

    [[nodiscard]] static std::string imageBaseName(const std::string& imagePath);
    [[nodiscard]] static std::filesystem::path outputPathFor(const std::filesystem::path& outputDir,
                                                             const std::string& imagePath,
                                                             const JobName& name);

private:
    ExecutorConfig config_;
    RunRegistry& registry_;
    Console& console_;
};

}
