/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/batch.hpp"
#include "volbatch/console.hpp"
#include "volbatch/dispatcher.hpp"
#include "volbatch/joblist.hpp"
#include "volbatch/logger.hpp"
#include "volbatch/monitor.hpp"
#include <cstdio>
#include <system_error>
#include <utility>

namespace volbatch {

Batch::Batch(BatchConfig config, Console& console)
    : config_(std::move(config)), console_(console) {
    LOG_DEBUG("Batch created - tool: " + config_.toolPath + ", image: " + config_.imagePath +
              ", modules: " + config_.jobListPath.string() + ", output: " + config_.outputDir.string() +
              ", workers: " + std::to_string(config_.workers));
}

bool Batch::createOutputDir(std::string& error) noexcept {
    try {
        std::error_code ec;
        std::filesystem::create_directories(config_.outputDir, ec);
        if (ec) {
            error = ec.message();
            return false;
        }
        if (!std::filesystem::is_directory(config_.outputDir, ec)) {
            error = "not a directory";
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

BatchResult Batch::run() {
    BatchResult result;

    std::string dirError;
    if (!createOutputDir(dirError)) {
        result.error = BatchError::OutputDir;
        result.message = "Error creating output directory " + config_.outputDir.string() + ": " + dirError;
        LOG_ERROR(result.message);
        return result;
    }

    auto jobList = loadJobList(config_.jobListPath);
    if (!jobList) {
        result.error = BatchError::JobList;
        result.message = "Error reading modules file: " + jobList.message;
        LOG_ERROR(result.message);
        return result;
    }
    if (jobList.jobs.empty()) {
        LOG_WARN("Module list is empty: " + config_.jobListPath.string());
    }

    Dispatcher dispatcher(config_.workers);
    console_.line("Using up to " + std::to_string(dispatcher.workerCount()) + " workers");

    const auto totalStart = Clock::now();

    StatusMonitor monitor(registry_, console_, config_.controlFd);
    if (config_.controlFd >= 0 && !monitor.start()) {
        LOG_WARN("Continuing without status monitor");
    }

    Executor executor(ExecutorConfig{config_.toolPath, config_.imagePath, config_.outputDir},
                      registry_, console_);
    result.outcomes = dispatcher.runAll(jobList.jobs, [&executor](const JobName& name, int) {
        return executor.run(name);
    });

    monitor.stop();
    result.elapsedSeconds = secondsSince(totalStart);

    for (const auto& outcome : result.outcomes) {
        switch (outcome.status) {
            case Status::Done: ++result.succeeded; break;
            case Status::Skipped: ++result.skipped; break;
            default: ++result.failed; break;
        }
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", result.elapsedSeconds);
    console_.line("All jobs completed in " + std::string(buf) + " seconds.");
    LOG_INFO("Batch summary: " + std::to_string(result.succeeded) + " succeeded, " +
             std::to_string(result.failed) + " failed, " + std::to_string(result.skipped) + " skipped");

    result.ok = true;
    return result;
}

}
