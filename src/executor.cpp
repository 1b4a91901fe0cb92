/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/executor.hpp"
#include "volbatch/command.hpp"
#include "volbatch/console.hpp"
#include "volbatch/logger.hpp"
#include "volbatch/registry.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <utility>

namespace volbatch {

namespace {

// O_CLOEXEC: only the child spawned for this job may inherit the descriptor.
class OutputFile final {
public:
    explicit OutputFile(const std::filesystem::path& path) noexcept
        : fd_(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)),
          errno_(fd_ < 0 ? errno : 0) {}
    ~OutputFile() {
        if (fd_ >= 0) ::close(fd_);
    }

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] std::string error() const { return std::strerror(errno_); }

private:
    int fd_;
    int errno_;
};

// Deregisters on every exit path once the job is recorded.
class Registration final {
public:
    Registration(RunRegistry& registry, const JobName& name, TimePoint started)
        : registry_(registry), name_(name) {
        registry_.record(name_, started);
    }
    ~Registration() { registry_.forget(name_); }

    Registration(const Registration&) = delete;
    Registration& operator=(const Registration&) = delete;

private:
    RunRegistry& registry_;
    const JobName& name_;
};

JobError toJobError(CommandError error) noexcept {
    switch (error) {
        case CommandError::None: return JobError::None;
        case CommandError::Launch: return JobError::Launch;
        case CommandError::ExitStatus: return JobError::ExitStatus;
        case CommandError::Signaled: return JobError::Signaled;
        case CommandError::Wait: return JobError::Internal;
    }
    return JobError::Internal;
}

std::string formatSeconds(double seconds) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", seconds);
    return buf;
}

}

Executor::Executor(ExecutorConfig config, RunRegistry& registry, Console& console)
    : config_(std::move(config)), registry_(registry), console_(console) {
    LOG_DEBUG("Executor created - tool: " + config_.toolPath + ", image: " + config_.imagePath +
              ", output: " + config_.outputDir.string());
}

std::string Executor::imageBaseName(const std::string& imagePath) {
    auto pos = imagePath.find_last_of('/');
    if (pos == std::string::npos) {
        return imagePath;
    }
    return imagePath.substr(pos + 1);
}

std::filesystem::path Executor::outputPathFor(const std::filesystem::path& outputDir,
                                              const std::string& imagePath,
                                              const JobName& name) {
    return outputDir / (imageBaseName(imagePath) + "_" + name + ".csv");
}

JobOutcome Executor::run(const JobName& name) noexcept {
    JobOutcome outcome;
    try {
        outcome.name = name;
        outcome.outputPath = outputPathFor(config_.outputDir, config_.imagePath, name);

        OutputFile output(outcome.outputPath);
        if (!output.isOpen()) {
            outcome.status = Status::Skipped;
            outcome.error = JobError::OutputOpen;
            outcome.message = output.error();
            console_.line("Error creating output file for job " + name + ": " + outcome.message);
            LOG_ERROR("Cannot open " + outcome.outputPath.string() + ": " + outcome.message);
            return outcome;
        }

        const auto started = Clock::now();
        Registration registration(registry_, name, started);
        outcome.status = Status::Running;

        Command command{config_.toolPath, {"-f", config_.imagePath, "-r", "csv", name}};
        console_.line("Running job: " + name);
        LOG_DEBUG("Executing: " + command.describe() + " > " + outcome.outputPath.string());

        CommandResult result = runCommand(command, output.fd());
        outcome.elapsedSeconds = secondsSince(started);

        if (result.ok) {
            outcome.status = Status::Done;
            console_.line("    Job " + name + " completed in " + formatSeconds(outcome.elapsedSeconds) + " seconds");
            LOG_INFO("JOB COMPLETED: " + name + " -> " + outcome.outputPath.string());
        } else {
            outcome.status = Status::Failed;
            outcome.error = toJobError(result.error);
            outcome.message = result.message;
            console_.line("!--- Error running job " + name + ": " + result.message);
            LOG_WARN("Job failed: " + name + " - " + result.message);
        }
        return outcome;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception running job " + name + ": " + std::string(e.what()));
        outcome.status = Status::Failed;
        outcome.error = JobError::Internal;
        outcome.message = e.what();
        return outcome;
    }
}

}
