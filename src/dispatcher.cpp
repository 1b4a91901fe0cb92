/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/dispatcher.hpp"
#include "volbatch/logger.hpp"
#include <string>
#include <system_error>

namespace volbatch {

namespace {

class TokenGuard final {
public:
    explicit TokenGuard(TokenPool& tokens) noexcept : tokens_(tokens) {}
    ~TokenGuard() { tokens_.release(); }

    TokenGuard(const TokenGuard&) = delete;
    TokenGuard& operator=(const TokenGuard&) = delete;

private:
    TokenPool& tokens_;
};

}

TokenPool::TokenPool(int capacity) noexcept
    : capacity_(capacity < 1 ? 1 : capacity), available_(capacity_) {}

void TokenPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [this] { return available_ > 0; });
    --available_;
}

void TokenPool::release() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++available_;
    }
    released_.notify_one();
}

int TokenPool::available() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_;
}

Dispatcher::Dispatcher(int workers) noexcept : tokens_(workers) {
    LOG_DEBUG("Dispatcher created with " + std::to_string(tokens_.capacity()) + " workers");
}

Dispatcher::~Dispatcher() {
    joinAll();
}

std::vector<JobOutcome> Dispatcher::runAll(const std::vector<JobName>& jobs, JobProcessor processor) {
    std::vector<JobOutcome> outcomes(jobs.size());
    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return outcomes;
    }

    jobThreads_.reserve(jobs.size());
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        tokens_.acquire();
        const int index = static_cast<int>(i);
        LOG_DEBUG("Admitting job " + std::to_string(index) + ": " + jobs[i]);

        try {
            jobThreads_.emplace_back([this, &jobs, &outcomes, &processor, index] {
                TokenGuard token(tokens_);
                setThreadName(getThreadName(index));
                const JobName& name = jobs[static_cast<std::size_t>(index)];
                JobOutcome& outcome = outcomes[static_cast<std::size_t>(index)];
                try {
                    outcome = processor(name, index);
                } catch (const std::exception& e) {
                    LOG_ERROR("Job processing error: " + std::string(e.what()) + " (job: " + name + ")");
                    outcome.name = name;
                    outcome.status = Status::Failed;
                    outcome.error = JobError::Internal;
                    outcome.message = e.what();
                }
            });
        } catch (const std::system_error& e) {
            tokens_.release();
            LOG_ERROR("Failed to start thread for job " + jobs[i] + ": " + std::string(e.what()));
            outcomes[i].name = jobs[i];
            outcomes[i].status = Status::Failed;
            outcomes[i].error = JobError::Internal;
            outcomes[i].message = e.what();
        }
    }

    joinAll();
    LOG_DEBUG("All " + std::to_string(jobs.size()) + " jobs finished");
    return outcomes;
}

void Dispatcher::joinAll() noexcept {
    for (auto& thread : jobThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    jobThreads_.clear();
}

}
