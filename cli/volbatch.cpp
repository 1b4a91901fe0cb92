/*
 * volbatch - Batch runner (volbatch)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/batch.hpp"
#include "volbatch/config.hpp"
#include "volbatch/console.hpp"
#include "volbatch/logger.hpp"
#include <cstdlib>
#include <iostream>
#include <unistd.h>

using namespace volbatch;

int main(int argc, char* argv[]) {
    // Default to WARN so job lines stay readable; VOLBATCH_LOG_LEVEL overrides
    if (!std::getenv("VOLBATCH_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    else
        Logger::initFromEnv();

    auto parsed = parseArgs(argc, argv);
    if (!parsed) {
        std::cerr << parsed.message << "\n\n";
        printUsage(std::cerr, argv[0]);
        return 2;
    }

    const Config& config = parsed.config;
    if (config.showHelp) {
        printUsage(std::cout, argv[0]);
        return 0;
    }
    if (config.showVersion) {
        std::cout << VERSION << "\n";
        return 0;
    }
    if (config.logLevel) {
        Logger::setLevel(*config.logLevel);
    }

    setThreadName("Main");

    try {
        Console console(std::cout);

        BatchConfig batchConfig;
        batchConfig.toolPath = config.toolPath;
        batchConfig.imagePath = config.imagePath;
        batchConfig.jobListPath = config.jobListPath;
        batchConfig.outputDir = config.outputDir;
        batchConfig.workers = resolveWorkers(config);
        batchConfig.controlFd = STDIN_FILENO;

        Batch batch(batchConfig, console);
        auto result = batch.run();
        if (!result) {
            return 1;
        }

    } catch (const std::exception& e) {
        LOG_ERROR("Batch error: " + std::string(e.what()));
        return 1;
    } catch (...) {
        LOG_ERROR("Unknown batch error");
        return 1;
    }

    LOG_DEBUG("volbatch finished");
    return 0;
}
