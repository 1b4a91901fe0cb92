/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "volbatch/logger.hpp"

namespace volbatch {

constexpr const char* VERSION = "0.1.0";

struct Config {
    std::string toolPath;
    std::string imagePath;
    std::string jobListPath;
    std::string outputDir;
    int workers = 0; // 0 = derive from hardware
    std::optional<LogLevel> logLevel;
    bool showHelp = false;
    bool showVersion = false;
};

enum class ConfigError : uint8_t {
    None = 0,
    MissingRequired,
    MissingValue,
    InvalidWorkers,
    UnknownOption
};

struct ConfigResult {
    bool ok = false;
    Config config;
    ConfigError error = ConfigError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

[[nodiscard]] ConfigResult parseArgs(int argc, const char* const argv[]);

// hardware_concurrency() - 1, never below 1.
[[nodiscard]] int defaultWorkers(unsigned hardwareThreads) noexcept;

// -w wins, then VOLBATCH_WORKERS, then the hardware default.
[[nodiscard]] int resolveWorkers(const Config& config) noexcept;

void printUsage(std::ostream& out, const char* progName);

}
