/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/config.hpp"
#include <cstdlib>
#include <exception>
#include <thread>

namespace volbatch {

namespace {

std::optional<int> parsePositive(const std::string& text) noexcept {
    if (text.empty()) return std::nullopt;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    try {
        int value = std::stoi(text);
        if (value < 1) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

ConfigResult fail(ConfigError error, const std::string& message) {
    ConfigResult result;
    result.error = error;
    result.message = message;
    return result;
}

}

ConfigResult parseArgs(int argc, const char* const argv[]) {
    ConfigResult result;
    Config& config = result.config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
            result.ok = true;
            return result;
        }
        if (arg == "-v" || arg == "--version") {
            config.showVersion = true;
            result.ok = true;
            return result;
        }
        if (arg == "-q" || arg == "--quiet") {
            config.logLevel = LogLevel::ERROR;
            continue;
        }
        if (arg == "--verbose") {
            config.logLevel = LogLevel::DEBUG;
            continue;
        }

        std::string* target = nullptr;
        if (arg == "-p" || arg == "--tool") target = &config.toolPath;
        else if (arg == "-i" || arg == "--image") target = &config.imagePath;
        else if (arg == "-m" || arg == "--modules") target = &config.jobListPath;
        else if (arg == "-o" || arg == "--output") target = &config.outputDir;

        if (target) {
            if (i + 1 >= argc) {
                return fail(ConfigError::MissingValue, arg + " requires a value");
            }
            *target = argv[++i];
            continue;
        }

        if (arg == "-w" || arg == "--workers") {
            if (i + 1 >= argc) {
                return fail(ConfigError::MissingValue, arg + " requires a value");
            }
            auto workers = parsePositive(argv[++i]);
            if (!workers) {
                return fail(ConfigError::InvalidWorkers, "Invalid worker count: " + std::string(argv[i]));
            }
            config.workers = *workers;
            continue;
        }

        return fail(ConfigError::UnknownOption, "Unknown option: " + arg);
    }

    if (config.toolPath.empty() || config.imagePath.empty() ||
        config.jobListPath.empty() || config.outputDir.empty()) {
        return fail(ConfigError::MissingRequired, "All flags (-p, -i, -m, -o) are required.");
    }

    result.ok = true;
    return result;
}

int defaultWorkers(unsigned hardwareThreads) noexcept {
    int workers = static_cast<int>(hardwareThreads) - 1;
    return workers < 1 ? 1 : workers;
}

int resolveWorkers(const Config& config) noexcept {
    if (config.workers > 0) {
        return config.workers;
    }
    if (const char* env = std::getenv("VOLBATCH_WORKERS")) {
        if (auto workers = parsePositive(env)) {
            return *workers;
        }
        LOG_WARN("Ignoring invalid VOLBATCH_WORKERS: " + std::string(env));
    }
    return defaultWorkers(std::thread::hardware_concurrency());
}

void printUsage(std::ostream& out, const char* progName) {
    out << "volbatch Batch Runner v" << VERSION << "\n\n";
    out << "Runs every module in a list against one memory image, a bounded\n";
    out << "number at a time, writing each module's CSV output to its own file.\n\n";
    out << "Usage: " << progName << " -p <tool> -i <image> -m <modules> -o <outdir> [options]\n";
    out << "       " << progName << " --help | --version\n\n";
    out << "Required:\n";
    out << "  -p, --tool <path>      Analysis executable (e.g. vol)\n";
    out << "  -i, --image <path>     Memory image to analyse\n";
    out << "  -m, --modules <path>   Module list, one name per line\n";
    out << "  -o, --output <dir>     Output directory (created if missing)\n\n";
    out << "Options:\n";
    out << "  -w, --workers <n>      Modules run at once (default: CPUs - 1, at least 1)\n";
    out << "  -q, --quiet            Only log errors\n";
    out << "      --verbose          Debug logging\n";
    out << "  -h, --help             Show this help message\n";
    out << "  -v, --version          Show version\n\n";
    out << "Environment Variables:\n";
    out << "  VOLBATCH_LOG_LEVEL     Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    out << "  VOLBATCH_WORKERS       Default worker count when -w is not given\n\n";
    out << "While running:\n";
    out << "  Press Enter to print the modules currently running and their runtime.\n\n";
    out << "Output:\n";
    out << "  <outdir>/<image name>_<module>.csv, overwritten if present.\n\n";
    out << "Example:\n";
    out << "  " << progName << " -p /usr/bin/vol -i /cases/image.dd -m modules.txt -o /cases/out\n";
}

}
