/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/joblist.hpp"
#include "volbatch/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace volbatch {

JobListResult parseJobList(std::istream& in) {
    JobListResult result;
    std::string line;
    std::size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            LOG_TRACE("Skipping blank line " + std::to_string(lineNo));
            continue;
        }
        result.jobs.push_back(line);
    }

    if (in.bad()) {
        result.message = "read error after line " + std::to_string(lineNo);
        return result;
    }

    result.ok = true;
    return result;
}

JobListResult loadJobList(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        JobListResult result;
        result.message = path.string() + " is a directory";
        return result;
    }

    std::ifstream file(path);
    if (!file) {
        JobListResult result;
        result.message = "cannot open " + path.string() + ": " + std::strerror(errno);
        return result;
    }

    JobListResult result = parseJobList(file);
    if (!result.ok) {
        result.message = path.string() + ": " + result.message;
        return result;
    }
    LOG_DEBUG("Loaded " + std::to_string(result.jobs.size()) + " jobs from " + path.string());
    return result;
}

}
