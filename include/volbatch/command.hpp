/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace volbatch {

struct Command {
    std::string program;            // resolved through PATH when it has no '/'
    std::vector<std::string> args;  // argv[1..]

    [[nodiscard]] std::string describe() const;
};

enum class CommandError : uint8_t {
    None = 0,
    Launch,      // spawn itself failed
    ExitStatus,  // exited with non-zero code
    Signaled,    // terminated by a signal
    Wait         // waitpid failed
};

struct CommandResult {
    bool ok = false;
    CommandError error = CommandError::None;
    int exitCode = -1;
    int signal = 0;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Runs a command to completion. The child's stdout is the given descriptor;
// its stdin and stderr are /dev/null.
[[nodiscard]] CommandResult runCommand(const Command& command, int stdoutFd) noexcept;

}
