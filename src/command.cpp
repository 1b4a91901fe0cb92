/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "volbatch/command.hpp"
#include "volbatch/logger.hpp"
#include <cerrno>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace volbatch {

namespace {

// posix_spawn attributes and file actions released on every exit path.
struct SpawnSetup {
    posix_spawnattr_t attr;
    posix_spawn_file_actions_t actions;
    bool attrReady = false;
    bool actionsReady = false;

    ~SpawnSetup() {
        if (actionsReady) posix_spawn_file_actions_destroy(&actions);
        if (attrReady) posix_spawnattr_destroy(&attr);
    }
};

CommandResult failure(CommandError error, const std::string& message) {
    CommandResult result;
    result.error = error;
    result.message = message;
    return result;
}

}

std::string Command::describe() const {
    std::string text = program;
    for (const auto& arg : args) {
        text += " " + arg;
    }
    return text;
}

CommandResult runCommand(const Command& command, int stdoutFd) noexcept {
    try {
        std::vector<char*> argv;
        argv.reserve(command.args.size() + 2);
        argv.push_back(const_cast<char*>(command.program.c_str()));
        for (const auto& arg : command.args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        SpawnSetup setup;
        if (int rc = posix_spawnattr_init(&setup.attr); rc != 0) {
            return failure(CommandError::Launch, "posix_spawnattr_init: " + std::string(std::strerror(rc)));
        }
        setup.attrReady = true;
        if (int rc = posix_spawn_file_actions_init(&setup.actions); rc != 0) {
            return failure(CommandError::Launch, "posix_spawn_file_actions_init: " + std::string(std::strerror(rc)));
        }
        setup.actionsReady = true;

        // Default signal dispositions in the child
        sigset_t defaults;
        sigemptyset(&defaults);
        sigaddset(&defaults, SIGPIPE);
        sigaddset(&defaults, SIGINT);
        posix_spawnattr_setsigdefault(&setup.attr, &defaults);
        posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETSIGDEF);

        posix_spawn_file_actions_adddup2(&setup.actions, stdoutFd, STDOUT_FILENO);
        posix_spawn_file_actions_addopen(&setup.actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
        // stdin is the operator's control input; the tool must never read it
        posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

        pid_t pid = -1;
        int rc = posix_spawnp(&pid, command.program.c_str(), &setup.actions, &setup.attr,
                              argv.data(), environ);
        if (rc != 0) {
            LOG_DEBUG("posix_spawnp failed for " + command.program + ": " + std::strerror(rc));
            return failure(CommandError::Launch, "failed to launch " + command.program + ": " + std::strerror(rc));
        }
        LOG_TRACE("Spawned pid " + std::to_string(pid) + ": " + command.describe());

        int status = 0;
        pid_t waited = -1;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited == -1 && errno == EINTR);

        if (waited == -1) {
            return failure(CommandError::Wait, "waitpid: " + std::string(std::strerror(errno)));
        }

        CommandResult result;
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
            if (result.exitCode == 0) {
                result.ok = true;
                return result;
            }
            result.error = CommandError::ExitStatus;
            result.message = "exit status " + std::to_string(result.exitCode);
            return result;
        }
        if (WIFSIGNALED(status)) {
            result.signal = WTERMSIG(status);
            result.error = CommandError::Signaled;
            result.message = "terminated by signal " + std::to_string(result.signal);
            return result;
        }
        result.error = CommandError::Wait;
        result.message = "unexpected wait status " + std::to_string(status);
        return result;

    } catch (const std::exception& e) {
        return failure(CommandError::Launch, "failed to launch " + command.program + ": " + e.what());
    }
}

}
