/*
 * volbatch - Bounded Batch Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace volbatch {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text) noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
std::string getThreadName(int job_index);

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::volbatch::Logger::error(msg)
#define LOG_WARN(msg)  ::volbatch::Logger::warn(msg)  
#define LOG_INFO(msg)  ::volbatch::Logger::info(msg)
#define LOG_DEBUG(msg) ::volbatch::Logger::debug(msg)
#define LOG_TRACE(msg) ::volbatch::Logger::trace(msg)
