//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logging with level filtering, console/file sinks and env configuration.
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <cstring>
#include <errno.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <format>
#include <cstdlib>
#include <cctype>
#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Unknown strings map to INFO.
    static LogLevel levelFromString(const std::string& lvl) {
        std::string s; s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
        if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
        if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
        if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
        if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
        return LogLevel::LOG_INFO_LEVEL;
    }

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
            case LogLevel::LOG_INFO_LEVEL: return "INFO";
            case LogLevel::LOG_WARN_LEVEL: return "WARN";
            case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
            case LogLevel::LOG_FATAL_LEVEL: return "FATAL";
        }
        return "INFO";
    }

    // Variadic logging using C++20 std::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = std::vformat(fmt, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            buffer = std::format("Format error: {}", e.what());
        }
        log(level, buffer, file, line);
    }

public:
    // Configure logging
    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    static void setLogLevelFromString(const std::string& level) {
        sLogLevel = levelFromString(level);
    }

    static void setUseStderr(bool enabled) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        sUseStderr = enabled;
    }

    //==========================================================================================================
    // configureFromEnvironment
    // Purpose: Applies EMBEDMCP_LOG_LEVEL, EMBEDMCP_LOG_STDERR and EMBEDMCP_LOG_FILE.
    // Notes:
    //   EMBEDMCP_LOG_COLOR is read lazily on first log line.
    //==========================================================================================================
    static void configureFromEnvironment() {
        const std::string lvl = GetEnvOrDefault("EMBEDMCP_LOG_LEVEL", "");
        if (!lvl.empty()) {
            setLogLevelFromString(lvl);
        }
        const std::string toStderr = GetEnvOrDefault("EMBEDMCP_LOG_STDERR", "0");
        setUseStderr(toStderr == "1" || toStderr == "true" || toStderr == "TRUE");
        const std::string file = GetEnvOrDefault("EMBEDMCP_LOG_FILE", "");
        if (!file.empty()) {
            setLogFile(file);
        }
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        } else {
            // Write a newline and timestamp as the first entry
            sLogFile << "\n=== Log opened at " << timestamp() << " ===\n";
            sLogFile.flush();
        }
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        std::ostringstream oss;
        // Optional ANSI colorization for LABEL only controlled by EMBEDMCP_LOG_COLOR
        static bool colorEnabled = [](){
            const std::string v = GetEnvOrDefault("EMBEDMCP_LOG_COLOR", "1");
            return (v == "1" || v == "true" || v == "TRUE");
        }();
        const char* reset = colorEnabled ? "\033[0m" : "";
        const char* labelColor = "";
        if (colorEnabled) {
            if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
                labelColor = "\033[38;5;88m"; // burgundy
            } else if (::strncmp(level, "WARN", 4) == 0) {
                labelColor = "\033[33m";
            } else {
                labelColor = "\033[35m";
            }
        }
        oss << timestamp() << " [" << labelColor << level << reset << "] " << baseName(file) << ":" << line << ": " << msg << '\n';

        const std::string logMessage = oss.str();
        if (sUseStderr) {
            std::cerr << logMessage;
        } else {
            std::cout << logMessage;
        }

        if (sLogFile.is_open()) {
            sLogFile << logMessage;
            sLogFile.flush();
        }
    }

    static LogLevel sLogLevel;

private:
    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm buf{};
        ::localtime_r(&nowTime, &buf);
        std::ostringstream oss;
        oss << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
        return oss.str();
    }

    static const char* baseName(const char* path) {
        const char* slash = std::strrchr(path, '/');
        return slash ? slash + 1 : path;
    }

    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
    static bool sUseStderr;
};

// Static members declared but not defined here
// Definitions are in Logger.cpp

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
#define FUNC_ENTRY() LOG_DEBUG("ENTER: {}", __FUNCTION__)
#define FUNC_EXIT()  LOG_DEBUG("EXIT:  {}", __FUNCTION__)

// Scope-based entry/exit guard to avoid manual pairs and ensure correct function on exit
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_ENTRY() ((void)0)
#define FUNC_EXIT()  ((void)0)
#define FUNC_SCOPE() ((void)0)
#endif
