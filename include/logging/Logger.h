//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger. Console output always goes to stderr (stdout carries protocol frames).
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <cstring>
#include <cerrno>
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

// Output shape for every line written by Logger.
enum class LogFormat {
    Text,
    Json
};

class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Defaults to INFO.
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

    static LogFormat formatFromString(const std::string& fmt) {
        std::string s; s.reserve(fmt.size());
        for (char c : fmt) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
        return (s == "json") ? LogFormat::Json : LogFormat::Text;
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

    static void setLogFormat(LogFormat format) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        sLogFormat = format;
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        if (filePath.empty()) {
            return;
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        } else if (sLogFormat == LogFormat::Text) {
            std::tm buf = localNow();
            sLogFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
            sLogFile.flush();
        }
    }

    //==========================================================================================================
    // Applies TOOLRPC_LOG_LEVEL, TOOLRPC_LOG_FORMAT and TOOLRPC_LOG_FILE. Unset variables leave the current
    // setting untouched.
    //==========================================================================================================
    static void configureFromEnvironment() {
        const std::string lvl = GetEnvOrDefault("TOOLRPC_LOG_LEVEL", "");
        if (!lvl.empty()) setLogLevel(levelFromString(lvl));
        const std::string fmt = GetEnvOrDefault("TOOLRPC_LOG_FORMAT", "");
        if (!fmt.empty()) setLogFormat(formatFromString(fmt));
        const std::string file = GetEnvOrDefault("TOOLRPC_LOG_FILE", "");
        if (!file.empty()) setLogFile(file);
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        std::string logMessage;
        if (sLogFormat == LogFormat::Json) {
            std::ostringstream comp;
            comp << baseName(file) << ":" << line;
            logMessage = "{\"timestamp\":\"" + isoTimestamp() + "\",\"level\":\"" + level +
                         "\",\"component\":\"" + jsonEscape(comp.str()) +
                         "\",\"message\":\"" + jsonEscape(msg) + "\"}\n";
        } else {
            std::ostringstream oss;
            // Optional ANSI colorization for LABEL only controlled by TOOLRPC_LOG_COLOR
            static bool colorEnabled = [](){
                const std::string v = GetEnvOrDefault("TOOLRPC_LOG_COLOR", "0");
                return (v == "1" || v == "true" || v == "TRUE");
            }();
            const char* reset = colorEnabled ? "\033[0m" : "";
            const char* labelColor = "";
            if (colorEnabled) {
                labelColor = (::strncmp(level, "ERROR", 5) == 0) ? "\033[38;5;88m" : "\033[35m";
            }
            if (*labelColor) {
                oss << "[" << labelColor << level << reset << "] " << baseName(file) << ":" << line << ": " << msg << "\n";
            } else {
                oss << "[" << level << "] " << baseName(file) << ":" << line << ": " << msg << "\n";
            }
            logMessage = oss.str();
        }
        emitLocked(logMessage);
    }

    //==========================================================================================================
    // writeStructured
    // Purpose: Writes an already-serialized JSON object as one line to the log sinks, sharing the logger mutex.
    // Args:
    //   jsonLine: Complete JSON object text without trailing newline.
    //==========================================================================================================
    static void writeStructured(const std::string& jsonLine) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        emitLocked(jsonLine + "\n");
    }

    // ISO-8601 UTC timestamp with millisecond precision.
    static std::string isoTimestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm buf{};
        ::gmtime_r(&t, &buf);
        std::ostringstream oss;
        oss << std::put_time(&buf, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
        return oss.str();
    }

    static std::string jsonEscape(const std::string& s) {
        std::string out; out.reserve(s.size() + 8);
        for (unsigned char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (c < 0x20) { out += std::format("\\u{:04x}", static_cast<unsigned int>(c)); }
                    else { out.push_back(static_cast<char>(c)); }
            }
        }
        return out;
    }

    static LogLevel sLogLevel;

private:
    static void emitLocked(const std::string& line) {
        std::cerr << line;
        std::cerr.flush();
        if (sLogFile.is_open()) {
            sLogFile << line;
            sLogFile.flush();
        }
    }

    static const char* baseName(const char* path) {
        const char* slash = std::strrchr(path, '/');
        return slash ? slash + 1 : path;
    }

    static std::tm localNow() {
        std::time_t now_time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm buf{};
        ::localtime_r(&now_time, &buf);
        return buf;
    }

    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
    static LogFormat sLogFormat;
};

// Static members declared but not defined here
// Definitions are in Logger.cpp

// Enhanced logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
