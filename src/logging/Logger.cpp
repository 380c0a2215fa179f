//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static members and the stderr/file sink.
//==========================================================================================================

#include "logging/Logger.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

#include "env/EnvVars.h"

// Define static members
LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

// -1 = decide from environment on first use
std::atomic<int> gColorOverride{-1};

bool colorEnabled() {
    const int forced = gColorOverride.load();
    if (forced >= 0) {
        return forced == 1;
    }
    static const bool fromEnv = GetEnvBoolOrDefault("CODEBRIDGE_LOG_COLOR", ::isatty(STDERR_FILENO) == 1);
    return fromEnv;
}

std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm buf{};
    ::localtime_r(&t, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

// Strip the directory part so lines stay readable with out-of-tree builds.
const char* baseName(const char* file) {
    const char* slash = std::strrchr(file, '/');
    return slash ? slash + 1 : file;
}

} // namespace

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s; s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG" || s == "TRACE") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "OFF" || s == "NONE") return LogLevel::LOG_OFF_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

void Logger::setColorEnabled(bool enabled) {
    gColorOverride.store(enabled ? 1 : 0);
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return false;
    }
    sLogFile << "\n=== Log opened at " << timestamp() << " ===\n";
    sLogFile.flush();
    return true;
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    const bool color = colorEnabled();
    const std::string ts = timestamp();

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostringstream plain;
    plain << ts << " [" << level << "] " << baseName(file) << ":" << line << ": " << msg << '\n';

    if (color) {
        const char* labelColor = (::strncmp(level, "ERROR", 5) == 0) ? "\033[38;5;88m" /* burgundy */
                               : (::strncmp(level, "WARN", 4) == 0)  ? "\033[33m"       /* yellow */
                                                                      : "\033[35m";     /* purple */
        std::cerr << ts << " [" << labelColor << level << "\033[0m] " << baseName(file) << ":" << line << ": "
                  << msg << '\n';
    } else {
        std::cerr << plain.str();
    }
    std::cerr.flush();

    if (sLogFile.is_open()) {
        sLogFile << plain.str();
        sLogFile.flush();
    }
}
