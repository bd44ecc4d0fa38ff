//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger line formatting and sinks. The initial level honours RR_LOG_LEVEL and RR_LOG_FILE opens a
//          log file at startup.
//==========================================================================================================

#include "logging/Logger.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>
#include <thread>

// Define static members
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("RR_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

namespace {

// "2025-01-31 12:00:00.123"
std::string timestampNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm buf{};
    ::localtime_r(&secs, &buf);
    char text[32];
    std::strftime(text, sizeof(text), "%Y-%m-%d %H:%M:%S", &buf);
    return fmt::format("{}.{:03}", text, ms);
}

// Keeps log lines short: ".../src/rr/HttpExecutor.cpp" becomes "HttpExecutor.cpp".
const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

const char* labelColor(const char* level) {
    if (std::strncmp(level, "ERROR", 5) == 0 || std::strncmp(level, "FATAL", 5) == 0) {
        return "\033[38;5;88m"; // burgundy
    }
    if (std::strncmp(level, "WARN", 4) == 0) {
        return "\033[33m"; // yellow
    }
    return "\033[35m"; // purple
}

// Opens RR_LOG_FILE once static members exist.
const bool sEnvLogFileOpened = []() {
    const std::string path = GetEnvOrDefault("RR_LOG_FILE", "");
    return !path.empty() && Logger::setLogFile(path);
}();

} // namespace

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
    sLogFile << "\n=== Log opened at " << timestampNow() << " ===\n";
    sLogFile.flush();
    return true;
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    // ANSI colour on the console label only; RR_LOG_COLOR=0 disables it
    static const bool colorEnabled = GetEnvBoolOrDefault("RR_LOG_COLOR", true);
    // RR_LOG_STDERR=1 keeps stdout clean for embedding CLIs
    static const bool useStderr = GetEnvBoolOrDefault("RR_LOG_STDERR", false);

    const std::string stamp = timestampNow();
    const std::size_t tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;
    const std::string tail = fmt::format("[{:05}] {}:{}: {}\n", tid, baseName(file), line, msg);

    std::lock_guard<std::mutex> lock(sLogMutex);
    std::ostream& console = useStderr ? std::cerr : std::cout;
    if (colorEnabled) {
        console << stamp << " [" << labelColor(level) << level << "\033[0m] " << tail;
    } else {
        console << stamp << " [" << level << "] " << tail;
    }
    console.flush();

    if (sLogFile.is_open()) {
        sLogFile << stamp << " [" << level << "] " << tail;
        sLogFile.flush();
    }
}
