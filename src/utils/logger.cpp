/**
 * @file logger.cpp
 * @brief Logging utilities
 */

#include "utils/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <unordered_set>

namespace overlay_ocr {

namespace {

std::atomic<LogLevel> g_minLogLevel{LogLevel::INFO};
std::mutex g_logMutex;
std::unordered_set<std::string> g_onceKeys;

std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace

void setLogLevel(LogLevel level) {
    g_minLogLevel = level;
}

bool parseLogLevel(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") { level = LogLevel::DEBUG; return true; }
    if (lower == "info") { level = LogLevel::INFO; return true; }
    if (lower == "warning" || lower == "warn") { level = LogLevel::WARNING; return true; }
    if (lower == "error") { level = LogLevel::ERROR; return true; }
    return false;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_minLogLevel.load()) return;

    const char* levelStr = "";
    switch (level) {
        case LogLevel::DEBUG:   levelStr = "[DEBUG]"; break;
        case LogLevel::INFO:    levelStr = "[INFO]"; break;
        case LogLevel::WARNING: levelStr = "[WARN]"; break;
        case LogLevel::ERROR:   levelStr = "[ERROR]"; break;
    }

    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cout << getTimestamp() << " " << levelStr << " " << message << std::endl;
}

void logDebug(const std::string& message) { log(LogLevel::DEBUG, message); }
void logInfo(const std::string& message) { log(LogLevel::INFO, message); }
void logWarning(const std::string& message) { log(LogLevel::WARNING, message); }
void logError(const std::string& message) { log(LogLevel::ERROR, message); }

void logErrorOnce(const std::string& key, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_onceKeys.insert(key).second) return;
    }
    logError(message);
}

} // namespace overlay_ocr
