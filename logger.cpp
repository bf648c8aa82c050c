#include "logger.h"
#include <fstream>
#include <iostream>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <mutex>

namespace {
    std::ofstream logFile;
    std::mutex logMutex;
    bool initialized = false;
    LogLevel minLevel = LogLevel::Debug;

    std::string levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Off:     return "OFF";
        }
        return "UNKNOWN";
    }

    std::string currentTimeString() {
        using namespace std::chrono;
        auto now = system_clock::now();
        std::time_t t = system_clock::to_time_t(now);
        std::tm tm{};
    #if defined(_WIN32) || defined(_WIN64)
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return std::string(buf);
    }

    void openFile(const std::string& path) {
        if (logFile.is_open()) logFile.close();
        if (!path.empty()) {
            logFile.open(path, std::ios::out | std::ios::app);
        }
    }

    // вызывается под logMutex
    void ensureInitialized() {
        if (initialized) return;
        initialized = true;

        const char* levelEnv = std::getenv("TIMETABLE_LOG_LEVEL");
        if (levelEnv) {
            LogLevel lvl;
            if (parseLogLevel(levelEnv, lvl)) minLevel = lvl;
        }

        const char* fileEnv = std::getenv("TIMETABLE_LOG_FILE");
        openFile(fileEnv ? std::string(fileEnv) : std::string("log.txt"));
    }
}

bool parseLogLevel(const std::string& s, LogLevel& out) {
    if (s == "debug") { out = LogLevel::Debug;   return true; }
    if (s == "info")  { out = LogLevel::Info;    return true; }
    if (s == "warn")  { out = LogLevel::Warning; return true; }
    if (s == "error") { out = LogLevel::Error;   return true; }
    if (s == "off")   { out = LogLevel::Off;     return true; }
    return false;
}

void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex);
    ensureInitialized();
    minLevel = level;
}

void setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    ensureInitialized();
    openFile(path);
}

void logMessage(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(logMutex);
    ensureInitialized();

    if (level == LogLevel::Off || level < minLevel) return;

    std::string timeStr  = currentTimeString();
    std::string levelStr = levelToString(level);

    std::string full = "[" + timeStr + "][" + levelStr + "] " + msg + "\n";

    if (logFile.is_open()) {
        logFile << full;
        logFile.flush();
    }

    // в консоль только через stderr, stdout занят JSON-ответом
    std::cerr << full;
}

void logInfo(const std::string& msg)    { logMessage(LogLevel::Info, msg); }
void logWarning(const std::string& msg) { logMessage(LogLevel::Warning, msg); }
void logError(const std::string& msg)   { logMessage(LogLevel::Error, msg); }
void logDebug(const std::string& msg)   { logMessage(LogLevel::Debug, msg); }
