#pragma once

#include <string>

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Off
};

void logMessage(LogLevel level, const std::string& msg);

void logInfo(const std::string& msg);
void logWarning(const std::string& msg);
void logError(const std::string& msg);
void logDebug(const std::string& msg);

// Сообщения ниже уровня отбрасываются. По умолчанию TIMETABLE_LOG_LEVEL или Debug.
void setLogLevel(LogLevel level);

// Пустой путь: писать только в stderr. По умолчанию TIMETABLE_LOG_FILE или log.txt.
void setLogFile(const std::string& path);

bool parseLogLevel(const std::string& s, LogLevel& out);
