// log.h
// Observer-style logging. The frontend decides where lines go.
#pragma once
#include <functional>
#include <string>

enum class LogLevel { Info, Warn, Error };

using LogObserver = std::function<void(const std::string&)>;

void logSubscribe(LogObserver cb);
void logClear();

// Formats "[level] msg" and hands it to every observer. No observers: dropped.
void logMessage(LogLevel level, const std::string& msg);

inline void logInfo(const std::string& msg) { logMessage(LogLevel::Info, msg); }
inline void logWarn(const std::string& msg) { logMessage(LogLevel::Warn, msg); }
inline void logError(const std::string& msg) { logMessage(LogLevel::Error, msg); }
