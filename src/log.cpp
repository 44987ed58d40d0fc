// log.cpp
#include "log.h"
#include <utility>
#include <vector>

static std::vector<LogObserver> g_logObservers;

static const char* levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Info:  return "[info] ";
    case LogLevel::Warn:  return "[warn] ";
    case LogLevel::Error: return "[error] ";
    }
    return "";
}

void logSubscribe(LogObserver cb) {
    if (cb) g_logObservers.push_back(std::move(cb));
}

void logClear() {
    g_logObservers.clear();
}

void logMessage(LogLevel level, const std::string& msg) {
    if (g_logObservers.empty()) return;
    std::string line = levelTag(level) + msg;
    for (auto& cb : g_logObservers) cb(line);
}
