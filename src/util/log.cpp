#include "util/log.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace {

std::mutex& outputMutex() {
    static std::mutex m;
    return m;
}

const char* levelName(LogLine::Level level) {
    switch (level) {
        case LogLine::Level::Debug: return "DEBUG";
        case LogLine::Level::Info:  return "INFO";
        case LogLine::Level::Warn:  return "WARN";
        case LogLine::Level::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace

// Constructor
LogLine::LogLine(Level level, const char* component)
    : level_(level), component_(component), enabled_(level != Level::Debug || debugEnabled()) {}

// Destructor, flushes the buffered line
LogLine::~LogLine() {
    if (!enabled_) return;

    std::lock_guard<std::mutex> lock(outputMutex());
    std::ostream& out = (level_ == Level::Warn || level_ == Level::Error) ? std::cerr : std::cout;
    out << "[" << component_ << "] [" << levelName(level_) << "] " << stream_.str() << std::endl;
}

// READBACK_DEBUG=1 turns on debug lines
bool LogLine::debugEnabled() {
    static const bool enabled = [] {
        const char* raw = std::getenv("READBACK_DEBUG");
        return raw && (std::strcmp(raw, "1") == 0 || std::strcmp(raw, "true") == 0);
    }();
    return enabled;
}

LogLine logDebug(const char* component) { return LogLine(LogLine::Level::Debug, component); }
LogLine logInfo(const char* component) { return LogLine(LogLine::Level::Info, component); }
LogLine logWarn(const char* component) { return LogLine(LogLine::Level::Warn, component); }
LogLine logError(const char* component) { return LogLine(LogLine::Level::Error, component); }
