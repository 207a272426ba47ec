#ifndef LOG_HPP
#define LOG_HPP

#include <sstream>
#include <string>

// Line-oriented logger: "[Component] [LEVEL] message".
// A LogLine buffers one message and writes it whole on destruction so lines from
// the audio threads and the control loop never interleave.
class LogLine {
public:
    enum class Level { Debug, Info, Warn, Error };

    LogLine(Level level, const char* component);
    ~LogLine();

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (enabled_) stream_ << value;
        return *this;
    }

    static bool debugEnabled();

private:
    Level level_;
    const char* component_;
    bool enabled_;
    std::ostringstream stream_;
};

// Usage: logInfo("Audio Recorder") << "Ready";
LogLine logDebug(const char* component);
LogLine logInfo(const char* component);
LogLine logWarn(const char* component);
LogLine logError(const char* component);

#endif
