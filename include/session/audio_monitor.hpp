#ifndef AUDIO_MONITOR_HPP
#define AUDIO_MONITOR_HPP

#include "stt/transcriber.hpp"

#include <optional>

// What the control loop sees of the audio side. Every call is non-blocking.
class AudioMonitor {
public:
    virtual ~AudioMonitor() = default;

    virtual bool isCalibrated() const = 0;
    virtual std::optional<TranscriptEvent> pollTranscript() = 0;
    virtual double secondsUntilNextWindow() const = 0;
    virtual void stop() = 0;
};

#endif
