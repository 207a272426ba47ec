#ifndef TRANSCRIBER_HPP
#define TRANSCRIBER_HPP

#include "audio/audio_window.hpp"
#include "core/service_result.hpp"

#include <chrono>
#include <string>

// Recognized text from one speech window. status Empty/Error means "nothing to match".
struct TranscriptEvent {
    std::string text;
    ResultStatus status = ResultStatus::Empty;
    std::string error;
    AudioWindow::Clock::time_point windowStart{};

    bool hasText() const { return status == ResultStatus::Ok && !text.empty(); }
};

class Transcriber {
public:
    virtual ~Transcriber() = default;

    // Must not throw; engine failures come back as ResultStatus::Error
    virtual TextResult transcribe(const AudioWindow& window, const std::string& language) = 0;
};

#endif
