#ifndef SERVICE_RESULT_HPP
#define SERVICE_RESULT_HPP

#include <string>
#include <utility>

// Outcome of a call into an external service (transcriber, OCR, synthesizer, player).
// Services report failures through this instead of throwing into the control loops.
enum class ResultStatus { Ok, Empty, Error };

struct TextResult {
    ResultStatus status = ResultStatus::Empty;
    std::string text;
    std::string error;

    static TextResult ok(std::string text) {
        TextResult r;
        r.status = text.empty() ? ResultStatus::Empty : ResultStatus::Ok;
        r.text = std::move(text);
        return r;
    }

    static TextResult empty() { return TextResult{}; }

    static TextResult failure(std::string message) {
        TextResult r;
        r.status = ResultStatus::Error;
        r.error = std::move(message);
        return r;
    }

    bool hasText() const { return status == ResultStatus::Ok && !text.empty(); }
};

const char* toString(ResultStatus status);

#endif
