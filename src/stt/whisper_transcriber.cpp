#include "stt/whisper_transcriber.hpp"
#include "util/log.hpp"

#include <whisper.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

constexpr int kWhisperSampleRate = 16000;

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

// whisper.cpp wants 16 kHz; linear resample anything else
std::vector<float> resampleTo16k(const std::vector<float>& in, int rate) {
    if (rate == kWhisperSampleRate || rate <= 0 || in.empty()) return in;

    const double ratio = (double)rate / (double)kWhisperSampleRate;
    const size_t outLen = (size_t)((double)in.size() / ratio);
    std::vector<float> out(outLen);
    for (size_t i = 0; i < outLen; ++i) {
        const double pos = (double)i * ratio;
        const size_t i0 = (size_t)pos;
        const size_t i1 = std::min(i0 + 1, in.size() - 1);
        const float frac = (float)(pos - (double)i0);
        out[i] = in[i0] * (1.0f - frac) + in[i1] * frac;
    }
    return out;
}

} // namespace

// Constructor
WhisperTranscriber::WhisperTranscriber(Config config) : config_(std::move(config)) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    cparams.flash_attn = false;

    context_ = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
    if (!context_) throw std::runtime_error("whisper_init_from_file_with_params failed: " + config_.modelPath);
}

// Destructor
WhisperTranscriber::~WhisperTranscriber() {
    if (context_) whisper_free(context_);
}

// Transcribes one speech window; engine failures are returned, not thrown
TextResult WhisperTranscriber::transcribe(const AudioWindow& window, const std::string& language) {
    if (window.empty()) return TextResult::empty();

    try {
        const std::vector<float> pcm = resampleTo16k(window.toFloat(), window.sampleRate);
        return TextResult::ok(trim(run(pcm, language)));
    } catch (const std::exception& e) {
        logError("Whisper STT") << e.what();
        return TextResult::failure(e.what());
    }
}

// Converts pcm16kMono into text (std::string)
std::string WhisperTranscriber::run(const std::vector<float>& pcm16kMono, const std::string& language) {
    if (pcm16kMono.empty()) return {};

    std::lock_guard<std::mutex> lock(mutex_);

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

    // "en-US" style codes are cut down to the two-letter code whisper expects
    const std::string lang = language.substr(0, language.find_first_of("-_"));

    params.n_threads = config_.threads;
    params.language = lang.empty() ? "en" : lang.c_str();
    params.translate = false;

    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    params.no_speech_thold = config_.noSpeechThreshold;

    const int rc = whisper_full(context_, params, pcm16kMono.data(), (int)pcm16kMono.size());
    if (rc != 0) throw std::runtime_error("whisper_full failed (" + std::to_string(rc) + ")");

    std::string out;
    const int n_segments = whisper_full_n_segments(context_);
    for (int i = 0; i < n_segments; ++i) out += whisper_full_get_segment_text(context_, i);
    return out;
}
