#include "tts/audio_artifact.hpp"
#include "util/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

// Constructor
AudioArtifact::AudioArtifact(std::string path) : path_(std::move(path)) {}

// Destructor
AudioArtifact::~AudioArtifact() { release(); }

AudioArtifact::AudioArtifact(AudioArtifact&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

AudioArtifact& AudioArtifact::operator=(AudioArtifact&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

bool AudioArtifact::release() {
    if (path_.empty()) return true;

    std::error_code ec;
    std::filesystem::remove(path_, ec);
    const bool ok = !ec;
    if (!ok) {
        logWarn("Audio Artifact") << "Could not delete " << path_ << ": " << ec.message();
    }
    path_.clear();
    return ok;
}

AudioArtifact AudioArtifact::createTemp(const std::string& suffix) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) dir = "/tmp";

    std::string pattern = (dir / "readback-XXXXXX").string() + suffix;
    std::vector<char> buff(pattern.begin(), pattern.end());
    buff.push_back('\0');

    const int fd = ::mkstemps(buff.data(), (int)suffix.size());
    if (fd < 0) {
        throw std::runtime_error(std::string("mkstemps failed: ") + std::strerror(errno));
    }
    ::close(fd);
    return AudioArtifact(std::string(buff.data()));
}
