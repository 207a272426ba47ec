#ifndef AUDIO_ARTIFACT_HPP
#define AUDIO_ARTIFACT_HPP

#include <string>

// Owns a temporary audio file. The file is removed when the artifact is destroyed
// or released; a failed removal is logged and otherwise ignored.
class AudioArtifact {
public:
    AudioArtifact() = default;
    explicit AudioArtifact(std::string path);
    ~AudioArtifact();

    AudioArtifact(AudioArtifact&& other) noexcept;
    AudioArtifact& operator=(AudioArtifact&& other) noexcept;

    AudioArtifact(const AudioArtifact&) = delete;
    AudioArtifact& operator=(const AudioArtifact&) = delete;

    const std::string& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

    // Deletes the file now; returns false if it could not be removed
    bool release();

    // Creates an empty, uniquely named file in the temp directory and takes ownership of it
    static AudioArtifact createTemp(const std::string& suffix);

private:
    std::string path_;
};

#endif
