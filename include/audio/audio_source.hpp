#ifndef AUDIO_SOURCE_HPP
#define AUDIO_SOURCE_HPP

#include <cstdint>
#include <vector>

// Blocking, device-clocked mono int16 input. One read() returns one device buffer.
class AudioSource {
public:
    enum class ReadStatus { Ok, Overflow, Error, EndOfStream };

    virtual ~AudioSource() = default;

    // Throws DeviceError when the microphone is unavailable
    virtual void open() = 0;
    virtual ReadStatus read(std::vector<int16_t>& buffer) = 0;
    virtual void close() = 0;

    virtual int sampleRate() const = 0;
    virtual int framesPerBuffer() const = 0;
};

#endif
