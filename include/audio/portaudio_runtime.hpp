#ifndef PORTAUDIO_RUNTIME_HPP
#define PORTAUDIO_RUNTIME_HPP

// Process-wide PortAudio initialization. Create one in main before any
// PortAudioSource or PortAudioPlayer and keep it alive until they are gone.
class PortAudioRuntime {
public:
    // Throws DeviceError if PortAudio cannot be initialized
    PortAudioRuntime();
    ~PortAudioRuntime();

    PortAudioRuntime(const PortAudioRuntime&) = delete;
    PortAudioRuntime& operator=(const PortAudioRuntime&) = delete;
};

#endif
