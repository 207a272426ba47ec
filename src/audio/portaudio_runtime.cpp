#include "audio/portaudio_runtime.hpp"
#include "core/errors.hpp"
#include "util/log.hpp"

#include <portaudio.h>

#include <string>

// Constructor
PortAudioRuntime::PortAudioRuntime() {
    const PaError e = Pa_Initialize();
    if (e != paNoError) {
        throw DeviceError("Pa_Initialize (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
    logDebug("Audio") << Pa_GetVersionText();
}

// Destructor
PortAudioRuntime::~PortAudioRuntime() { Pa_Terminate(); }
