#include "audio/PortAudioSystem.hpp"
#include <spdlog/spdlog.h>

#ifdef HAS_PORTAUDIO
#include <portaudio.h>
#endif

PortAudioSystem::PortAudioSystem() {
#ifdef HAS_PORTAUDIO
    PaError err = Pa_Initialize();
    if (err == paNoError) {
        initialized_ = true;
        spdlog::debug("PortAudio initialized ({})", Pa_GetVersionText());
    } else {
        spdlog::error("PortAudio init failed: {}", Pa_GetErrorText(err));
    }
#else
    spdlog::warn("PortAudio not available (built without HAS_PORTAUDIO)");
#endif
}

PortAudioSystem::~PortAudioSystem() {
#ifdef HAS_PORTAUDIO
    if (initialized_)
        Pa_Terminate();
#endif
}
