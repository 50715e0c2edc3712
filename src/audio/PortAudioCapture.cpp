#include "audio/PortAudioCapture.hpp"
#include <spdlog/spdlog.h>

#ifdef HAS_PORTAUDIO
#include <portaudio.h>
#endif

PortAudioCapture::PortAudioCapture(PortAudioSystem& system)
    : system_(system) {}

PortAudioCapture::~PortAudioCapture() {
    stop();
}

bool PortAudioCapture::open(const Config& config) {
#ifdef HAS_PORTAUDIO
    if (!system_.ok()) return false;
    if (stream_) stop();

    config_ = config;
    config_.channelCount = 1;

    PaStreamParameters inputParams;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    if (config.deviceId >= 0) {
        inputParams.device = config.deviceId;
    } else {
        inputParams.device = Pa_GetDefaultInputDevice();
        if (inputParams.device == paNoDevice) {
            spdlog::error("No default audio input device");
            return false;
        }
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(inputParams.device);
    if (!devInfo) {
        spdlog::error("Invalid audio device ID {}", inputParams.device);
        return false;
    }
    if (devInfo->maxInputChannels < 1) {
        spdlog::error("Device '{}' has no input channels", devInfo->name);
        return false;
    }
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;

    spdlog::info("Opening audio: device='{}', mono, {}Hz, {} frames/block",
                 devInfo->name, config_.sampleRate, config_.framesPerBlock);

    PaError err = Pa_OpenStream(
        &stream_,
        &inputParams,
        nullptr,  // no output
        config_.sampleRate,
        config_.framesPerBlock,
        paClipOff,
        &PortAudioCapture::paCallback,
        this
    );

    if (err != paNoError) {
        spdlog::error("Pa_OpenStream failed: {}", Pa_GetErrorText(err));
        stream_ = nullptr;
        return false;
    }

    return true;
#else
    (void)config;
    spdlog::warn("PortAudio not available (built without HAS_PORTAUDIO)");
    return false;
#endif
}

bool PortAudioCapture::start() {
#ifdef HAS_PORTAUDIO
    if (!stream_) return false;
    PaError err = Pa_StartStream(stream_);
    if (err != paNoError) {
        spdlog::error("Pa_StartStream failed: {}", Pa_GetErrorText(err));
        return false;
    }
    running_ = true;
    spdlog::debug("Audio capture started");
    return true;
#else
    return false;
#endif
}

void PortAudioCapture::stop() {
#ifdef HAS_PORTAUDIO
    running_ = false;
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        spdlog::debug("Audio capture stopped");
    }
#endif
}

std::vector<IAudioCapture::DeviceInfo> PortAudioCapture::listDevices() const {
    std::vector<DeviceInfo> result;
#ifdef HAS_PORTAUDIO
    if (!system_.ok()) return result;

    int count = Pa_GetDeviceCount();
    if (count < 0) {
        spdlog::error("Pa_GetDeviceCount failed: {}", Pa_GetErrorText(count));
        return result;
    }
    for (int i = 0; i < count; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            result.push_back({
                i,
                info->name,
                info->maxInputChannels,
                info->defaultSampleRate
            });
        }
    }
#endif
    return result;
}

int PortAudioCapture::paCallback(
    const void* input, void* /*output*/,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* /*timeInfo*/,
    unsigned long /*statusFlags*/,
    void* userData)
{
    auto* self = static_cast<PortAudioCapture*>(userData);
    return self->handleAudio(input, frameCount);
}

int PortAudioCapture::handleAudio(const void* input, unsigned long frameCount) {
    if (!input || !callback_) return 0;  // paContinue

    // Mono paFloat32 interleaved: frameCount * 4 bytes
    callback_(static_cast<const uint8_t*>(input),
              static_cast<size_t>(frameCount) * sizeof(float));
    return 0;  // paContinue
}
