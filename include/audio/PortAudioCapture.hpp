#pragma once
#include "IAudioCapture.hpp"
#include "PortAudioSystem.hpp"
#include <atomic>
#include <string>
#include <vector>

// PortAudio-based mono capture (ALSA/PulseAudio on Linux). Link with
// -lportaudio.
//
// The PortAudio callback hands each block of interleaved paFloat32 frames
// straight to the registered FrameCallback as raw bytes. No buffering
// happens here; the Recorder owns the sample buffer.

// Forward declare PortAudio types to avoid including portaudio.h in header
typedef void PaStream;
struct PaStreamCallbackTimeInfo;

class PortAudioCapture : public IAudioCapture {
public:
    explicit PortAudioCapture(PortAudioSystem& system);
    ~PortAudioCapture() override;

    bool open(const Config& config) override;
    bool start() override;
    void stop() override;
    bool isRunning() const override { return running_; }

    void setCallback(FrameCallback cb) override { callback_ = cb; }

    std::vector<DeviceInfo> listDevices() const override;
    std::string backendName() const override { return "PortAudio"; }

private:
    // PortAudio stream callback (static → forwards to instance)
    static int paCallback(const void* input, void* output,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo* timeInfo,
                          unsigned long statusFlags,
                          void* userData);

    int handleAudio(const void* input, unsigned long frameCount);

    PortAudioSystem&    system_;
    Config              config_;
    PaStream*           stream_ = nullptr;
    std::atomic<bool>   running_{false};
    FrameCallback       callback_;
};
