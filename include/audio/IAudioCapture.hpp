#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Abstract mono capture device.
// Implementations: PortAudioCapture. Tests provide scripted fakes.
class IAudioCapture {
public:
    virtual ~IAudioCapture() = default;

    struct DeviceInfo {
        int         id;
        std::string name;
        int         maxInputChannels;
        double      defaultSampleRate;
    };

    struct Config {
        int    deviceId       = -1;    // -1 = backend default input
        int    channelCount   = 1;
        double sampleRate     = 16000;
        int    framesPerBlock = 512;
    };

    // Lifecycle
    virtual bool open(const Config& config) = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;     // halts delivery and releases the device
    virtual bool isRunning() const = 0;

    // Called on the backend's audio thread with raw little-endian
    // float32 frames. byteCount is frames * channels * 4.
    using FrameCallback = std::function<void(const uint8_t* data,
                                             size_t byteCount)>;
    virtual void setCallback(FrameCallback cb) = 0;

    // Input devices only
    virtual std::vector<DeviceInfo> listDevices() const = 0;

    // Name for logging
    virtual std::string backendName() const = 0;
};
