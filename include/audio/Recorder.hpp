#pragma once
#include "IAudioCapture.hpp"
#include "DeviceSelector.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class CaptureError {
    None,
    AlreadyRecording,
    NotRecording,
    DeviceNotFound,
    DeviceOpenFailed,
    DeviceStartFailed
};

inline const char* captureErrorToString(CaptureError e) {
    switch (e) {
        case CaptureError::None:              return "none";
        case CaptureError::AlreadyRecording:  return "already recording";
        case CaptureError::NotRecording:      return "not recording";
        case CaptureError::DeviceNotFound:    return "device not found";
        case CaptureError::DeviceOpenFailed:  return "device open failed";
        case CaptureError::DeviceStartFailed: return "device start failed";
    }
    return "unknown";
}

struct CaptureResult {
    bool         success = true;
    CaptureError error   = CaptureError::None;
    std::string  message;

    static CaptureResult ok() { return {}; }
    static CaptureResult fail(CaptureError e, std::string msg) {
        return {false, e, std::move(msg)};
    }
};

struct RecorderConfig {
    double      sampleRate      = 16000;
    int         framesPerBlock  = 512;
    std::string deviceFilter;           // empty = backend default input
    int         preallocSeconds = 10;   // buffer headroom reserved on start()
};

// Captures one mono session into a growing sample buffer.
//
// The capture callback runs on the backend's audio thread and appends
// under bufferMtx_. stop() clears the recording flag under that same lock
// before the device is torn down, so no frame can land after the buffer
// has been handed to the caller.
class Recorder {
public:
    // Produces a fresh capture device for each session
    using CaptureFactory = std::function<std::unique_ptr<IAudioCapture>()>;

    Recorder(CaptureFactory factory, const RecorderConfig& config,
             std::string label = "mic");
    virtual ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    CaptureResult start();

    // Hands over everything captured since start(). `out` is replaced.
    CaptureResult stop(std::vector<float>& out);

    // Synchronous teardown of a live session; captured audio is dropped.
    void close();

    bool   isRecording() const;
    size_t sampleCount() const;

    // Reserved sample storage; zero while idle
    size_t bufferCapacity() const;

    // Appends little-endian IEEE-754 float32 values decoded from `data`.
    // A trailing partial sample is ignored. Returns samples appended.
    static size_t decodeFloat32LE(const uint8_t* data, size_t byteCount,
                                  std::vector<float>& out);

protected:
    // Picks a device, then opens and starts `capture` on it.
    virtual CaptureResult acquire(IAudioCapture& capture);

    IAudioCapture::Config deviceConfig(int deviceId) const;

    DeviceSelector    selector_;
    const std::string label_;

private:
    void onFrames(const uint8_t* data, size_t byteCount);

    CaptureFactory  factory_;
    RecorderConfig  config_;

    std::unique_ptr<IAudioCapture> capture_;   // guarded by controlMtx_
    std::mutex         controlMtx_;            // serializes start/stop/close

    mutable std::mutex bufferMtx_;
    bool               recording_ = false;
    std::vector<float> samples_;
};
