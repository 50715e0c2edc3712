#include "audio/Recorder.hpp"
#include <spdlog/spdlog.h>
#include <cstring>

Recorder::Recorder(CaptureFactory factory, const RecorderConfig& config,
                   std::string label)
    : label_(std::move(label))
    , factory_(std::move(factory))
    , config_(config)
{
}

Recorder::~Recorder() {
    close();
}

CaptureResult Recorder::start() {
    std::lock_guard control(controlMtx_);

    {
        std::lock_guard lock(bufferMtx_);
        if (recording_)
            return CaptureResult::fail(CaptureError::AlreadyRecording,
                                       "already recording");
    }

    auto capture = factory_ ? factory_() : nullptr;
    if (!capture)
        return CaptureResult::fail(CaptureError::DeviceOpenFailed,
                                   "no capture backend available");

    capture->setCallback([this](const uint8_t* data, size_t byteCount) {
        onFrames(data, byteCount);
    });

    auto result = acquire(*capture);
    if (!result.success) {
        spdlog::error("{}: {} ({})", label_, result.message,
                      captureErrorToString(result.error));
        return result;
    }

    {
        std::lock_guard lock(bufferMtx_);
        samples_ = std::vector<float>();
        samples_.reserve(static_cast<size_t>(
            config_.sampleRate * config_.preallocSeconds));
        recording_ = true;
    }
    capture_ = std::move(capture);

    spdlog::info("{}: recording started ({}Hz, {} backend)",
                 label_, config_.sampleRate, capture_->backendName());
    return result;
}

CaptureResult Recorder::stop(std::vector<float>& out) {
    std::lock_guard control(controlMtx_);

    {
        std::lock_guard lock(bufferMtx_);
        if (!recording_)
            return CaptureResult::fail(CaptureError::NotRecording,
                                       "not recording");

        recording_ = false;
        out = std::move(samples_);
        samples_ = std::vector<float>();
    }

    // Outside bufferMtx_: the backend may wait for an in-flight callback,
    // which itself may be waiting on bufferMtx_.
    auto capture = std::move(capture_);
    if (capture) capture->stop();

    spdlog::info("{}: recording stopped ({} samples, {:.2f}s)",
                 label_, out.size(),
                 config_.sampleRate > 0 ? out.size() / config_.sampleRate : 0.0);
    return CaptureResult::ok();
}

void Recorder::close() {
    std::lock_guard control(controlMtx_);
    {
        std::lock_guard lock(bufferMtx_);
        recording_ = false;
        samples_ = std::vector<float>();
    }
    auto capture = std::move(capture_);
    if (capture) capture->stop();
}

bool Recorder::isRecording() const {
    std::lock_guard lock(bufferMtx_);
    return recording_;
}

size_t Recorder::sampleCount() const {
    std::lock_guard lock(bufferMtx_);
    return samples_.size();
}

size_t Recorder::bufferCapacity() const {
    std::lock_guard lock(bufferMtx_);
    return samples_.capacity();
}

size_t Recorder::decodeFloat32LE(const uint8_t* data, size_t byteCount,
                                 std::vector<float>& out) {
    if (!data) return 0;
    size_t count = byteCount / 4;
    for (size_t i = 0; i < count; i++) {
        const uint8_t* p = data + i * 4;
        uint32_t bits = (uint32_t)p[0]
                      | ((uint32_t)p[1] << 8)
                      | ((uint32_t)p[2] << 16)
                      | ((uint32_t)p[3] << 24);
        float sample;
        std::memcpy(&sample, &bits, sizeof(sample));
        out.push_back(sample);
    }
    return count;
}

void Recorder::onFrames(const uint8_t* data, size_t byteCount) {
    std::lock_guard lock(bufferMtx_);
    if (!recording_) return;
    decodeFloat32LE(data, byteCount, samples_);
}

IAudioCapture::Config Recorder::deviceConfig(int deviceId) const {
    IAudioCapture::Config cfg;
    cfg.deviceId       = deviceId;
    cfg.channelCount   = 1;
    cfg.sampleRate     = config_.sampleRate;
    cfg.framesPerBlock = config_.framesPerBlock;
    return cfg;
}

CaptureResult Recorder::acquire(IAudioCapture& capture) {
    int deviceId = -1;

    if (!config_.deviceFilter.empty()) {
        auto dev = selector_.selectMicrophone(capture.listDevices(),
                                              config_.deviceFilter);
        if (!dev)
            return CaptureResult::fail(CaptureError::DeviceNotFound,
                "device '" + config_.deviceFilter + "' not found");

        if (DeviceSelector::isMonitor(dev->name)) {
            spdlog::warn("{}: '{}' is a monitor device, it captures system "
                         "audio rather than the microphone", label_, dev->name);
        } else {
            spdlog::info("{}: using microphone '{}'", label_, dev->name);
        }
        deviceId = dev->id;
    } else {
        spdlog::info("{}: using default capture device", label_);
    }

    if (!capture.open(deviceConfig(deviceId)))
        return CaptureResult::fail(CaptureError::DeviceOpenFailed,
                                   "failed to open capture device");

    if (!capture.start()) {
        capture.stop();
        return CaptureResult::fail(CaptureError::DeviceStartFailed,
                                   "failed to start capture device");
    }
    return CaptureResult::ok();
}
