#pragma once
#include "Recorder.hpp"

// Records system output through a monitor-class device. The result is the
// far-end reference for echo cancellation.
//
// Candidates are tried in DeviceSelector priority order; the first one that
// opens and starts wins. When every candidate fails the error names each
// attempt. RecorderConfig::deviceFilter is ignored.
class LoopbackRecorder : public Recorder {
public:
    LoopbackRecorder(CaptureFactory factory, const RecorderConfig& config)
        : Recorder(std::move(factory), config, "loopback") {}

protected:
    CaptureResult acquire(IAudioCapture& capture) override;
};
