#include "audio/LoopbackRecorder.hpp"
#include <spdlog/spdlog.h>

CaptureResult LoopbackRecorder::acquire(IAudioCapture& capture) {
    auto devices    = capture.listDevices();
    auto candidates = selector_.loopbackCandidates(devices);

    if (candidates.empty()) {
        spdlog::warn("{}: no monitor devices among {} capture devices",
                     label_, devices.size());
        for (auto& dev : devices)
            spdlog::debug("  [{}] {}", dev.id, dev.name);
        return CaptureResult::fail(CaptureError::DeviceNotFound,
                                   "no monitor device found");
    }

    std::string failures;
    for (size_t i = 0; i < candidates.size(); i++) {
        const auto& dev = candidates[i];
        spdlog::info("{}: trying device [{}] '{}'", label_, i, dev.name);

        std::string failure;
        if (!capture.open(deviceConfig(dev.id))) {
            failure = "open failed";
        } else if (!capture.start()) {
            capture.stop();
            failure = "start failed";
        } else {
            spdlog::info("{}: using '{}'", label_, dev.name);
            return CaptureResult::ok();
        }

        spdlog::warn("{}: '{}' {}", label_, dev.name, failure);
        if (!failures.empty()) failures += "; ";
        failures += "'" + dev.name + "': " + failure;
    }

    return CaptureResult::fail(CaptureError::DeviceStartFailed,
        "no loopback device could be started (" + failures + ")");
}
