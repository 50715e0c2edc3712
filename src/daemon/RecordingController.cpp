#include "daemon/RecordingController.hpp"
#include <spdlog/spdlog.h>
#include <system_error>
#include <thread>

RecordingController::RecordingController(
    std::unique_ptr<Recorder> mic,
    std::unique_ptr<LoopbackRecorder> loopback,
    std::shared_ptr<ProcessingPipeline> pipeline,
    std::unique_ptr<FeedbackPlayer> feedback)
    : mic_(std::move(mic))
    , loopback_(std::move(loopback))
    , pipeline_(std::move(pipeline))
    , feedback_(std::move(feedback))
{
}

RecordingController::~RecordingController() {
    shutdown();
}

ControlResult RecordingController::start() {
    std::lock_guard lock(mtx_);
    return startLocked();
}

ControlResult RecordingController::stop() {
    std::lock_guard lock(mtx_);
    return stopLocked();
}

ControlResult RecordingController::toggle() {
    std::lock_guard lock(mtx_);
    return state_ == RecordingState::Recording ? stopLocked() : startLocked();
}

ControlResult RecordingController::startLocked() {
    if (state_ == RecordingState::Recording)
        return ControlResult::fail(ControlError::AlreadyRecording, "Already recording");

    // Reference first so it covers the whole utterance
    sessionAec_ = false;
    if (loopback_ && pipeline_->hasEchoCanceller()) {
        auto r = loopback_->start();
        if (r.success) {
            sessionAec_ = true;
        } else {
            spdlog::warn("Echo cancellation disabled for this session: {}", r.message);
        }
    }

    auto r = mic_->start();
    if (!r.success) {
        if (sessionAec_) loopback_->close();
        sessionAec_ = false;
        spdlog::error("Cannot start recording: {}", r.message);
        return ControlResult::fail(ControlError::DeviceError, r.message);
    }

    state_ = RecordingState::Recording;
    spdlog::info("Recording started{}", sessionAec_ ? " (echo cancellation on)" : "");
    if (feedback_) feedback_->playStart();
    return ControlResult::ok("Recording started");
}

ControlResult RecordingController::stopLocked() {
    if (state_ != RecordingState::Recording)
        return ControlResult::fail(ControlError::NotRecording, "Not recording");

    state_ = RecordingState::Idle;

    std::vector<float> micSamples;
    auto r = mic_->stop(micSamples);
    if (!r.success)
        spdlog::warn("Microphone stop: {}", r.message);

    std::vector<float> refSamples;
    if (sessionAec_) {
        auto lr = loopback_->stop(refSamples);
        if (!lr.success)
            spdlog::warn("Loopback stop: {}", lr.message);
    }

    spdlog::info("Recording stopped: {} mic samples, {} reference samples",
                 micSamples.size(), refSamples.size());
    // Devices are closed, so the cue stays out of the utterance
    if (feedback_) feedback_->playStop();

    auto pipeline = pipeline_;
    bool useAec   = sessionAec_;
    pipeline->beginTask();
    try {
        std::thread([pipeline, useAec,
                     mic = std::move(micSamples),
                     ref = std::move(refSamples)]() mutable {
            try {
                auto outcome = pipeline->process(std::move(mic), std::move(ref), useAec);
                spdlog::debug("Processing finished: {}", pipelineOutcomeToString(outcome));
            } catch (const std::exception& e) {
                spdlog::error("Processing task failed: {}", e.what());
            }
            pipeline->endTask();
        }).detach();
    } catch (const std::system_error& e) {
        pipeline->endTask();
        spdlog::error("Cannot spawn processing task: {}", e.what());
        return ControlResult::fail(ControlError::DeviceError,
                                   std::string("processing task failed: ") + e.what());
    }

    return ControlResult::ok("Recording stopped");
}

RecordingState RecordingController::status() const {
    std::lock_guard lock(mtx_);
    return state_;
}

RecordingState RecordingController::detailedStatus() const {
    std::lock_guard lock(mtx_);
    if (state_ == RecordingState::Recording) return RecordingState::Recording;
    return pipeline_->activeTasks() > 0 ? RecordingState::Processing
                                        : RecordingState::Idle;
}

bool RecordingController::echoCancellationActive() const {
    std::lock_guard lock(mtx_);
    return sessionAec_;
}

bool RecordingController::waitForProcessing(int timeoutMs) {
    return pipeline_->waitIdle(timeoutMs);
}

void RecordingController::shutdown() {
    std::lock_guard lock(mtx_);
    if (state_ == RecordingState::Recording)
        spdlog::info("Shutdown: discarding open recording");
    if (mic_) mic_->close();
    if (loopback_) loopback_->close();
    state_      = RecordingState::Idle;
    sessionAec_ = false;
}
