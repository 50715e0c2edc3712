#pragma once
#include "audio/FeedbackPlayer.hpp"
#include "audio/Recorder.hpp"
#include "audio/LoopbackRecorder.hpp"
#include "daemon/ProcessingPipeline.hpp"
#include <memory>
#include <mutex>
#include <string>

enum class RecordingState { Idle, Recording, Processing };

inline const char* recordingStateToString(RecordingState s) {
    switch (s) {
        case RecordingState::Idle:       return "idle";
        case RecordingState::Recording:  return "recording";
        case RecordingState::Processing: return "processing";
    }
    return "unknown";
}

enum class ControlError { None, AlreadyRecording, NotRecording, DeviceError };

struct ControlResult {
    bool         success = true;
    ControlError error   = ControlError::None;
    std::string  message;

    static ControlResult ok(std::string msg) {
        return {true, ControlError::None, std::move(msg)};
    }
    static ControlResult fail(ControlError e, std::string msg) {
        return {false, e, std::move(msg)};
    }
};

// Sequences start/stop/toggle against background processing tasks.
//
// state_ is the single source of truth for status(). Only Idle and
// Recording are ever stored; Processing is derived from the pipeline's
// in-flight task count. A task for the previous utterance may still run
// while a new recording is open.
class RecordingController {
public:
    // loopback may be null (echo cancellation never attempted);
    // feedback may be null (no start/stop cues)
    RecordingController(std::unique_ptr<Recorder> mic,
                        std::unique_ptr<LoopbackRecorder> loopback,
                        std::shared_ptr<ProcessingPipeline> pipeline,
                        std::unique_ptr<FeedbackPlayer> feedback = nullptr);
    ~RecordingController();

    RecordingController(const RecordingController&) = delete;
    RecordingController& operator=(const RecordingController&) = delete;

    ControlResult start();
    ControlResult stop();
    ControlResult toggle();

    RecordingState status() const;
    RecordingState detailedStatus() const;

    // True while the current (or last) session records a reference
    bool echoCancellationActive() const;

    // Blocks until no processing task is in flight
    bool waitForProcessing(int timeoutMs);

    // Closes capture devices synchronously; running tasks finish on their own
    void shutdown();

private:
    ControlResult startLocked();
    ControlResult stopLocked();

    std::unique_ptr<Recorder>           mic_;
    std::unique_ptr<LoopbackRecorder>   loopback_;
    std::shared_ptr<ProcessingPipeline> pipeline_;
    std::unique_ptr<FeedbackPlayer>     feedback_;

    mutable std::mutex mtx_;
    RecordingState     state_      = RecordingState::Idle;
    bool               sessionAec_ = false;
};
