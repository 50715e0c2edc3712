#pragma once
#include "audio/EchoCanceller.hpp"
#include "analysis/VoiceActivityDetector.hpp"
#include "stt/ITranscriber.hpp"
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class PipelineOutcome {
    Transcribed,
    NoSpeech,             // VAD found no segments; transcriber not called
    EmptyCapture,
    EmptyTranscript,
    TranscriptionFailed
};

inline const char* pipelineOutcomeToString(PipelineOutcome o) {
    switch (o) {
        case PipelineOutcome::Transcribed:         return "transcribed";
        case PipelineOutcome::NoSpeech:            return "no speech";
        case PipelineOutcome::EmptyCapture:        return "empty capture";
        case PipelineOutcome::EmptyTranscript:     return "empty transcript";
        case PipelineOutcome::TranscriptionFailed: return "transcription failed";
    }
    return "unknown";
}

struct PipelineConfig {
    int  sampleRate            = 16000;
    bool resetFilterPerSession = false;  // isolate each utterance's AEC state
};

// AEC -> VAD -> transcription -> transcript sink for one utterance.
//
// Owned through shared_ptr by the controller and by every running task, so
// a task may outlive the controller. process() is safe to call from
// overlapping tasks: each works on its own buffers, and the one shared
// mutable stage (the echo canceller) serializes itself.
class ProcessingPipeline {
public:
    using TranscriptSink  = std::function<void(const std::string& text)>;
    using OutcomeListener = std::function<void(PipelineOutcome)>;

    // aec / vad may be null to disable the stage
    ProcessingPipeline(const PipelineConfig& config,
                       std::shared_ptr<ITranscriber> transcriber,
                       std::unique_ptr<EchoCanceller> aec,
                       std::unique_ptr<VoiceActivityDetector> vad);

    // Install before the first task runs
    void setTranscriptSink(TranscriptSink sink)     { sink_ = std::move(sink); }
    void setOutcomeListener(OutcomeListener l)      { onOutcome_ = std::move(l); }

    PipelineOutcome process(std::vector<float> mic,
                            std::vector<float> reference,
                            bool useEchoCancellation);

    bool hasEchoCanceller() const { return aec_ != nullptr; }

    // Background task bookkeeping
    void beginTask();
    void endTask();
    int  activeTasks() const;
    bool waitIdle(int timeoutMs);

private:
    PipelineOutcome finish(PipelineOutcome outcome);

    PipelineConfig                         config_;
    std::shared_ptr<ITranscriber>          transcriber_;
    std::unique_ptr<EchoCanceller>         aec_;
    std::unique_ptr<VoiceActivityDetector> vad_;
    TranscriptSink                         sink_;
    OutcomeListener                        onOutcome_;

    mutable std::mutex      tasksMtx_;
    std::condition_variable tasksCv_;
    int                     activeTasks_ = 0;
};
