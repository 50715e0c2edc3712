#include "daemon/ProcessingPipeline.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

ProcessingPipeline::ProcessingPipeline(
    const PipelineConfig& config,
    std::shared_ptr<ITranscriber> transcriber,
    std::unique_ptr<EchoCanceller> aec,
    std::unique_ptr<VoiceActivityDetector> vad)
    : config_(config)
    , transcriber_(std::move(transcriber))
    , aec_(std::move(aec))
    , vad_(std::move(vad))
{
}

PipelineOutcome ProcessingPipeline::process(std::vector<float> mic,
                                            std::vector<float> reference,
                                            bool useEchoCancellation) {
    spdlog::debug("Pipeline: mic {} samples, reference {} samples",
                  mic.size(), reference.size());

    if (mic.empty()) {
        spdlog::warn("Pipeline: empty capture, nothing to transcribe");
        return finish(PipelineOutcome::EmptyCapture);
    }

    std::vector<float> signal = std::move(mic);

    // ── Echo cancellation ───────────────────────────────────────────────
    if (useEchoCancellation && aec_) {
        if (reference.empty()) {
            spdlog::warn("AEC: no loopback samples captured, skipping");
        } else {
            size_t n = std::min(signal.size(), reference.size());
            signal.resize(n);
            reference.resize(n);

            auto out = config_.resetFilterPerSession
                ? aec_->processIsolated(signal, reference)
                : aec_->processFrame(signal, reference);

            spdlog::info("AEC: processed {} samples, ERLE {:.1f}dB", n,
                         EchoCanceller::echoReturnLossEnhancement(signal, out));
            signal = std::move(out);
        }
    }

    // ── Voice activity ──────────────────────────────────────────────────
    if (vad_) {
        auto segments = vad_->voiceSegments(signal);
        if (segments.empty()) {
            spdlog::info("VAD: no voice detected, skipping transcription");
            return finish(PipelineOutcome::NoSpeech);
        }

        for (size_t i = 0; i < segments.size(); i++) {
            spdlog::debug("VAD: segment {}: {:.1f}ms-{:.1f}ms ({:.1f}ms)",
                          i + 1, segments[i].startMs, segments[i].endMs,
                          segments[i].durationMs);
        }

        signal = vad_->muteNonVoice(signal, segments);

        size_t kept = std::count_if(signal.begin(), signal.end(),
                                    [](float s) { return s != 0.0f; });
        spdlog::info("VAD: {} segment(s), {:.1f}% of samples kept",
                     segments.size(), 100.0 * kept / signal.size());
    }

    // ── Transcription ───────────────────────────────────────────────────
    TranscriptionResult result;
    if (!transcriber_) {
        result.error = "no transcriber configured";
    } else {
        try {
            result = transcriber_->transcribe(signal, config_.sampleRate);
        } catch (const std::exception& e) {
            result = {false, "", e.what()};
        }
    }

    if (!result.success) {
        spdlog::error("Transcription failed: {}", result.error);
        return finish(PipelineOutcome::TranscriptionFailed);
    }
    if (result.text.empty()) {
        spdlog::warn("No transcription generated");
        return finish(PipelineOutcome::EmptyTranscript);
    }

    spdlog::info("Transcription: {}", result.text);
    if (sink_) {
        try {
            sink_(result.text);
        } catch (const std::exception& e) {
            spdlog::error("Transcript delivery failed: {}", e.what());
        }
    }
    return finish(PipelineOutcome::Transcribed);
}

PipelineOutcome ProcessingPipeline::finish(PipelineOutcome outcome) {
    if (onOutcome_) onOutcome_(outcome);
    return outcome;
}

void ProcessingPipeline::beginTask() {
    std::lock_guard lock(tasksMtx_);
    activeTasks_++;
}

void ProcessingPipeline::endTask() {
    {
        std::lock_guard lock(tasksMtx_);
        activeTasks_--;
    }
    tasksCv_.notify_all();
}

int ProcessingPipeline::activeTasks() const {
    std::lock_guard lock(tasksMtx_);
    return activeTasks_;
}

bool ProcessingPipeline::waitIdle(int timeoutMs) {
    std::unique_lock lock(tasksMtx_);
    return tasksCv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                             [this] { return activeTasks_ == 0; });
}
