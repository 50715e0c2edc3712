#pragma once
#include "ITranscriber.hpp"
#include <mutex>
#include <string>

struct WhisperConfig {
    std::string modelPath;          // ggml-<model>.bin
    int         threads  = 4;
    std::string language;           // empty = auto-detect
    std::string initialPrompt;
};

// whisper.cpp binding. Built only when whisper.cpp is found (HAS_WHISPER).
// One context is shared; calls are serialized because a whisper_context is
// not reentrant.
struct whisper_context;

class WhisperTranscriber : public ITranscriber {
public:
    explicit WhisperTranscriber(const WhisperConfig& config);
    ~WhisperTranscriber() override;

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    bool isLoaded() const { return ctx_ != nullptr; }

    TranscriptionResult transcribe(const std::vector<float>& pcm,
                                   int sampleRate) override;

    std::string engineName() const override { return "whisper.cpp"; }

private:
    WhisperConfig    config_;
    whisper_context* ctx_ = nullptr;
    std::mutex       mtx_;
};
