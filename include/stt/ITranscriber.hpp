#pragma once
#include <string>
#include <vector>

struct TranscriptionResult {
    bool        success = false;
    std::string text;
    std::string error;
};

// Speech-to-text engine seam. Implementations: WhisperTranscriber,
// NullTranscriber. Called from processing tasks, possibly concurrently.
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    // pcm: mono float32 at sampleRate
    virtual TranscriptionResult transcribe(const std::vector<float>& pcm,
                                           int sampleRate) = 0;

    // Name for logging
    virtual std::string engineName() const = 0;
};
