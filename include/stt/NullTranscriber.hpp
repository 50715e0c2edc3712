#pragma once
#include "ITranscriber.hpp"

// Used when no speech engine is compiled in or the model failed to load.
// Every call fails, so the pipeline still runs end to end and reports why.
class NullTranscriber : public ITranscriber {
public:
    explicit NullTranscriber(std::string reason = "no transcription engine")
        : reason_(std::move(reason)) {}

    TranscriptionResult transcribe(const std::vector<float>&, int) override {
        return {false, "", reason_};
    }

    std::string engineName() const override { return "null"; }

private:
    std::string reason_;
};
