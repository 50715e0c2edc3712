#pragma once
#include "audio/EchoCanceller.hpp"
#include "audio/FeedbackPlayer.hpp"
#include "audio/Recorder.hpp"
#include "analysis/VoiceActivityDetector.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

// Thrown when the config file exists but cannot be parsed.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DaemonConfig {
    // Capture
    int         sampleRate   = 16000;
    std::string audioDevice;                 // empty = default input
    std::string socketPath;                  // defaults under $HOME

    // Transcription
    std::string model           = "base";
    std::string whisperModelDir;             // defaults under $HOME
    int         threads         = 4;
    std::string language;                    // empty = auto-detect
    std::string whisperPrompt;
    std::string transcriptCommand;           // receives transcripts on stdin

    // Echo cancellation
    bool   echoCancellation   = true;
    int    aecFilterLength    = 1024;
    double aecStepSize        = 0.05;
    double aecLeakageFactor   = 0.999;
    double aecEchoSuppression = 0.7;
    bool   aecResetPerSession = false;

    // Voice activity detection
    bool   voiceActivityDetection = true;
    int    vadFrameSize       = 512;
    int    vadOverlap         = 256;
    double vadEnergyThreshold = 0.01;
    double vadZcrThreshold    = 0.1;
    double vadVoiceThreshold  = 0.5;
    double vadPaddingMs       = 200.0;

    // Start/stop notification sounds
    bool        audioFeedback    = true;
    double      startSoundVolume = 0.4;
    double      stopSoundVolume  = 0.4;
    std::string startSoundPath;              // empty = bundled start.ogg
    std::string stopSoundPath;               // empty = bundled stop.ogg

    // Defaults merged with `j`; out-of-range values are clamped with a warning.
    static DaemonConfig fromJson(const nlohmann::json& j);

    // Missing file -> defaults. Malformed JSON -> ConfigError.
    static DaemonConfig load(const std::string& path);

    nlohmann::json toJson() const;
    bool save(const std::string& path) const;

    static std::string defaultPath();

    std::string    modelPath() const;
    AECConfig      aecConfig() const;
    VADConfig      vadConfig() const;
    RecorderConfig recorderConfig() const;
    FeedbackConfig feedbackConfig() const;
};
