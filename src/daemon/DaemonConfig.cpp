#include "daemon/DaemonConfig.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static std::string homeDir() {
    const char* home = std::getenv("HOME");
    return home ? home : ".";
}

// Absent or null -> fallback
static std::string optionalString(const nlohmann::json& j, const char* key,
                                  const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return fallback;
    return it->get<std::string>();
}

template <typename T>
static T clampSetting(const char* key, T value, T lo, T hi) {
    T clamped = std::clamp(value, lo, hi);
    if (clamped != value) {
        spdlog::warn("Config: {}={} out of range [{}, {}], using {}",
                     key, value, lo, hi, clamped);
    }
    return clamped;
}

DaemonConfig DaemonConfig::fromJson(const nlohmann::json& j) {
    DaemonConfig c;
    c.socketPath      = (fs::path(homeDir()) / ".config" / "voxd" / "voxd.sock").string();
    c.whisperModelDir = (fs::path(homeDir()) / ".local" / "share" / "voxd").string();

    if (!j.is_object()) {
        if (!j.is_null())
            spdlog::warn("Config: top level is not an object, using defaults");
        return c;
    }

    try {
        c.sampleRate        = j.value("sample_rate", c.sampleRate);
        c.audioDevice       = optionalString(j, "audio_device", c.audioDevice);
        c.socketPath        = j.value("socket_path", c.socketPath);
        c.model             = j.value("model", c.model);
        c.whisperModelDir   = j.value("whisper_model_dir", c.whisperModelDir);
        c.threads           = j.value("threads", c.threads);
        c.language          = optionalString(j, "language", c.language);
        c.whisperPrompt     = j.value("whisper_prompt", c.whisperPrompt);
        c.transcriptCommand = optionalString(j, "transcript_command", c.transcriptCommand);

        c.echoCancellation   = j.value("echo_cancellation", c.echoCancellation);
        c.aecFilterLength    = j.value("aec_filter_length", c.aecFilterLength);
        c.aecStepSize        = j.value("aec_step_size", c.aecStepSize);
        c.aecLeakageFactor   = j.value("aec_leakage_factor", c.aecLeakageFactor);
        c.aecEchoSuppression = j.value("aec_echo_suppression", c.aecEchoSuppression);
        c.aecResetPerSession = j.value("aec_reset_per_session", c.aecResetPerSession);

        c.voiceActivityDetection = j.value("voice_activity_detection", c.voiceActivityDetection);
        c.vadFrameSize       = j.value("vad_frame_size", c.vadFrameSize);
        c.vadOverlap         = j.value("vad_overlap", c.vadOverlap);
        c.vadEnergyThreshold = j.value("vad_energy_threshold", c.vadEnergyThreshold);
        c.vadZcrThreshold    = j.value("vad_zcr_threshold", c.vadZcrThreshold);
        c.vadVoiceThreshold  = j.value("vad_voice_threshold", c.vadVoiceThreshold);
        c.vadPaddingMs       = j.value("vad_padding_ms", c.vadPaddingMs);

        c.audioFeedback    = j.value("audio_feedback", c.audioFeedback);
        c.startSoundVolume = j.value("start_sound_volume", c.startSoundVolume);
        c.stopSoundVolume  = j.value("stop_sound_volume", c.stopSoundVolume);
        c.startSoundPath   = optionalString(j, "start_sound_path", c.startSoundPath);
        c.stopSoundPath    = optionalString(j, "stop_sound_path", c.stopSoundPath);
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    // Range checks
    c.sampleRate         = clampSetting("sample_rate", c.sampleRate, 8000, 192000);
    c.threads            = clampSetting("threads", c.threads, 1, 64);
    c.aecFilterLength    = clampSetting("aec_filter_length", c.aecFilterLength, 512, 2048);
    c.aecStepSize        = clampSetting("aec_step_size", c.aecStepSize, 0.01, 0.1);
    c.aecLeakageFactor   = clampSetting("aec_leakage_factor", c.aecLeakageFactor, 0.9, 1.0);
    c.aecEchoSuppression = clampSetting("aec_echo_suppression", c.aecEchoSuppression, 0.0, 1.0);
    c.vadFrameSize       = clampSetting("vad_frame_size", c.vadFrameSize, 2, 1 << 16);
    c.vadOverlap         = clampSetting("vad_overlap", c.vadOverlap, 1, c.vadFrameSize);
    c.vadEnergyThreshold = clampSetting("vad_energy_threshold", c.vadEnergyThreshold, 1e-9, 1.0);
    c.vadZcrThreshold    = clampSetting("vad_zcr_threshold", c.vadZcrThreshold, 1e-6, 1.0);
    c.vadVoiceThreshold  = clampSetting("vad_voice_threshold", c.vadVoiceThreshold, 0.0, 1.0);
    c.vadPaddingMs       = clampSetting("vad_padding_ms", c.vadPaddingMs, 0.0, 10000.0);
    c.startSoundVolume   = clampSetting("start_sound_volume", c.startSoundVolume, 0.0, 1.0);
    c.stopSoundVolume    = clampSetting("stop_sound_volume", c.stopSoundVolume, 0.0, 1.0);

    return c;
}

DaemonConfig DaemonConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::info("Config {} not found, using defaults", path);
        return fromJson(nlohmann::json());
    }

    nlohmann::json j;
    try {
        f >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }

    spdlog::info("Loaded config: {}", path);
    return fromJson(j);
}

nlohmann::json DaemonConfig::toJson() const {
    return {
        {"sample_rate",              sampleRate},
        {"audio_device",             audioDevice},
        {"socket_path",              socketPath},
        {"model",                    model},
        {"whisper_model_dir",        whisperModelDir},
        {"threads",                  threads},
        {"language",                 language},
        {"whisper_prompt",           whisperPrompt},
        {"transcript_command",       transcriptCommand},
        {"echo_cancellation",        echoCancellation},
        {"aec_filter_length",        aecFilterLength},
        {"aec_step_size",            aecStepSize},
        {"aec_leakage_factor",       aecLeakageFactor},
        {"aec_echo_suppression",     aecEchoSuppression},
        {"aec_reset_per_session",    aecResetPerSession},
        {"voice_activity_detection", voiceActivityDetection},
        {"vad_frame_size",           vadFrameSize},
        {"vad_overlap",              vadOverlap},
        {"vad_energy_threshold",     vadEnergyThreshold},
        {"vad_zcr_threshold",        vadZcrThreshold},
        {"vad_voice_threshold",      vadVoiceThreshold},
        {"vad_padding_ms",           vadPaddingMs},
        {"audio_feedback",           audioFeedback},
        {"start_sound_volume",       startSoundVolume},
        {"stop_sound_volume",        stopSoundVolume},
        {"start_sound_path",         startSoundPath.empty() ? nlohmann::json() : nlohmann::json(startSoundPath)},
        {"stop_sound_path",          stopSoundPath.empty() ? nlohmann::json() : nlohmann::json(stopSoundPath)}
    };
}

bool DaemonConfig::save(const std::string& path) const {
    std::error_code ec;
    auto dir = fs::path(path).parent_path();
    if (!dir.empty()) fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Cannot create config directory {}: {}", dir.string(), ec.message());
        return false;
    }

    std::ofstream f(path);
    if (!f.is_open()) {
        spdlog::error("Cannot write config file: {}", path);
        return false;
    }
    f << toJson().dump(2) << "\n";
    return f.good();
}

std::string DaemonConfig::defaultPath() {
    return (fs::path(homeDir()) / ".config" / "voxd" / "config.json").string();
}

std::string DaemonConfig::modelPath() const {
    return (fs::path(whisperModelDir) / ("ggml-" + model + ".bin")).string();
}

AECConfig DaemonConfig::aecConfig() const {
    AECConfig a;
    a.filterLength    = aecFilterLength;
    a.stepSize        = aecStepSize;
    a.leakageFactor   = aecLeakageFactor;
    a.echoSuppression = aecEchoSuppression;
    return a;
}

VADConfig DaemonConfig::vadConfig() const {
    VADConfig v;
    v.frameSize       = vadFrameSize;
    v.overlap         = vadOverlap;
    v.energyThreshold = vadEnergyThreshold;
    v.zcrThreshold    = vadZcrThreshold;
    v.voiceThreshold  = vadVoiceThreshold;
    v.sampleRate      = sampleRate;
    v.paddingMs       = vadPaddingMs;
    return v;
}

RecorderConfig DaemonConfig::recorderConfig() const {
    RecorderConfig r;
    r.sampleRate   = sampleRate;
    r.deviceFilter = audioDevice;
    return r;
}

FeedbackConfig DaemonConfig::feedbackConfig() const {
    auto share = fs::path(homeDir()) / ".local" / "share" / "voxd";

    FeedbackConfig f;
    f.enabled        = audioFeedback;
    f.startVolume    = startSoundVolume;
    f.stopVolume     = stopSoundVolume;
    f.startSoundPath = startSoundPath;
    f.stopSoundPath  = stopSoundPath;
    f.assetDirs = {
        (share / "assets").string(),
        share.string(),
        "/usr/local/share/voxd/assets",
        "/usr/share/voxd/assets",
        "share/assets",
    };
    return f;
}
