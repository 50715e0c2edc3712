#include <gtest/gtest.h>
#include "daemon/DaemonConfig.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static std::string tempPath(const std::string& name) {
    return (fs::temp_directory_path() / ("voxd_test_" + name)).string();
}

TEST(DaemonConfigTest, DefaultsWhenEmpty) {
    auto c = DaemonConfig::fromJson(nlohmann::json::object());
    EXPECT_EQ(c.sampleRate, 16000);
    EXPECT_TRUE(c.echoCancellation);
    EXPECT_EQ(c.aecFilterLength, 1024);
    EXPECT_DOUBLE_EQ(c.aecStepSize, 0.05);
    EXPECT_DOUBLE_EQ(c.aecLeakageFactor, 0.999);
    EXPECT_DOUBLE_EQ(c.aecEchoSuppression, 0.7);
    EXPECT_FALSE(c.aecResetPerSession);
    EXPECT_TRUE(c.voiceActivityDetection);
    EXPECT_EQ(c.vadFrameSize, 512);
    EXPECT_EQ(c.vadOverlap, 256);
    EXPECT_DOUBLE_EQ(c.vadPaddingMs, 200.0);
    EXPECT_EQ(c.model, "base");
    EXPECT_FALSE(c.socketPath.empty());
}

TEST(DaemonConfigTest, ReadsKnownKeys) {
    auto j = nlohmann::json::parse(R"({
        "sample_rate": 48000,
        "audio_device": "USB",
        "model": "small.en",
        "whisper_model_dir": "/opt/models",
        "echo_cancellation": false,
        "aec_filter_length": 2048,
        "aec_reset_per_session": true,
        "vad_voice_threshold": 0.6,
        "vad_padding_ms": 150,
        "transcript_command": "wl-copy"
    })");
    auto c = DaemonConfig::fromJson(j);

    EXPECT_EQ(c.sampleRate, 48000);
    EXPECT_EQ(c.audioDevice, "USB");
    EXPECT_FALSE(c.echoCancellation);
    EXPECT_EQ(c.aecFilterLength, 2048);
    EXPECT_TRUE(c.aecResetPerSession);
    EXPECT_DOUBLE_EQ(c.vadVoiceThreshold, 0.6);
    EXPECT_DOUBLE_EQ(c.vadPaddingMs, 150.0);
    EXPECT_EQ(c.transcriptCommand, "wl-copy");
    EXPECT_EQ(c.modelPath(), "/opt/models/ggml-small.en.bin");
}

TEST(DaemonConfigTest, NullStringsFallBackToDefault) {
    auto j = nlohmann::json::parse(R"({"audio_device": null, "language": null})");
    auto c = DaemonConfig::fromJson(j);
    EXPECT_TRUE(c.audioDevice.empty());
    EXPECT_TRUE(c.language.empty());
}

TEST(DaemonConfigTest, OutOfRangeValuesAreClamped) {
    auto j = nlohmann::json::parse(R"({
        "aec_filter_length": 64,
        "aec_step_size": 0.5,
        "aec_echo_suppression": 1.5,
        "vad_voice_threshold": -1,
        "vad_frame_size": 256,
        "vad_overlap": 1000
    })");
    auto c = DaemonConfig::fromJson(j);

    EXPECT_EQ(c.aecFilterLength, 512);
    EXPECT_DOUBLE_EQ(c.aecStepSize, 0.1);
    EXPECT_DOUBLE_EQ(c.aecEchoSuppression, 1.0);
    EXPECT_DOUBLE_EQ(c.vadVoiceThreshold, 0.0);
    EXPECT_EQ(c.vadOverlap, 256);
}

TEST(DaemonConfigTest, CaptureAndVadLimits) {
    auto low = DaemonConfig::fromJson(nlohmann::json::parse(R"({
        "sample_rate": 100, "threads": 0, "vad_frame_size": 1,
        "vad_energy_threshold": 0, "vad_zcr_threshold": -0.5,
        "vad_padding_ms": -20
    })"));
    EXPECT_EQ(low.sampleRate, 8000);
    EXPECT_EQ(low.threads, 1);
    EXPECT_EQ(low.vadFrameSize, 2);
    EXPECT_DOUBLE_EQ(low.vadEnergyThreshold, 1e-9);
    EXPECT_DOUBLE_EQ(low.vadZcrThreshold, 1e-6);
    EXPECT_DOUBLE_EQ(low.vadPaddingMs, 0.0);

    auto high = DaemonConfig::fromJson(nlohmann::json::parse(R"({
        "sample_rate": 384000, "threads": 512, "vad_frame_size": 100000,
        "vad_energy_threshold": 3.0, "vad_zcr_threshold": 2.0,
        "vad_padding_ms": 60000
    })"));
    EXPECT_EQ(high.sampleRate, 192000);
    EXPECT_EQ(high.threads, 64);
    EXPECT_EQ(high.vadFrameSize, 65536);
    EXPECT_DOUBLE_EQ(high.vadEnergyThreshold, 1.0);
    EXPECT_DOUBLE_EQ(high.vadZcrThreshold, 1.0);
    EXPECT_DOUBLE_EQ(high.vadPaddingMs, 10000.0);
}

TEST(DaemonConfigTest, AudioFeedbackKeys) {
    auto defaults = DaemonConfig::fromJson(nlohmann::json::object());
    EXPECT_TRUE(defaults.audioFeedback);
    EXPECT_DOUBLE_EQ(defaults.startSoundVolume, 0.4);
    EXPECT_DOUBLE_EQ(defaults.stopSoundVolume, 0.4);
    EXPECT_TRUE(defaults.startSoundPath.empty());
    EXPECT_TRUE(defaults.stopSoundPath.empty());

    auto c = DaemonConfig::fromJson(nlohmann::json::parse(R"({
        "audio_feedback": false,
        "start_sound_volume": 1.7,
        "stop_sound_volume": -0.2,
        "start_sound_path": "ping.ogg",
        "stop_sound_path": null
    })"));
    EXPECT_FALSE(c.audioFeedback);
    EXPECT_DOUBLE_EQ(c.startSoundVolume, 1.0);
    EXPECT_DOUBLE_EQ(c.stopSoundVolume, 0.0);
    EXPECT_EQ(c.startSoundPath, "ping.ogg");
    EXPECT_TRUE(c.stopSoundPath.empty());

    auto f = c.feedbackConfig();
    EXPECT_FALSE(f.enabled);
    EXPECT_DOUBLE_EQ(f.startVolume, 1.0);
    EXPECT_EQ(f.startSoundPath, "ping.ogg");
    ASSERT_FALSE(f.assetDirs.empty());
    EXPECT_EQ(f.assetDirs.back(), "share/assets");
}

TEST(DaemonConfigTest, WrongTypeIsConfigError) {
    auto j = nlohmann::json::parse(R"({"sample_rate": "fast"})");
    EXPECT_THROW(DaemonConfig::fromJson(j), ConfigError);
}

TEST(DaemonConfigTest, MissingFileGivesDefaults) {
    auto c = DaemonConfig::load(tempPath("does_not_exist.json"));
    EXPECT_EQ(c.sampleRate, 16000);
}

TEST(DaemonConfigTest, MalformedFileIsConfigError) {
    std::string path = tempPath("malformed.json");
    {
        std::ofstream f(path);
        f << "{ \"sample_rate\": ";
    }
    EXPECT_THROW(DaemonConfig::load(path), ConfigError);
    std::remove(path.c_str());
}

TEST(DaemonConfigTest, SaveThenLoadPreservesSettings) {
    std::string dir  = tempPath("save_dir");
    std::string path = (fs::path(dir) / "config.json").string();

    DaemonConfig c = DaemonConfig::fromJson(nlohmann::json::object());
    c.audioDevice        = "Focusrite";
    c.aecEchoSuppression = 0.5;
    c.voiceActivityDetection = false;
    c.stopSoundVolume    = 0.25;
    c.startSoundPath     = "/opt/sounds/begin.wav";
    ASSERT_TRUE(c.save(path));

    auto loaded = DaemonConfig::load(path);
    EXPECT_EQ(loaded.audioDevice, "Focusrite");
    EXPECT_DOUBLE_EQ(loaded.aecEchoSuppression, 0.5);
    EXPECT_FALSE(loaded.voiceActivityDetection);
    EXPECT_DOUBLE_EQ(loaded.stopSoundVolume, 0.25);
    EXPECT_EQ(loaded.startSoundPath, "/opt/sounds/begin.wav");
    EXPECT_TRUE(loaded.stopSoundPath.empty());

    fs::remove_all(dir);
}

TEST(DaemonConfigTest, DerivedComponentConfigs) {
    auto j = nlohmann::json::parse(R"({"sample_rate": 22050, "vad_overlap": 128,
                                       "aec_step_size": 0.02, "audio_device": "mic"})");
    auto c = DaemonConfig::fromJson(j);

    EXPECT_EQ(c.vadConfig().sampleRate, 22050);
    EXPECT_EQ(c.vadConfig().overlap, 128);
    EXPECT_DOUBLE_EQ(c.aecConfig().stepSize, 0.02);
    EXPECT_DOUBLE_EQ(c.recorderConfig().sampleRate, 22050.0);
    EXPECT_EQ(c.recorderConfig().deviceFilter, "mic");
}
