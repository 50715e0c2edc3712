#pragma once
#include "PortAudioSystem.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Decoded notification sound, interleaved float frames
struct SoundClip {
    std::vector<float> samples;
    int                channels   = 1;
    double             sampleRate = 44100.0;

    size_t frameCount() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }
};

// Blocking playback sink. Called only from the player's worker thread.
class ISoundOutput {
public:
    virtual ~ISoundOutput() = default;
    virtual bool play(const SoundClip& clip) = 0;
};

// Default output device through a blocking-write PortAudio stream
class PortAudioSoundOutput : public ISoundOutput {
public:
    explicit PortAudioSoundOutput(PortAudioSystem& system);

    bool play(const SoundClip& clip) override;

private:
    PortAudioSystem& system_;
};

struct FeedbackConfig {
    bool        enabled     = true;
    double      startVolume = 0.4;
    double      stopVolume  = 0.4;
    std::string startSoundPath;              // empty = start.ogg in assets
    std::string stopSoundPath;               // empty = stop.ogg in assets
    std::vector<std::string> assetDirs;      // searched in order for start.ogg
};

// Start/stop cues played on a worker thread so the controller never waits
// on the sound device. Clips are loaded once and pre-scaled by their volume.
// Any missing asset disables the player with a warning.
class FeedbackPlayer {
public:
    using ClipLoader = std::function<std::optional<SoundClip>(const std::string& path)>;

    FeedbackPlayer(const FeedbackConfig& config,
                   std::unique_ptr<ISoundOutput> output,
                   ClipLoader loader = &FeedbackPlayer::loadSoundFile);
    ~FeedbackPlayer();

    FeedbackPlayer(const FeedbackPlayer&) = delete;
    FeedbackPlayer& operator=(const FeedbackPlayer&) = delete;

    void playStart();
    void playStop();

    bool enabled() const { return enabled_; }
    double startVolume() const { return startVolume_; }
    double stopVolume() const  { return stopVolume_; }
    const std::string& startSoundPath() const { return startPath_; }
    const std::string& stopSoundPath() const  { return stopPath_; }

    // Blocks until every queued cue has been played
    bool waitIdle(int timeoutMs);

    static double clampVolume(double volume);

    // First directory holding start.ogg, empty when none does
    static std::string findAssetsDir(const std::vector<std::string>& dirs);

    // Absolute custom path if it exists, else custom path under assetsDir if
    // it exists, else assetsDir/defaultName
    static std::string resolveSoundPath(const std::string& custom,
                                        const std::string& assetsDir,
                                        const std::string& defaultName);

    // Decodes any format libsndfile reads (ogg/vorbis, wav, flac)
    static std::optional<SoundClip> loadSoundFile(const std::string& path);

private:
    void enqueue(const SoundClip* clip);
    void workerLoop();

    std::unique_ptr<ISoundOutput> output_;
    bool        enabled_     = false;
    double      startVolume_ = 0.4;
    double      stopVolume_  = 0.4;
    std::string startPath_;
    std::string stopPath_;
    SoundClip   startClip_;
    SoundClip   stopClip_;

    std::mutex                    mtx_;
    std::condition_variable       cv_;
    std::condition_variable       idleCv_;
    std::deque<const SoundClip*>  queue_;
    bool                          playing_  = false;
    bool                          stopping_ = false;
    std::thread                   worker_;
};
