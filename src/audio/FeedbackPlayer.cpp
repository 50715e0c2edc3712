#include "audio/FeedbackPlayer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <filesystem>

#ifdef HAS_PORTAUDIO
#include <portaudio.h>
#endif

#ifdef HAS_SNDFILE
#include <sndfile.h>
#endif

namespace fs = std::filesystem;

// ── PortAudio output ────────────────────────────────────────────────────

PortAudioSoundOutput::PortAudioSoundOutput(PortAudioSystem& system)
    : system_(system) {}

bool PortAudioSoundOutput::play(const SoundClip& clip) {
#ifdef HAS_PORTAUDIO
    if (!system_.ok() || clip.frameCount() == 0) return false;

    PaStream* stream = nullptr;
    PaError err = Pa_OpenDefaultStream(&stream, 0, clip.channels, paFloat32,
                                       clip.sampleRate,
                                       paFramesPerBufferUnspecified,
                                       nullptr, nullptr);
    if (err != paNoError) {
        spdlog::warn("Feedback: Pa_OpenDefaultStream failed: {}", Pa_GetErrorText(err));
        return false;
    }

    err = Pa_StartStream(stream);
    if (err == paNoError) {
        err = Pa_WriteStream(stream, clip.samples.data(),
                             static_cast<unsigned long>(clip.frameCount()));
        if (err == paOutputUnderflowed) err = paNoError;
        Pa_StopStream(stream);
    }
    Pa_CloseStream(stream);

    if (err != paNoError) {
        spdlog::warn("Feedback: playback failed: {}", Pa_GetErrorText(err));
        return false;
    }
    return true;
#else
    (void)clip;
    return false;
#endif
}

// ── Player ──────────────────────────────────────────────────────────────

double FeedbackPlayer::clampVolume(double volume) {
    return std::clamp(volume, 0.0, 1.0);
}

std::string FeedbackPlayer::findAssetsDir(const std::vector<std::string>& dirs) {
    std::error_code ec;
    for (auto& dir : dirs) {
        if (fs::exists(fs::path(dir) / "start.ogg", ec))
            return dir;
    }
    return "";
}

std::string FeedbackPlayer::resolveSoundPath(const std::string& custom,
                                             const std::string& assetsDir,
                                             const std::string& defaultName) {
    std::error_code ec;
    if (!custom.empty()) {
        fs::path p(custom);
        if (p.is_absolute()) {
            if (fs::exists(p, ec)) return p.string();
        } else {
            auto rel = fs::path(assetsDir) / p;
            if (fs::exists(rel, ec)) return rel.string();
        }
        spdlog::warn("Feedback: sound '{}' not found, using {}", custom, defaultName);
    }
    return (fs::path(assetsDir) / defaultName).string();
}

std::optional<SoundClip> FeedbackPlayer::loadSoundFile(const std::string& path) {
#ifdef HAS_SNDFILE
    SF_INFO info{};
    SNDFILE* f = sf_open(path.c_str(), SFM_READ, &info);
    if (!f) {
        spdlog::warn("Feedback: cannot open {}: {}", path, sf_strerror(nullptr));
        return std::nullopt;
    }

    SoundClip clip;
    clip.channels   = info.channels;
    clip.sampleRate = info.samplerate;
    clip.samples.resize(static_cast<size_t>(info.frames) * info.channels);

    sf_count_t got = sf_readf_float(f, clip.samples.data(), info.frames);
    sf_close(f);
    if (got <= 0) {
        spdlog::warn("Feedback: {} holds no audio", path);
        return std::nullopt;
    }
    clip.samples.resize(static_cast<size_t>(got) * info.channels);
    return clip;
#else
    spdlog::warn("Feedback: cannot decode {} (built without libsndfile)", path);
    return std::nullopt;
#endif
}

static void scale(SoundClip& clip, double volume) {
    float gain = static_cast<float>(volume);
    for (auto& s : clip.samples) s *= gain;
}

FeedbackPlayer::FeedbackPlayer(const FeedbackConfig& config,
                               std::unique_ptr<ISoundOutput> output,
                               ClipLoader loader)
    : output_(std::move(output))
    , startVolume_(clampVolume(config.startVolume))
    , stopVolume_(clampVolume(config.stopVolume))
{
    if (!config.enabled) {
        spdlog::debug("Feedback: disabled by config");
        return;
    }
    if (!output_ || !loader) {
        spdlog::warn("Feedback: no sound output, audio feedback disabled");
        return;
    }

    std::string assets = findAssetsDir(config.assetDirs);
    if (assets.empty()) {
        spdlog::warn("Feedback: sound assets not found in {} location(s), "
                     "audio feedback disabled", config.assetDirs.size());
        return;
    }
    spdlog::info("Feedback: sound assets in {}", assets);

    startPath_ = resolveSoundPath(config.startSoundPath, assets, "start.ogg");
    stopPath_  = resolveSoundPath(config.stopSoundPath, assets, "stop.ogg");

    auto start = loader(startPath_);
    auto stop  = loader(stopPath_);
    if (!start || !stop) {
        spdlog::warn("Feedback: cannot load notification sounds, audio feedback disabled");
        return;
    }
    startClip_ = std::move(*start);
    stopClip_  = std::move(*stop);
    scale(startClip_, startVolume_);
    scale(stopClip_, stopVolume_);

    enabled_ = true;
    worker_  = std::thread(&FeedbackPlayer::workerLoop, this);
}

FeedbackPlayer::~FeedbackPlayer() {
    {
        std::lock_guard lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

void FeedbackPlayer::playStart() {
    enqueue(&startClip_);
}

void FeedbackPlayer::playStop() {
    enqueue(&stopClip_);
}

void FeedbackPlayer::enqueue(const SoundClip* clip) {
    if (!enabled_) return;
    {
        std::lock_guard lock(mtx_);
        queue_.push_back(clip);
    }
    cv_.notify_one();
}

bool FeedbackPlayer::waitIdle(int timeoutMs) {
    std::unique_lock lock(mtx_);
    return idleCv_.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                            [this] { return queue_.empty() && !playing_; });
}

void FeedbackPlayer::workerLoop() {
    std::unique_lock lock(mtx_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (stopping_) break;

        const SoundClip* clip = queue_.front();
        queue_.pop_front();
        playing_ = true;

        lock.unlock();
        if (!output_->play(*clip))
            spdlog::debug("Feedback: cue not played");
        lock.lock();

        playing_ = false;
        if (queue_.empty()) idleCv_.notify_all();
    }
    queue_.clear();
    playing_ = false;
    idleCv_.notify_all();
}
