#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

struct VADConfig {
    int    frameSize       = 512;
    int    overlap         = 256;    // hop between frame starts
    double energyThreshold = 0.01;
    double zcrThreshold    = 0.1;
    double voiceThreshold  = 0.5;    // probability cut-off (0..1)
    int    sampleRate      = 16000;
    double paddingMs       = 200.0;  // kept around each segment when muting
};

struct VoiceSegment {
    double startMs    = 0.0;
    double endMs      = 0.0;
    double durationMs = 0.0;
};

// Time-domain voice activity detector.
//
// Each frame gets a weighted score from three cheap features:
//   energy   - mean square, normalised against energyThreshold
//   ZCR      - fraction of sign changes; voiced speech crosses rarely
//   centroid - amplitude-weighted mean sample index. A coarse stand-in
//              for a spectral centroid, not an FFT measurement.
// Stateless; safe to share between threads.
class VoiceActivityDetector {
public:
    struct FrameScore {
        double energy        = 0.0;
        double zcr           = 0.0;
        double centroid      = 0.0;
        double energyScore   = 0.0;
        double zcrScore      = 0.0;
        double spectralScore = 0.0;
        double probability   = 0.0;
        bool   voice         = false;
    };

    explicit VoiceActivityDetector(const VADConfig& config = {})
        : config_(config) {}

    const VADConfig& config() const { return config_; }

    double hopMs() const {
        return (double)config_.overlap / config_.sampleRate * 1000.0;
    }

    // floor((L - f) / hop) + 1 when L >= f, else 0
    size_t frameCount(size_t length) const {
        size_t f = (size_t)config_.frameSize;
        if (config_.frameSize <= 0 || config_.overlap <= 0 || length < f)
            return 0;
        return (length - f) / (size_t)config_.overlap + 1;
    }

    FrameScore scoreFrame(const float* frame, size_t n) const {
        FrameScore s;
        if (!frame || n == 0) return s;

        double sumSq = 0.0;
        double weighted = 0.0;
        double magnitude = 0.0;
        size_t crossings = 0;

        for (size_t i = 0; i < n; i++) {
            double x = frame[i];
            sumSq += x * x;

            double a = std::abs(x);
            weighted  += a * (double)i;
            magnitude += a;

            if (i > 0 && ((frame[i - 1] >= 0.0f) != (frame[i] >= 0.0f)))
                crossings++;
        }

        s.energy   = sumSq / n;
        s.zcr      = n > 1 ? (double)crossings / (n - 1) : 0.0;
        s.centroid = magnitude > 0.0 ? weighted / magnitude : 0.0;

        s.energyScore   = std::clamp(s.energy / config_.energyThreshold / 2.0,
                                     0.0, 1.0);
        s.zcrScore      = std::clamp(1.0 - s.zcr / config_.zcrThreshold,
                                     0.0, 1.0);
        s.spectralScore = std::clamp(s.centroid / 2000.0, 0.0, 1.0);

        s.probability = 0.5 * s.energyScore
                      + 0.3 * s.zcrScore
                      + 0.2 * s.spectralScore;
        s.voice = s.probability > config_.voiceThreshold;
        return s;
    }

    bool isVoiceFrame(const float* frame, size_t n) const {
        return scoreFrame(frame, n).voice;
    }

    // One flag per analysis frame
    std::vector<bool> voiceActivity(const std::vector<float>& audio) const {
        size_t count = frameCount(audio.size());
        std::vector<bool> activity(count, false);
        for (size_t i = 0; i < count; i++) {
            size_t start = i * (size_t)config_.overlap;
            activity[i] = isVoiceFrame(audio.data() + start,
                                       (size_t)config_.frameSize);
        }
        return activity;
    }

    // Runs of voice frames as time ranges. A run still open at the end of
    // the buffer closes at frameCount * hopMs.
    std::vector<VoiceSegment> voiceSegments(const std::vector<float>& audio) const {
        std::vector<VoiceSegment> segments;
        auto activity = voiceActivity(audio);
        double hop = hopMs();

        auto close = [&](size_t from, size_t to) {
            segments.push_back({from * hop, to * hop, (to - from) * hop});
        };

        bool inVoice = false;
        size_t segStart = 0;
        for (size_t i = 0; i < activity.size(); i++) {
            if (activity[i] && !inVoice) {
                inVoice = true;
                segStart = i;
            } else if (!activity[i] && inVoice) {
                inVoice = false;
                close(segStart, i);
            }
        }
        if (inVoice) close(segStart, activity.size());

        return segments;
    }

    // Copy of `audio` with everything outside the padded segments set to
    // 0.0. Length and timing are preserved.
    std::vector<float> muteNonVoice(const std::vector<float>& audio,
                                    const std::vector<VoiceSegment>& segments) const {
        std::vector<bool> keep = keepMask(audio.size(), segments);
        std::vector<float> muted(audio);
        for (size_t i = 0; i < muted.size(); i++) {
            if (!keep[i]) muted[i] = 0.0f;
        }
        return muted;
    }

    // true = sample lies in some [start - pad, end + pad) range
    std::vector<bool> keepMask(size_t length,
                               const std::vector<VoiceSegment>& segments) const {
        std::vector<bool> keep(length, false);
        double perMs = config_.sampleRate / 1000.0;
        long long padding = (long long)(config_.paddingMs * perMs);
        long long len = (long long)length;

        for (auto& seg : segments) {
            long long from = (long long)(seg.startMs * perMs) - padding;
            long long to   = (long long)(seg.endMs * perMs) + padding;
            from = std::clamp(from, 0LL, len);
            to   = std::clamp(to, 0LL, len);
            for (long long i = from; i < to; i++)
                keep[(size_t)i] = true;
        }
        return keep;
    }

private:
    VADConfig config_;
};
