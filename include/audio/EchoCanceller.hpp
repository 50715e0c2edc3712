#pragma once
#include "HistoryRing.hpp"
#include <mutex>
#include <vector>

struct AECConfig {
    int    filterLength    = 1024;   // taps; longer covers longer echo tails
    double stepSize        = 0.05;   // NLMS mu
    double leakageFactor   = 0.999;  // < 1 bleeds off coefficient drift
    double echoSuppression = 0.7;    // post-cancellation gain
};

// Acoustic echo canceller: NLMS adaptive filter driven by the far-end
// (loopback) reference.
//
// The filter state lives for the daemon's lifetime. Every entry point takes
// mtx_, so overlapping processing tasks adapt the filter one at a time.
class EchoCanceller {
public:
    static constexpr double kEpsilon = 1e-10;

    explicit EchoCanceller(const AECConfig& config = {});

    // Cancels the echo of farEnd in mic. Lengths must match; otherwise mic
    // is returned unchanged with a warning.
    std::vector<float> processFrame(const std::vector<float>& mic,
                                    const std::vector<float>& farEnd);

    // reset() + processFrame() as one atomic step
    std::vector<float> processIsolated(const std::vector<float>& mic,
                                       const std::vector<float>& farEnd);

    void reset();

    std::vector<double> coefficients() const;
    const AECConfig& config() const { return config_; }

    // ERLE in dB, clamped to [0, 60]
    static double echoReturnLossEnhancement(const std::vector<float>& mic,
                                            const std::vector<float>& output);

private:
    std::vector<float> processLocked(const std::vector<float>& mic,
                                     const std::vector<float>& farEnd);
    void resetLocked();

    AECConfig           config_;
    std::vector<double> weights_;
    HistoryRing<double> history_;
    mutable std::mutex  mtx_;
};
