#include "audio/EchoCanceller.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

EchoCanceller::EchoCanceller(const AECConfig& config)
    : config_(config)
    , weights_(std::max(config.filterLength, 1), 0.0)
    , history_(std::max(config.filterLength, 1))
{
    config_.filterLength = (int)weights_.size();
}

std::vector<float> EchoCanceller::processFrame(const std::vector<float>& mic,
                                               const std::vector<float>& farEnd) {
    std::lock_guard lock(mtx_);
    return processLocked(mic, farEnd);
}

std::vector<float> EchoCanceller::processIsolated(const std::vector<float>& mic,
                                                  const std::vector<float>& farEnd) {
    std::lock_guard lock(mtx_);
    resetLocked();
    return processLocked(mic, farEnd);
}

void EchoCanceller::reset() {
    std::lock_guard lock(mtx_);
    resetLocked();
}

std::vector<double> EchoCanceller::coefficients() const {
    std::lock_guard lock(mtx_);
    return weights_;
}

std::vector<float> EchoCanceller::processLocked(const std::vector<float>& mic,
                                                const std::vector<float>& farEnd) {
    if (mic.size() != farEnd.size()) {
        spdlog::warn("AEC: signal length mismatch (mic={}, far-end={}), "
                     "skipping echo cancellation", mic.size(), farEnd.size());
        return mic;
    }

    std::vector<float> output(mic.size());
    double* w = weights_.data();

    for (size_t i = 0; i < mic.size(); i++) {
        history_.push(farEnd[i]);

        double echoEstimate = 0.0;
        double power = 0.0;
        history_.forEachNewest([&](size_t j, double r) {
            echoEstimate += w[j] * r;
            power        += r * r;
        });

        double error = (double)mic[i] - echoEstimate;

        // Frozen while the reference is silent
        if (power > kEpsilon) {
            double mu = config_.stepSize / (power + kEpsilon);
            double leak = config_.leakageFactor;
            history_.forEachNewest([&](size_t j, double r) {
                w[j] = leak * w[j] + mu * error * r;
            });
        }

        double out = error * config_.echoSuppression;
        output[i] = (float)std::clamp(out, -1.0, 1.0);
    }

    return output;
}

void EchoCanceller::resetLocked() {
    std::fill(weights_.begin(), weights_.end(), 0.0);
    history_.reset();
}

double EchoCanceller::echoReturnLossEnhancement(const std::vector<float>& mic,
                                                const std::vector<float>& output) {
    if (mic.empty() || output.empty()) return 0.0;

    double micPower = 0.0;
    double outPower = 0.0;
    size_t n = std::min(mic.size(), output.size());
    for (size_t i = 0; i < n; i++) {
        micPower += (double)mic[i] * mic[i];
        outPower += (double)output[i] * output[i];
    }

    if (outPower < kEpsilon) return 60.0;
    double erle = 10.0 * std::log10(micPower / outPower);
    return std::clamp(erle, 0.0, 60.0);
}
