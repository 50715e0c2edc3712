#pragma once
#include "IAudioCapture.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Classifies capture devices by name and ranks them for a role.
//
// Loopback candidates come from an ordered list of named predicates;
// registering another predicate extends matching for new drivers without
// touching the recorders or the controller.
class DeviceSelector {
public:
    using DeviceInfo = IAudioCapture::DeviceInfo;

    struct Rule {
        std::string name;
        std::function<bool(const std::string& lowerName)> matches;
    };

    DeviceSelector() {
        auto monitorWith = [](const std::string& word) {
            return [word](const std::string& n) {
                return isMonitorName(n) && n.find(word) != std::string::npos;
            };
        };

        loopbackRules_.push_back({"speaker-monitor", monitorWith("speaker")});
        loopbackRules_.push_back({"hdmi-monitor",    monitorWith("hdmi")});
        loopbackRules_.push_back({"any-monitor",
            [](const std::string& n) { return isMonitorName(n); }});
    }

    // Insert a loopback predicate at `position` (clamped; default: last)
    void addLoopbackRule(Rule rule, size_t position = SIZE_MAX) {
        position = std::min(position, loopbackRules_.size());
        loopbackRules_.insert(loopbackRules_.begin() + position,
                              std::move(rule));
    }

    const std::vector<Rule>& loopbackRules() const { return loopbackRules_; }

    // Monitor-class devices tap system output rather than a microphone.
    static bool isMonitor(const std::string& name) {
        return isMonitorName(toLower(name));
    }

    // Human-readable role label used by `voxd devices`
    std::string classify(const DeviceInfo& dev) const {
        std::string lower = toLower(dev.name);
        for (auto& rule : loopbackRules_) {
            if (rule.matches(lower)) return "loopback (" + rule.name + ")";
        }
        return isMonitorName(lower) ? "monitor" : "microphone";
    }

    // Case-insensitive substring match. Non-monitor matches win; a monitor
    // is returned only when nothing else matches.
    std::optional<DeviceInfo> selectMicrophone(
        const std::vector<DeviceInfo>& devices,
        const std::string& filter) const
    {
        std::string needle = toLower(filter);
        std::optional<DeviceInfo> monitorMatch;

        for (auto& dev : devices) {
            std::string lower = toLower(dev.name);
            if (lower.find(needle) == std::string::npos) continue;
            if (!isMonitorName(lower)) return dev;
            if (!monitorMatch) monitorMatch = dev;
        }
        return monitorMatch;
    }

    // Eligible loopback devices in rule priority order, each listed once.
    std::vector<DeviceInfo> loopbackCandidates(
        const std::vector<DeviceInfo>& devices) const
    {
        std::vector<DeviceInfo> result;
        for (auto& rule : loopbackRules_) {
            for (auto& dev : devices) {
                std::string lower = toLower(dev.name);
                if (lower.find("microphone") != std::string::npos) continue;
                if (!rule.matches(lower)) continue;

                bool seen = std::any_of(result.begin(), result.end(),
                    [&](const DeviceInfo& d) { return d.id == dev.id; });
                if (!seen) result.push_back(dev);
            }
        }
        return result;
    }

private:
    static bool isMonitorName(const std::string& lowerName) {
        return lowerName.find("monitor") != std::string::npos;
    }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return (char)std::tolower(c); });
        return s;
    }

    std::vector<Rule> loopbackRules_;
};
