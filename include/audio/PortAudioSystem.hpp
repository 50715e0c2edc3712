#pragma once

// Owns PortAudio's process-wide initialization. Construct once at startup,
// hand it by reference to every PortAudioCapture, destroy at shutdown.
class PortAudioSystem {
public:
    PortAudioSystem();
    ~PortAudioSystem();

    PortAudioSystem(const PortAudioSystem&) = delete;
    PortAudioSystem& operator=(const PortAudioSystem&) = delete;

    bool ok() const { return initialized_; }

private:
    bool initialized_ = false;
};
