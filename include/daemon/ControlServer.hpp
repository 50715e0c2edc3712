#pragma once
#include "daemon/RecordingController.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <thread>

// Line-oriented control protocol on a Unix domain socket.
// One command per connection, one reply line back.
class ControlServer {
public:
    explicit ControlServer(RecordingController& controller);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Binds `socketPath` (mode 0600), replacing a stale socket file
    bool start(const std::string& socketPath);
    void stop();
    bool isRunning() const { return running_; }

    // Maps one command line to its reply (no trailing newline)
    static std::string respond(RecordingController& controller,
                               const std::string& line);

private:
    void acceptLoop();
    void serveClient(int fd);

    RecordingController& controller_;
    std::string          path_;
    int                  listenFd_ = -1;

    std::atomic<bool> running_{false};
    std::thread       acceptThread_;
};

namespace ControlClient {
    // Sends `command`, fills `reply`. False with `error` set on socket failure.
    bool send(const std::string& socketPath, const std::string& command,
              std::string& reply, std::string& error);
}
