#include "daemon/ControlServer.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <filesystem>

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static bool fillAddress(const std::string& path, sockaddr_un& addr) {
    addr = {};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) return false;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return true;
}

static void setTimeouts(int fd, int ms) {
    struct timeval tv{};
    tv.tv_sec  = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

ControlServer::ControlServer(RecordingController& controller)
    : controller_(controller)
{
}

ControlServer::~ControlServer() {
    stop();
}

bool ControlServer::start(const std::string& socketPath) {
    sockaddr_un addr;
    if (!fillAddress(socketPath, addr)) {
        spdlog::error("Control: socket path too long: {}", socketPath);
        return false;
    }

    std::error_code ec;
    auto dir = std::filesystem::path(socketPath).parent_path();
    if (!dir.empty()) std::filesystem::create_directories(dir, ec);
    std::filesystem::remove(socketPath, ec);

    listenFd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (listenFd_ < 0) {
        spdlog::error("Control: failed to create socket: {}", strerror(errno));
        return false;
    }

    // Socket file is created 0600; never visible with wider permissions
    mode_t oldMask = ::umask(0177);
    int bound = ::bind(listenFd_, (struct sockaddr*)&addr, sizeof(addr));
    ::umask(oldMask);  // always succeeds, errno untouched

    if (bound < 0 || ::listen(listenFd_, 8) < 0) {
        spdlog::error("Control: cannot listen on {}: {}", socketPath, strerror(errno));
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }

    path_    = socketPath;
    running_ = true;
    acceptThread_ = std::thread(&ControlServer::acceptLoop, this);

    spdlog::info("Control: listening on {}", path_);
    return true;
}

void ControlServer::stop() {
    running_ = false;
    if (acceptThread_.joinable())
        acceptThread_.join();
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
}

void ControlServer::acceptLoop() {
    while (running_) {
        // 100ms poll so stop() is noticed promptly
        pollfd pfd{listenFd_, POLLIN, 0};
        int n = ::poll(&pfd, 1, 100);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::error("Control: poll failed: {}", strerror(errno));
            break;
        }
        if (n == 0) continue;

        int fd = ::accept(listenFd_, nullptr, nullptr);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED)
                spdlog::warn("Control: accept failed: {}", strerror(errno));
            continue;
        }
        serveClient(fd);
        ::close(fd);
    }
}

void ControlServer::serveClient(int fd) {
    setTimeouts(fd, 1000);

    std::string line;
    char buf[256];
    while (line.find('\n') == std::string::npos && line.size() < 1024) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        line.append(buf, n);
    }
    line = trim(line.substr(0, line.find('\n')));
    if (line.empty()) return;

    std::string reply = respond(controller_, line) + "\n";
    if (::send(fd, reply.data(), reply.size(), MSG_NOSIGNAL) < 0)
        spdlog::warn("Control: reply failed: {}", strerror(errno));
}

std::string ControlServer::respond(RecordingController& controller,
                                   const std::string& line) {
    std::string cmd = trim(line);
    spdlog::debug("Control: command '{}'", cmd);

    if (cmd == "status")
        return recordingStateToString(controller.detailedStatus());

    ControlResult r;
    if      (cmd == "start")  r = controller.start();
    else if (cmd == "stop")   r = controller.stop();
    else if (cmd == "toggle") r = controller.toggle();
    else return "ERROR: Unknown command '" + cmd + "'";

    return (r.success ? "OK: " : "ERROR: ") + r.message;
}

bool ControlClient::send(const std::string& socketPath, const std::string& command,
                         std::string& reply, std::string& error) {
    sockaddr_un addr;
    if (!fillAddress(socketPath, addr)) {
        error = "socket path too long";
        return false;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        error = strerror(errno);
        return false;
    }
    setTimeouts(fd, 5000);

    if (::connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        error = "cannot connect to " + socketPath + ": " + strerror(errno);
        ::close(fd);
        return false;
    }

    std::string msg = command + "\n";
    if (::send(fd, msg.data(), msg.size(), MSG_NOSIGNAL) < 0) {
        error = std::string("send failed: ") + strerror(errno);
        ::close(fd);
        return false;
    }

    reply.clear();
    char buf[256];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0)
        reply.append(buf, n);
    ::close(fd);

    if (n < 0 && reply.empty()) {
        error = std::string("no reply: ") + strerror(errno);
        return false;
    }
    reply = trim(reply);
    return true;
}
