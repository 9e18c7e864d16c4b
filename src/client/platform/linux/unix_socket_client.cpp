#include "platform/linux/unix_socket_client.hpp"

#include "json_text.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::~UnixSocketClient() {
    close();
}

int UnixSocketClient::connect(const std::string& endpoint) {
    close();

    sockaddr_un addr{};
    if (endpoint.size() >= sizeof(addr.sun_path)) return ENAMETOOLONG;
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, endpoint.c_str(), endpoint.size() + 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return errno;

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close();
        return err;
    }
    return 0;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;
    std::string msg = to_json_text(cmd) + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) continue;
        if (sent <= 0) return false;
        off += static_cast<size_t>(sent);
    }
    return true;
}

RecvStatus UnixSocketClient::recv(nlohmann::json& response, int timeout_ms) {
    if (fd_ < 0) return RecvStatus::Closed;

    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));

    for (;;) {
        auto pos = buf_.find('\n');
        if (pos != std::string::npos) {
            if (pos > max_reply_bytes_) {
                buf_.erase(0, pos + 1);
                return RecvStatus::Oversized;
            }
            std::string line = buf_.substr(0, pos);
            buf_.erase(0, pos + 1);
            try {
                response = nlohmann::json::parse(line);
            } catch (const nlohmann::json::exception&) {
                return RecvStatus::Malformed;
            }
            return response.is_object() ? RecvStatus::Ok : RecvStatus::Malformed;
        }
        if (buf_.size() > max_reply_bytes_) return RecvStatus::Oversized;

        int wait_ms = -1;
        if (timeout_ms >= 0) {
            auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now());
            if (left.count() <= 0) return RecvStatus::Timeout;
            wait_ms = static_cast<int>(left.count());
        }

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0 && errno == EINTR) continue;
        if (ret < 0) return RecvStatus::Closed;
        if (ret == 0) return RecvStatus::Timeout;

        char tmp[8192];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return RecvStatus::Closed;
        buf_.append(tmp, static_cast<size_t>(n));
    }
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
}
