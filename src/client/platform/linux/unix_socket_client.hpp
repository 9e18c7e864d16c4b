#pragma once

#include "platform/ipc_client.hpp"

#include <cstddef>
#include <string>

// Blocking client side of the whisperd line protocol. Bytes after a reply's
// newline are kept for the next recv().
class UnixSocketClient : public IpcClient {
public:
    // Transcripts of long recordings are far larger than a request line.
    static constexpr size_t kMaxReplyBytes = 64u << 20;

    UnixSocketClient() = default;
    explicit UnixSocketClient(size_t max_reply_bytes) : max_reply_bytes_(max_reply_bytes) {}
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    int connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    RecvStatus recv(nlohmann::json& response, int timeout_ms = -1) override;
    void close() override;

private:
    int fd_ = -1;
    size_t max_reply_bytes_ = kMaxReplyBytes;
    std::string buf_;
};
