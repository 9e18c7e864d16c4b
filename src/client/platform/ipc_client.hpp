#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

// Outcome of waiting for one reply line from whisperd.
enum class RecvStatus {
    Ok,
    Timeout,   // no complete line before the deadline
    Closed,    // daemon closed the connection or the socket failed
    Malformed, // a line arrived but is not a JSON object
    Oversized, // no newline within the reply size limit
};

inline std::string_view recv_status_name(RecvStatus s) {
    switch (s) {
        case RecvStatus::Ok: return "ok";
        case RecvStatus::Timeout: return "timed out waiting for whisperd";
        case RecvStatus::Closed: return "whisperd closed the connection";
        case RecvStatus::Malformed: return "whisperd sent a malformed reply";
        case RecvStatus::Oversized: return "whisperd reply exceeds the size limit";
    }
    return "unknown";
}

class IpcClient {
public:
    virtual ~IpcClient() = default;

    // Returns 0 on success, otherwise the errno of the failed step.
    virtual int connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // timeout_ms < 0 waits until the daemon answers or hangs up.
    virtual RecvStatus recv(nlohmann::json& response, int timeout_ms = -1) = 0;
    virtual void close() = 0;

    RecvStatus request(const nlohmann::json& cmd, nlohmann::json& response, int timeout_ms) {
        if (!send(cmd)) return RecvStatus::Closed;
        return recv(response, timeout_ms);
    }
};
