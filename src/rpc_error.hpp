#pragma once

#include <stdexcept>
#include <string>

// Codes raised locally; anything else comes verbatim from the peer.
inline constexpr int RPC_TRANSPORT_ERROR   = -342; // no/invalid HTTP response
inline constexpr int RPC_MISSING_RESULT    = -343;
inline constexpr int RPC_BATCH_PARSE_ERROR = -32700;

// Single error kind for every failure of a call: transport, content type and
// peer-reported errors alike. what() renders "<code>: <message>".
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message)
        : std::runtime_error(std::to_string(code) + ": " + message), code_(code),
          message_(message) {}

    [[nodiscard]] int                code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    int         code_;
    std::string message_;
};

// The request deadline expired; the in-flight request was abandoned.
class RpcTimeoutError : public RpcError {
public:
    explicit RpcTimeoutError(const std::string& message)
        : RpcError(RPC_TRANSPORT_ERROR, message) {}
};
