#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "endpoint.hpp"

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    int         status = 0;
    std::string reason;
    HttpHeaders headers;
    std::string body;

    // Case-insensitive lookup; empty if the header is absent.
    [[nodiscard]] std::string header(const std::string& name) const;
    [[nodiscard]] bool        has_header(const std::string& name) const;
};

// Shared HTTP/1.1 connection handle. Idle keep-alive sockets are pooled per
// host:port; each request in flight holds its own socket, so one session can
// serve any number of concurrent calls.
class HttpSession {
public:
    HttpSession() = default;
    ~HttpSession();

    HttpSession(const HttpSession&)            = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    // POSTs `body` to endpoint.path. The deadline covers connect, send and
    // receive; when it expires the socket is closed and RpcTimeoutError thrown.
    // Name resolution (getaddrinfo) is blocking and not bounded by the deadline.
    // Other transport failures throw RpcError(RPC_TRANSPORT_ERROR, ...).
    // Authorization is taken from the URL credentials unless `headers` has one.
    HttpResponse post(const Endpoint& endpoint, const HttpHeaders& headers,
                      const std::string& body, std::chrono::milliseconds timeout);

    // Closes idle sockets; later requests fail. In-flight requests finish and
    // their sockets are closed instead of pooled.
    void close();

    [[nodiscard]] bool   is_closed() const;
    [[nodiscard]] size_t idle_connections() const;
    [[nodiscard]] size_t opened_connections() const;

private:
    mutable std::mutex              mtx_;
    bool                            closed_ = false;
    std::multimap<std::string, int> idle_; // "host:port" -> socket
    size_t                          opened_ = 0;

    int  acquire(const Endpoint& endpoint, const std::string& key,
                 std::chrono::steady_clock::time_point deadline, std::chrono::milliseconds timeout);
    void release(const std::string& key, int sock);
};
