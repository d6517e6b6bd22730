#include "http_session.hpp"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstring>
#include <memory>
#include <stdexcept>

#include "rpc_error.hpp"

using Clock = std::chrono::steady_clock;

namespace {

// SIGPIPE is suppressed per send where the platform allows it, per socket
// (SO_NOSIGPIPE) on macOS.
#ifdef MSG_NOSIGNAL
constexpr int SEND_FLAGS = MSG_NOSIGNAL;
#else
constexpr int SEND_FLAGS = 0;
#endif

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string to_lower(std::string s) {
    std::ranges::transform(s, s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trimmed(std::string s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.erase(s.begin());
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.pop_back();
    return s;
}

// Closes the socket on scope exit unless released. Closing an in-flight
// socket is how an expired request is cancelled.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0)
            ::close(fd_);
    }
    SocketGuard(const SocketGuard&)            = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    int               release() noexcept {
        const int fd = fd_;
        fd_          = -1;
        return fd;
    }

private:
    int fd_;
};

struct Deadline {
    Clock::time_point         at;
    std::chrono::milliseconds budget;

    [[nodiscard]] int remaining_ms() const {
        const auto left =
            std::chrono::duration_cast<std::chrono::milliseconds>(at - Clock::now()).count();
        if (left <= 0)
            return 0;
        return static_cast<int>(std::min<long long>(left, INT_MAX));
    }
};

void wait_ready(int fd, short events, const Deadline& dl) {
    while (true) {
        pollfd    pfd{fd, events, 0};
        const int rc = ::poll(&pfd, 1, dl.remaining_ms());
        if (rc > 0)
            return;
        if (rc == 0)
            throw RpcTimeoutError("request timed out after " + std::to_string(dl.budget.count()) +
                                  " ms");
        if (errno != EINTR)
            throw RpcError(RPC_TRANSPORT_ERROR, "poll() failed: " + std::string(strerror(errno)));
    }
}

int connect_to(const Endpoint& ep, const Deadline& dl) {
    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string port_str = std::to_string(ep.port);
    const int         err      = getaddrinfo(ep.host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0)
        throw RpcError(RPC_TRANSPORT_ERROR, "getaddrinfo: " + std::string(gai_strerror(err)));
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addrs(res, &freeaddrinfo);

    std::string last_error = "no usable address";
    for (addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
        SocketGuard sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (sock.get() < 0) {
            last_error = strerror(errno);
            continue;
        }
#ifdef __APPLE__
        int one = 1;
        setsockopt(sock.get(), SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
        const int flags = fcntl(sock.get(), F_GETFL, 0);
        if (flags < 0 || fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
            last_error = strerror(errno);
            continue;
        }
        if (::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
            if (errno != EINPROGRESS) {
                last_error = strerror(errno);
                continue;
            }
            wait_ready(sock.get(), POLLOUT, dl);
            int       so_error = 0;
            socklen_t len      = sizeof(so_error);
            if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0)
                so_error = errno;
            if (so_error != 0) {
                last_error = strerror(so_error);
                continue;
            }
        }
        return sock.release();
    }
    throw RpcError(RPC_TRANSPORT_ERROR,
                   "connect to " + ep.host + ":" + port_str + " failed: " + last_error);
}

void send_all(int fd, const std::string& data, const Deadline& dl) {
    size_t sent_total = 0;
    while (sent_total < data.size()) {
        const ssize_t n =
            ::send(fd, data.data() + sent_total, data.size() - sent_total, SEND_FLAGS);
        if (n > 0) {
            sent_total += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            wait_ready(fd, POLLOUT, dl);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        throw RpcError(RPC_TRANSPORT_ERROR, "send() failed: " + std::string(strerror(errno)));
    }
}

// An idle pooled socket that turned readable was closed by the peer (or holds
// stray bytes); either way it cannot carry the next request.
bool still_usable(int fd) {
    pollfd pfd{fd, POLLIN, 0};
    return ::poll(&pfd, 1, 0) == 0;
}

// ---------------------------------------------------------------------------
// Response reading
// ---------------------------------------------------------------------------
class ResponseReader {
public:
    ResponseReader(int fd, Deadline dl) : fd_(fd), dl_(dl) {}

    // Line without its CRLF.
    std::string line() {
        size_t eol;
        while ((eol = buf_.find("\r\n", pos_)) == std::string::npos)
            if (!fill())
                throw closed_early();
        std::string out = buf_.substr(pos_, eol - pos_);
        pos_            = eol + 2;
        return out;
    }

    std::string exact(size_t n) {
        while (buf_.size() - pos_ < n)
            if (!fill())
                throw closed_early();
        std::string out = buf_.substr(pos_, n);
        pos_ += n;
        return out;
    }

    std::string until_eof() {
        while (fill()) {
        }
        std::string out = buf_.substr(pos_);
        pos_            = buf_.size();
        return out;
    }

    [[nodiscard]] bool exhausted() const noexcept { return pos_ == buf_.size(); }

private:
    int         fd_;
    Deadline    dl_;
    std::string buf_;
    size_t      pos_ = 0;

    // Appends whatever is available; false on orderly shutdown by the peer.
    bool fill() {
        char buf[4096];
        while (true) {
            const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n > 0) {
                buf_.append(buf, static_cast<size_t>(n));
                return true;
            }
            if (n == 0)
                return false;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                wait_ready(fd_, POLLIN, dl_);
                continue;
            }
            if (errno == EINTR)
                continue;
            throw RpcError(RPC_TRANSPORT_ERROR, "recv() failed: " + std::string(strerror(errno)));
        }
    }

    [[nodiscard]] RpcError closed_early() const {
        if (buf_.empty())
            return RpcError(RPC_TRANSPORT_ERROR, "missing HTTP response from server");
        return RpcError(RPC_TRANSPORT_ERROR, "connection closed in the middle of the response");
    }
};

std::string read_chunked_body(ResponseReader& in) {
    std::string body;
    while (true) {
        std::string size_line = in.line();
        size_line             = trimmed(size_line.substr(0, size_line.find(';')));
        size_t chunk_size     = 0;
        try {
            chunk_size = std::stoul(size_line, nullptr, 16);
        } catch (const std::logic_error&) {
            throw RpcError(RPC_TRANSPORT_ERROR, "Invalid chunk size '" + size_line + "'");
        }
        if (chunk_size == 0)
            break;
        body += in.exact(chunk_size);
        if (!in.line().empty())
            throw RpcError(RPC_TRANSPORT_ERROR, "Malformed chunked body");
    }
    // Optional trailer fields, then the terminating empty line
    while (!in.line().empty()) {
    }
    return body;
}

HttpResponse read_response(ResponseReader& in, bool& keep_alive) {
    HttpResponse resp;
    std::string  version;

    // Skip interim 1xx responses
    do {
        const std::string status_line = in.line();
        const auto        sp1         = status_line.find(' ');
        if (sp1 == std::string::npos || status_line.rfind("HTTP/", 0) != 0)
            throw RpcError(RPC_TRANSPORT_ERROR, "Invalid HTTP status line");
        version               = status_line.substr(0, sp1);
        const auto        sp2 = status_line.find(' ', sp1 + 1);
        const std::string code =
            status_line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
        if (code.size() != 3 ||
            !std::ranges::all_of(code, [](unsigned char c) { return std::isdigit(c) != 0; }))
            throw RpcError(RPC_TRANSPORT_ERROR, "Invalid HTTP status line");
        resp.status = std::stoi(code);
        resp.reason = sp2 == std::string::npos ? "" : status_line.substr(sp2 + 1);

        resp.headers.clear();
        for (std::string line = in.line(); !line.empty(); line = in.line()) {
            const auto colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            resp.headers.emplace_back(trimmed(line.substr(0, colon)),
                                      trimmed(line.substr(colon + 1)));
        }
    } while (resp.status >= 100 && resp.status < 200);

    bool framed = true;
    if (to_lower(resp.header("Transfer-Encoding")).find("chunked") != std::string::npos) {
        resp.body = read_chunked_body(in);
    } else if (resp.has_header("Content-Length")) {
        const std::string len_str = resp.header("Content-Length");
        if (len_str.empty() ||
            !std::ranges::all_of(len_str, [](unsigned char c) { return std::isdigit(c) != 0; }))
            throw RpcError(RPC_TRANSPORT_ERROR, "Invalid Content-Length '" + len_str + "'");
        size_t length = 0;
        try {
            length = static_cast<size_t>(std::stoull(len_str));
        } catch (const std::out_of_range&) {
            throw RpcError(RPC_TRANSPORT_ERROR, "Invalid Content-Length '" + len_str + "'");
        }
        resp.body = in.exact(length);
    } else {
        resp.body = in.until_eof();
        framed    = false;
    }

    const std::string connection = to_lower(resp.header("Connection"));
    const bool        persistent = version == "HTTP/1.1"
                                       ? connection.find("close") == std::string::npos
                                       : connection.find("keep-alive") != std::string::npos;
    keep_alive = framed && persistent && in.exhausted();
    return resp;
}

} // namespace

// ---------------------------------------------------------------------------
// HttpResponse
// ---------------------------------------------------------------------------
std::string HttpResponse::header(const std::string& name) const {
    for (const auto& [k, v] : headers)
        if (iequals(k, name))
            return v;
    return {};
}

bool HttpResponse::has_header(const std::string& name) const {
    return std::ranges::any_of(headers, [&](const auto& h) { return iequals(h.first, name); });
}

// ---------------------------------------------------------------------------
// HttpSession
// ---------------------------------------------------------------------------
HttpSession::~HttpSession() { close(); }

HttpResponse HttpSession::post(const Endpoint& endpoint, const HttpHeaders& headers,
                               const std::string& body, std::chrono::milliseconds timeout) {
    const Deadline    dl{Clock::now() + timeout, timeout};
    const std::string key = endpoint.host + ":" + std::to_string(endpoint.port);

    SocketGuard sock(acquire(endpoint, key, dl.at, dl.budget));

    std::string request  = "POST " + endpoint.path + " HTTP/1.1\r\n";
    bool        has_host = false;
    bool        has_auth = false;
    for (const auto& [name, value] : headers) {
        request += name + ": " + value + "\r\n";
        has_host = has_host || iequals(name, "Host");
        has_auth = has_auth || iequals(name, "Authorization");
    }
    if (!has_host)
        request += "Host: " + endpoint.host_header() + "\r\n";
    if (!has_auth && endpoint.has_credentials)
        request += "Authorization: " + endpoint.auth_header() + "\r\n";
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    request += body;

    send_all(sock.get(), request, dl);

    ResponseReader in(sock.get(), dl);
    bool           keep_alive = false;
    HttpResponse   resp       = read_response(in, keep_alive);
    if (keep_alive)
        release(key, sock.release());
    return resp;
}

int HttpSession::acquire(const Endpoint& endpoint, const std::string& key,
                         Clock::time_point deadline, std::chrono::milliseconds timeout) {
    while (true) {
        int fd = -1;
        {
            std::lock_guard lk(mtx_);
            if (closed_)
                throw RpcError(RPC_TRANSPORT_ERROR, "HTTP session is closed");
            auto it = idle_.find(key);
            if (it == idle_.end())
                break;
            fd = it->second;
            idle_.erase(it);
        }
        if (still_usable(fd))
            return fd;
        ::close(fd);
    }

    const int       fd = connect_to(endpoint, Deadline{deadline, timeout});
    std::lock_guard lk(mtx_);
    ++opened_;
    return fd;
}

void HttpSession::release(const std::string& key, int sock) {
    std::lock_guard lk(mtx_);
    if (closed_)
        ::close(sock);
    else
        idle_.emplace(key, sock);
}

void HttpSession::close() {
    std::lock_guard lk(mtx_);
    closed_ = true;
    for (const auto& [key, fd] : idle_)
        ::close(fd);
    idle_.clear();
}

bool HttpSession::is_closed() const {
    std::lock_guard lk(mtx_);
    return closed_;
}

size_t HttpSession::idle_connections() const {
    std::lock_guard lk(mtx_);
    return idle_.size();
}

size_t HttpSession::opened_connections() const {
    std::lock_guard lk(mtx_);
    return opened_;
}
