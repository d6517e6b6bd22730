#include "endpoint.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

// ---------------------------------------------------------------------------
// base64 encoder (RFC 4648)
// ---------------------------------------------------------------------------
std::string base64_encode(const std::string& input) {
    static const char* chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((input.size() + 2) / 3 * 4);

    unsigned char buf[3];
    int           i = 0;

    for (unsigned char c : input) {
        buf[i++] = c;
        if (i == 3) {
            out += chars[(buf[0] >> 2) & 0x3f];
            out += chars[((buf[0] & 0x03) << 4) | ((buf[1] >> 4) & 0x0f)];
            out += chars[((buf[1] & 0x0f) << 2) | ((buf[2] >> 6) & 0x03)];
            out += chars[buf[2] & 0x3f];
            i = 0;
        }
    }
    if (i == 1) {
        out += chars[(buf[0] >> 2) & 0x3f];
        out += chars[(buf[0] & 0x03) << 4];
        out += '=';
        out += '=';
    } else if (i == 2) {
        out += chars[(buf[0] >> 2) & 0x3f];
        out += chars[((buf[0] & 0x03) << 4) | ((buf[1] >> 4) & 0x0f)];
        out += chars[(buf[1] & 0x0f) << 2];
        out += '=';
    }
    return out;
}

// ---------------------------------------------------------------------------
// URL parsing
// ---------------------------------------------------------------------------
static int parse_port(const std::string& s, const std::string& url) {
    if (s.empty() || s.size() > 5 ||
        !std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c) != 0; }))
        throw std::invalid_argument("Invalid port in URL: " + url);
    const int port = std::stoi(s);
    if (port < 1 || port > 65535)
        throw std::invalid_argument("Port out of range in URL: " + url);
    return port;
}

Endpoint Endpoint::parse(const std::string& url) {
    Endpoint ep;

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0)
        throw std::invalid_argument("Invalid service URL (expected scheme://host): " + url);
    ep.scheme = url.substr(0, scheme_end);
    std::ranges::transform(ep.scheme, ep.scheme.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ep.scheme != "http")
        throw std::invalid_argument("Unsupported URL scheme '" + ep.scheme +
                                    "' (only http is supported)");

    const std::string rest          = url.substr(scheme_end + 3);
    const auto        authority_end = rest.find_first_of("/?#");
    std::string       authority     = rest.substr(0, authority_end);
    if (authority_end != std::string::npos) {
        std::string path = rest.substr(authority_end);
        path             = path.substr(0, path.find('#'));
        if (path.empty() || path[0] != '/')
            path.insert(path.begin(), '/');
        ep.path = path;
    }

    // Credentials: everything before the last '@'
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        const std::string userinfo = authority.substr(0, at);
        const auto        colon    = userinfo.find(':');
        ep.user                    = userinfo.substr(0, colon);
        if (colon != std::string::npos)
            ep.password = userinfo.substr(colon + 1);
        ep.has_credentials = true;
        authority          = authority.substr(at + 1);
    }

    if (!authority.empty() && authority[0] == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos)
            throw std::invalid_argument("Unterminated IPv6 address in URL: " + url);
        ep.host                = authority.substr(1, close - 1);
        const std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':')
                throw std::invalid_argument("Invalid host in URL: " + url);
            if (tail.size() > 1)
                ep.port = parse_port(tail.substr(1), url);
        }
    } else {
        const auto colon = authority.rfind(':');
        ep.host          = authority.substr(0, colon);
        if (colon != std::string::npos && colon + 1 < authority.size())
            ep.port = parse_port(authority.substr(colon + 1), url);
    }

    if (ep.host.empty())
        throw std::invalid_argument("Missing host in URL: " + url);
    return ep;
}

std::string Endpoint::auth_header() const { return "Basic " + base64_encode(user + ":" + password); }

std::string Endpoint::host_header() const {
    if (host.find(':') != std::string::npos)
        return "[" + host + "]";
    return host;
}

std::string Endpoint::display_url() const {
    return scheme + "://" + host_header() + ":" + std::to_string(port) + path;
}
