#include "rpc_config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

int default_port(const std::string& network) {
    if (network == "testnet3")
        return 18332;
    if (network == "signet")
        return 38332;
    if (network == "regtest")
        return 18443;
    return 8332;
}

std::string cookie_default_path(const std::string& network, const std::string& datadir) {
    std::string base;
    if (!datadir.empty()) {
        base = datadir;
    } else {
        const char* home = std::getenv("HOME");
        if (!home)
            throw std::runtime_error("HOME not set; use --datadir or --cookie to locate .cookie");
#ifdef __APPLE__
        base = std::string(home) + "/Library/Application Support/Bitcoin";
#else
        base = std::string(home) + "/.bitcoin";
#endif
    }
    std::string sub;
    if (network == "testnet3")
        sub = "testnet3/";
    else if (network == "signet")
        sub = "signet/";
    else if (network == "regtest")
        sub = "regtest/";
    return base + "/" + sub + ".cookie";
}

void apply_cookie(RpcConfig& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("Cannot open cookie file: " + path);
    std::string line;
    if (!std::getline(f, line) || line.empty())
        throw std::runtime_error("Cookie file is empty: " + path);
    // Strip trailing \r in case the file has CRLF line endings
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    auto colon = line.find(':');
    if (colon == std::string::npos)
        throw std::runtime_error("Invalid cookie file (no ':' found): " + path);
    cfg.user     = line.substr(0, colon);
    cfg.password = line.substr(colon + 1);
}

std::string service_url(const RpcConfig& cfg) {
    const std::string host =
        cfg.host.find(':') != std::string::npos ? "[" + cfg.host + "]" : cfg.host;
    std::string url = "http://" + cfg.user + ":" + cfg.password + "@" + host + ":" +
                      std::to_string(cfg.port) + "/";
    if (!cfg.wallet.empty())
        url += "wallet/" + cfg.wallet;
    return url;
}
