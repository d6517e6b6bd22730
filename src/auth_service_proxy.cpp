#include "auth_service_proxy.hpp"

#include <stdexcept>

#include "logging.hpp"

namespace {

RpcError error_from(const json& err) {
    if (err.is_object())
        return RpcError(err.value("code", 0), err.value("message", ""));
    return RpcError(0, err.is_string() ? err.get<std::string>() : err.dump());
}

} // namespace

AuthServiceProxy::AuthServiceProxy(const std::string& service_url, ProxyOptions options)
    : endpoint_(std::make_shared<const Endpoint>(Endpoint::parse(service_url))),
      timeout_(options.timeout), connection_(std::move(options.connection)),
      ownership_(connection_ ? ConnectionOwnership::External : ConnectionOwnership::Owned),
      ids_(options.ids ? std::move(options.ids) : RequestIdCounter::process_default()),
      framing_(options.framing), auth_header_(endpoint_->auth_header()) {}

AuthServiceProxy::AuthServiceProxy(const std::string& service_url, std::string service_name,
                                   ProxyOptions options)
    : AuthServiceProxy(service_url, std::move(options)) {
    service_name_ = std::move(service_name);
}

AuthServiceProxy AuthServiceProxy::operator[](const std::string& name) const {
    if (name.empty())
        throw std::out_of_range("AuthServiceProxy: empty method name");
    // Dunder names are introspection hooks, never remote methods
    if (name.starts_with("__") && name.ends_with("__"))
        throw std::out_of_range("AuthServiceProxy: no such attribute '" + name + "'");

    AuthServiceProxy child = *this;
    child.service_name_    = service_name_ ? *service_name_ + "." + name : name;
    return child;
}

// ---------------------------------------------------------------------------
// Single call
// ---------------------------------------------------------------------------
json AuthServiceProxy::call_params(const json::array_t& params) const {
    if (!service_name_)
        throw std::logic_error("AuthServiceProxy: the root proxy has no method to call");

    const int64_t id          = ids_->next();
    const json    params_json = params;

    auto log = rpc_logger();
    if (log->should_log(spdlog::level::debug))
        log->debug("-{}-> {} {}", id, *service_name_, params_json.dump());

    json request = {
        {"method", *service_name_},
        {"params", params_json},
        {"id", id},
    };
    if (framing_ == RpcFraming::Version11)
        request["version"] = "1.1";
    else
        request["jsonrpc"] = "2.0";

    const HttpHeaders headers = {
        {"Host", endpoint_->host_header()},
        {"User-Agent", USER_AGENT},
        {"Content-type", "application/json"},
    };
    const json response = exchange(request.dump(), headers);

    if (response.contains("error") && !response["error"].is_null())
        throw error_from(response["error"]);
    if (!response.contains("result"))
        throw RpcError(RPC_MISSING_RESULT, "missing JSON-RPC result");
    return response["result"];
}

// ---------------------------------------------------------------------------
// Batch call
// ---------------------------------------------------------------------------
std::vector<json> AuthServiceProxy::batch(std::vector<json::array_t> calls) const {
    // Validate everything first so a bad entry does not consume ids
    for (const auto& rpc_call : calls) {
        if (rpc_call.empty() || !rpc_call.front().is_string())
            throw std::invalid_argument("batch entry must start with a method name");
    }

    json::array_t batch_data;
    batch_data.reserve(calls.size());
    for (auto& rpc_call : calls) {
        const std::string m = rpc_call.front().get<std::string>();
        rpc_call.erase(rpc_call.begin());
        json entry = {
            {"jsonrpc", "2.0"},
            {"method", m},
            {"params", json(std::move(rpc_call))},
            {"id", ids_->next()},
        };
        batch_data.push_back(std::move(entry));
    }

    const std::string postdata = json(std::move(batch_data)).dump();
    rpc_logger()->debug("--> {}", postdata);

    // Batches carry credentials explicitly rather than relying on the URL
    const HttpHeaders headers = {
        {"Host", endpoint_->host_header()},
        {"User-Agent", USER_AGENT},
        {"Authorization", auth_header_},
        {"Content-type", "application/json"},
    };
    const json responses = exchange(postdata, headers);

    if (!responses.is_array()) {
        if (responses.contains("error") && !responses["error"].is_null())
            throw error_from(responses["error"]);
        throw RpcError(RPC_BATCH_PARSE_ERROR, "Parse error");
    }

    std::vector<json> results;
    results.reserve(responses.size());
    for (const json& response : responses) {
        if (!response["error"].is_null())
            throw error_from(response["error"]);
        if (!response.contains("result"))
            throw RpcError(RPC_MISSING_RESULT, "missing JSON-RPC result");
        results.push_back(response["result"]);
    }
    return results;
}

// ---------------------------------------------------------------------------
// Transport + response codec
// ---------------------------------------------------------------------------
json AuthServiceProxy::exchange(const std::string& postdata, const HttpHeaders& headers) const {
    // Owned: a session just for this call, closed once the response is decoded
    // (or on the way out of an exception).
    std::unique_ptr<HttpSession> owned;
    HttpSession*                 conn = connection_.get();
    if (ownership_ == ConnectionOwnership::Owned) {
        owned = std::make_unique<HttpSession>();
        conn  = owned.get();
    }

    HttpResponse resp;
    try {
        resp = conn->post(*endpoint_, headers, postdata, timeout_);
    } catch (const RpcError& e) {
        rpc_logger()->debug("<-- {} ({})", e.what(), endpoint_->display_url());
        throw;
    }

    json response = decode(resp);
    if (owned)
        owned->close();
    return response;
}

json AuthServiceProxy::decode(const HttpResponse& resp) const {
    json response;
    try {
        response = json::parse(resp.body);
    } catch (const json::exception&) {
        throw RpcError(RPC_TRANSPORT_ERROR, "missing HTTP response from server");
    }

    if (resp.header("Content-Type") != "application/json")
        throw RpcError(RPC_TRANSPORT_ERROR, "non-JSON HTTP response with '" +
                                                std::to_string(resp.status) + " " + resp.reason +
                                                "' from server");

    auto log = rpc_logger();
    if (log->should_log(spdlog::level::debug)) {
        // Read-only view: the mutable operator[] would insert missing keys
        const json& r = response;
        if (r.contains("error") && r["error"].is_null())
            log->debug("<-{}- {}", r["id"].dump(), r["result"].dump());
        else
            log->debug("<-- {} {}", resp.status, resp.reason);
    }
    return response;
}
