#pragma once

#include <string>
#include <vector>

#include "auth_service_proxy.hpp"
#include "json.hpp"

// One console command: `getblock "000000..." 2`
struct ParsedCommand {
    std::string   method;
    json::array_t params;

    // [method, params...] as expected by AuthServiceProxy::batch
    [[nodiscard]] json::array_t batch_entry() const;
};

// A token that parses as JSON becomes that value (numbers keep full decimal
// precision); anything else is passed as a string.
json parse_param(const std::string& token);

// Whitespace-separated tokens; '...' is literal, "..." honours \" and \\.
// Throws std::invalid_argument for an empty line, unterminated quotes or more
// than one command.
ParsedCommand parse_command(const std::string& line);

// Commands separated by ';' outside quotes; empty commands are dropped.
std::vector<ParsedCommand> parse_commands(const std::string& line);

// Walks a dotted method name ("wallet.getbalance") down from `root`.
AuthServiceProxy resolve_method(const AuthServiceProxy& root, const std::string& method);
