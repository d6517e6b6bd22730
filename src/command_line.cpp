#include "command_line.hpp"

#include <cctype>
#include <stdexcept>

namespace {

using Tokens = std::vector<std::string>;

std::vector<Tokens> scan(const std::string& line) {
    std::vector<Tokens> commands(1);
    std::string         token;
    bool                in_token = false;
    char                quote    = 0;

    auto flush = [&] {
        if (in_token)
            commands.back().push_back(std::move(token));
        token.clear();
        in_token = false;
    };

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == quote)
                quote = 0;
            else if (quote == '"' && c == '\\' && i + 1 < line.size())
                token += line[++i];
            else
                token += c;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote    = c;
            in_token = true;
        } else if (c == ';') {
            flush();
            commands.emplace_back();
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            token += c;
            in_token = true;
        }
    }
    if (quote)
        throw std::invalid_argument(std::string("Unterminated ") + quote + " quote");
    flush();

    std::erase_if(commands, [](const Tokens& t) { return t.empty(); });
    return commands;
}

ParsedCommand to_command(const Tokens& tokens) {
    ParsedCommand cmd;
    cmd.method = tokens.front();
    for (size_t i = 1; i < tokens.size(); ++i)
        cmd.params.push_back(parse_param(tokens[i]));
    return cmd;
}

} // namespace

json::array_t ParsedCommand::batch_entry() const {
    json::array_t entry;
    entry.reserve(params.size() + 1);
    entry.emplace_back(method);
    entry.insert(entry.end(), params.begin(), params.end());
    return entry;
}

json parse_param(const std::string& token) {
    try {
        return json::parse(token);
    } catch (const json::exception&) {
        return json(token);
    }
}

ParsedCommand parse_command(const std::string& line) {
    const auto commands = scan(line);
    if (commands.empty())
        throw std::invalid_argument("Empty command");
    if (commands.size() > 1)
        throw std::invalid_argument("Expected a single command, got " +
                                    std::to_string(commands.size()));
    return to_command(commands.front());
}

std::vector<ParsedCommand> parse_commands(const std::string& line) {
    std::vector<ParsedCommand> out;
    for (const auto& tokens : scan(line))
        out.push_back(to_command(tokens));
    return out;
}

AuthServiceProxy resolve_method(const AuthServiceProxy& root, const std::string& method) {
    AuthServiceProxy proxy = root;
    size_t           start = 0;
    while (true) {
        const auto dot = method.find('.', start);
        proxy          = proxy[method.substr(start, dot == std::string::npos ? dot : dot - start)];
        if (dot == std::string::npos)
            return proxy;
        start = dot + 1;
    }
}
