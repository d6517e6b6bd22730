#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

inline constexpr const char* RPC_LOGGER_NAME = "BitcoinRPC";

// Logger for request/response trace events. Until set_rpc_logger() is called
// this is a stderr logger at warn level, so traces stay silent by default.
std::shared_ptr<spdlog::logger> rpc_logger();

void set_rpc_logger(std::shared_ptr<spdlog::logger> logger);

// Replaces the logger with one appending to `path` at the given level.
void log_rpc_to_file(const std::string& path, spdlog::level::level_enum level);
