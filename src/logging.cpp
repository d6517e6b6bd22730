#include "logging.hpp"

#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

std::mutex                      logger_mtx;
std::shared_ptr<spdlog::logger> current_logger;

} // namespace

std::shared_ptr<spdlog::logger> rpc_logger() {
    std::lock_guard lk(logger_mtx);
    if (!current_logger) {
        // Not registered with spdlog: callers may own a logger of the same name.
        auto sink      = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        current_logger = std::make_shared<spdlog::logger>(RPC_LOGGER_NAME, std::move(sink));
        current_logger->set_level(spdlog::level::warn);
    }
    return current_logger;
}

void set_rpc_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard lk(logger_mtx);
    current_logger = std::move(logger);
}

void log_rpc_to_file(const std::string& path, spdlog::level::level_enum level) {
    auto sink   = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
    auto logger = std::make_shared<spdlog::logger>(RPC_LOGGER_NAME, std::move(sink));
    logger->set_level(level);
    logger->flush_on(level);
    set_rpc_logger(std::move(logger));
}
