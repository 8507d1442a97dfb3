#include "lspc/log.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lspc {

namespace {

std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;

std::shared_ptr<spdlog::logger> make_default_logger() {
    if (auto existing = spdlog::get("lspc")) return existing;
    return spdlog::stderr_color_mt("lspc");
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!current_logger) current_logger = make_default_logger();
    return current_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_logger = std::move(logger);
}

} // namespace lspc
