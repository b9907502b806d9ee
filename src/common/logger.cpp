/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "common/logger.hpp"

#include <mutex>

namespace suffixsort {

namespace {
std::once_flag g_logger_once;
}  // namespace

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& name, spdlog::level::level_enum level) {
    std::call_once(g_logger_once, [&name, level] {
        logger_ = spdlog::get(name);
        if (logger_ == nullptr) {
            logger_ = spdlog::stderr_color_mt(name);
        }
        logger_->set_level(level);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    });
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    init();
    return logger_;
}

}  // namespace suffixsort
