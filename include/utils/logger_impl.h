#pragma once

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace docsan {
namespace utils {

template<typename FormatString, typename... Args>
void Logger::log(Level level, FormatString&& fmt, Args&&... args) {
    if (!logger_) {
        return;
    }
    spdlog::level::level_enum target = spdlog::level::info;
    switch (level) {
        case Level::DEBUG: target = spdlog::level::debug; break;
        case Level::WARN: target = spdlog::level::warn; break;
        case Level::ERROR: target = spdlog::level::err; break;
        default: break;
    }
    logger_->log(target, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::debug(FormatString&& fmt, Args&&... args) {
    log(Level::DEBUG, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::info(FormatString&& fmt, Args&&... args) {
    log(Level::INFO, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::warn(FormatString&& fmt, Args&&... args) {
    log(Level::WARN, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

template<typename FormatString, typename... Args>
void Logger::error(FormatString&& fmt, Args&&... args) {
    log(Level::ERROR, std::forward<FormatString>(fmt), std::forward<Args>(args)...);
}

} // namespace utils
} // namespace docsan
