#pragma once

// Windows compatibility - undef macros that conflict with Logger::Level
#ifdef ERROR
#undef ERROR
#endif

#include <string>
#include <memory>

namespace spdlog { class logger; }

namespace docsan {
namespace utils {

/**
 * @brief Process-wide "docsan" logger
 *
 * Nothing is written until init() runs, so the library stays silent for
 * callers that never configure logging.
 */
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };
    
    // Empty log_file => console sink only
    static void init(const std::string& log_file = "docsan.log", Level level = Level::INFO);
    static void shutdown();
    static bool isInitialized();
    // Returns INFO on unknown
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);
    
    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);
    
    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);
    
    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);
    
    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);
    
private:
    template<typename FormatString, typename... Args>
    static void log(Level level, FormatString&& fmt, Args&&... args);

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace docsan

// Include implementation
#include "utils/logger_impl.h"

// Logging macros
#define DOCSAN_DEBUG(...) ::docsan::utils::Logger::debug(__VA_ARGS__)
#define DOCSAN_INFO(...) ::docsan::utils::Logger::info(__VA_ARGS__)
#define DOCSAN_WARN(...) ::docsan::utils::Logger::warn(__VA_ARGS__)
#define DOCSAN_ERROR(...) ::docsan::utils::Logger::error(__VA_ARGS__)
