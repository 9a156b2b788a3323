#pragma once

// windows.h defines ERROR
#ifdef ERROR
#undef ERROR
#endif

#include <string>
#include <memory>

namespace spdlog { class logger; }

namespace prism {
namespace utils {

class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    // Console sink always; file sink only when log_file is non-empty
    static void init(const std::string& log_file = "prism.log", Level level = Level::INFO);
    static void shutdown();
    // Console-only logger is created on first use
    static std::shared_ptr<spdlog::logger> get();
    static bool isInitialized();
    static void setLevel(Level level);
    // Case-insensitive; accepts "warning", "err" and "crit"; INFO on unknown
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void trace(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void debug(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void info(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void warn(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void error(FormatString&& fmt, Args&&... args);

    template<typename FormatString, typename... Args>
    static void critical(FormatString&& fmt, Args&&... args);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace prism

#include "utils/logger_impl.h"

// Logging macros
#define PRISM_TRACE(...) ::prism::utils::Logger::trace(__VA_ARGS__)
#define PRISM_DEBUG(...) ::prism::utils::Logger::debug(__VA_ARGS__)
#define PRISM_INFO(...) ::prism::utils::Logger::info(__VA_ARGS__)
#define PRISM_WARN(...) ::prism::utils::Logger::warn(__VA_ARGS__)
#define PRISM_ERROR(...) ::prism::utils::Logger::error(__VA_ARGS__)
#define PRISM_CRITICAL(...) ::prism::utils::Logger::critical(__VA_ARGS__)
