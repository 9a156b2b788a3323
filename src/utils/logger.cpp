#include "utils/logger.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <vector>

#ifdef ERROR
#undef ERROR
#endif

namespace prism {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {

struct LevelName {
    Logger::Level level;
    const char* name;
    spdlog::level::level_enum spdlog_level;
};

// First entry per level is its canonical name; later ones are accepted aliases
constexpr LevelName kLevels[] = {
    {Logger::Level::TRACE, "trace", spdlog::level::trace},
    {Logger::Level::DEBUG, "debug", spdlog::level::debug},
    {Logger::Level::INFO, "info", spdlog::level::info},
    {Logger::Level::WARN, "warn", spdlog::level::warn},
    {Logger::Level::WARN, "warning", spdlog::level::warn},
    {Logger::Level::ERROR, "error", spdlog::level::err},
    {Logger::Level::ERROR, "err", spdlog::level::err},
    {Logger::Level::CRITICAL, "critical", spdlog::level::critical},
    {Logger::Level::CRITICAL, "crit", spdlog::level::critical},
};

const LevelName& lookup(Logger::Level level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) return entry;
    }
    return kLevels[2];
}

} // namespace

void Logger::init(const std::string& log_file, Level level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
        }

        logger_ = std::make_shared<spdlog::logger>("prism", sinks.begin(), sinks.end());
        logger_->set_level(lookup(level).spdlog_level);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
        spdlog::set_default_logger(logger_);

        logger_->info("Logger initialized (level={}, file={})", levelToString(level),
                      log_file.empty() ? "-" : log_file);
    }
    catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }
    logger_->flush();
    spdlog::shutdown();
    logger_.reset();
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (!logger_) {
        init("", Level::INFO);
    }
    return logger_;
}

bool Logger::isInitialized() {
    return logger_ != nullptr;
}

void Logger::setLevel(Level level) {
    if (auto logger = get()) {
        logger->set_level(lookup(level).spdlog_level);
    }
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string lowered(lvl.size(), '\0');
    std::transform(lvl.begin(), lvl.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : kLevels) {
        if (lowered == entry.name) return entry.level;
    }
    return Level::INFO;
}

const char* Logger::levelToString(Level lvl) {
    return lookup(lvl).name;
}

} // namespace utils
} // namespace prism
