#include "filetree/logger.h"

#include <ctime>
#include <iomanip>
#include <iostream>

namespace filetree {

Logger::Logger()
    : stream_{&std::clog}, level_{Level::Error} {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) {
    if (name == "error") {
        return Level::Error;
    }
    if (name == "warn" || name == "warning") {
        return Level::Warning;
    }
    if (name == "info") {
        return Level::Info;
    }
    if (name == "debug") {
        return Level::Debug;
    }
    if (name == "trace") {
        return Level::Trace;
    }
    return std::nullopt;
}

std::string_view Logger::level_name(Level level) noexcept {
    switch (level) {
        case Level::Error:
            return "ERROR";
        case Level::Warning:
            return "WARNING";
        case Level::Info:
            return "INFO";
        case Level::Debug:
            return "DEBUG";
        case Level::Trace:
            return "TRACE";
    }
    return "UNKNOWN";
}

void Logger::set_level(Level level) noexcept {
    level_ = level;
}

Logger::Level Logger::level() const noexcept {
    return level_;
}

void Logger::set_output(std::ostream* stream) noexcept {
    std::scoped_lock lock{mutex_};
    stream_ = stream != nullptr ? stream : &std::clog;
}

void Logger::write(Level level, std::string_view message) {
    std::scoped_lock lock{mutex_};
    if (!stream_) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif
    (*stream_) << std::put_time(&tm, "%d-%m-%Y %H:%M:%S") << " - " << level_name(level) << ": " << message << '\n';
    stream_->flush();
}

} // namespace filetree
