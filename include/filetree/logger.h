#pragma once

#include <chrono>
#include <format>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

namespace filetree {

class Logger {
public:
    enum class Level {
        Error = 0,
        Warning,
        Info,
        Debug,
        Trace
    };

    static Logger& instance();

    // Accepts error, warn/warning, info, debug and trace.
    static std::optional<Level> parse_level(std::string_view name);
    static std::string_view level_name(Level level) noexcept;

    void set_level(Level level) noexcept;
    Level level() const noexcept;

    bool enabled(Level level) const noexcept { return level <= level_; }

    template <typename... Args>
    void log(Level level, std::string_view fmt, Args&&... args) {
        if (!enabled(level)) {
            return;
        }
        if constexpr (sizeof...(Args) == 0) {
            write(level, fmt);
        } else {
            auto tuple_args = std::make_tuple(std::forward<Args>(args)...);
            auto formatted = std::apply(
                [&](auto&... unpacked) {
                    return std::vformat(fmt, std::make_format_args(unpacked...));
                },
                tuple_args);
            write(level, formatted);
        }
    }

    template <typename... Args>
    void trace(std::string_view fmt, Args&&... args) {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args) {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view fmt, Args&&... args) {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args) {
        log(Level::Warning, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view fmt, Args&&... args) {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    // nullptr restores std::clog. The stream must outlive its use here.
    void set_output(std::ostream* stream) noexcept;

private:
    Logger();
    void write(Level level, std::string_view message);

    std::ostream* stream_;
    Level level_;
    std::mutex mutex_;
};

} // namespace filetree
