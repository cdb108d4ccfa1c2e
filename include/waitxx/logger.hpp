#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <type_traits>

namespace waitxx::logging {
    enum class Level { ERROR = 1, WARN, INFO, DEBUG, TRACE };

    constexpr std::string_view LevelStr(Level level) {
        switch (level) {
            case Level::ERROR: return "ERROR";
            case Level::WARN:  return  "WARN";
            case Level::INFO:  return  "INFO";
            case Level::DEBUG: return "DEBUG";
            case Level::TRACE: return "TRACE";
        }
        return "UNKNOWN";
    }

    // Case insensitive, accepts the names printed by LevelStr
    inline std::optional<Level> parseLevel(std::string name) {
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
            return static_cast<char>(std::toupper(ch));
        });
        for (Level level: {Level::ERROR, Level::WARN, Level::INFO, Level::DEBUG, Level::TRACE})
            if (LevelStr(level) == name) return level;
        return std::nullopt;
    }

    inline std::string TimeStamp() {
        namespace cr = std::chrono;

        auto now = cr::system_clock::now();
        auto ms = cr::duration_cast<cr::milliseconds>(now.time_since_epoch()) % 1000;

        std::time_t t = cr::system_clock::to_time_t(now);
        std::tm tm {};
        localtime_r(&t, &tm);

        return std::format(
            "{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count()
        );
    }

    namespace impl {
        class Logger {
            private:
                Level logLevel;
                mutable std::mutex mutex;

                Logger(): logLevel{Level::INFO} {}

            public:
                void setLevel(Level level) {
                    std::lock_guard lock {mutex};
                    logLevel = level;
                }

                Level level() const {
                    std::lock_guard lock {mutex};
                    return logLevel;
                }

                [[nodiscard]] static Logger &instance() {
                    static Logger logger {};
                    return logger;
                }

                bool enabled(Level lvl) const {
                    using LevelT = std::underlying_type_t<Level>;
                    return static_cast<LevelT>(level()) >= static_cast<LevelT>(lvl);
                }

                template<typename ...Args>
                void log(Level lvl, std::format_string<Args...> fmt, Args &&...args) const {
                    if (!enabled(lvl)) return;
                    auto msg = std::format(fmt, std::forward<Args>(args)...);
                    std::lock_guard lock {mutex};
                    std::println(stderr, "[{} {}] waitxx: {}", TimeStamp(), LevelStr(lvl), msg);
                }
        };
    }

    inline void setLogLevel(Level level) { impl::Logger::instance().setLevel(level); }
    inline Level logLevel() { return impl::Logger::instance().level(); }

    template<typename ...Args>
    inline void Error(std::format_string<Args...> fmt, Args &&...args) {
        impl::Logger::instance().log(Level::ERROR, fmt, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Warn(std::format_string<Args...> fmt, Args &&...args) {
        impl::Logger::instance().log(Level::WARN, fmt, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Info(std::format_string<Args...> fmt, Args &&...args) {
        impl::Logger::instance().log(Level::INFO, fmt, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Debug(std::format_string<Args...> fmt, Args &&...args) {
        impl::Logger::instance().log(Level::DEBUG, fmt, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Trace(std::format_string<Args...> fmt, Args &&...args) {
        impl::Logger::instance().log(Level::TRACE, fmt, std::forward<Args>(args)...);
    }
}
