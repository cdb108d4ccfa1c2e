#pragma once

#include "errors.hpp"
#include "logger.hpp"
#include "waitspec.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <system_error>

// Environment driven configuration. Variables:
//   BROWSER            firefox | chrome | msedge
//   BROWSER_BINARY     path to the browser executable
//   PORT               port the webdriver server listens on
//   HEADLESS           1 / true to run without a window (optional)
//   WAITXX_TIMEOUT_MS  default explicit wait timeout (optional)
//   WAITXX_POLL_MS     default poll interval (optional)
//   WAITXX_LOG_LEVEL   error | warn | info | debug | trace (optional)
namespace waitxx::config {

    inline std::optional<std::string> findEnv(const std::string &key) {
        const char* envVal {std::getenv(key.c_str())};
        if (!envVal) return std::nullopt;
        return std::string{envVal};
    }

    inline std::string getEnv(const std::string &key) {
        std::optional<std::string> envVal {findEnv(key)};
        if (!envVal)
            throw ConfigurationError('`' + key + "` env variable not set.");
        return *envVal;
    }

    inline std::string getEnvOr(const std::string &key, const std::string &fallback) {
        return findEnv(key).value_or(fallback);
    }

    inline long parseMillis(const std::string &key, const std::string &raw) {
        long value {0};
        auto [ptr, ec] {std::from_chars(raw.data(), raw.data() + raw.size(), value)};
        if (ec != std::errc{} || ptr != raw.data() + raw.size())
            throw ConfigurationError('`' + key + "` must be a whole number of milliseconds, got `" + raw + '`');
        return value;
    }

    inline bool parseFlag(const std::string &key, const std::string &raw) {
        if (raw == "1" || raw == "true" || raw == "yes") return true;
        if (raw == "0" || raw == "false" || raw == "no" || raw.empty()) return false;
        throw ConfigurationError('`' + key + "` must be a boolean, got `" + raw + '`');
    }

    struct SessionSettings {
        std::string browser, binary, port;
        bool headless {false};

        static SessionSettings fromEnvironment() {
            SessionSettings settings;
            settings.browser = getEnv("BROWSER");
            settings.binary = getEnv("BROWSER_BINARY");
            settings.port = getEnv("PORT");
            settings.headless = parseFlag("HEADLESS", getEnvOr("HEADLESS", "0"));
            return settings;
        }
    };

    // Overlay WAITXX_TIMEOUT_MS / WAITXX_POLL_MS on top of `fallback`
    inline WaitSpec waitSpecFromEnvironment(const WaitSpec &fallback = {}) {
        WaitSpec spec {fallback};
        if (std::optional<std::string> raw {findEnv("WAITXX_TIMEOUT_MS")})
            spec = spec.withTimeout(std::chrono::milliseconds{parseMillis("WAITXX_TIMEOUT_MS", *raw)});
        if (std::optional<std::string> raw {findEnv("WAITXX_POLL_MS")})
            spec = spec.pollingEvery(std::chrono::milliseconds{parseMillis("WAITXX_POLL_MS", *raw)});
        return spec;
    }

    inline logging::Level applyLogLevelFromEnvironment() {
        if (std::optional<std::string> raw {findEnv("WAITXX_LOG_LEVEL")}) {
            std::optional<logging::Level> level {logging::parseLevel(*raw)};
            if (!level)
                throw ConfigurationError("`WAITXX_LOG_LEVEL` has unknown level `" + *raw + '`');
            logging::setLogLevel(*level);
        }
        return logging::logLevel();
    }
}
