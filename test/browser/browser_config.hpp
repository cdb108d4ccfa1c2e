#pragma once

#include "waitxx.hpp"
#include "waitxx/webdriver.hpp"

#include <string>

using namespace std::chrono_literals;

// BROWSER, BROWSER_BINARY and PORT must point at a running webdriver server
inline const waitxx::config::SessionSettings SETTINGS {waitxx::config::SessionSettings::fromEnvironment()};

// Schedules `body` to run in the page after `delayMs`
inline std::string later(unsigned int delayMs, const std::string &body) {
    return "setTimeout(() => { " + body + " }, " + std::to_string(delayMs) + "); return true;";
}
