#include "waitxx.hpp"
#include "waitxx/webdriver.hpp"

#include <chrono>
#include <print>

using namespace waitxx;

int main() {
    config::applyLogLevelFromEnvironment();

    // Browser, binary and driver port come from the environment
    webdriver::Driver driver {config::SessionSettings::fromEnvironment()};

    // Every lookup in this session waits up to 10 s, pages get 30 s to load
    driver.setTimeouts({.pageLoad = 30'000, .implicit = 10'000});
    auto timeouts {driver.getTimeouts()};
    std::println("Implicit wait: {} ms, page load: {} ms",
            timeouts.implicit.value_or(0), timeouts.pageLoad.value_or(0));

    driver.navigateTo("https://www.example.com");
    std::println("Title: {}", driver.getTitle());

    // A missing element only fails once the implicit wait has run out
    auto start {std::chrono::steady_clock::now()};
    try {
        driver.findElement(By::id("non-existent-id"));
    } catch (const NotFoundError &ex) {
        std::chrono::duration<double> taken {std::chrono::steady_clock::now() - start};
        std::println("Time taken to throw exception: {:.2f} seconds", taken.count());
        std::println("Exception: {}", ex.what());
    }
}
