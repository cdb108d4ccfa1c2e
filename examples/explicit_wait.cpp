#include "waitxx.hpp"
#include "waitxx/webdriver.hpp"

#include <print>

using namespace std::chrono_literals;
using namespace waitxx;

int main() {
    config::applyLogLevelFromEnvironment();

    webdriver::Driver driver {config::SessionSettings::fromEnvironment()};
    driver.navigateTo("https://www.example.com");

    // Defaults can be overridden with WAITXX_TIMEOUT_MS / WAITXX_POLL_MS
    WaitEngine<webdriver::Driver> wait {driver, config::waitSpecFromEnvironment(WaitSpec{10s, 500ms})};

    auto heading {wait.until(expected::visibilityOfElementLocated(By::tagName("h1")))};
    std::println("Heading: {}", heading.getElementText());

    auto link {wait.until(expected::elementToBeClickable(By::tagName("a")))};
    std::println("Link is clickable: {}", link.getElementText());

    // Same wait, checked every 100 ms instead
    WaitEngine<webdriver::Driver> eager {driver, wait.spec().pollingEvery(100ms)};
    eager.until(expected::textToBePresentInElementLocated(By::tagName("p"), "illustrative examples"));

    // All of them at once
    wait.until(
        expected::titleIs("Example Domain")
        && expected::presenceOfElementLocated(By::tagName("p"))
        && expected::urlContains("example.com")
    );
    std::println("All combined conditions met!");

    // Conditions can also be written inline against the driver
    auto paragraphs {wait.until(makeCondition("at least two paragraphs", [](webdriver::Driver &page) {
        auto found {page.findElements(By::tagName("p"))};
        return found.size() >= 2? std::optional{found}: std::nullopt;
    }))};
    std::println("Found {} paragraphs", paragraphs.size());
}
