#include "waitxx.hpp"
#include "waitxx/webdriver.hpp"

#include <print>
#include <stdexcept>

using namespace std::chrono_literals;
using namespace waitxx;

class CustomTimeoutException: public std::runtime_error {
    public:
        explicit CustomTimeoutException(const std::string &message): std::runtime_error(message) {}
};

int main() {
    config::applyLogLevelFromEnvironment();

    webdriver::Driver driver {config::SessionSettings::fromEnvironment()};
    driver.navigateTo("https://www.example.com");

    // Fluent style: 30 s budget, checked every 5 s, missing elements are retried
    const WaitSpec fluent {WaitSpec{30s, 5s}.ignoring<NotFoundError>("NotFoundError")};
    auto title {until(driver, [](webdriver::Driver &page) {
        return page.findElement(By::tagName("h1")).getElementText();
    }, fluent)};
    std::println("Heading text: {}", title);

    // Wait for a collection instead of a single element
    auto links {until(driver, expected::numberOfElementsToBeMoreThan(By::tagName("a"), 0), fluent)};
    std::println("Number of links: {}", links.size());

    // Caller defined exception on timeout, polling twice a second
    try {
        auto element {pollFor<CustomTimeoutException>(driver, "displayed element located by id \"dynamicElement\"",
            [](webdriver::Driver &page) { return page.findElement(By::id("dynamicElement")); },
            [](const webdriver::Element &element) { return element.isDisplayed(); },
            10s
        )};
        std::println("Element found: {}", element.getElementText());
    } catch (const CustomTimeoutException &ex) {
        std::println("Custom wait timed out: {}", ex.what());
    }
}
