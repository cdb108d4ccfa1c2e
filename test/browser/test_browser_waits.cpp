#include "browser_config.hpp"

#include <cassert>

using namespace waitxx;

int main() {
    webdriver::Driver driver {SETTINGS};
    driver.navigateTo("about:blank");

    // Element inserted by the page some time after load
    {
        driver.execute<bool>(later(700,
            "const div = document.createElement('div');"
            "div.id = 'late'; div.textContent = 'ready';"
            "document.body.appendChild(div); document.title = 'Loaded';"
        ));

        WaitEngine<webdriver::Driver> engine {driver, WaitSpec{10s, 100ms}};
        webdriver::Element element {engine.until(expected::visibilityOfElementLocated(By::id("late")))};
        assert(element.getElementText() == "ready");
        assert(engine.until(expected::titleIs("Loaded")));
    }

    // Removal of the element satisfies invisibility, stale handles included
    {
        driver.execute<bool>(later(300, "document.getElementById('late').remove();"));
        assert(until(driver, expected::invisibilityOfElementLocated(By::id("late")), WaitSpec{5s, 100ms}));
    }

    // Elements that never show up time out with the locator in the message
    {
        bool timedOut {false};
        try {
            until(driver, expected::presenceOfElementLocated(By::id("never")), WaitSpec{1s, 200ms});
        } catch (const TimeoutError &ex) {
            timedOut = ex.description().find("[id=\"never\"]") != std::string::npos && ex.attempts() >= 2;
        }
        assert(timedOut);
    }

    // Session wide implicit wait lets a single lookup block until the element exists
    {
        driver.setTimeouts({.implicit = 3000});
        driver.execute<bool>(later(500,
            "const p = document.createElement('p'); p.id = 'implicit'; document.body.appendChild(p);"
        ));
        assert(driver.findElement(By::id("implicit")));
        driver.setTimeouts({.implicit = 0});
    }

    return 0;
}
