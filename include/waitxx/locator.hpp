#pragma once

#include <string>

namespace waitxx {

    enum LOCATION_STRATEGY {CSS, TAGNAME, XPATH, LINK_TEXT};

    inline std::string strategyKeyword(LOCATION_STRATEGY strategy) {
        switch (strategy) {
            case CSS: return "css selector";
            case TAGNAME: return "tag name";
            case XPATH: return "xpath";
            case LINK_TEXT: return "link text";
        }
        return "css selector";
    }

    struct Locator {
        LOCATION_STRATEGY strategy;
        std::string criteria;

        std::string describe() const {
            return strategyKeyword(strategy) + " \"" + criteria + '"';
        }

        bool operator==(const Locator &other) const = default;
    };

    namespace By {
        inline Locator css(const std::string &selector) { return {CSS, selector}; }
        inline Locator tagName(const std::string &name) { return {TAGNAME, name}; }
        inline Locator xpath(const std::string &expression) { return {XPATH, expression}; }
        inline Locator linkText(const std::string &text) { return {LINK_TEXT, text}; }

        // W3C WebDriver has no id strategy, match on the attribute instead
        inline Locator id(const std::string &id) { return {CSS, "[id=\"" + id + "\"]"}; }
    }
}
