#pragma once

#include "condition.hpp"
#include "errors.hpp"
#include "locator.hpp"
#include "outcome.hpp"

#include <concepts>
#include <cstddef>
#include <optional>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// Ready made conditions for page probes, named after the usual WebDriver expectations
namespace waitxx::expected {

    template<typename E>
    concept ElementHandle = requires(const E &element, const std::string &name) {
        { element.isDisplayed() } -> std::convertible_to<bool>;
        { element.isEnabled() } -> std::convertible_to<bool>;
        { element.getElementText() } -> std::convertible_to<std::string>;
        { element.getElementAttribute(name) } -> std::convertible_to<std::optional<std::string>>;
    };

    template<typename P>
    concept PageProbe = requires(const P &probe, const Locator &locator) {
        { probe.getTitle() } -> std::convertible_to<std::string>;
        { probe.getCurrentURL() } -> std::convertible_to<std::string>;
        { probe.findElement(locator) } -> ElementHandle;
        { probe.findElements(locator) } -> std::ranges::range;
    };

    namespace detail {
        // Lookups that find nothing, or find a detached element, are reported as
        // transient outcomes instead of exceptions
        template<typename F>
        auto atProbeBoundary(F &&lookup) -> OutcomeFor<std::invoke_result_t<F>> {
            using Result = OutcomeFor<std::invoke_result_t<F>>;
            try {
                return toOutcome(lookup());
            } catch (const NotFoundError &ex) {
                return Result::transient("NotFoundError", ex.what());
            } catch (const StaleElementReferenceError &ex) {
                return Result::transient("StaleElementReferenceError", ex.what());
            }
        }

        inline std::string quoted(const std::string &text) { return '"' + text + '"'; }
    }

    inline auto titleIs(const std::string &title) {
        return makeCondition("title to be " + detail::quoted(title), [title](PageProbe auto &probe) {
            std::string current {probe.getTitle()};
            if (current == title) return Outcome<bool>::success(true);
            return Outcome<bool>::notYet("title is " + detail::quoted(current));
        });
    }

    inline auto titleContains(const std::string &fragment) {
        return makeCondition("title to contain " + detail::quoted(fragment), [fragment](PageProbe auto &probe) {
            std::string current {probe.getTitle()};
            if (current.find(fragment) != std::string::npos) return Outcome<bool>::success(true);
            return Outcome<bool>::notYet("title is " + detail::quoted(current));
        });
    }

    inline auto urlToBe(const std::string &url) {
        return makeCondition("url to be " + detail::quoted(url), [url](PageProbe auto &probe) {
            std::string current {probe.getCurrentURL()};
            if (current == url) return Outcome<bool>::success(true);
            return Outcome<bool>::notYet("url is " + detail::quoted(current));
        });
    }

    inline auto urlContains(const std::string &fragment) {
        return makeCondition("url to contain " + detail::quoted(fragment), [fragment](PageProbe auto &probe) {
            std::string current {probe.getCurrentURL()};
            if (current.find(fragment) != std::string::npos) return Outcome<bool>::success(true);
            return Outcome<bool>::notYet("url is " + detail::quoted(current));
        });
    }

    inline auto presenceOfElementLocated(const Locator &locator) {
        return makeCondition("presence of element located by " + locator.describe(), [locator](PageProbe auto &probe) {
            return detail::atProbeBoundary([&] { return probe.findElement(locator); });
        });
    }

    inline auto presenceOfAllElementsLocatedBy(const Locator &locator) {
        return makeCondition("presence of all elements located by " + locator.describe(), [locator](PageProbe auto &probe) {
            return detail::atProbeBoundary([&] { return probe.findElements(locator); });
        });
    }

    inline auto visibilityOfElementLocated(const Locator &locator) {
        return makeCondition("visibility of element located by " + locator.describe(), [locator](PageProbe auto &probe) {
            using Element = std::remove_cvref_t<decltype(probe.findElement(locator))>;
            return detail::atProbeBoundary([&]() -> std::optional<Element> {
                auto element {probe.findElement(locator)};
                if (element.isDisplayed()) return element;
                return std::nullopt;
            });
        });
    }

    inline auto visibilityOfAllElementsLocatedBy(const Locator &locator) {
        return makeCondition("visibility of all elements located by " + locator.describe(), [locator](PageProbe auto &probe) {
            using Elements = std::remove_cvref_t<decltype(probe.findElements(locator))>;
            return detail::atProbeBoundary([&]() -> std::optional<Elements> {
                auto elements {probe.findElements(locator)};
                if (elements.empty()) return std::nullopt;
                for (const auto &element: elements)
                    if (!element.isDisplayed()) return std::nullopt;
                return elements;
            });
        });
    }

    // Satisfied once the element is gone from the page or hidden
    inline auto invisibilityOfElementLocated(const Locator &locator) {
        return makeCondition("invisibility of element located by " + locator.describe(), [locator](PageProbe auto &probe) {
            try {
                if (!probe.findElement(locator).isDisplayed()) return Outcome<bool>::success(true);
                return Outcome<bool>::notYet("element is displayed");
            } catch (const NotFoundError &) {
                return Outcome<bool>::success(true);
            } catch (const StaleElementReferenceError &) {
                return Outcome<bool>::success(true);
            }
        });
    }

    inline auto elementToBeClickable(const Locator &locator) {
        return makeCondition("element located by " + locator.describe() + " to be clickable", [locator](PageProbe auto &probe) {
            using Element = std::remove_cvref_t<decltype(probe.findElement(locator))>;
            return detail::atProbeBoundary([&]() -> Outcome<Element> {
                auto element {probe.findElement(locator)};
                if (!element.isDisplayed()) return Outcome<Element>::notYet("element is not displayed");
                if (!element.isEnabled()) return Outcome<Element>::notYet("element is disabled");
                return Outcome<Element>::success(std::move(element));
            });
        });
    }

    inline auto textToBePresentInElementLocated(const Locator &locator, const std::string &text) {
        return makeCondition("text " + detail::quoted(text) + " to be present in element located by " + locator.describe(),
            [locator, text](PageProbe auto &probe) {
                return detail::atProbeBoundary([&]() -> Outcome<bool> {
                    std::string current {probe.findElement(locator).getElementText()};
                    if (current.find(text) != std::string::npos) return Outcome<bool>::success(true);
                    return Outcome<bool>::notYet("element text is " + detail::quoted(current));
                });
            }
        );
    }

    inline auto attributeToBe(const Locator &locator, const std::string &name, const std::string &value) {
        return makeCondition("attribute " + name + " of element located by " + locator.describe() + " to be " + detail::quoted(value),
            [locator, name, value](PageProbe auto &probe) {
                return detail::atProbeBoundary([&]() -> Outcome<bool> {
                    std::optional<std::string> current {probe.findElement(locator).getElementAttribute(name)};
                    if (current == value) return Outcome<bool>::success(true);
                    return Outcome<bool>::notYet("attribute is " + (current? detail::quoted(*current): std::string{"absent"}));
                });
            }
        );
    }

    // Succeeds with the located elements, also when zero elements are expected
    inline auto numberOfElementsToBe(const Locator &locator, std::size_t count) {
        return makeCondition("number of elements located by " + locator.describe() + " to be " + std::to_string(count),
            [locator, count](PageProbe auto &probe) {
                using Elements = std::remove_cvref_t<decltype(probe.findElements(locator))>;
                return detail::atProbeBoundary([&]() -> Outcome<Elements> {
                    auto elements {probe.findElements(locator)};
                    if (std::ranges::size(elements) == count) return Outcome<Elements>::success(std::move(elements));
                    return Outcome<Elements>::notYet("found " + std::to_string(std::ranges::size(elements)) + " elements");
                });
            }
        );
    }

    inline auto numberOfElementsToBeMoreThan(const Locator &locator, std::size_t count) {
        return makeCondition("number of elements located by " + locator.describe() + " to be more than " + std::to_string(count),
            [locator, count](PageProbe auto &probe) {
                using Elements = std::remove_cvref_t<decltype(probe.findElements(locator))>;
                return detail::atProbeBoundary([&]() -> Outcome<Elements> {
                    auto elements {probe.findElements(locator)};
                    if (std::ranges::size(elements) > count) return Outcome<Elements>::success(std::move(elements));
                    return Outcome<Elements>::notYet("found " + std::to_string(std::ranges::size(elements)) + " elements");
                });
            }
        );
    }
}
