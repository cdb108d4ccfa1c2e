#pragma once

#include "outcome.hpp"

#include <exception>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace waitxx {

    // A described callable evaluated against a probe once per wait attempt
    template<typename Fn>
    class Condition {
        private:
            std::string description_;
            Fn fn;

        public:
            Condition(std::string description, Fn fn):
                description_(std::move(description)), fn(std::move(fn)) {}

            const std::string &description() const noexcept { return description_; }

            template<typename Probe>
            auto operator()(Probe &probe) const {
                return toOutcome(std::invoke(fn, probe));
            }
    };

    template<typename Fn>
    Condition<std::decay_t<Fn>> makeCondition(std::string description, Fn &&fn) {
        return Condition<std::decay_t<Fn>>{std::move(description), std::forward<Fn>(fn)};
    }

    namespace detail {
        template<typename T> struct IsCondition: std::false_type {};
        template<typename Fn> struct IsCondition<Condition<Fn>>: std::true_type {};

        template<typename First, typename ...Rest>
        std::string join(const std::string &separator, const First &first, const Rest &...rest) {
            std::string joined {first.description()};
            ((joined += separator + rest.description()), ...);
            return joined;
        }
    }

    template<typename T>
    concept ConditionLike = detail::IsCondition<std::remove_cvref_t<T>>::value;

    // Value type produced when `condition` is evaluated against `Probe`
    template<typename C, typename Probe>
    using ConditionValue = typename std::invoke_result_t<const C&, Probe&>::value_type;

    // Satisfied when every sub-condition succeeds within the same attempt. Stops at
    // the first one that is not satisfied; exceptions propagate untouched.
    template<typename ...Fns>
    auto allOf(const Condition<Fns> &...conditions) {
        static_assert(sizeof...(Fns) > 0, "allOf needs at least one condition");
        return makeCondition('(' + detail::join(" and ", conditions...) + ')',
            [conditions...](auto &probe) -> Outcome<bool> {
                std::string pending;
                auto satisfied = [&probe, &pending](const auto &condition) {
                    auto outcome {condition(probe)};
                    if (outcome.ok()) return true;
                    pending = condition.description() + " is " + outcome.describe();
                    return false;
                };

                if ((satisfied(conditions) && ...)) return Outcome<bool>::success(true);
                return Outcome<bool>::notYet(pending);
            }
        );
    }

    // Satisfied by the first sub-condition that succeeds. A sub-condition that
    // throws does not stop the later ones; when none succeeds the first exception
    // is rethrown so the engine can still classify it.
    template<typename ...Fns>
    auto anyOf(const Condition<Fns> &...conditions) {
        static_assert(sizeof...(Fns) > 0, "anyOf needs at least one condition");
        return makeCondition('(' + detail::join(" or ", conditions...) + ')',
            [conditions...](auto &probe) -> Outcome<bool> {
                std::string pending;
                std::exception_ptr firstError;
                auto satisfied = [&probe, &pending, &firstError](const auto &condition) {
                    try {
                        auto outcome {condition(probe)};
                        if (outcome.ok()) return true;
                        if (!pending.empty()) pending += "; ";
                        pending += condition.description() + " is " + outcome.describe();
                    } catch (...) {
                        if (!firstError) firstError = std::current_exception();
                    }
                    return false;
                };

                if ((satisfied(conditions) || ...)) return Outcome<bool>::success(true);
                if (firstError) std::rethrow_exception(firstError);
                return Outcome<bool>::notYet(pending);
            }
        );
    }

    // Swaps success and not-yet. A transient outcome stays not-yet and exceptions
    // are never inverted.
    template<typename Fn>
    auto negate(const Condition<Fn> &condition) {
        return makeCondition("not " + condition.description(),
            [condition](auto &probe) -> Outcome<bool> {
                auto outcome {condition(probe)};
                if (outcome.ok())
                    return Outcome<bool>::notYet(condition.description() + " is satisfied");
                if (outcome.transient())
                    return Outcome<bool>::pending(outcome);
                return Outcome<bool>::success(true);
            }
        );
    }

    template<typename A, typename B>
    auto operator&&(const Condition<A> &lhs, const Condition<B> &rhs) { return allOf(lhs, rhs); }

    template<typename A, typename B>
    auto operator||(const Condition<A> &lhs, const Condition<B> &rhs) { return anyOf(lhs, rhs); }

    template<typename Fn>
    auto operator!(const Condition<Fn> &condition) { return negate(condition); }
}
