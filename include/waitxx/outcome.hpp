#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace waitxx {

    // Result of evaluating a condition once. Fatal failures are never an Outcome,
    // they leave the condition as exceptions.
    template<typename T>
    class Outcome {
        public:
            using value_type = T;
            enum class State { SUCCESS, NOT_YET, TRANSIENT };

        private:
            State state_;
            std::optional<T> value_;
            std::string detail_;

            Outcome(State state, std::optional<T> value, std::string detail):
                state_(state), value_(std::move(value)), detail_(std::move(detail)) {}

        public:
            static Outcome success(T value) {
                return Outcome{State::SUCCESS, std::move(value), {}};
            }

            static Outcome notYet(const std::string &reason = "not satisfied") {
                return Outcome{State::NOT_YET, std::nullopt, reason};
            }

            static Outcome transient(const std::string &kind, const std::string &message) {
                return Outcome{State::TRANSIENT, std::nullopt, kind + ": " + message};
            }

            // Re-type a non-successful outcome, keeping its state and detail
            template<typename U>
            static Outcome pending(const Outcome<U> &other) {
                if (other.ok())
                    throw std::logic_error("Cannot re-type a successful outcome");
                return Outcome{other.transient()? State::TRANSIENT: State::NOT_YET, std::nullopt, other.detail()};
            }

            State state() const noexcept { return state_; }
            bool ok() const noexcept { return state_ == State::SUCCESS; }
            bool transient() const noexcept { return state_ == State::TRANSIENT; }
            explicit operator bool() const noexcept { return ok(); }

            const std::string &detail() const noexcept { return detail_; }

            const T &value() const & {
                if (!value_) throw std::logic_error("Outcome holds no value: " + describe());
                return *value_;
            }

            T &&value() && {
                if (!value_) throw std::logic_error("Outcome holds no value: " + describe());
                return std::move(*value_);
            }

            std::string describe() const {
                switch (state_) {
                    case State::SUCCESS: return "success";
                    case State::NOT_YET: return "not yet (" + detail_ + ')';
                    case State::TRANSIENT: return "transient failure (" + detail_ + ')';
                }
                return "unknown";
            }
    };

    namespace detail {
        template<typename T> struct IsOutcome: std::false_type {};
        template<typename T> struct IsOutcome<Outcome<T>>: std::true_type {};

        template<typename T> struct IsOptional: std::false_type {};
        template<typename T> struct IsOptional<std::optional<T>>: std::true_type {};

        template<typename R>
        struct OutcomeFor { using type = Outcome<R>; };

        template<typename T>
        struct OutcomeFor<Outcome<T>> { using type = Outcome<T>; };

        template<typename T>
        struct OutcomeFor<std::optional<T>> { using type = Outcome<T>; };
    }

    template<typename R>
    using OutcomeFor = typename detail::OutcomeFor<std::remove_cvref_t<R>>::type;

    // Normalise whatever a condition callable returned: false, null, empty and
    // nullopt mean "not yet", everything else is a success carrying the value.
    template<typename R>
    OutcomeFor<R> toOutcome(R &&result) {
        using Raw = std::remove_cvref_t<R>;
        using Result = OutcomeFor<R>;

        if constexpr (detail::IsOutcome<Raw>::value) {
            return std::forward<R>(result);
        }

        else if constexpr (std::is_same_v<Raw, bool>) {
            return result? Result::success(true): Result::notYet("condition returned false");
        }

        else if constexpr (detail::IsOptional<Raw>::value) {
            if (!result) return Result::notYet("condition returned no value");
            return Result::success(*std::forward<R>(result));
        }

        else if constexpr (std::is_pointer_v<Raw>) {
            if (result == nullptr) return Result::notYet("condition returned null");
            return Result::success(result);
        }

        else if constexpr (requires { result.empty(); }) {
            if (result.empty()) return Result::notYet("condition returned an empty result");
            return Result::success(std::forward<R>(result));
        }

        else if constexpr (std::is_class_v<Raw> && std::is_constructible_v<bool, const Raw&>) {
            if (!static_cast<bool>(result)) return Result::notYet("condition returned a null handle");
            return Result::success(std::forward<R>(result));
        }

        else {
            return Result::success(std::forward<R>(result));
        }
    }
}
