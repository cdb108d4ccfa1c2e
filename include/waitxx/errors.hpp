#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>

namespace waitxx {

    // Invalid wait / session configuration, raised before any polling happens
    class ConfigurationError: public std::invalid_argument {
        public:
            explicit ConfigurationError(const std::string &message):
                std::invalid_argument(message) {}
    };

    // Raised by a probe when a lookup found nothing (e.g. no element for a locator)
    class NotFoundError: public std::runtime_error {
        public:
            explicit NotFoundError(const std::string &message):
                std::runtime_error(message) {}
    };

    // Raised by a probe when a previously located element left the document
    class StaleElementReferenceError: public std::runtime_error {
        public:
            explicit StaleElementReferenceError(const std::string &message):
                std::runtime_error(message) {}
    };

    class WaitError: public std::runtime_error {
        private:
            std::string description_;
            std::chrono::milliseconds elapsed_;
            std::size_t attempts_;

        public:
            WaitError(const std::string &message, const std::string &description,
                    std::chrono::milliseconds elapsed, std::size_t attempts):
                std::runtime_error(message), description_(description),
                elapsed_(elapsed), attempts_(attempts) {}

            const std::string &description() const noexcept { return description_; }
            std::chrono::milliseconds elapsed() const noexcept { return elapsed_; }
            std::size_t attempts() const noexcept { return attempts_; }
    };

    class TimeoutError: public WaitError {
        private:
            std::string lastOutcome_;

        public:
            TimeoutError(const std::string &description, std::chrono::milliseconds elapsed,
                    std::size_t attempts, const std::string &lastOutcome):
                WaitError(
                    "Timed out after " + std::to_string(elapsed.count()) + " ms waiting for " +
                    description + " (" + std::to_string(attempts) + " attempts, last outcome: " +
                    lastOutcome + ')',
                    description, elapsed, attempts
                ),
                lastOutcome_(lastOutcome) {}

            const std::string &lastOutcome() const noexcept { return lastOutcome_; }
    };

    class CancelledError: public WaitError {
        public:
            CancelledError(const std::string &description, std::chrono::milliseconds elapsed, std::size_t attempts):
                WaitError(
                    "Cancelled after " + std::to_string(elapsed.count()) + " ms while waiting for " + description,
                    description, elapsed, attempts
                ) {}
    };

    // Always thrown with the condition's own exception nested inside
    class FatalFailure: public WaitError {
        public:
            FatalFailure(const std::string &description, std::chrono::milliseconds elapsed,
                    std::size_t attempts, const std::string &cause):
                WaitError(
                    "Condition " + description + " failed on attempt " + std::to_string(attempts) + ": " + cause,
                    description, elapsed, attempts
                ) {}
    };

    inline std::string describeException(const std::exception_ptr &error) {
        if (!error) return "no exception";
        try {
            std::rethrow_exception(error);
        } catch (const std::exception &ex) {
            return ex.what();
        } catch (...) {
            return "non-standard exception";
        }
    }

    // A named family of exceptions a wait may treat as transient. Derived types
    // match the kind of their base.
    class FailureKind {
        private:
            std::string name_;
            std::function<bool(const std::exception_ptr&)> matcher;

            FailureKind(const std::string &name, std::function<bool(const std::exception_ptr&)> matcher):
                name_(name), matcher(std::move(matcher)) {}

        public:
            template<typename E>
            static FailureKind of(const std::string &name = typeid(E).name()) {
                return FailureKind{name, [](const std::exception_ptr &error) {
                    try {
                        std::rethrow_exception(error);
                    } catch (const E &) {
                        return true;
                    } catch (...) {
                        return false;
                    }
                }};
            }

            const std::string &name() const noexcept { return name_; }

            bool matches(const std::exception_ptr &error) const {
                return error && matcher(error);
            }
    };
}
