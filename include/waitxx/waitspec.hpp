#pragma once

#include "clock.hpp"
#include "errors.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace waitxx {

    // Immutable per wait-point configuration. The with* / ignoring calls return
    // modified copies and validate them.
    class WaitSpec {
        public:
            static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT {10'000};
            static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL {500};

            // Longest sleep the clock can represent. Timeouts may be longer, the
            // engine then waits without a deadline.
            static constexpr std::chrono::milliseconds MAX_POLL_INTERVAL {
                std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max())
            };

        private:
            std::chrono::milliseconds timeout_;
            std::chrono::milliseconds pollInterval_;
            std::vector<FailureKind> ignored;

            void validate() const {
                if (pollInterval_ <= std::chrono::milliseconds::zero())
                    throw ConfigurationError("Poll interval must be positive, got " +
                            std::to_string(pollInterval_.count()) + " ms");
                if (pollInterval_ > MAX_POLL_INTERVAL)
                    throw ConfigurationError("Poll interval is too long, got " +
                            std::to_string(pollInterval_.count()) + " ms");
                if (timeout_ < std::chrono::milliseconds::zero())
                    throw ConfigurationError("Timeout must not be negative, got " +
                            std::to_string(timeout_.count()) + " ms");
            }

        public:
            WaitSpec(): WaitSpec(DEFAULT_TIMEOUT) {}

            explicit WaitSpec(
                std::chrono::milliseconds timeout,
                std::chrono::milliseconds pollInterval = DEFAULT_POLL_INTERVAL,
                std::vector<FailureKind> ignoredFailures = {}
            ):
                timeout_(timeout), pollInterval_(pollInterval),
                ignored(std::move(ignoredFailures))
            { validate(); }

            std::chrono::milliseconds timeout() const noexcept { return timeout_; }
            std::chrono::milliseconds pollInterval() const noexcept { return pollInterval_; }
            const std::vector<FailureKind> &ignoredFailures() const noexcept { return ignored; }

            [[nodiscard]] WaitSpec withTimeout(std::chrono::milliseconds timeout) const {
                return WaitSpec{timeout, pollInterval_, ignored};
            }

            [[nodiscard]] WaitSpec pollingEvery(std::chrono::milliseconds pollInterval) const {
                return WaitSpec{timeout_, pollInterval, ignored};
            }

            [[nodiscard]] WaitSpec ignoring(const FailureKind &kind) const {
                std::vector<FailureKind> kinds {ignored};
                kinds.push_back(kind);
                return WaitSpec{timeout_, pollInterval_, std::move(kinds)};
            }

            template<typename E>
            [[nodiscard]] WaitSpec ignoring(const std::string &name = typeid(E).name()) const {
                return ignoring(FailureKind::of<E>(name));
            }

            // The first ignored kind the error belongs to, if any
            std::optional<FailureKind> ignores(const std::exception_ptr &error) const {
                auto it {std::find_if(ignored.begin(), ignored.end(), [&error](const FailureKind &kind) {
                    return kind.matches(error);
                })};
                if (it == ignored.end()) return std::nullopt;
                return *it;
            }
    };
}
