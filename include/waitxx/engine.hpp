#pragma once

#include "clock.hpp"
#include "condition.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "waitspec.hpp"

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace waitxx {

    // Polls a condition against a probe until it succeeds, fails fatally, times out
    // or is cancelled. The engine only borrows the probe, the clock and the token;
    // all of them must outlive it.
    template<typename Probe>
    class WaitEngine {
        private:
            Probe &probe;
            const WaitSpec spec_;
            const Clock *clock;
            const CancellationToken *token {nullptr};

            static std::chrono::milliseconds millis(Clock::duration duration) {
                return std::chrono::duration_cast<std::chrono::milliseconds>(duration);
            }

            // Timeouts the clock cannot represent never expire
            Clock::time_point deadlineFrom(Clock::time_point start) const {
                const auto remaining {std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - start)};
                if (spec_.timeout() >= remaining) return Clock::time_point::max();
                return start + std::chrono::duration_cast<Clock::duration>(spec_.timeout());
            }

        public:
            explicit WaitEngine(Probe &probe, const WaitSpec &spec = {}, const Clock &clock = SteadyClock::instance()):
                probe(probe), spec_(spec), clock(&clock) {}

            WaitEngine &cancelOn(const CancellationToken &token) {
                this->token = &token;
                return *this;
            }

            const WaitSpec &spec() const noexcept { return spec_; }

            template<typename Fn>
            ConditionValue<Condition<Fn>, Probe> until(const Condition<Fn> &condition) const {
                const std::string &description {condition.description()};
                const Clock::time_point start {clock->now()};
                const Clock::time_point deadline {deadlineFrom(start)};
                std::size_t attempts {0};
                std::string lastOutcome {"never evaluated"};

                for (;;) {
                    if (token && token->isCancelled()) {
                        logging::Debug("Wait for {} cancelled before attempt {}", description, attempts + 1);
                        throw CancelledError(description, millis(clock->now() - start), attempts);
                    }

                    ++attempts;
                    try {
                        auto outcome {condition(probe)};
                        if (outcome.ok()) {
                            logging::Debug("{} satisfied on attempt {} after {} ms", description,
                                    attempts, millis(clock->now() - start).count());
                            return std::move(outcome).value();
                        }
                        lastOutcome = outcome.describe();
                    } catch (...) {
                        std::exception_ptr error {std::current_exception()};
                        std::optional<FailureKind> kind {spec_.ignores(error)};
                        if (!kind) {
                            std::string cause {describeException(error)};
                            logging::Warn("Wait for {} aborted on attempt {}: {}", description, attempts, cause);
                            std::throw_with_nested(FatalFailure(description, millis(clock->now() - start), attempts, cause));
                        }
                        lastOutcome = "ignored " + kind->name() + " (" + describeException(error) + ')';
                    }
                    logging::Trace("Attempt {} for {}: {}", attempts, description, lastOutcome);

                    const Clock::time_point now {clock->now()};
                    if (now >= deadline) {
                        logging::Debug("Wait for {} timed out after {} attempt(s)", description, attempts);
                        throw TimeoutError(description, millis(now - start), attempts, lastOutcome);
                    }

                    // Never sleep past the deadline
                    const Clock::duration pause {std::min<Clock::duration>(spec_.pollInterval(), deadline - now)};
                    if (!clock->sleepFor(pause, token)) {
                        logging::Debug("Wait for {} interrupted after {} attempt(s)", description, attempts);
                        throw CancelledError(description, millis(clock->now() - start), attempts);
                    }
                }
            }

            template<typename F> requires (!ConditionLike<F>)
            auto until(F &&fn) const {
                return until(makeCondition("anonymous condition", std::forward<F>(fn)));
            }
    };

    template<typename Probe, typename C>
    auto until(Probe &probe, C &&condition, const WaitSpec &spec = {}) {
        return WaitEngine<Probe>{probe, spec}.until(std::forward<C>(condition));
    }

    template<typename Probe, typename C>
    auto until(Probe &probe, C &&condition, const WaitSpec &spec, const CancellationToken &token) {
        WaitEngine<Probe> engine {probe, spec};
        return engine.cancelOn(token).until(std::forward<C>(condition));
    }

    struct PollOptions {
        std::chrono::milliseconds interval {WaitSpec::DEFAULT_POLL_INTERVAL};
        const CancellationToken *token {nullptr};
        const Clock *clock {nullptr};
    };

    // Hand-rolled style polling: run `query` on the probe every `interval` until
    // `predicate` accepts its result. Probe lookups that find nothing are retried.
    // Timing out raises the caller's own exception type instead of TimeoutError.
    template<typename TimeoutException, typename Probe, typename Query, typename Predicate>
        requires std::constructible_from<TimeoutException, std::string>
    auto pollFor(Probe &probe, const std::string &description, Query &&query, Predicate &&predicate,
            std::chrono::milliseconds timeout, const PollOptions &options = {}) {
        using Value = std::remove_cvref_t<std::invoke_result_t<Query&, Probe&>>;

        const WaitSpec spec {WaitSpec{timeout, options.interval}.ignoring<NotFoundError>("NotFoundError")};
        WaitEngine<Probe> engine {probe, spec, options.clock? *options.clock: SteadyClock::instance()};
        if (options.token) engine.cancelOn(*options.token);

        auto condition {makeCondition(description, [&query, &predicate](Probe &target) -> std::optional<Value> {
            Value value {std::invoke(query, target)};
            if (std::invoke(predicate, std::as_const(value))) return value;
            return std::nullopt;
        })};

        try {
            return engine.until(condition);
        } catch (const TimeoutError &ex) {
            throw TimeoutException(description + " not met within " + std::to_string(timeout.count()) +
                    " ms (" + std::to_string(ex.attempts()) + " attempts)");
        } catch (const CancelledError &) {
            std::throw_with_nested(TimeoutException(std::string{"Wait interrupted"}));
        }
    }
}
