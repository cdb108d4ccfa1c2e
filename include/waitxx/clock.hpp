#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace waitxx {

    // Cancellation signal shared between a waiting thread and whoever wants it to stop
    class CancellationToken {
        private:
            mutable std::mutex mutex;
            mutable std::condition_variable cancelledCV;
            std::atomic<bool> cancelled {false};

        public:
            CancellationToken() = default;
            CancellationToken(const CancellationToken&) = delete;
            CancellationToken &operator=(const CancellationToken&) = delete;

            void cancel() {
                {
                    std::lock_guard lock {mutex};
                    cancelled = true;
                }
                cancelledCV.notify_all();
            }

            void reset() {
                std::lock_guard lock {mutex};
                cancelled = false;
            }

            bool isCancelled() const noexcept { return cancelled; }

            // Block for up to `duration`, returns false if cancelled before or during the wait
            template<typename Rep, typename Period>
            bool waitFor(const std::chrono::duration<Rep, Period> &duration) const {
                auto until {std::chrono::steady_clock::now() + duration};
                std::unique_lock lock {mutex};
                return !cancelledCV.wait_until(lock, until, [this] { return cancelled.load(); });
            }
    };

    class Clock {
        public:
            using time_point = std::chrono::steady_clock::time_point;
            using duration = std::chrono::steady_clock::duration;

            virtual ~Clock() = default;

            virtual time_point now() const = 0;

            // Returns false when the sleep was cut short by `token`
            virtual bool sleepFor(duration pause, const CancellationToken *token) const = 0;
    };

    class SteadyClock final: public Clock {
        public:
            [[nodiscard]] static const SteadyClock &instance() {
                static const SteadyClock clock {};
                return clock;
            }

            time_point now() const override { return std::chrono::steady_clock::now(); }

            bool sleepFor(duration pause, const CancellationToken *token) const override {
                if (token) return token->waitFor(pause);
                std::this_thread::sleep_for(pause);
                return true;
            }
    };
}
