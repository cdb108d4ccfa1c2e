#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <future>
#include <thread>
#include <vector>

using namespace waitxx;

int main() {
    struct Session {} session;

    // A token cancelled up front stops the wait before the first evaluation
    {
        CancellationToken token;
        token.cancel();
        std::size_t calls {0};
        try {
            until(session, [&calls](Session &) { ++calls; return false; }, WaitSpec{1s, 100ms}, token);
            assert(false);
        } catch (const CancelledError &ex) {
            assert(ex.attempts() == 0);
        }
        assert(calls == 0);
    }

    // Cancelling during a sleep surfaces CancelledError, not TimeoutError
    {
        FakeClock clock;
        CancellationToken token;
        clock.onSleep = [&token](std::size_t sleeps) { if (sleeps == 2) token.cancel(); };

        WaitEngine<Session> engine {session, WaitSpec{10s, 100ms}, clock};
        engine.cancelOn(token);
        bool cancelled {false};
        try {
            engine.until([](Session &) { return false; });
        } catch (const TimeoutError &) {
            assert(false);
        } catch (const CancelledError &ex) {
            cancelled = ex.attempts() == 2;
        }
        assert(cancelled);
    }

    // Another thread interrupts a long poll interval promptly
    {
        CancellationToken token;
        auto start {std::chrono::steady_clock::now()};
        std::thread canceller {[&token] {
            std::this_thread::sleep_for(100ms);
            token.cancel();
        }};

        bool cancelled {false};
        try {
            until(session, [](Session &) { return false; }, WaitSpec{30s, 10s}, token);
        } catch (const CancelledError &ex) {
            cancelled = ex.attempts() == 1;
        }
        canceller.join();

        assert(cancelled);
        assert(std::chrono::steady_clock::now() - start < 2s);
    }

    // A token can be reset and reused
    {
        CancellationToken token;
        token.cancel();
        assert(token.isCancelled());
        token.reset();
        assert(!token.isCancelled());
        assert(token.waitFor(1ms));
    }

    // Concurrent waits share one spec but nothing else
    {
        const WaitSpec spec {2s, 10ms};
        std::vector<std::future<int>> results;
        for (int worker {0}; worker < 4; ++worker) {
            results.push_back(std::async(std::launch::async, [&spec, worker] {
                struct Probe { std::atomic<int> polls {0}; } probe;
                return until(probe, [worker](Probe &p) {
                    int polls {++p.polls};
                    return polls > worker? std::optional<int>{worker * 100 + polls}: std::nullopt;
                }, spec);
            }));
        }

        for (int worker {0}; worker < 4; ++worker)
            assert(results[static_cast<std::size_t>(worker)].get() == worker * 100 + worker + 1);
    }

    return 0;
}
