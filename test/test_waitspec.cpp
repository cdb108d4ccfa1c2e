#include "test_support.hpp"

#include <cassert>
#include <exception>
#include <stdexcept>
#include <type_traits>

using namespace waitxx;

namespace {
    template<typename F>
    bool rejects(F &&build) {
        try {
            build();
        } catch (const ConfigurationError &) {
            return true;
        }
        return false;
    }
}

int main() {
    // Defaults
    {
        WaitSpec spec;
        assert(spec.timeout() == WaitSpec::DEFAULT_TIMEOUT);
        assert(spec.pollInterval() == WaitSpec::DEFAULT_POLL_INTERVAL);
        assert(spec.timeout() != spec.pollInterval());
        assert(spec.ignoredFailures().empty());
    }

    // Invalid intervals and timeouts are refused up front
    {
        assert(rejects([] { WaitSpec{1s, 0ms}; }));
        assert(rejects([] { WaitSpec{1s, -5ms}; }));
        assert(rejects([] { WaitSpec{-1ms, 100ms}; }));
        assert(rejects([] { (void) WaitSpec{}.pollingEvery(0ms); }));
        assert(rejects([] { (void) WaitSpec{}.withTimeout(-1s); }));
        assert(!rejects([] { WaitSpec{0ms, 1ms}; }));
        assert(rejects([] { WaitSpec{1s, std::chrono::milliseconds::max()}; }));
        assert(!rejects([] { WaitSpec{std::chrono::milliseconds::max(), 100ms}; }));
    }

    // A bare duration is not a WaitSpec, call sites have to name it
    {
        static_assert(!std::is_convertible_v<std::chrono::seconds, WaitSpec>);
        static_assert(std::is_constructible_v<WaitSpec, std::chrono::seconds>);
        WaitSpec spec {5s};
        assert(spec.timeout() == 5s && spec.pollInterval() == WaitSpec::DEFAULT_POLL_INTERVAL);
    }

    // Configuration errors are invalid arguments, not wait errors
    {
        bool caught {false};
        try {
            WaitSpec{1s, 0ms};
        } catch (const std::invalid_argument &) {
            caught = true;
        }
        assert(caught);
    }

    // Builders return modified copies and leave the original alone
    {
        const WaitSpec base {2s, 250ms};
        WaitSpec longer {base.withTimeout(30s)};
        WaitSpec faster {base.pollingEvery(50ms)};
        WaitSpec tolerant {base.ignoring<NotFoundError>("NotFoundError")};

        assert(base.timeout() == 2s && base.pollInterval() == 250ms && base.ignoredFailures().empty());
        assert(longer.timeout() == 30s && longer.pollInterval() == 250ms);
        assert(faster.timeout() == 2s && faster.pollInterval() == 50ms);
        assert(tolerant.ignoredFailures().size() == 1);
        assert(tolerant.ignoredFailures().front().name() == "NotFoundError");
    }

    // Matching of ignored kinds
    {
        WaitSpec spec {WaitSpec{}.ignoring<NotFoundError>("NotFoundError").ignoring<std::out_of_range>("out_of_range")};

        auto notFound {std::make_exception_ptr(NotFoundError("x"))};
        auto outOfRange {std::make_exception_ptr(std::out_of_range("y"))};
        auto other {std::make_exception_ptr(std::runtime_error("z"))};

        assert(spec.ignores(notFound)->name() == "NotFoundError");
        assert(spec.ignores(outOfRange)->name() == "out_of_range");
        assert(!spec.ignores(other));
        assert(!spec.ignores(std::exception_ptr{}));

        // std::out_of_range derives from std::logic_error, the reverse does not match
        assert(!spec.ignores(std::make_exception_ptr(std::logic_error("w"))));
        assert(FailureKind::of<std::logic_error>().matches(outOfRange));
    }

    return 0;
}
