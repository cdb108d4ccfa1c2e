#include "test_support.hpp"

#include <cassert>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

using namespace waitxx;

namespace {
    class ScreenerTimeout: public std::runtime_error {
        public:
            explicit ScreenerTimeout(const std::string &message): std::runtime_error(message) {}
    };

    // Result table that fills up a few rows per refresh
    struct ResultTable {
        std::size_t refreshes {0}, rowsPerRefresh {5};
        bool loaded {false};

        std::vector<std::string> rows() {
            ++refreshes;
            if (!loaded) throw NotFoundError("results table not rendered yet");
            return std::vector<std::string>(refreshes * rowsPerRefresh, "row");
        }
    };
}

int main() {
    // The queried value is returned once the predicate accepts it
    {
        FakeClock clock;
        ResultTable table;
        clock.onSleep = [&table](std::size_t sleeps) { if (sleeps == 1) table.loaded = true; };

        auto rows {pollFor<ScreenerTimeout>(table, "at least 10 rows",
            [](ResultTable &t) { return t.rows(); },
            [](const std::vector<std::string> &found) { return found.size() >= 10; },
            5s, PollOptions{.interval = 200ms, .clock = &clock})};

        assert(rows.size() == 10);
        assert(table.refreshes == 2);
        assert(clock.sleeps().size() == 1);
    }

    // Timing out raises the caller's exception type
    {
        FakeClock clock;
        ResultTable table;
        table.loaded = true;

        bool raised {false};
        try {
            pollFor<ScreenerTimeout>(table, "more than 100 rows",
                [](ResultTable &t) { return t.rows(); },
                [](const std::vector<std::string> &found) { return found.size() > 100; },
                1s, PollOptions{.interval = 250ms, .clock = &clock});
        } catch (const TimeoutError &) {
            assert(false);
        } catch (const ScreenerTimeout &ex) {
            raised = std::string{ex.what()} == "more than 100 rows not met within 1000 ms (5 attempts)";
        }
        assert(raised);
    }

    // Missing elements are retried even when they never show up
    {
        FakeClock clock;
        ResultTable table;

        bool raised {false};
        try {
            pollFor<ScreenerTimeout>(table, "any rows",
                [](ResultTable &t) { return t.rows(); },
                [](const std::vector<std::string> &found) { return !found.empty(); },
                600ms, PollOptions{.interval = 200ms, .clock = &clock});
        } catch (const ScreenerTimeout &) {
            raised = true;
        }
        assert(raised);
        assert(table.refreshes == 4);
    }

    // Cancellation is reported as an interrupted wait with the cause nested
    {
        FakeClock clock;
        CancellationToken token;
        ResultTable table;
        clock.onSleep = [&token](std::size_t) { token.cancel(); };

        bool interrupted {false};
        try {
            pollFor<ScreenerTimeout>(table, "any rows",
                [](ResultTable &t) { return t.rows(); },
                [](const std::vector<std::string> &found) { return !found.empty(); },
                10s, PollOptions{.interval = 100ms, .token = &token, .clock = &clock});
        } catch (const ScreenerTimeout &ex) {
            assert(std::string{ex.what()} == "Wait interrupted");
            try {
                std::rethrow_if_nested(ex);
            } catch (const CancelledError &cause) {
                interrupted = cause.attempts() == 1;
            }
        }
        assert(interrupted);
    }

    // Anything other than a missing element is fatal and keeps its cause
    {
        FakeClock clock;
        ResultTable table;

        bool fatal {false};
        try {
            pollFor<ScreenerTimeout>(table, "parsable rows",
                [](ResultTable &) -> int { throw std::out_of_range("column 12"); },
                [](int) { return true; },
                1s, PollOptions{.interval = 100ms, .clock = &clock});
        } catch (const ScreenerTimeout &) {
            assert(false);
        } catch (const FatalFailure &ex) {
            assert(ex.attempts() == 1);
            try {
                std::rethrow_if_nested(ex);
            } catch (const std::out_of_range &cause) {
                fatal = std::string{cause.what()} == "column 12";
            }
        }
        assert(fatal);
    }

    return 0;
}
