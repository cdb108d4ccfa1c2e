#include "test_support.hpp"

#include <cassert>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace waitxx;

int main() {
    // Booleans
    {
        assert(toOutcome(true).ok());
        assert(toOutcome(true).value());
        assert(!toOutcome(false).ok());
        assert(toOutcome(false).state() == Outcome<bool>::State::NOT_YET);
    }

    // Optionals carry their value through
    {
        auto found {toOutcome(std::optional<int>{5})};
        assert(found.ok() && found.value() == 5);
        assert(!toOutcome(std::optional<int>{}).ok());
    }

    // Null pointers, empty containers and null handles are "not yet"
    {
        int target {3};
        assert(toOutcome(&target).ok());
        assert(!toOutcome(static_cast<int*>(nullptr)).ok());
        assert(!toOutcome(std::vector<int>{}).ok());
        assert(toOutcome(std::vector<int>{1, 2}).value().size() == 2);
        assert(!toOutcome(std::string{}).ok());
        assert(toOutcome(std::string{"x"}).ok());
        assert(!toOutcome(FakeElement{}).ok());
        assert(toOutcome(FakeElement{.id = "e1"}).value().id == "e1");
        assert(!toOutcome(std::unique_ptr<int>{}).ok());
    }

    // Zero is a perfectly good count
    {
        auto count {toOutcome(0)};
        assert(count.ok() && count.value() == 0);
    }

    // Explicit outcomes pass through unchanged
    {
        auto transient {toOutcome(Outcome<int>::transient("NotFoundError", "no row"))};
        assert(transient.transient());
        assert(transient.describe() == "transient failure (NotFoundError: no row)");
        assert(Outcome<int>::notYet("waiting").describe() == "not yet (waiting)");
        assert(Outcome<int>::success(1).describe() == "success");
    }

    // Reading the value of a pending outcome is a logic error
    {
        bool thrown {false};
        try {
            (void) Outcome<int>::notYet().value();
        } catch (const std::logic_error &) {
            thrown = true;
        }
        assert(thrown);
    }

    // Re-typing keeps the pending state
    {
        auto retyped {Outcome<bool>::pending(Outcome<int>::transient("Busy", "later"))};
        assert(retyped.transient());
        assert(retyped.detail() == "Busy: later");
    }

    return 0;
}
