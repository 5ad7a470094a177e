#include <catch2/catch_test_macros.hpp>

#include "session_gate.hpp"

#include <stdexcept>
#include <vector>

TEST_CASE("SessionGate", "[session_gate]") {
    SessionGate gate;

    SECTION("WaitRunsImmediatelyWhenIdle") {
        bool ran = false;
        gate.wait([&] { ran = true; });
        REQUIRE(ran);
        REQUIRE_FALSE(gate.pending());
    }

    SECTION("BeginIsIdempotent") {
        REQUIRE(gate.begin());
        REQUIRE_FALSE(gate.begin());
        REQUIRE(gate.pending());
    }

    SECTION("ResolveRunsWaitersOnceInOrder") {
        std::vector<int> order;
        gate.begin();
        gate.wait([&] { order.push_back(1); });
        gate.wait([&] { order.push_back(2); });
        REQUIRE(order.empty());
        REQUIRE(gate.waiter_count() == 2);

        REQUIRE(gate.resolve());
        REQUIRE(order == std::vector<int>{1, 2});
        REQUIRE_FALSE(gate.pending());
        REQUIRE(gate.waiter_count() == 0);

        REQUIRE_FALSE(gate.resolve());
        REQUIRE(order.size() == 2);
    }

    SECTION("WaiterMayOpenNextSlot") {
        bool second = false;
        gate.begin();
        gate.wait([&] {
            gate.begin();
            gate.wait([&] { second = true; });
        });

        gate.resolve();
        REQUIRE(gate.pending());
        REQUIRE_FALSE(second);

        gate.resolve();
        REQUIRE(second);
    }

    SECTION("ThrowingWaiterDoesNotStopOthers") {
        bool ran = false;
        gate.begin();
        gate.wait([] { throw std::runtime_error("waiter broke"); });
        gate.wait([&] { ran = true; });
        gate.resolve();
        REQUIRE(ran);
    }

    SECTION("EmptyContinuationIgnored") {
        gate.wait({});
        gate.begin();
        gate.wait({});
        REQUIRE(gate.resolve());
    }
}
