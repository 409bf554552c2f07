#include <catch2/catch_test_macros.hpp>
#include "troupe/timing_wheel.hpp"

using namespace troupe;

TEST_CASE("TimingWheel expiry", "[timing_wheel]") {
    TimingWheel<int> wheel(5);

    SECTION("Id expires after exactly N ticks") {
        wheel.insert(1);
        for (int i = 0; i < 4; ++i) {
            REQUIRE(wheel.expire().empty());
        }
        auto expired = wheel.expire();
        REQUIRE(expired.size() == 1);
        REQUIRE(expired.count(1) == 1);
        REQUIRE(wheel.size() == 0);
    }

    SECTION("Expired id is reported once") {
        wheel.insert(1);
        int reports = 0;
        for (int i = 0; i < 20; ++i) {
            reports += static_cast<int>(wheel.expire().count(1));
        }
        REQUIRE(reports == 1);
    }

    SECTION("Reset every tick never expires") {
        size_t slot = wheel.insert(1);
        for (int i = 0; i < 50; ++i) {
            REQUIRE(wheel.expire().empty());
            slot = wheel.reset(1, slot);
        }
        REQUIRE(wheel.size() == 1);
    }

    SECTION("Removed id never expires") {
        size_t slot = wheel.insert(7);
        REQUIRE(wheel.remove(7, slot));
        REQUIRE_FALSE(wheel.remove(7, slot));
        for (int i = 0; i < 10; ++i) {
            REQUIRE(wheel.expire().empty());
        }
    }

    SECTION("Ids inserted on different ticks expire separately") {
        wheel.insert(1);
        wheel.expire();
        wheel.insert(2);

        for (int i = 0; i < 3; ++i) {
            REQUIRE(wheel.expire().empty());
        }
        auto first = wheel.expire();
        REQUIRE(first.size() == 1);
        REQUIRE(first.count(1) == 1);

        auto second = wheel.expire();
        REQUIRE(second.size() == 1);
        REQUIRE(second.count(2) == 1);
    }

    SECTION("Out of range slot") {
        REQUIRE_FALSE(wheel.remove(1, 99));
    }
}

TEST_CASE("TimingWheel with a single slot", "[timing_wheel]") {
    TimingWheel<int> wheel(0);
    REQUIRE(wheel.slots() == 1);

    wheel.insert(3);
    auto expired = wheel.expire();
    REQUIRE(expired.count(3) == 1);
}
