#include <catch2/catch_test_macros.hpp>
#include "troupe/orset.hpp"
#include <algorithm>
#include <random>
#include <string>
#include <vector>

using namespace troupe;

using Set = ORSet<std::string, std::string>;

TEST_CASE("ORSet add and remove", "[orset]") {
    Set set("a");

    SECTION("Add makes element present") {
        auto delta = set.add("x");
        REQUIRE(set.contains("x"));
        REQUIRE(delta.adds.count("x") == 1);
        REQUIRE(delta.removes.empty());
    }

    SECTION("Remove of absent element yields nothing") {
        REQUIRE_FALSE(set.remove("x").has_value());
    }

    SECTION("Remove tombstones observed dots") {
        set.add("x");
        set.add("x");
        auto delta = set.remove("x");
        REQUIRE(delta.has_value());
        REQUIRE(delta->removes.at("x").size() == 2);
        REQUIRE_FALSE(set.contains("x"));
        REQUIRE(set.elements().empty());
    }

    SECTION("Counter increases with every add") {
        uint64_t before = set.counter();
        set.add("x");
        set.add("y");
        REQUIRE(set.counter() == before + 2);
    }
}

TEST_CASE("ORSet join", "[orset]") {
    Set a("a");
    Set b("b");

    SECTION("Join is idempotent") {
        auto delta = a.add("x");
        REQUIRE(b.join(delta));
        auto once = b.state();
        REQUIRE_FALSE(b.join(delta));
        REQUIRE(b.state() == once);

        REQUIRE_FALSE(b.join(a.state()));
        REQUIRE(b.state() == once);
    }

    SECTION("Concurrent add survives remove") {
        a.add("x");
        b.join(a.state());

        // b removes what it has seen while a re-adds concurrently
        auto removal = b.remove("x");
        REQUIRE(removal.has_value());
        auto readd = a.add("x");

        a.join(*removal);
        b.join(readd);

        REQUIRE(a.contains("x"));
        REQUIRE(b.contains("x"));
        REQUIRE(a.state() == b.state());
    }

    SECTION("Tombstone arriving before its add") {
        auto add = a.add("x");
        auto removal = a.remove("x");
        REQUIRE(removal.has_value());

        REQUIRE(b.join(*removal));
        REQUIRE_FALSE(b.join(add));
        REQUIRE_FALSE(b.contains("x"));
    }

    SECTION("join_novel returns only what was new") {
        auto d1 = a.add("x");
        a.add("y");
        b.join(d1);

        auto novel = b.join_novel(a.state());
        REQUIRE(novel.adds.size() == 1);
        REQUIRE(novel.adds.count("y") == 1);
        REQUIRE(b.join_novel(a.state()).empty());
    }

    SECTION("Own dots seen through a merge advance the counter") {
        Set restarted("a", 0);
        a.add("x");
        restarted.join(a.state());
        REQUIRE(restarted.counter() == a.counter());

        restarted.add("y");
        REQUIRE(restarted.counter() > a.counter());
    }
}

TEST_CASE("ORSet converges under random delivery", "[orset]") {
    constexpr int REPLICAS = 3;
    const std::vector<std::string> elements{"n1", "n2", "n3", "n4"};

    for (unsigned seed = 1; seed <= 25; ++seed) {
        std::mt19937 rng(seed);
        std::vector<Set> replicas;
        for (int r = 0; r < REPLICAS; ++r) {
            replicas.emplace_back("r" + std::to_string(r));
        }

        // Deltas in flight: (target replica, delta)
        std::vector<std::pair<int, Set::Delta>> in_flight;

        auto publish = [&](int origin, const Set::Delta& delta) {
            for (int r = 0; r < REPLICAS; ++r) {
                if (r == origin) continue;
                in_flight.emplace_back(r, delta);
                if (rng() % 4 == 0) {
                    in_flight.emplace_back(r, delta);  // duplicate delivery
                }
            }
        };

        for (int step = 0; step < 60; ++step) {
            int r = static_cast<int>(rng() % REPLICAS);
            const auto& elem = elements[rng() % elements.size()];

            switch (rng() % 3) {
                case 0:
                    publish(r, replicas[r].add(elem));
                    break;
                case 1:
                    if (auto delta = replicas[r].remove(elem)) {
                        publish(r, *delta);
                    }
                    break;
                default:
                    // Deliver one random in-flight delta, out of order
                    if (!in_flight.empty()) {
                        size_t i = rng() % in_flight.size();
                        auto [target, delta] = in_flight[i];
                        in_flight.erase(in_flight.begin() + static_cast<long>(i));
                        replicas[target].join(delta);
                    }
                    break;
            }
        }

        std::shuffle(in_flight.begin(), in_flight.end(), rng);
        for (const auto& [target, delta] : in_flight) {
            replicas[target].join(delta);
        }

        for (int r = 1; r < REPLICAS; ++r) {
            REQUIRE(replicas[r].elements() == replicas[0].elements());
            REQUIRE(replicas[r].state() == replicas[0].state());
        }
    }
}
