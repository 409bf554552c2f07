#include <catch2/catch_test_macros.hpp>
#include "troupe/members.hpp"

using namespace troupe;

TEST_CASE("Members starts with the local node", "[members]") {
    NodeId local("node1", "127.0.0.1:7001");
    Members members(local);

    REQUIRE(members.local() == local);
    REQUIRE(members.contains(local));
    REQUIRE(members.all() == std::set<NodeId>{local});
    REQUIRE_FALSE(members.snapshot().empty());
}

TEST_CASE("Members add, leave and join", "[members]") {
    NodeId n1("node1", "127.0.0.1:7001");
    NodeId n2("node2", "127.0.0.1:7002");
    NodeId n3("node3", "127.0.0.1:7003");

    Members m1(n1, 100);
    Members m2(n2, 200);

    SECTION("Snapshot exchange converges") {
        m1.add(n2);
        REQUIRE(m2.join(m1.snapshot()));
        REQUIRE(m1.join(m2.snapshot()));

        std::set<NodeId> expected{n1, n2};
        REQUIRE(m1.all() == expected);
        REQUIRE(m2.all() == expected);
    }

    SECTION("Leave of a non-member yields no delta") {
        REQUIRE_FALSE(m1.leave(n3).has_value());
    }

    SECTION("Leave delta removes the node elsewhere") {
        auto add = m1.add(n3);
        m2.join(add);
        REQUIRE(m2.contains(n3));

        auto removal = m1.leave(n3);
        REQUIRE(removal.has_value());
        REQUIRE(m2.join(*removal));
        REQUIRE_FALSE(m2.contains(n3));
    }

    SECTION("join_novel of a known state is empty") {
        m2.join(m1.snapshot());
        REQUIRE(m2.join_novel(m1.snapshot()).empty());
    }

    SECTION("Dots are tagged with the local node text") {
        auto delta = m1.add(n3);
        const auto& dots = delta.adds.at(n3);
        REQUIRE(dots.size() == 1);
        REQUIRE(dots.begin()->actor == "node1@127.0.0.1:7001");
        REQUIRE(dots.begin()->counter > 100);
    }
}

TEST_CASE("Restarted node does not reuse tombstoned dots", "[members]") {
    NodeId n1("node1", "127.0.0.1:7001");
    NodeId n2("node2", "127.0.0.1:7002");

    // First life of node1 joins node2, then node2 is removed
    Members first(n1, 10);
    Members peer(n2, 500);
    peer.join(first.snapshot());
    auto add = first.add(n2);
    peer.join(add);
    auto removal = first.leave(n2);
    REQUIRE(removal.has_value());
    peer.join(*removal);
    REQUIRE_FALSE(peer.contains(n2));

    // Restart with a counter that went backwards; learning its old dots
    // through the merge moves it past them
    Members restarted(n1, 10);
    restarted.join(peer.snapshot());
    auto readd = restarted.add(n2);
    REQUIRE(peer.join(readd));
    REQUIRE(peer.contains(n2));
}
