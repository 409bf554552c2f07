#include <catch2/catch_test_macros.hpp>
#include "troupe/types.hpp"
#include <unordered_set>

using namespace troupe;

TEST_CASE("NodeId parsing and formatting", "[types]") {
    SECTION("Valid text") {
        auto node = NodeId::parse("node1@127.0.0.1:7946");
        REQUIRE(node.has_value());
        REQUIRE(node->name() == "node1");
        REQUIRE(node->address() == "127.0.0.1:7946");
        REQUIRE(node->is_valid());
        REQUIRE(node->to_string() == "node1@127.0.0.1:7946");
    }

    SECTION("Missing separator") {
        REQUIRE_FALSE(NodeId::parse("node1").has_value());
    }

    SECTION("More than one separator") {
        REQUIRE_FALSE(NodeId::parse("a@b@c:1").has_value());
    }

    SECTION("Empty parts") {
        REQUIRE_FALSE(NodeId::parse("@127.0.0.1:1").has_value());
        REQUIRE_FALSE(NodeId::parse("node@").has_value());
    }

    SECTION("Default is invalid") {
        NodeId node;
        REQUIRE_FALSE(node.is_valid());
    }
}

TEST_CASE("NodeId ordering", "[types]") {
    NodeId a("a", "127.0.0.1:2");
    NodeId b("b", "127.0.0.1:1");
    NodeId a2("a", "127.0.0.1:3");

    SECTION("Name sorts first") {
        REQUIRE(a < b);
        REQUIRE_FALSE(b < a);
    }

    SECTION("Address breaks ties") {
        REQUIRE(a < a2);
        REQUIRE_FALSE(a2 < a);
    }

    SECTION("Equality") {
        REQUIRE(a == NodeId("a", "127.0.0.1:2"));
        REQUIRE(a != a2);
    }
}

TEST_CASE("NodeId hashing", "[types]") {
    NodeId a("ab", "c");
    NodeId b("a", "bc");

    REQUIRE(a.hash() == NodeId("ab", "c").hash());
    REQUIRE(a.hash() != b.hash());

    std::unordered_set<NodeId> set{a, b, NodeId("ab", "c")};
    REQUIRE(set.size() == 2);
}

TEST_CASE("Pid formatting and ordering", "[types]") {
    NodeId node("node1", "127.0.0.1:7946");

    SECTION("Without group") {
        Pid pid{"echo", std::nullopt, node};
        REQUIRE(pid.to_string() == "echo::node1@127.0.0.1:7946");
    }

    SECTION("With group") {
        Pid pid{"cluster_server", std::string("troupe"), node};
        REQUIRE(pid.to_string() == "troupe::cluster_server::node1@127.0.0.1:7946");
    }

    SECTION("Ordering and hashing") {
        Pid p1{"a", std::nullopt, node};
        Pid p2{"b", std::nullopt, node};
        REQUIRE(p1 < p2);
        REQUIRE(p1 != p2);

        std::unordered_set<Pid> set{p1, p2, p1};
        REQUIRE(set.size() == 2);
    }
}

TEST_CASE("CorrelationId", "[types]") {
    Pid pid{"client", std::nullopt, NodeId("n", "127.0.0.1:1")};
    auto cid = CorrelationId::for_pid(pid);

    REQUIRE(cid.pid == pid);
    REQUIRE_FALSE(cid.handle.has_value());
    REQUIRE_FALSE(cid.request.has_value());

    auto other = cid;
    other.request = 7;
    REQUIRE_FALSE(cid == other);
}

TEST_CASE("Status operations", "[types]") {
    SECTION("Ok status") {
        auto status = Status::make_ok();
        REQUIRE(status.ok());
        REQUIRE(status.is_ok());
        REQUIRE_FALSE(status.is_error());
        REQUIRE(static_cast<bool>(status));
        REQUIRE(status.code() == ErrorCode::Ok);
    }

    SECTION("Error status") {
        auto status = Status::error(ErrorCode::DecodeError, "bad frame");
        REQUIRE_FALSE(status.ok());
        REQUIRE(status.is_error());
        REQUIRE(status.code() == ErrorCode::DecodeError);
        REQUIRE(status.message() == "bad frame");
        REQUIRE(status.to_string().find("bad frame") != std::string::npos);
    }

    SECTION("Error code names") {
        REQUIRE(std::string(error_code_string(ErrorCode::Ok)) == "Ok");
        REQUIRE(std::string(error_code_string(ErrorCode::SendError)) == "Send error");
    }
}
