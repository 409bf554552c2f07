#include <catch2/catch_test_macros.hpp>
#include "troupe/handshake.hpp"
#include <string>

using namespace troupe;

TEST_CASE("Duplicate link resolution", "[handshake]") {
    NodeId a("a", "127.0.0.1:7001");
    NodeId b("b", "127.0.0.1:7002");
    REQUIRE(a < b);

    SECTION("Both sides keep the link initiated by the greater node") {
        // On a, the existing link is the one a dialed; the new one came from b
        REQUIRE(resolve_duplicate_link(a, b, true) == LinkResolution::ReplaceExisting);
        // On b, the existing link is the one b dialed; the new one came from a
        REQUIRE(resolve_duplicate_link(b, a, true) == LinkResolution::KeepExisting);
    }

    SECTION("Existing link from the greater node is kept on both sides") {
        // On a, b's link came first; a's own dial completes second
        REQUIRE(resolve_duplicate_link(a, b, false) == LinkResolution::KeepExisting);
        REQUIRE(resolve_duplicate_link(b, a, true) == LinkResolution::KeepExisting);
    }

    SECTION("Existing link from the lesser node is replaced on both sides") {
        REQUIRE(resolve_duplicate_link(b, a, false) == LinkResolution::ReplaceExisting);
        REQUIRE(resolve_duplicate_link(a, b, true) == LinkResolution::ReplaceExisting);
    }

    SECTION("Names") {
        REQUIRE(std::string(link_resolution_string(LinkResolution::KeepExisting)) == "keep-existing");
        REQUIRE(std::string(link_resolution_string(LinkResolution::ReplaceExisting)) == "replace-existing");
    }
}
