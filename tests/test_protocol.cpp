#include <catch2/catch_test_macros.hpp>
#include "troupe/protocol.hpp"

using namespace troupe;
using namespace troupe::protocol;

namespace {

NodeId node1() { return NodeId("node1", "127.0.0.1:7001"); }
NodeId node2() { return NodeId("node2", "127.0.0.1:7002"); }

template<typename T>
T roundtrip(const PeerMessage& msg) {
    auto frame = Codec::encode(msg);
    auto decoded = Codec::decode(frame);
    REQUIRE(std::holds_alternative<T>(decoded));
    return std::get<T>(decoded);
}

Envelope make_envelope(Msg body) {
    Envelope env;
    env.to = Pid{"echo", std::nullopt, node2()};
    env.from = Pid{"client", std::string("apps"), node1()};
    env.body = std::move(body);
    return env;
}

}  // namespace

TEST_CASE("Message header parsing", "[protocol]") {
    SECTION("Valid header") {
        ByteBuffer buf(MessageHeader::SIZE);

        // Magic "TRPE" in little-endian = 0x45505254
        buf[0] = 0x54; buf[1] = 0x52; buf[2] = 0x50; buf[3] = 0x45;
        // Version = 1
        buf[4] = 0x01; buf[5] = 0x00;
        // Type = Envelope = 3
        buf[6] = 0x03; buf[7] = 0x00;
        // Length = 16
        buf[8] = 0x10; buf[9] = 0x00; buf[10] = 0x00; buf[11] = 0x00;

        auto header = Codec::parse_header(buf);

        REQUIRE(header.magic == MAGIC);
        REQUIRE(header.version == VERSION);
        REQUIRE(header.type == static_cast<uint16_t>(MessageType::Envelope));
        REQUIRE(header.length == 16);
    }

    SECTION("Invalid magic throws") {
        ByteBuffer buf(MessageHeader::SIZE, 0);
        buf[0] = 0xFF;

        REQUIRE_THROWS(Codec::parse_header(buf));
    }

    SECTION("Unsupported version throws") {
        auto frame = Codec::encode(PingMessage{});
        frame[4] = 0x02;

        REQUIRE_THROWS(Codec::parse_header(frame));
        REQUIRE_FALSE(is_compatible_version(2));
        REQUIRE(is_compatible_version(VERSION));
    }

    SECTION("Truncated header throws") {
        ByteBuffer buf(10, 0);

        REQUIRE_THROWS(Codec::parse_header(buf));
    }
}

TEST_CASE("Members message encoding/decoding", "[protocol]") {
    Members members(node1(), 1000);
    members.add(node2());
    auto removal = members.leave(node2());
    REQUIRE(removal.has_value());

    MembersMessage original{node1(), members.snapshot()};
    auto decoded = roundtrip<MembersMessage>(original);

    REQUIRE(decoded.from == node1());
    REQUIRE(decoded.state == original.state);
    REQUIRE(decoded.state.removes.count(node2()) == 1);
}

TEST_CASE("Ping message encoding/decoding", "[protocol]") {
    auto frame = Codec::encode(PingMessage{});

    REQUIRE(frame.size() == MessageHeader::SIZE);
    REQUIRE(Codec::parse_header(frame).length == 0);
    REQUIRE(std::holds_alternative<PingMessage>(Codec::decode(frame)));
}

TEST_CASE("Envelope message encoding/decoding", "[protocol]") {
    SECTION("User payload") {
        auto original = make_envelope(UserMsg{ByteBuffer{1, 2, 3, 0, 255}});
        auto decoded = roundtrip<EnvelopeMessage>(EnvelopeMessage{original});

        REQUIRE(decoded.envelope == original);
        REQUIRE(decoded.envelope.from.group == std::optional<std::string>("apps"));
        REQUIRE_FALSE(decoded.envelope.to.group.has_value());
    }

    SECTION("Correlation id with every field") {
        auto original = make_envelope(GetMetrics{});
        CorrelationId cid = CorrelationId::for_pid(original.from);
        cid.handle = 9;
        cid.request = 1ULL << 40;
        original.correlation_id = cid;

        auto decoded = roundtrip<EnvelopeMessage>(EnvelopeMessage{original});
        REQUIRE(decoded.envelope == original);
    }

    SECTION("Correlation id with only a request") {
        auto original = make_envelope(UserMsg{});
        CorrelationId cid;
        cid.request = 5;
        original.correlation_id = cid;

        auto decoded = roundtrip<EnvelopeMessage>(EnvelopeMessage{original});
        REQUIRE(decoded.envelope.correlation_id == cid);
    }

    SECTION("Metrics reply") {
        MetricsReply reply;
        reply.metrics.push_back(Metric{"cluster_server:joins", Metric::Counter, 3});
        reply.metrics.push_back(Metric{"cluster_server:members", Metric::Gauge, 2});
        auto original = make_envelope(reply);

        auto decoded = roundtrip<EnvelopeMessage>(EnvelopeMessage{original});
        REQUIRE(decoded.envelope == original);
    }

    SECTION("Cluster status") {
        ClusterStatus status;
        status.members = {node1(), node2()};
        status.established = {node2()};
        status.num_connections = 1;
        auto original = make_envelope(status);

        auto decoded = roundtrip<EnvelopeMessage>(EnvelopeMessage{original});
        REQUIRE(decoded.envelope == original);
    }
}

TEST_CASE("Delta message encoding/decoding", "[protocol]") {
    Members members(node1(), 0);
    auto delta = members.add(node2());

    auto decoded = roundtrip<DeltaMessage>(DeltaMessage{delta});
    REQUIRE(decoded.delta == delta);
}

TEST_CASE("Malformed frames are rejected", "[protocol]") {
    auto frame = Codec::encode(EnvelopeMessage{make_envelope(UserMsg{ByteBuffer{7}})});

    SECTION("Truncated payload") {
        frame.pop_back();
        REQUIRE_THROWS(Codec::decode(frame));
    }

    SECTION("Trailing bytes") {
        frame.push_back(0);
        REQUIRE_THROWS(Codec::decode(frame));
    }

    SECTION("Trailing bytes covered by the length field") {
        frame.push_back(0);
        frame[8] = static_cast<uint8_t>(frame[8] + 1);
        REQUIRE_THROWS(Codec::decode(frame));
    }

    SECTION("Unknown message type") {
        frame[6] = 0x7F;
        REQUIRE_THROWS(Codec::decode(frame));
    }

    SECTION("Unknown body tag") {
        ByteBuffer payload;
        Codec::encode_string(payload, "a");
        Codec::encode_u8(payload, 0);
        Codec::encode_string(payload, "n");
        Codec::encode_string(payload, "h:1");
        Codec::encode_string(payload, "b");
        Codec::encode_u8(payload, 0);
        Codec::encode_string(payload, "n");
        Codec::encode_string(payload, "h:1");
        Codec::encode_u8(payload, 0);   // no correlation id
        Codec::encode_u8(payload, 42);  // body tag

        ByteBuffer bad;
        Codec::encode_header(bad, MessageType::Envelope, static_cast<uint32_t>(payload.size()));
        bad.insert(bad.end(), payload.begin(), payload.end());
        REQUIRE_THROWS(Codec::decode(bad));
    }
}
