#include "troupe/protocol.hpp"
#include <cstring>
#include <stdexcept>

namespace troupe::protocol {

bool is_compatible_version(uint16_t remote_version) {
    // For now, only exact match
    return remote_version == VERSION;
}

// Encoding helpers
void Codec::encode_header(ByteBuffer& buf, MessageType type, uint32_t payload_len) {
    encode_u32(buf, MAGIC);
    encode_u16(buf, VERSION);
    encode_u16(buf, static_cast<uint16_t>(type));
    encode_u32(buf, payload_len);
}

void Codec::encode_string(ByteBuffer& buf, std::string_view str) {
    encode_u32(buf, static_cast<uint32_t>(str.size()));
    buf.insert(buf.end(), str.begin(), str.end());
}

void Codec::encode_bytes(ByteBuffer& buf, ByteView data) {
    encode_u32(buf, static_cast<uint32_t>(data.size()));
    buf.insert(buf.end(), data.begin(), data.end());
}

void Codec::encode_u8(ByteBuffer& buf, uint8_t v) {
    buf.push_back(v);
}

void Codec::encode_u16(ByteBuffer& buf, uint16_t v) {
    buf.push_back(v & 0xFF);
    buf.push_back((v >> 8) & 0xFF);
}

void Codec::encode_u32(ByteBuffer& buf, uint32_t v) {
    buf.push_back(v & 0xFF);
    buf.push_back((v >> 8) & 0xFF);
    buf.push_back((v >> 16) & 0xFF);
    buf.push_back((v >> 24) & 0xFF);
}

void Codec::encode_u64(ByteBuffer& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back((v >> (i * 8)) & 0xFF);
    }
}

// Decoding helpers
std::string Codec::decode_string(ByteView& data) {
    uint32_t len = decode_u32(data);
    if (data.size() < len) {
        throw std::runtime_error("Truncated string");
    }
    std::string result(reinterpret_cast<const char*>(data.data()), len);
    data = data.subspan(len);
    return result;
}

ByteBuffer Codec::decode_bytes(ByteView& data) {
    uint32_t len = decode_u32(data);
    if (data.size() < len) {
        throw std::runtime_error("Truncated bytes");
    }
    ByteBuffer result(data.begin(), data.begin() + len);
    data = data.subspan(len);
    return result;
}

uint8_t Codec::decode_u8(ByteView& data) {
    if (data.empty()) throw std::runtime_error("Truncated u8");
    uint8_t v = data[0];
    data = data.subspan(1);
    return v;
}

uint16_t Codec::decode_u16(ByteView& data) {
    if (data.size() < 2) throw std::runtime_error("Truncated u16");
    uint16_t v = data[0] | (static_cast<uint16_t>(data[1]) << 8);
    data = data.subspan(2);
    return v;
}

uint32_t Codec::decode_u32(ByteView& data) {
    if (data.size() < 4) throw std::runtime_error("Truncated u32");
    uint32_t v = data[0] |
                 (static_cast<uint32_t>(data[1]) << 8) |
                 (static_cast<uint32_t>(data[2]) << 16) |
                 (static_cast<uint32_t>(data[3]) << 24);
    data = data.subspan(4);
    return v;
}

uint64_t Codec::decode_u64(ByteView& data) {
    if (data.size() < 8) throw std::runtime_error("Truncated u64");
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(data[i]) << (i * 8);
    }
    data = data.subspan(8);
    return v;
}

MessageHeader Codec::parse_header(ByteView data) {
    if (data.size() < MessageHeader::SIZE) {
        throw std::runtime_error("Truncated header");
    }

    MessageHeader hdr;
    hdr.magic = decode_u32(data);
    hdr.version = decode_u16(data);
    hdr.type = decode_u16(data);
    hdr.length = decode_u32(data);

    if (hdr.magic != MAGIC) {
        throw std::runtime_error("Invalid magic number");
    }
    if (!is_compatible_version(hdr.version)) {
        throw std::runtime_error("Unsupported protocol version " + std::to_string(hdr.version));
    }

    return hdr;
}

namespace {

// Identifier helpers

void encode_node_id(ByteBuffer& buf, const NodeId& node) {
    Codec::encode_string(buf, node.name());
    Codec::encode_string(buf, node.address());
}

NodeId decode_node_id(ByteView& data) {
    auto name = Codec::decode_string(data);
    auto address = Codec::decode_string(data);
    return NodeId(std::move(name), std::move(address));
}

void encode_pid(ByteBuffer& buf, const Pid& pid) {
    Codec::encode_string(buf, pid.name);
    Codec::encode_u8(buf, pid.group.has_value() ? 1 : 0);
    if (pid.group) {
        Codec::encode_string(buf, *pid.group);
    }
    encode_node_id(buf, pid.node);
}

Pid decode_pid(ByteView& data) {
    Pid pid;
    pid.name = Codec::decode_string(data);
    if (Codec::decode_u8(data) != 0) {
        pid.group = Codec::decode_string(data);
    }
    pid.node = decode_node_id(data);
    return pid;
}

// Bit flags for the optional CorrelationId fields
constexpr uint8_t CID_PID = 0x01;
constexpr uint8_t CID_HANDLE = 0x02;
constexpr uint8_t CID_REQUEST = 0x04;

void encode_correlation_id(ByteBuffer& buf, const CorrelationId& cid) {
    uint8_t flags = 0;
    if (cid.pid) flags |= CID_PID;
    if (cid.handle) flags |= CID_HANDLE;
    if (cid.request) flags |= CID_REQUEST;
    Codec::encode_u8(buf, flags);
    if (cid.pid) encode_pid(buf, *cid.pid);
    if (cid.handle) Codec::encode_u64(buf, *cid.handle);
    if (cid.request) Codec::encode_u64(buf, *cid.request);
}

CorrelationId decode_correlation_id(ByteView& data) {
    CorrelationId cid;
    uint8_t flags = Codec::decode_u8(data);
    if (flags & ~(CID_PID | CID_HANDLE | CID_REQUEST)) {
        throw std::runtime_error("Invalid correlation id flags");
    }
    if (flags & CID_PID) cid.pid = decode_pid(data);
    if (flags & CID_HANDLE) cid.handle = Codec::decode_u64(data);
    if (flags & CID_REQUEST) cid.request = Codec::decode_u64(data);
    return cid;
}

void encode_node_list(ByteBuffer& buf, const std::vector<NodeId>& nodes) {
    Codec::encode_u32(buf, static_cast<uint32_t>(nodes.size()));
    for (const auto& node : nodes) {
        encode_node_id(buf, node);
    }
}

std::vector<NodeId> decode_node_list(ByteView& data) {
    std::vector<NodeId> nodes;
    uint32_t count = Codec::decode_u32(data);
    for (uint32_t i = 0; i < count; ++i) {
        nodes.push_back(decode_node_id(data));
    }
    return nodes;
}

// Envelope body, tagged with its variant index

enum class BodyTag : uint8_t {
    User = 0,
    GetMetrics = 1,
    Metrics = 2,
    ClusterStatus = 3,
};

void encode_body(ByteBuffer& buf, const Msg& body) {
    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, UserMsg>) {
            Codec::encode_u8(buf, static_cast<uint8_t>(BodyTag::User));
            Codec::encode_bytes(buf, m.data);
        }
        else if constexpr (std::is_same_v<T, GetMetrics>) {
            Codec::encode_u8(buf, static_cast<uint8_t>(BodyTag::GetMetrics));
        }
        else if constexpr (std::is_same_v<T, MetricsReply>) {
            Codec::encode_u8(buf, static_cast<uint8_t>(BodyTag::Metrics));
            Codec::encode_u32(buf, static_cast<uint32_t>(m.metrics.size()));
            for (const auto& metric : m.metrics) {
                Codec::encode_string(buf, metric.name);
                Codec::encode_u8(buf, metric.kind);
                Codec::encode_u64(buf, metric.value);
            }
        }
        else if constexpr (std::is_same_v<T, ClusterStatus>) {
            Codec::encode_u8(buf, static_cast<uint8_t>(BodyTag::ClusterStatus));
            encode_node_list(buf, m.members);
            encode_node_list(buf, m.established);
            Codec::encode_u64(buf, m.num_connections);
        }
    }, body);
}

Msg decode_body(ByteView& data) {
    auto tag = static_cast<BodyTag>(Codec::decode_u8(data));
    switch (tag) {
        case BodyTag::User: {
            UserMsg m;
            m.data = Codec::decode_bytes(data);
            return m;
        }

        case BodyTag::GetMetrics:
            return GetMetrics{};

        case BodyTag::Metrics: {
            MetricsReply m;
            uint32_t count = Codec::decode_u32(data);
            for (uint32_t i = 0; i < count; ++i) {
                Metric metric;
                metric.name = Codec::decode_string(data);
                uint8_t kind = Codec::decode_u8(data);
                if (kind > Metric::Gauge) {
                    throw std::runtime_error("Unknown metric kind");
                }
                metric.kind = static_cast<Metric::Kind>(kind);
                metric.value = Codec::decode_u64(data);
                m.metrics.push_back(std::move(metric));
            }
            return m;
        }

        case BodyTag::ClusterStatus: {
            ClusterStatus m;
            m.members = decode_node_list(data);
            m.established = decode_node_list(data);
            m.num_connections = Codec::decode_u64(data);
            return m;
        }

        default:
            throw std::runtime_error("Unknown envelope body tag");
    }
}

void encode_envelope(ByteBuffer& buf, const Envelope& env) {
    encode_pid(buf, env.to);
    encode_pid(buf, env.from);
    Codec::encode_u8(buf, env.correlation_id.has_value() ? 1 : 0);
    if (env.correlation_id) {
        encode_correlation_id(buf, *env.correlation_id);
    }
    encode_body(buf, env.body);
}

Envelope decode_envelope(ByteView& data) {
    Envelope env;
    env.to = decode_pid(data);
    env.from = decode_pid(data);
    if (Codec::decode_u8(data) != 0) {
        env.correlation_id = decode_correlation_id(data);
    }
    env.body = decode_body(data);
    return env;
}

// Membership state: per element, its dots

void encode_dot_map(ByteBuffer& buf, const std::map<NodeId, MemberSet::DotSet>& entries) {
    Codec::encode_u32(buf, static_cast<uint32_t>(entries.size()));
    for (const auto& [node, dots] : entries) {
        encode_node_id(buf, node);
        Codec::encode_u32(buf, static_cast<uint32_t>(dots.size()));
        for (const auto& dot : dots) {
            Codec::encode_string(buf, dot.actor);
            Codec::encode_u64(buf, dot.counter);
        }
    }
}

std::map<NodeId, MemberSet::DotSet> decode_dot_map(ByteView& data) {
    std::map<NodeId, MemberSet::DotSet> entries;
    uint32_t count = Codec::decode_u32(data);
    for (uint32_t i = 0; i < count; ++i) {
        auto node = decode_node_id(data);
        auto& dots = entries[node];
        uint32_t dot_count = Codec::decode_u32(data);
        for (uint32_t j = 0; j < dot_count; ++j) {
            MemberSet::DotType dot;
            dot.actor = Codec::decode_string(data);
            dot.counter = Codec::decode_u64(data);
            dots.insert(std::move(dot));
        }
    }
    return entries;
}

void encode_member_state(ByteBuffer& buf, const MemberState& state) {
    encode_dot_map(buf, state.adds);
    encode_dot_map(buf, state.removes);
}

MemberState decode_member_state(ByteView& data) {
    MemberState state;
    state.adds = decode_dot_map(data);
    state.removes = decode_dot_map(data);
    return state;
}

}  // namespace

ByteBuffer Codec::encode(const PeerMessage& msg) {
    ByteBuffer payload;
    MessageType type;

    std::visit([&](const auto& m) {
        using T = std::decay_t<decltype(m)>;

        if constexpr (std::is_same_v<T, MembersMessage>) {
            type = MessageType::Members;
            encode_node_id(payload, m.from);
            encode_member_state(payload, m.state);
        }
        else if constexpr (std::is_same_v<T, PingMessage>) {
            type = MessageType::Ping;
        }
        else if constexpr (std::is_same_v<T, EnvelopeMessage>) {
            type = MessageType::Envelope;
            encode_envelope(payload, m.envelope);
        }
        else if constexpr (std::is_same_v<T, DeltaMessage>) {
            type = MessageType::Delta;
            encode_member_state(payload, m.delta);
        }
    }, msg);

    ByteBuffer result;
    result.reserve(MessageHeader::SIZE + payload.size());
    encode_header(result, type, static_cast<uint32_t>(payload.size()));
    result.insert(result.end(), payload.begin(), payload.end());

    return result;
}

PeerMessage Codec::decode(ByteView frame) {
    auto header = parse_header(frame);
    auto data = frame.subspan(MessageHeader::SIZE);
    if (data.size() != header.length) {
        throw std::runtime_error("Frame length mismatch");
    }

    PeerMessage msg;

    switch (static_cast<MessageType>(header.type)) {
        case MessageType::Members: {
            MembersMessage m;
            m.from = decode_node_id(data);
            m.state = decode_member_state(data);
            msg = std::move(m);
            break;
        }

        case MessageType::Ping:
            msg = PingMessage{};
            break;

        case MessageType::Envelope: {
            EnvelopeMessage m;
            m.envelope = decode_envelope(data);
            msg = std::move(m);
            break;
        }

        case MessageType::Delta: {
            DeltaMessage m;
            m.delta = decode_member_state(data);
            msg = std::move(m);
            break;
        }

        default:
            throw std::runtime_error("Unknown message type");
    }

    if (!data.empty()) {
        throw std::runtime_error("Trailing bytes after message");
    }

    return msg;
}

}  // namespace troupe::protocol
