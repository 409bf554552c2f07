#pragma once

#include "troupe/types.hpp"
#include "troupe/envelope.hpp"
#include "troupe/members.hpp"
#include <variant>
#include <vector>

namespace troupe::protocol {

// Protocol version
constexpr uint16_t VERSION = 1;
constexpr uint32_t MAGIC = 0x45505254;  // "TRPE"

// Message types
enum class MessageType : uint16_t {
    Members = 0x0001,
    Ping = 0x0002,
    Envelope = 0x0003,
    Delta = 0x0004,
};

// Frame header (fixed size, precedes every payload)
struct MessageHeader {
    uint32_t magic = MAGIC;
    uint16_t version = VERSION;
    uint16_t type = 0;
    uint32_t length = 0;  // Payload length (not including header)

    static constexpr size_t SIZE = 12;
};

// Handshake: who the sender is, plus its full membership state
struct MembersMessage {
    NodeId from;
    MemberState state;
};

// Liveness heartbeat
struct PingMessage {};

// Relayed actor message
struct EnvelopeMessage {
    troupe::Envelope envelope;
};

// Incremental membership update
struct DeltaMessage {
    MemberDelta delta;
};

// Unified peer message type
using PeerMessage = std::variant<
    MembersMessage,
    PingMessage,
    EnvelopeMessage,
    DeltaMessage
>;

bool is_compatible_version(uint16_t remote_version);

// Codec for serialization/deserialization. Decoding throws
// std::runtime_error on malformed or truncated input.
class Codec {
public:
    // Serialize message to a complete frame (header + payload)
    static ByteBuffer encode(const PeerMessage& msg);

    // Deserialize one complete frame
    static PeerMessage decode(ByteView frame);

    // Parse header only (for length-prefixed reading)
    static MessageHeader parse_header(ByteView data);

    // Encoding helpers (public for use by helper functions)
    static void encode_header(ByteBuffer& buf, MessageType type, uint32_t payload_len);
    static void encode_string(ByteBuffer& buf, std::string_view str);
    static void encode_bytes(ByteBuffer& buf, ByteView data);
    static void encode_u8(ByteBuffer& buf, uint8_t v);
    static void encode_u16(ByteBuffer& buf, uint16_t v);
    static void encode_u32(ByteBuffer& buf, uint32_t v);
    static void encode_u64(ByteBuffer& buf, uint64_t v);

    // Decoding helpers (public for use by helper functions)
    static std::string decode_string(ByteView& data);
    static ByteBuffer decode_bytes(ByteView& data);
    static uint8_t decode_u8(ByteView& data);
    static uint16_t decode_u16(ByteView& data);
    static uint32_t decode_u32(ByteView& data);
    static uint64_t decode_u64(ByteView& data);
};

}  // namespace troupe::protocol
