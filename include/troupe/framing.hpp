#pragma once

#include "troupe/types.hpp"
#include "troupe/protocol.hpp"
#include <vector>

namespace troupe {

// Accumulates bytes from a non-blocking socket and cuts them into frames.
// A frame whose declared payload exceeds max_frame_size is rejected before
// its payload is buffered.
class FrameReader {
public:
    explicit FrameReader(uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

    // Read until the socket would block, decoding complete frames into `out`
    // as they arrive. Frames decoded before an error are still delivered.
    // Reading stops at the first bad header. Peer close is reported as ReadError.
    Status read(int fd, std::vector<protocol::PeerMessage>& out);

    // Append raw bytes
    void feed(ByteView data);

    // Decode all complete frames buffered so far
    Status decode(std::vector<protocol::PeerMessage>& out);

    size_t buffered() const noexcept { return buffer_.size(); }
    uint32_t max_frame_size() const noexcept { return max_frame_size_; }

private:
    uint32_t max_frame_size_;
    ByteBuffer buffer_;
};

// Queue of encoded frames waiting for write readiness
class FrameWriter {
public:
    FrameWriter() = default;

    // Encode and enqueue a message
    Status push(const protocol::PeerMessage& msg);

    // Enqueue an already encoded frame
    void push_frame(const ByteBuffer& frame);

    // Write until drained or the socket would block
    Status flush(int fd);

    bool pending() const noexcept { return offset_ < buffer_.size(); }
    size_t pending_bytes() const noexcept { return buffer_.size() - offset_; }

private:
    ByteBuffer buffer_;
    size_t offset_ = 0;
};

}  // namespace troupe
