#include "troupe/framing.hpp"
#include <cerrno>
#include <stdexcept>
#include <sys/socket.h>

namespace troupe {

namespace {

constexpr size_t READ_CHUNK = 64 * 1024;

}  // namespace

// FrameReader

FrameReader::FrameReader(uint32_t max_frame_size)
    : max_frame_size_(max_frame_size)
{
    buffer_.reserve(READ_CHUNK);
}

Status FrameReader::read(int fd, std::vector<protocol::PeerMessage>& out) {
    uint8_t chunk[READ_CHUNK];

    // Decode after every chunk: at most one chunk past the current frame is buffered
    while (true) {
        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer_.insert(buffer_.end(), chunk, chunk + n);
            auto status = decode(out);
            if (!status) {
                return status;
            }
            continue;
        }
        if (n == 0) {
            return Status::error(ErrorCode::ReadError, "Connection closed by peer");
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return Status::make_ok();
        }
        return Status::from_errno(ErrorCode::ReadError, "recv");
    }
}

void FrameReader::feed(ByteView data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

Status FrameReader::decode(std::vector<protocol::PeerMessage>& out) {
    size_t consumed = 0;
    Status status;

    while (buffer_.size() - consumed >= protocol::MessageHeader::SIZE) {
        ByteView rest(buffer_.data() + consumed, buffer_.size() - consumed);

        protocol::MessageHeader header;
        try {
            header = protocol::Codec::parse_header(rest);
        } catch (const std::exception& e) {
            status = Status::error(ErrorCode::DecodeError, e.what());
            break;
        }

        if (header.length > max_frame_size_) {
            status = Status::error(ErrorCode::FrameTooLarge,
                "Frame of " + std::to_string(header.length) +
                " bytes exceeds limit of " + std::to_string(max_frame_size_));
            break;
        }

        size_t frame_size = protocol::MessageHeader::SIZE + header.length;
        if (rest.size() < frame_size) {
            break;  // wait for the rest of the payload
        }

        try {
            out.push_back(protocol::Codec::decode(rest.first(frame_size)));
        } catch (const std::exception& e) {
            status = Status::error(ErrorCode::DecodeError, e.what());
            break;
        }
        consumed += frame_size;
    }

    buffer_.erase(buffer_.begin(), buffer_.begin() + consumed);
    return status;
}

// FrameWriter

Status FrameWriter::push(const protocol::PeerMessage& msg) {
    try {
        push_frame(protocol::Codec::encode(msg));
    } catch (const std::exception& e) {
        return Status::error(ErrorCode::EncodeError, e.what());
    }
    return Status::make_ok();
}

void FrameWriter::push_frame(const ByteBuffer& frame) {
    if (offset_ == buffer_.size()) {
        buffer_.clear();
        offset_ = 0;
    }
    buffer_.insert(buffer_.end(), frame.begin(), frame.end());
}

Status FrameWriter::flush(int fd) {
    while (offset_ < buffer_.size()) {
        ssize_t n = ::send(fd, buffer_.data() + offset_, buffer_.size() - offset_, MSG_NOSIGNAL);
        if (n > 0) {
            offset_ += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return Status::make_ok();
        }
        return Status::from_errno(ErrorCode::WriteError, "send");
    }

    buffer_.clear();
    offset_ = 0;
    return Status::make_ok();
}

}  // namespace troupe
