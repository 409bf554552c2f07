#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <span>
#include <chrono>
#include <optional>
#include <tuple>
#include <functional>

namespace troupe {

// Constants
constexpr uint32_t DEFAULT_MAX_FRAME_SIZE = 100 * 1024 * 1024;  // 100MB
constexpr std::chrono::milliseconds DEFAULT_TICK_INTERVAL{1000};
constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{5000};
constexpr std::chrono::milliseconds DEFAULT_EXECUTOR_TICK_INTERVAL{100};

// Time types
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

// Buffer types
using ByteBuffer = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

// Reactor-assigned id of a registered socket or timer
using RegistrationId = uint64_t;

// Node identifier. Ordering is lexicographic on name, then address, and is
// the same on every node.
class NodeId {
public:
    NodeId() = default;
    NodeId(std::string name, std::string address)
        : name_(std::move(name)), address_(std::move(address)) {}

    // Parse "name@host:port"
    static std::optional<NodeId> parse(std::string_view text);

    const std::string& name() const noexcept { return name_; }
    const std::string& address() const noexcept { return address_; }
    bool is_valid() const noexcept { return !name_.empty() && !address_.empty(); }

    bool operator==(const NodeId& other) const noexcept {
        return name_ == other.name_ && address_ == other.address_;
    }
    bool operator!=(const NodeId& other) const noexcept { return !(*this == other); }
    bool operator<(const NodeId& other) const noexcept {
        return std::tie(name_, address_) < std::tie(other.name_, other.address_);
    }

    std::string to_string() const;
    size_t hash() const noexcept;

private:
    std::string name_;
    std::string address_;
};

// Addressable actor or service, routed by its owning node
struct Pid {
    std::string name;
    std::optional<std::string> group;
    NodeId node;

    bool operator==(const Pid& other) const noexcept {
        return name == other.name && group == other.group && node == other.node;
    }
    bool operator!=(const Pid& other) const noexcept { return !(*this == other); }
    bool operator<(const Pid& other) const noexcept {
        return std::tie(name, group, node) < std::tie(other.name, other.group, other.node);
    }

    std::string to_string() const;
};

// Request/response correlator threaded through envelopes
struct CorrelationId {
    std::optional<Pid> pid;
    std::optional<uint64_t> handle;
    std::optional<uint64_t> request;

    static CorrelationId for_pid(Pid pid) {
        CorrelationId cid;
        cid.pid = std::move(pid);
        return cid;
    }

    bool operator==(const CorrelationId& other) const noexcept {
        return pid == other.pid && handle == other.handle && request == other.request;
    }
};

// Error codes
enum class ErrorCode {
    Ok = 0,
    EncodeError,
    DecodeError,
    FrameTooLarge,
    ReadError,
    WriteError,
    RegistrarError,
    ConnectError,
    SendError,
    NetworkError,
    InvalidArgument,
    Shutdown,
    InternalError
};

const char* error_code_string(ErrorCode code);

// Status wrapper
class Status {
public:
    Status() : code_(ErrorCode::Ok) {}
    explicit Status(ErrorCode code, std::string msg = {})
        : code_(code), message_(std::move(msg)) {}

    static Status make_ok() { return Status(); }
    static Status error(ErrorCode code, std::string msg = {}) {
        return Status(code, std::move(msg));
    }
    // Error built from the current errno
    static Status from_errno(ErrorCode code, std::string_view what);

    bool ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_ok() const noexcept { return code_ == ErrorCode::Ok; }
    bool is_error() const noexcept { return code_ != ErrorCode::Ok; }
    explicit operator bool() const noexcept { return is_ok(); }

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
};

}  // namespace troupe

// Hash specializations for standard containers
namespace std {

template<>
struct hash<troupe::NodeId> {
    size_t operator()(const troupe::NodeId& n) const noexcept {
        return n.hash();
    }
};

template<>
struct hash<troupe::Pid> {
    size_t operator()(const troupe::Pid& p) const noexcept {
        size_t h = p.node.hash();
        h ^= std::hash<std::string>{}(p.name) + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
        if (p.group) {
            h ^= std::hash<std::string>{}(*p.group) + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
        }
        return h;
    }
};

}  // namespace std
