#include "troupe/types.hpp"
#include <xxhash.h>
#include <cerrno>
#include <cstring>

namespace troupe {

// NodeId implementation
std::optional<NodeId> NodeId::parse(std::string_view text) {
    auto at = text.find('@');
    if (at == std::string_view::npos || text.find('@', at + 1) != std::string_view::npos) {
        return std::nullopt;
    }

    auto name = text.substr(0, at);
    auto address = text.substr(at + 1);
    if (name.empty() || address.empty()) {
        return std::nullopt;
    }
    return NodeId(std::string(name), std::string(address));
}

std::string NodeId::to_string() const {
    return name_ + "@" + address_;
}

size_t NodeId::hash() const noexcept {
    // Hash name and address separately so "a@bc" and "ab@c" differ
    XXH64_hash_t seed = XXH3_64bits(name_.data(), name_.size());
    return static_cast<size_t>(XXH3_64bits_withSeed(address_.data(), address_.size(), seed));
}

// Pid implementation
std::string Pid::to_string() const {
    if (group) {
        return *group + "::" + name + "::" + node.to_string();
    }
    return name + "::" + node.to_string();
}

// Status helpers
const char* error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::EncodeError: return "Encode error";
        case ErrorCode::DecodeError: return "Decode error";
        case ErrorCode::FrameTooLarge: return "Frame too large";
        case ErrorCode::ReadError: return "Read error";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::RegistrarError: return "Registrar error";
        case ErrorCode::ConnectError: return "Connect error";
        case ErrorCode::SendError: return "Send error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::Shutdown: return "Shutdown";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

Status Status::from_errno(ErrorCode code, std::string_view what) {
    int err = errno;
    return Status(code, std::string(what) + ": " + std::strerror(err));
}

std::string Status::to_string() const {
    if (message_.empty()) {
        return error_code_string(code_);
    }
    return std::string(error_code_string(code_)) + ": " + message_;
}

}  // namespace troupe
