#pragma once

#include "troupe/types.hpp"
#include <optional>
#include <string>
#include <string_view>

struct sockaddr_in;

namespace troupe {

// IPv4 endpoint parsed from "host:port"
struct SocketAddress {
    std::string host;
    uint16_t port = 0;

    static std::optional<SocketAddress> parse(std::string_view text);

    // Resolve host to an IPv4 sockaddr
    Status resolve(sockaddr_in& out) const;

    std::string to_string() const;
};

// Owning non-blocking TCP stream socket
class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(int fd) : fd_(fd) {}
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    // Start a non-blocking connect. The socket becomes writable once the
    // connect finishes; check take_error() then.
    static Status connect(const SocketAddress& addr, TcpSocket& out);

    // Pending SO_ERROR of an in-progress connect
    Status take_error() const;

    int fd() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    void close();

private:
    int fd_ = -1;
};

// Owning non-blocking TCP listener
class TcpListener {
public:
    TcpListener() = default;
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;
    TcpListener(TcpListener&& other) noexcept;
    TcpListener& operator=(TcpListener&& other) noexcept;

    static Status bind(const SocketAddress& addr, TcpListener& out);

    // Accept one pending connection. `out` stays empty when none is waiting.
    Status accept(std::optional<TcpSocket>& out);

    int fd() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    uint16_t local_port() const;
    void close();

private:
    int fd_ = -1;
};

// Set O_NONBLOCK on fd
Status set_nonblocking(int fd);

}  // namespace troupe
