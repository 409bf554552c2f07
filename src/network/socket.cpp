#include "troupe/socket.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace troupe {

Status set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return Status::from_errno(ErrorCode::NetworkError, "fcntl(O_NONBLOCK)");
    }
    return Status::make_ok();
}

// SocketAddress

std::optional<SocketAddress> SocketAddress::parse(std::string_view text) {
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
        return std::nullopt;
    }

    auto port_text = text.substr(colon + 1);
    uint32_t port = 0;
    for (char c : port_text) {
        if (c < '0' || c > '9') return std::nullopt;
        port = port * 10 + static_cast<uint32_t>(c - '0');
        if (port > 65535) return std::nullopt;
    }

    SocketAddress addr;
    addr.host = std::string(text.substr(0, colon));
    addr.port = static_cast<uint16_t>(port);
    return addr;
}

Status SocketAddress::resolve(sockaddr_in& out) const {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) {
        return Status::make_ok();
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        return Status::error(ErrorCode::InvalidArgument,
            "Cannot resolve " + host + ": " + gai_strerror(rc));
    }
    out.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return Status::make_ok();
}

std::string SocketAddress::to_string() const {
    return host + ":" + std::to_string(port);
}

// TcpSocket

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : fd_(other.fd_)
{
    other.fd_ = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Status TcpSocket::connect(const SocketAddress& addr, TcpSocket& out) {
    sockaddr_in sa;
    auto status = addr.resolve(sa);
    if (!status) return status;

    TcpSocket sock(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        return Status::from_errno(ErrorCode::ConnectError, "socket");
    }

    int one = 1;
    setsockopt(sock.fd(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    if (::connect(sock.fd(), reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) < 0 &&
        errno != EINPROGRESS) {
        return Status::from_errno(ErrorCode::ConnectError, "connect to " + addr.to_string());
    }

    out = std::move(sock);
    return Status::make_ok();
}

Status TcpSocket::take_error() const {
    int err = 0;
    socklen_t len = sizeof(err);
    if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return Status::from_errno(ErrorCode::ConnectError, "getsockopt(SO_ERROR)");
    }
    if (err != 0) {
        return Status::error(ErrorCode::ConnectError, std::strerror(err));
    }
    return Status::make_ok();
}

void TcpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// TcpListener

TcpListener::~TcpListener() {
    close();
}

TcpListener::TcpListener(TcpListener&& other) noexcept
    : fd_(other.fd_)
{
    other.fd_ = -1;
}

TcpListener& TcpListener::operator=(TcpListener&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Status TcpListener::bind(const SocketAddress& addr, TcpListener& out) {
    sockaddr_in sa;
    auto status = addr.resolve(sa);
    if (!status) return status;

    TcpListener listener;
    listener.fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listener.fd_ < 0) {
        return Status::from_errno(ErrorCode::NetworkError, "socket");
    }

    int one = 1;
    setsockopt(listener.fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(listener.fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) < 0) {
        return Status::from_errno(ErrorCode::NetworkError, "bind " + addr.to_string());
    }
    if (::listen(listener.fd_, SOMAXCONN) < 0) {
        return Status::from_errno(ErrorCode::NetworkError, "listen");
    }

    out = std::move(listener);
    return Status::make_ok();
}

Status TcpListener::accept(std::optional<TcpSocket>& out) {
    out.reset();
    while (true) {
        int fd = ::accept4(fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd >= 0) {
            int one = 1;
            setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            out.emplace(fd);
            return Status::make_ok();
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return Status::make_ok();
        }
        return Status::from_errno(ErrorCode::NetworkError, "accept");
    }
}

uint16_t TcpListener::local_port() const {
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&sa), &len) < 0) {
        return 0;
    }
    return ntohs(sa.sin_port);
}

void TcpListener::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace troupe
