#include "socket_wrapper.hpp"
#include "log.hpp"
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <array>
#include <algorithm>

namespace gitwire {

class Socket::Impl {
public:
    int fd = -1;
    int timeout_sec = 30;
    std::string read_buffer;
    
    ~Impl() { if (fd >= 0) ::close(fd); }
};

Socket::Socket() : pImpl_(std::make_unique<Impl>()) {}
Socket::~Socket() = default;
Socket::Socket(Socket&&) noexcept = default;
Socket& Socket::operator=(Socket&&) noexcept = default;

void Socket::set_timeout(int seconds) {
    pImpl_->timeout_sec = seconds;
}

bool Socket::is_open() const {
    return pImpl_->fd >= 0;
}

void Socket::close() {
    if (pImpl_->fd >= 0) {
        ::close(pImpl_->fd);
        pImpl_->fd = -1;
    }
    pImpl_->read_buffer.clear();
}

int Socket::fd() const {
    return pImpl_->fd;
}

std::expected<void, SocketErrorInfo> Socket::connect(const std::string& host, uint16_t port) {
    addrinfo hints{}, *result = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    
    if (int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result); rc != 0) {
        return std::unexpected(SocketErrorInfo{SocketError::DNSError, 
            "Failed to resolve host " + host + ": " + gai_strerror(rc)});
    }
    
    std::string last_error = "no usable address";
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        
        timeval tv{pImpl_->timeout_sec, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        
        int flag = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
        
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            freeaddrinfo(result);
            pImpl_->fd = fd;
            pImpl_->read_buffer.clear();
            Log::debug("connected to " + host + ":" + std::to_string(port));
            return {};
        }
        last_error = std::strerror(errno);
        ::close(fd);
    }
    
    freeaddrinfo(result);
    return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed,
        "Connection failed to " + host + ":" + std::to_string(port) + ": " + last_error});
}

std::expected<size_t, SocketErrorInfo> Socket::write(std::span<const char> data) {
    if (pImpl_->fd < 0) {
        return std::unexpected(SocketErrorInfo{SocketError::WriteError, "Socket not connected"});
    }
    
    ssize_t sent = ::send(pImpl_->fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent < 0) {
        auto kind = (errno == EAGAIN || errno == EWOULDBLOCK) ? SocketError::TimeoutError : SocketError::WriteError;
        return std::unexpected(SocketErrorInfo{kind, std::string("Write failed: ") + std::strerror(errno)});
    }
    return static_cast<size_t>(sent);
}

std::expected<size_t, SocketErrorInfo> Socket::read(std::span<char> buffer) {
    if (!pImpl_->read_buffer.empty()) {
        size_t to_copy = std::min(buffer.size(), pImpl_->read_buffer.size());
        std::copy_n(pImpl_->read_buffer.begin(), to_copy, buffer.data());
        pImpl_->read_buffer.erase(0, to_copy);
        return to_copy;
    }
    
    if (pImpl_->fd < 0) {
        return std::unexpected(SocketErrorInfo{SocketError::ReadError, "Socket not connected"});
    }
    
    ssize_t received = ::recv(pImpl_->fd, buffer.data(), buffer.size(), 0);
    if (received < 0) {
        auto kind = (errno == EAGAIN || errno == EWOULDBLOCK) ? SocketError::TimeoutError : SocketError::ReadError;
        return std::unexpected(SocketErrorInfo{kind, std::string("Read failed: ") + std::strerror(errno)});
    }
    return static_cast<size_t>(received);
}

std::expected<std::string, SocketErrorInfo> Socket::read_until(const std::string& delim, size_t max_bytes) {
    std::array<char, 4096> temp_buf{};
    
    while (true) {
        if (auto pos = pImpl_->read_buffer.find(delim); pos != std::string::npos) {
            if (pos + delim.length() > max_bytes) return std::unexpected(line_too_long(max_bytes));
            auto result = pImpl_->read_buffer.substr(0, pos + delim.length());
            pImpl_->read_buffer.erase(0, pos + delim.length());
            return result;
        }
        if (pImpl_->read_buffer.size() >= max_bytes) return std::unexpected(line_too_long(max_bytes));
        
        if (pImpl_->fd < 0) {
            return std::unexpected(SocketErrorInfo{SocketError::ReadError, "Socket not connected"});
        }
        ssize_t received = ::recv(pImpl_->fd, temp_buf.data(), temp_buf.size(), 0);
        if (received < 0) {
            return std::unexpected(SocketErrorInfo{SocketError::ReadError, std::string("Read failed: ") + std::strerror(errno)});
        }
        if (received == 0) return std::unexpected(SocketErrorInfo{SocketError::Closed, "Connection closed"});
        pImpl_->read_buffer.append(temp_buf.data(), static_cast<size_t>(received));
    }
}

SocketErrorInfo line_too_long(size_t max_bytes) {
    return SocketErrorInfo{SocketError::LineTooLong, "no delimiter within " + std::to_string(max_bytes) + " bytes"};
}

std::expected<void, SocketErrorInfo> write_all(ISocket& socket, std::span<const char> data) {
    size_t total = 0;
    while (total < data.size()) {
        auto sent = socket.write(data.subspan(total));
        if (!sent) return std::unexpected(sent.error());
        if (*sent == 0) return std::unexpected(SocketErrorInfo{SocketError::WriteError, "Connection closed during write"});
        total += *sent;
    }
    return {};
}

} // namespace gitwire
