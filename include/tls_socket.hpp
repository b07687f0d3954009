#pragma once

#include "socket_wrapper.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace gitwire {

struct TlsOptions {
    bool verify_peer = true;
    std::string ca_file;   // PEM bundle, empty for the system default store
    std::string ca_path;   // hashed certificate directory
};

class TlsSocket : public ISocket {
public:
    TlsSocket();
    explicit TlsSocket(TlsOptions options);
    ~TlsSocket() override;
    
    TlsSocket(TlsSocket&&) noexcept;
    TlsSocket& operator=(TlsSocket&&) noexcept;
    
    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;
    
    std::expected<void, SocketErrorInfo> connect(const std::string& host, uint16_t port) override;
    std::expected<size_t, SocketErrorInfo> write(std::span<const char> data) override;
    std::expected<size_t, SocketErrorInfo> read(std::span<char> buffer) override;
    std::expected<std::string, SocketErrorInfo> read_until(const std::string& delimiter, size_t max_bytes) override;
    
    void set_timeout(int seconds) override;
    void close() override;
    bool is_open() const override;
    
private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace gitwire
