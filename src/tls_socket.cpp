#include "tls_socket.hpp"
#include "log.hpp"
#include <openssl/x509v3.h>
#include <array>
#include <algorithm>

namespace gitwire {

namespace {

std::string last_ssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    std::array<char, 256> buf{};
    ERR_error_string_n(code, buf.data(), buf.size());
    ERR_clear_error();
    return buf.data();
}

} // namespace

class TlsSocket::Impl {
public:
    Socket socket;
    TlsOptions options;
    SSL_CTX* ctx = nullptr;
    SSL* ssl = nullptr;
    std::string read_buffer;
    
    explicit Impl(TlsOptions opts) : options(std::move(opts)) {
        OPENSSL_init_ssl(0, nullptr);
        ctx = SSL_CTX_new(TLS_client_method());
    }
    
    ~Impl() {
        if (ssl) SSL_free(ssl);
        if (ctx) SSL_CTX_free(ctx);
    }

    std::expected<void, SocketErrorInfo> load_trust() {
        if (!options.verify_peer) {
            SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
            return {};
        }
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        if (options.ca_file.empty() && options.ca_path.empty()) {
            if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
                return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed,
                    "Failed to load default trust store: " + last_ssl_error()});
            }
            return {};
        }
        const char* file = options.ca_file.empty() ? nullptr : options.ca_file.c_str();
        const char* path = options.ca_path.empty() ? nullptr : options.ca_path.c_str();
        if (SSL_CTX_load_verify_locations(ctx, file, path) != 1) {
            return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed,
                "Failed to load trust roots: " + last_ssl_error()});
        }
        return {};
    }
};

TlsSocket::TlsSocket() : TlsSocket(TlsOptions{}) {}
TlsSocket::TlsSocket(TlsOptions options) : pImpl_(std::make_unique<Impl>(std::move(options))) {}
TlsSocket::~TlsSocket() = default;
TlsSocket::TlsSocket(TlsSocket&&) noexcept = default;
TlsSocket& TlsSocket::operator=(TlsSocket&&) noexcept = default;

void TlsSocket::set_timeout(int seconds) {
    pImpl_->socket.set_timeout(seconds);
}

bool TlsSocket::is_open() const {
    return pImpl_->ssl != nullptr && pImpl_->socket.is_open();
}

void TlsSocket::close() {
    if (pImpl_->ssl) {
        SSL_shutdown(pImpl_->ssl);
        SSL_free(pImpl_->ssl);
        pImpl_->ssl = nullptr;
    }
    pImpl_->read_buffer.clear();
    pImpl_->socket.close();
}

std::expected<void, SocketErrorInfo> TlsSocket::connect(const std::string& host, uint16_t port) {
    if (!pImpl_->ctx) {
        return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed, "Failed to create TLS context"});
    }
    if (auto trust = pImpl_->load_trust(); !trust) return trust;
    
    auto conn = pImpl_->socket.connect(host, port);
    if (!conn) return conn;
    
    pImpl_->ssl = SSL_new(pImpl_->ctx);
    SSL_set_fd(pImpl_->ssl, pImpl_->socket.fd());
    SSL_set_tlsext_host_name(pImpl_->ssl, host.c_str());
    if (pImpl_->options.verify_peer) {
        SSL_set_hostflags(pImpl_->ssl, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
        SSL_set1_host(pImpl_->ssl, host.c_str());
    }
    
    if (SSL_connect(pImpl_->ssl) <= 0) {
        std::string reason = last_ssl_error();
        if (long verify = SSL_get_verify_result(pImpl_->ssl); verify != X509_V_OK) {
            reason = X509_verify_cert_error_string(verify);
        }
        Log::debug("TLS handshake with " + host + " failed: " + reason);
        close();
        return std::unexpected(SocketErrorInfo{SocketError::ConnectionFailed, "TLS handshake failed: " + reason});
    }
    
    return {};
}

std::expected<size_t, SocketErrorInfo> TlsSocket::write(std::span<const char> data) {
    if (!pImpl_->ssl) {
        return std::unexpected(SocketErrorInfo{SocketError::WriteError, "TLS not connected"});
    }
    
    int sent = SSL_write(pImpl_->ssl, data.data(), static_cast<int>(data.size()));
    if (sent <= 0) {
        return std::unexpected(SocketErrorInfo{SocketError::WriteError, 
            "TLS write failed: " + std::to_string(SSL_get_error(pImpl_->ssl, sent))});
    }
    return static_cast<size_t>(sent);
}

std::expected<size_t, SocketErrorInfo> TlsSocket::read(std::span<char> buffer) {
    if (!pImpl_->read_buffer.empty()) {
        size_t to_copy = std::min(buffer.size(), pImpl_->read_buffer.size());
        std::copy_n(pImpl_->read_buffer.begin(), to_copy, buffer.data());
        pImpl_->read_buffer.erase(0, to_copy);
        return to_copy;
    }
    
    if (!pImpl_->ssl) {
        return std::unexpected(SocketErrorInfo{SocketError::ReadError, "TLS not connected"});
    }
    
    int received = SSL_read(pImpl_->ssl, buffer.data(), static_cast<int>(buffer.size()));
    if (received <= 0) {
        int err = SSL_get_error(pImpl_->ssl, received);
        if (err == SSL_ERROR_ZERO_RETURN) return 0;
        // HTTP/1.0 servers commonly drop the connection without a close_notify.
        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) return 0;
        if (err == SSL_ERROR_SSL) {
            return std::unexpected(SocketErrorInfo{SocketError::ReadError, "TLS read failed: " + last_ssl_error()});
        }
        return std::unexpected(SocketErrorInfo{SocketError::ReadError, 
            "TLS read failed: " + std::to_string(err)});
    }
    return static_cast<size_t>(received);
}

std::expected<std::string, SocketErrorInfo> TlsSocket::read_until(const std::string& delim, size_t max_bytes) {
    std::array<char, 4096> temp_buf{};
    
    while (true) {
        if (auto pos = pImpl_->read_buffer.find(delim); pos != std::string::npos) {
            if (pos + delim.length() > max_bytes) return std::unexpected(line_too_long(max_bytes));
            auto result = pImpl_->read_buffer.substr(0, pos + delim.length());
            pImpl_->read_buffer.erase(0, pos + delim.length());
            return result;
        }
        if (pImpl_->read_buffer.size() >= max_bytes) return std::unexpected(line_too_long(max_bytes));
        
        if (!pImpl_->ssl) {
            return std::unexpected(SocketErrorInfo{SocketError::ReadError, "TLS not connected"});
        }
        int received = SSL_read(pImpl_->ssl, temp_buf.data(), static_cast<int>(temp_buf.size()));
        if (received <= 0) {
            int err = SSL_get_error(pImpl_->ssl, received);
            if (err == SSL_ERROR_ZERO_RETURN || (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)) {
                return std::unexpected(SocketErrorInfo{SocketError::Closed, "Connection closed"});
            }
            return std::unexpected(SocketErrorInfo{SocketError::ReadError, "TLS read failed: " + std::to_string(err)});
        }
        pImpl_->read_buffer.append(temp_buf.data(), static_cast<size_t>(received));
    }
}

} // namespace gitwire
