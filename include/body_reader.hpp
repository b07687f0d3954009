#pragma once

#include "socket_wrapper.hpp"
#include "transport_error.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace gitwire {

// Sequential source of response-body bytes. read() returns 0 at end of body.
class BodyReader {
public:
    virtual ~BodyReader() = default;
    virtual std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) = 0;
};

// Body delimited by Content-Length or, without one, by connection close.
class SocketBodyReader : public BodyReader {
public:
    SocketBodyReader(std::unique_ptr<ISocket> socket, std::optional<size_t> content_length);
    ~SocketBodyReader() override;

    std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) override;

private:
    std::unique_ptr<ISocket> socket_;
    std::optional<size_t> remaining_;
};

// Body already held in memory, e.g. collected by libcurl.
class BufferBodyReader : public BodyReader {
public:
    explicit BufferBodyReader(std::string data);

    std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) override;

private:
    std::string data_;
    size_t offset_ = 0;
};

} // namespace gitwire
