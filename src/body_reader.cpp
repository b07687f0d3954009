#include "body_reader.hpp"
#include <algorithm>

namespace gitwire {

SocketBodyReader::SocketBodyReader(std::unique_ptr<ISocket> socket, std::optional<size_t> content_length)
    : socket_(std::move(socket)), remaining_(content_length) {}

SocketBodyReader::~SocketBodyReader() {
    if (socket_) socket_->close();
}

std::expected<size_t, TransportErrorInfo> SocketBodyReader::read(std::span<char> buffer) {
    if (buffer.empty()) return 0;
    if (remaining_) {
        if (*remaining_ == 0) return 0;
        buffer = buffer.first(std::min(buffer.size(), *remaining_));
    }
    auto n = socket_->read(buffer);
    if (!n) {
        return std::unexpected(TransportErrorInfo{TransportError::IoError, "failed to read body: " + n.error().message});
    }
    if (remaining_) {
        if (*n == 0) {
            return std::unexpected(TransportErrorInfo{TransportError::IoError,
                "connection closed with " + std::to_string(*remaining_) + " body bytes outstanding"});
        }
        *remaining_ -= *n;
    }
    return *n;
}

BufferBodyReader::BufferBodyReader(std::string data) : data_(std::move(data)) {}

std::expected<size_t, TransportErrorInfo> BufferBodyReader::read(std::span<char> buffer) {
    size_t to_copy = std::min(buffer.size(), data_.size() - offset_);
    std::copy_n(data_.data() + offset_, to_copy, buffer.data());
    offset_ += to_copy;
    return to_copy;
}

} // namespace gitwire
