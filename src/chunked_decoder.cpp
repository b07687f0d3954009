#include "chunked_decoder.hpp"
#include "log.hpp"
#include <algorithm>
#include <charconv>

namespace gitwire {

namespace {

TransportErrorInfo chunk_error(std::string message) {
    return TransportErrorInfo{TransportError::ChunkFormatError, std::move(message)};
}

} // namespace

ChunkedDecoder::ChunkedDecoder(std::unique_ptr<ISocket> socket, size_t max_line)
    : socket_(std::move(socket)), max_line_(max_line), state_(AwaitingChunkSize{}) {}

ChunkedDecoder::~ChunkedDecoder() {
    if (socket_) socket_->close();
}

bool ChunkedDecoder::done() const {
    return std::holds_alternative<Done>(state_);
}

std::expected<void, TransportErrorInfo> ChunkedDecoder::read_chunk_size() {
    auto line = socket_->read_until("\n", max_line_);
    if (!line && line.error().error == SocketError::LineTooLong) {
        return std::unexpected(chunk_error("chunk size line exceeds " + std::to_string(max_line_) + " bytes"));
    }
    if (!line) return std::unexpected(chunk_error("failed to read chunk size: " + line.error().message));
    if (line->size() < 2 || (*line)[line->size() - 2] != '\r') {
        return std::unexpected(chunk_error("chunk size line is not terminated by CRLF"));
    }

    // 1a;name=value\r\n
    std::string_view view(*line);
    view.remove_suffix(2);
    auto digits_end = view.find_first_of("; \t");
    auto digits = view.substr(0, digits_end);

    size_t size = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), size, 16);
    if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
        return std::unexpected(chunk_error("invalid chunk size '" + std::string(view) + "'"));
    }

    Log::debug("chunk of " + std::to_string(size) + " bytes");
    if (size == 0) {
        state_ = AwaitingTrailerTerminator{};
    } else {
        state_ = ReadingChunkData{size};
    }
    return {};
}

std::expected<void, TransportErrorInfo> ChunkedDecoder::read_trailer() {
    while (true) {
        auto line = socket_->read_until("\n", max_line_);
        if (!line) return std::unexpected(chunk_error("failed to read chunked trailer: " + line.error().message));
        if (*line == "\r\n") break;
        if (line->size() < 2 || (*line)[line->size() - 2] != '\r') {
            return std::unexpected(chunk_error("malformed chunked trailer"));
        }
    }
    state_ = Done{};
    return {};
}

std::expected<void, TransportErrorInfo> ChunkedDecoder::read_data_terminator() {
    auto line = socket_->read_until("\n", max_line_);
    if (!line) return std::unexpected(chunk_error("failed to read chunk terminator: " + line.error().message));
    if (*line != "\r\n") return std::unexpected(chunk_error("chunk data not followed by CRLF"));
    state_ = AwaitingChunkSize{};
    return {};
}

std::expected<size_t, TransportErrorInfo> ChunkedDecoder::read(std::span<char> buffer) {
    if (buffer.empty()) return 0;

    while (true) {
        if (std::holds_alternative<Done>(state_)) return 0;

        if (std::holds_alternative<AwaitingChunkSize>(state_)) {
            if (auto r = read_chunk_size(); !r) return std::unexpected(r.error());
            continue;
        }

        if (std::holds_alternative<AwaitingTrailerTerminator>(state_)) {
            if (auto r = read_trailer(); !r) return std::unexpected(r.error());
            continue;
        }

        auto& chunk = std::get<ReadingChunkData>(state_);
        auto n = socket_->read(buffer.first(std::min(buffer.size(), chunk.remaining)));
        if (!n) return std::unexpected(chunk_error("failed to read chunk data: " + n.error().message));
        if (*n == 0) return std::unexpected(chunk_error("connection closed inside a chunk"));

        chunk.remaining -= *n;
        if (chunk.remaining == 0) {
            if (auto r = read_data_terminator(); !r) return std::unexpected(r.error());
        }
        return *n;
    }
}

} // namespace gitwire
