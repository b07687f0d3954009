#pragma once

#include "body_reader.hpp"
#include <variant>

namespace gitwire {

// Decodes chunked transfer coding (RFC 7230 section 4.1) on demand from the
// connection. Chunk extensions are ignored and trailer fields are discarded.
class ChunkedDecoder : public BodyReader {
public:
    explicit ChunkedDecoder(std::unique_ptr<ISocket> socket, size_t max_line = 64 * 1024);
    ~ChunkedDecoder() override;

    std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) override;

    bool done() const;

private:
    struct AwaitingChunkSize {};
    struct ReadingChunkData { size_t remaining; };
    struct AwaitingTrailerTerminator {};
    struct Done {};
    using State = std::variant<AwaitingChunkSize, ReadingChunkData, AwaitingTrailerTerminator, Done>;

    std::expected<void, TransportErrorInfo> read_chunk_size();
    std::expected<void, TransportErrorInfo> read_trailer();
    std::expected<void, TransportErrorInfo> read_data_terminator();

    std::unique_ptr<ISocket> socket_;
    size_t max_line_;
    State state_;
};

} // namespace gitwire
