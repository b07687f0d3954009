#include "chunked_decoder.hpp"
#include "test_support.hpp"
#include <cassert>
#include <iostream>

using namespace gitwire;
using namespace gitwire::test;

namespace {

void decodes_wikipedia() {
    ChunkedDecoder decoder(memory_socket("4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n"));
    std::string out = drain(decoder, 3);
    assert(out == "Wikipedia");
    assert(out.size() == 9);
    assert(decoder.done());

    char buf[4];
    auto again = decoder.read(buf);
    assert(again && *again == 0);
}

void never_crosses_chunk_boundary() {
    ChunkedDecoder decoder(memory_socket("4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n", 64));
    char buf[64];
    auto first = decoder.read(buf);
    assert(first && *first == 4);
    assert(std::string(buf, 4) == "Wiki");
    auto second = decoder.read(buf);
    assert(second && *second == 5);
    assert(std::string(buf, 5) == "pedia");
    auto end = decoder.read(buf);
    assert(end && *end == 0);
}

void accepts_extensions_trailers_and_hex_case() {
    ChunkedDecoder decoder(memory_socket("A;name=value\r\n0123456789\r\n1a\r\nabcdefghijklmnopqrstuvwxyz\r\n0\r\nX-Checksum: 1\r\n\r\n"));
    assert(drain(decoder) == "0123456789abcdefghijklmnopqrstuvwxyz");
    assert(decoder.done());
}

void rejects_bad_size_line() {
    ChunkedDecoder decoder(memory_socket("zz\r\nWiki\r\n0\r\n\r\n"));
    char buf[16];
    auto r = decoder.read(buf);
    assert(!r);
    assert(r.error().error == TransportError::ChunkFormatError);
}

void rejects_missing_data_terminator() {
    ChunkedDecoder decoder(memory_socket("4\r\nWikiXX\r\n0\r\n\r\n", 64));
    char buf[16];
    auto r = decoder.read(buf);
    assert(!r);
    assert(r.error().error == TransportError::ChunkFormatError);
}

void rejects_truncated_chunk() {
    ChunkedDecoder decoder(memory_socket("10\r\nshort", 64));
    char buf[32];
    auto first = decoder.read(buf);
    assert(first && *first == 5);
    auto second = decoder.read(buf);
    assert(!second);
    assert(second.error().error == TransportError::ChunkFormatError);
}

void rejects_bare_lf_size_line() {
    ChunkedDecoder decoder(memory_socket("4\nWiki\r\n0\r\n\r\n"));
    char buf[16];
    auto r = decoder.read(buf);
    assert(!r);
    assert(r.error().error == TransportError::ChunkFormatError);
}

void rejects_over_long_size_line() {
    ChunkedDecoder unterminated(memory_socket(std::string(4096, '0')), 32);
    char buf[16];
    auto r = unterminated.read(buf);
    assert(!r);
    assert(r.error().error == TransportError::ChunkFormatError);
    assert(r.error().message.find("exceeds 32 bytes") != std::string::npos);

    ChunkedDecoder padded(memory_socket("4;" + std::string(64, 'x') + "\r\nWiki\r\n0\r\n\r\n"), 32);
    auto p = padded.read(buf);
    assert(!p && p.error().error == TransportError::ChunkFormatError);
}

} // namespace

int main() {
    decodes_wikipedia();
    never_crosses_chunk_boundary();
    accepts_extensions_trailers_and_hex_case();
    rejects_bad_size_line();
    rejects_missing_data_terminator();
    rejects_truncated_chunk();
    rejects_bare_lf_size_line();
    rejects_over_long_size_line();
    std::cout << "✓ chunked decoder\n";
    return 0;
}
