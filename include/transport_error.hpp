#pragma once

#include <string>
#include <string_view>

namespace gitwire {

enum class TransportError {
    UrlParseError,
    ConnectionError,
    HttpStatusError,
    ContentTypeMismatch,
    ResponseParseError,
    ChunkFormatError,
    ProtocolViolation,
    IoError,
    UnsupportedScheme
};

struct TransportErrorInfo {
    TransportError error;
    std::string message;
    int status_code = 0;
};

inline std::string_view to_string(TransportError error) {
    switch (error) {
        case TransportError::UrlParseError: return "url parse error";
        case TransportError::ConnectionError: return "connection error";
        case TransportError::HttpStatusError: return "http status error";
        case TransportError::ContentTypeMismatch: return "content-type mismatch";
        case TransportError::ResponseParseError: return "malformed response";
        case TransportError::ChunkFormatError: return "chunk format error";
        case TransportError::ProtocolViolation: return "protocol violation";
        case TransportError::IoError: return "i/o error";
        case TransportError::UnsupportedScheme: return "unsupported scheme";
    }
    return "transport error";
}

// Folds an error into the single network-class message the host engine reports.
inline std::string describe(const TransportErrorInfo& info) {
    std::string out(to_string(info.error));
    out += ": ";
    out += info.message;
    return out;
}

} // namespace gitwire
