#pragma once

#include "socket_wrapper.hpp"
#include "transport_error.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <expected>
#include <optional>
#include <cstdint>

namespace gitwire {

struct UrlParts {
    std::string scheme;
    std::string host;
    uint16_t port = 80;
    bool explicit_port = false;
    std::string path = "/";
    std::string query;
};

struct HttpRequest {
    std::string method = "GET";
    std::string target = "/";
    std::string host;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string_view body;
};

struct HttpResponse {
    int status_code = 0;
    std::string status_message;
    std::vector<std::pair<std::string, std::string>> headers;
    std::optional<size_t> content_length;
    bool chunked = false;
};

class HttpProtocol {
public:
    static std::expected<UrlParts, TransportErrorInfo> parse_url(std::string_view url);
    static std::string request_target(const UrlParts& url);
    static std::string host_header(const UrlParts& url);
    // Absolute form of a Location value; relative references are resolved
    // against the request URL.
    static std::string resolve_location(const UrlParts& request, const std::string& location);

    // HTTP/1.0 request head followed by the body, if any.
    static std::string build_request(const HttpRequest& req);

    static std::expected<HttpResponse, TransportErrorInfo> read_status(ISocket& socket, size_t max_line);
    // Reads CRLF-terminated header lines up to the empty line.
    static std::expected<void, TransportErrorInfo> read_headers(ISocket& socket, HttpResponse& response, size_t max_line);
    
    static std::optional<std::string> get_header(const HttpResponse& resp, std::string_view name);

    static bool header_equals(std::string_view value, std::string_view expected);
};

} // namespace gitwire
