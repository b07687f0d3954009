#include "http_protocol.hpp"
#include "log.hpp"
#include <algorithm>
#include <charconv>
#include <cctype>

namespace gitwire {

namespace {

TransportErrorInfo url_error(std::string_view url, std::string_view why) {
    return TransportErrorInfo{TransportError::UrlParseError,
        "invalid url '" + std::string(url) + "', " + std::string(why)};
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_ascii(std::string_view s) {
    return std::ranges::all_of(s, [](unsigned char c) { return c < 0x80; });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

// Reads one line and strips the CRLF. A bare LF, a non-ASCII byte or an
// over-long line is rejected.
std::expected<std::string, TransportErrorInfo> read_line(ISocket& socket, size_t max_line, std::string_view what) {
    auto line = socket.read_until("\n", max_line);
    if (!line && line.error().error == SocketError::LineTooLong) {
        return std::unexpected(TransportErrorInfo{TransportError::ResponseParseError,
            std::string(what) + " exceeds " + std::to_string(max_line) + " bytes"});
    }
    if (!line) {
        return std::unexpected(TransportErrorInfo{TransportError::IoError,
            "failed to read " + std::string(what) + ": " + line.error().message});
    }
    if (line->size() < 2 || (*line)[line->size() - 2] != '\r') {
        return std::unexpected(TransportErrorInfo{TransportError::ResponseParseError,
            std::string(what) + " is not terminated by CRLF"});
    }
    line->resize(line->size() - 2);
    if (!is_ascii(*line)) {
        return std::unexpected(TransportErrorInfo{TransportError::ResponseParseError,
            std::string(what) + " is not in ASCII"});
    }
    return std::move(*line);
}

} // namespace

std::expected<UrlParts, TransportErrorInfo> HttpProtocol::parse_url(std::string_view url) {
    UrlParts parts;
    auto proto_end = url.find("://");
    if (proto_end == std::string_view::npos || proto_end == 0) {
        return std::unexpected(url_error(url, "failed to parse"));
    }
    parts.scheme = lower(url.substr(0, proto_end));
    if (parts.scheme == "https") parts.port = 443;
    else if (parts.scheme == "http") parts.port = 80;
    else return std::unexpected(url_error(url, "unknown scheme"));

    auto rest = url.substr(proto_end + 3);
    auto authority_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authority_end);
    auto remainder = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host;
    std::string_view port;
    if (authority.starts_with('[')) {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::unexpected(url_error(url, "unterminated IPv6 literal"));
        host = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return std::unexpected(url_error(url, "failed to parse"));
            port = after.substr(1);
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    } else {
        host = authority;
    }

    if (host.empty()) return std::unexpected(url_error(url, "did not have a host"));
    parts.host = std::string(host);

    if (!port.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc() || ptr != port.data() + port.size() || value == 0 || value > 65535) {
            return std::unexpected(url_error(url, "bad port"));
        }
        parts.port = static_cast<uint16_t>(value);
        parts.explicit_port = true;
    }

    if (auto hash = remainder.find('#'); hash != std::string_view::npos) {
        remainder = remainder.substr(0, hash);
    }
    auto q = remainder.find('?');
    auto path = remainder.substr(0, q);
    parts.path = path.empty() ? "/" : std::string(path);
    if (q != std::string_view::npos) parts.query = std::string(remainder.substr(q + 1));
    return parts;
}

std::string HttpProtocol::request_target(const UrlParts& url) {
    if (url.query.empty()) return url.path;
    return url.path + "?" + url.query;
}

std::string HttpProtocol::host_header(const UrlParts& url) {
    std::string host = url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
    uint16_t default_port = url.scheme == "https" ? 443 : 80;
    if (url.explicit_port && url.port != default_port) {
        host += ":" + std::to_string(url.port);
    }
    return host;
}

std::string HttpProtocol::resolve_location(const UrlParts& request, const std::string& location) {
    if (location.find("://") != std::string::npos) return location;
    std::string origin = request.scheme + "://" + host_header(request);
    if (location.starts_with('/')) return origin + location;
    auto dir = request.path.substr(0, request.path.rfind('/') + 1);
    return origin + dir + location;
}

std::string HttpProtocol::build_request(const HttpRequest& req) {
    std::string out;
    out.reserve(256 + req.body.size());
    out += req.method + " " + req.target + " HTTP/1.0\r\n";
    out += "Host: " + req.host + "\r\n";
    for (const auto& [key, value] : req.headers) {
        out += key + ": " + value + "\r\n";
    }
    out += "\r\n";
    out.append(req.body.data(), req.body.size());
    return out;
}

std::expected<HttpResponse, TransportErrorInfo> HttpProtocol::read_status(ISocket& socket, size_t max_line) {
    auto status_line = read_line(socket, max_line, "status line");
    if (!status_line) return std::unexpected(status_line.error());
    Log::debug("received status: " + *status_line);

    // HTTP/1.1 200 OK
    std::string_view line(*status_line);
    auto first_space = line.find(' ');
    if (!line.starts_with("HTTP/") || first_space == std::string_view::npos) {
        return std::unexpected(TransportErrorInfo{TransportError::ResponseParseError,
            "bad status line '" + *status_line + "'"});
    }
    auto rest = line.substr(first_space + 1);
    auto code_end = rest.find(' ');
    auto code = rest.substr(0, code_end);

    HttpResponse response;
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), response.status_code);
    if (code.size() != 3 || ec != std::errc() || ptr != code.data() + code.size()) {
        return std::unexpected(TransportErrorInfo{TransportError::ResponseParseError,
            "bad status line '" + *status_line + "'"});
    }
    if (code_end != std::string_view::npos) response.status_message = std::string(rest.substr(code_end + 1));
    return response;
}

std::expected<void, TransportErrorInfo> HttpProtocol::read_headers(ISocket& socket, HttpResponse& response, size_t max_line) {
    while (true) {
        auto line = read_line(socket, max_line, "header line");
        if (!line) return std::unexpected(line.error());
        if (line->empty()) break;
        Log::debug("received header: " + *line);

        auto colon = line->find(':');
        if (colon == std::string::npos || colon == 0) {
            return std::unexpected(TransportErrorInfo{TransportError::ResponseParseError,
                "malformed header '" + *line + "'"});
        }
        std::string_view view(*line);
        response.headers.emplace_back(std::string(view.substr(0, colon)), std::string(trim(view.substr(colon + 1))));
    }

    if (auto cl = get_header(response, "content-length")) {
        size_t length = 0;
        auto [ptr, ec] = std::from_chars(cl->data(), cl->data() + cl->size(), length);
        if (ec != std::errc() || ptr != cl->data() + cl->size()) {
            return std::unexpected(TransportErrorInfo{TransportError::ResponseParseError,
                "bad Content-Length '" + *cl + "'"});
        }
        response.content_length = length;
    }
    
    if (auto te = get_header(response, "transfer-encoding")) {
        response.chunked = header_equals(*te, "chunked");
    }
    return {};
}

std::optional<std::string> HttpProtocol::get_header(const HttpResponse& resp, std::string_view name) {
    auto lower_name = lower(name);
    for (const auto& [key, value] : resp.headers) {
        if (lower(key) == lower_name) return value;
    }
    return std::nullopt;
}

bool HttpProtocol::header_equals(std::string_view value, std::string_view expected) {
    return lower(trim(value)) == lower(expected);
}

} // namespace gitwire
