#include "http_exchange.hpp"
#include "chunked_decoder.hpp"
#include "tls_socket.hpp"
#include "log.hpp"

namespace gitwire {

HttpExchange::HttpExchange(TransportConfig config, SocketFactory factory)
    : config_(std::move(config)),
      factory_(factory ? std::move(factory) : default_socket_factory(config_)) {}

SocketFactory HttpExchange::default_socket_factory(const TransportConfig& config) {
    TlsOptions tls{config.verify_peer, config.ca_file, config.ca_path};
    return [tls](const UrlParts& url) -> std::unique_ptr<ISocket> {
        if (url.scheme == "https") return std::make_unique<TlsSocket>(tls);
        return std::make_unique<Socket>();
    };
}

std::expected<ExchangeResult, TransportErrorInfo> HttpExchange::perform(
    const std::string& url,
    const ServiceBinding& binding,
    std::optional<std::span<const char>> body) {

    auto parsed = HttpProtocol::parse_url(url);
    if (!parsed) return std::unexpected(parsed.error());

    Log::debug("request to " + url);
    auto socket = factory_(*parsed);
    socket->set_timeout(config_.timeout_seconds);
    if (auto conn = socket->connect(parsed->host, parsed->port); !conn) {
        return std::unexpected(TransportErrorInfo{TransportError::ConnectionError, conn.error().message});
    }

    HttpRequest req;
    req.method = std::string(binding.method);
    req.target = HttpProtocol::request_target(*parsed);
    req.host = HttpProtocol::host_header(*parsed);
    req.headers.emplace_back("User-Agent", user_agent(config_));
    if (body && !body->empty()) {
        req.headers.emplace_back("Accept", result_content_type(binding));
        req.headers.emplace_back("Content-Type", request_content_type(binding));
        req.headers.emplace_back("Content-Length", std::to_string(body->size()));
        req.body = std::string_view(body->data(), body->size());
    } else {
        req.headers.emplace_back("Accept", "*/*");
    }

    auto wire = HttpProtocol::build_request(req);
    if (auto sent = write_all(*socket, wire); !sent) {
        return std::unexpected(TransportErrorInfo{TransportError::IoError, "failed to send request: " + sent.error().message});
    }

    auto response = HttpProtocol::read_status(*socket, config_.max_header_line);
    if (!response) return std::unexpected(response.error());
    if (response->status_code != 200) {
        return std::unexpected(TransportErrorInfo{TransportError::HttpStatusError,
            "failed to receive HTTP 200 response: got " + std::to_string(response->status_code),
            response->status_code});
    }

    if (auto headers = HttpProtocol::read_headers(*socket, *response, config_.max_header_line); !headers) {
        return std::unexpected(headers.error());
    }

    auto expected = expected_content_type(binding);
    auto content_type = HttpProtocol::get_header(*response, "content-type");
    if (!content_type) {
        return std::unexpected(TransportErrorInfo{TransportError::ContentTypeMismatch,
            "expected a Content-Type header with `" + expected + "` but didn't find one"});
    }
    if (*content_type != expected) {
        return std::unexpected(TransportErrorInfo{TransportError::ContentTypeMismatch,
            "expected a Content-Type header with `" + expected + "` but found `" + *content_type + "`"});
    }

    ExchangeResult result;
    if (auto location = HttpProtocol::get_header(*response, "location")) {
        result.location = HttpProtocol::resolve_location(*parsed, *location);
    }

    if (response->chunked) {
        result.body = std::make_unique<ChunkedDecoder>(std::move(socket), config_.max_header_line);
    } else {
        result.body = std::make_unique<SocketBodyReader>(std::move(socket), response->content_length);
    }
    return result;
}

} // namespace gitwire
