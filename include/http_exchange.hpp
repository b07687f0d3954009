#pragma once

#include "http_protocol.hpp"
#include "smart_transport.hpp"
#include "transport_config.hpp"
#include <functional>

namespace gitwire {

// Creates an unconnected socket suitable for the URL's scheme.
using SocketFactory = std::function<std::unique_ptr<ISocket>(const UrlParts&)>;

// Smart-HTTP exchange over a raw Socket/TlsSocket: HTTP/1.0 request, strict
// status and header parsing, body streamed straight off the connection.
class HttpExchange : public HttpExchanger {
public:
    explicit HttpExchange(TransportConfig config, SocketFactory factory = {});

    std::expected<ExchangeResult, TransportErrorInfo> perform(
        const std::string& url,
        const ServiceBinding& binding,
        std::optional<std::span<const char>> body) override;

    // Socket for http, TlsSocket configured from config for https.
    static SocketFactory default_socket_factory(const TransportConfig& config);

private:
    TransportConfig config_;
    SocketFactory factory_;
};

} // namespace gitwire
