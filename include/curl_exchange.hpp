#pragma once

#include "smart_transport.hpp"
#include "transport_config.hpp"

namespace gitwire {

// Smart-HTTP exchange through libcurl's easy interface. One blocking
// curl_easy_perform per exchange; the response body is collected in memory.
class CurlExchange : public HttpExchanger {
public:
    explicit CurlExchange(TransportConfig config);
    ~CurlExchange() override;

    CurlExchange(const CurlExchange&) = delete;
    CurlExchange& operator=(const CurlExchange&) = delete;

    std::expected<ExchangeResult, TransportErrorInfo> perform(
        const std::string& url,
        const ServiceBinding& binding,
        std::optional<std::span<const char>> body) override;

private:
    TransportConfig config_;
};

} // namespace gitwire
