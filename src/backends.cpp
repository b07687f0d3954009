#include "backends.hpp"
#include "curl_exchange.hpp"
#include "http_exchange.hpp"
#include "smart_http.hpp"
#include "log.hpp"
#include <mutex>

namespace gitwire {

namespace {

TransportConfig with_backend_name(TransportConfig config, Backend backend) {
    if (config.backend_name == TransportConfig{}.backend_name) {
        config.backend_name = "gitwire-" + std::string(to_string(backend));
    }
    return config;
}

std::shared_ptr<HttpExchanger> make_exchanger(Backend backend, const TransportConfig& config) {
    switch (backend) {
        case Backend::Curl: return std::make_shared<CurlExchange>(config);
        case Backend::Socket: break;
    }
    return std::make_shared<HttpExchange>(config);
}

void install(Backend backend, const TransportConfig& config) {
    auto named = with_backend_name(config, backend);
    auto exchanger = make_exchanger(backend, named);
    auto factory = [exchanger](const Remote& remote) {
        return Transport::smart(remote, true, std::make_unique<SmartHttpTransport>(exchanger));
    };
    auto& registry = TransportRegistry::instance();
    for (const char* prefix : {"http", "https"}) {
        if (registry.add(prefix, factory)) {
            Log::info("registered " + std::string(to_string(backend)) + " backend for " + prefix);
        }
    }
}

} // namespace

std::optional<Backend> backend_from_string(std::string_view name) {
    if (name == "socket") return Backend::Socket;
    if (name == "curl") return Backend::Curl;
    return std::nullopt;
}

std::string_view to_string(Backend backend) {
    switch (backend) {
        case Backend::Socket: return "socket";
        case Backend::Curl: return "curl";
    }
    return "unknown";
}

std::unique_ptr<SmartSubtransport> make_subtransport(Backend backend, const TransportConfig& config) {
    return std::make_unique<SmartHttpTransport>(make_exchanger(backend, with_backend_name(config, backend)));
}

void register_socket_backend(TransportConfig config) {
    static std::once_flag once;
    std::call_once(once, [&config] { install(Backend::Socket, config); });
}

void register_curl_backend(TransportConfig config) {
    static std::once_flag once;
    std::call_once(once, [&config] { install(Backend::Curl, config); });
}

void register_backend(Backend backend, TransportConfig config) {
    switch (backend) {
        case Backend::Socket: register_socket_backend(std::move(config)); return;
        case Backend::Curl: register_curl_backend(std::move(config)); return;
    }
}

} // namespace gitwire
