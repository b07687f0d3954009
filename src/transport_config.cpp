#include "transport_config.hpp"
#include "log.hpp"
#include <cstdlib>
#include <charconv>

namespace gitwire {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

bool env_truthy(std::string_view value) {
    return !(value == "0" || value == "false" || value == "no" || value == "off");
}

} // namespace

std::string user_agent(const TransportConfig& config) {
    return "git/1.0 (" + config.backend_name + " " + config.user_agent_version + ")";
}

TransportConfig config_from_env(TransportConfig base) {
    if (auto v = env("GIT_SSL_CAINFO")) base.ca_file = v;
    if (auto v = env("GIT_SSL_CAPATH")) base.ca_path = v;
    if (auto v = env("GIT_SSL_NO_VERIFY")) base.verify_peer = !env_truthy(v);
    if (auto v = env("GIT_HTTP_TIMEOUT")) {
        std::string_view s(v);
        int seconds = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), seconds);
        if (ec == std::errc() && ptr == s.data() + s.size() && seconds > 0) {
            base.timeout_seconds = seconds;
        } else {
            Log::warn("ignoring invalid GIT_HTTP_TIMEOUT '" + std::string(s) + "'");
        }
    }
    if (base.proxy.empty()) {
        if (auto v = env("https_proxy")) base.proxy = v;
        else if (auto v2 = env("http_proxy")) base.proxy = v2;
    }
    return base;
}

} // namespace gitwire
