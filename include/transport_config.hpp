#pragma once

#include <string>
#include <string_view>

namespace gitwire {

inline constexpr std::string_view kVersion = "0.1.0";

struct TransportConfig {
    int timeout_seconds = 30;
    std::string ca_file;               // GIT_SSL_CAINFO
    std::string ca_path;               // GIT_SSL_CAPATH
    bool verify_peer = true;           // GIT_SSL_NO_VERIFY disables
    std::string backend_name = "gitwire";
    std::string user_agent_version{kVersion};
    std::string proxy;                 // curl backend only
    bool follow_redirects = true;      // curl backend only
    size_t max_header_line = 64 * 1024;
};

// "git/1.0 (<backend> <version>)". Hosted forges key the smart responder
// off the git/ prefix.
std::string user_agent(const TransportConfig& config);

// Overlays git's conventional environment variables onto base.
TransportConfig config_from_env(TransportConfig base = {});

} // namespace gitwire
