#pragma once

#include "transport.hpp"
#include "transport_config.hpp"
#include <optional>
#include <string_view>

namespace gitwire {

enum class Backend { Socket, Curl };

std::optional<Backend> backend_from_string(std::string_view name);
std::string_view to_string(Backend backend);

std::unique_ptr<SmartSubtransport> make_subtransport(Backend backend, const TransportConfig& config);

// Installs the backend for "http" and "https". Runs at most once per backend;
// the config of the first call is kept for every transport created later.
// Whichever backend registers a prefix first owns it.
void register_socket_backend(TransportConfig config = config_from_env());
void register_curl_backend(TransportConfig config = config_from_env());
void register_backend(Backend backend, TransportConfig config = config_from_env());

} // namespace gitwire
