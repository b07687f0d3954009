#include "transport.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>

namespace gitwire {

Transport::Transport(std::string remote_url, bool rpc, std::unique_ptr<SmartSubtransport> subtransport)
    : remote_url_(std::move(remote_url)), rpc_(rpc), subtransport_(std::move(subtransport)) {}

std::expected<Transport, TransportErrorInfo> Transport::smart(
    const Remote& remote, bool rpc, std::unique_ptr<SmartSubtransport> subtransport) {
    if (!subtransport) {
        return std::unexpected(TransportErrorInfo{TransportError::ProtocolViolation, "no subtransport given"});
    }
    return Transport(remote.url(), rpc, std::move(subtransport));
}

std::expected<SmartSubtransportStream*, TransportErrorInfo> Transport::action(std::string_view url, Service service) {
    bool generate_stream = rpc_ || is_listing(service);
    if (!generate_stream) {
        if (!stream_) {
            return std::unexpected(TransportErrorInfo{TransportError::ProtocolViolation,
                std::string(to_string(service)) + " requested before its listing phase"});
        }
        return stream_.get();
    }

    auto stream = subtransport_->action(url, service);
    if (!stream) return std::unexpected(stream.error());
    stream_ = std::move(*stream);
    return stream_.get();
}

std::expected<void, TransportErrorInfo> Transport::close() {
    return subtransport_->close();
}

TransportRegistry& TransportRegistry::instance() {
    static TransportRegistry registry;
    return registry;
}

bool TransportRegistry::add(const std::string& prefix, TransportFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = factories_.try_emplace(prefix, std::move(factory));
    if (!inserted) Log::debug("transport for '" + prefix + "' already registered, ignoring");
    return inserted;
}

bool TransportRegistry::contains(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factories_.contains(prefix);
}

std::expected<Transport, TransportErrorInfo> TransportRegistry::create(const Remote& remote) const {
    auto scheme_end = remote.url().find("://");
    if (scheme_end == std::string::npos) {
        return std::unexpected(TransportErrorInfo{TransportError::UrlParseError,
            "invalid url '" + remote.url() + "', failed to parse"});
    }
    auto scheme = remote.url().substr(0, scheme_end);
    std::ranges::transform(scheme, scheme.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    TransportFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = factories_.find(scheme);
        if (it == factories_.end()) {
            return std::unexpected(TransportErrorInfo{TransportError::UnsupportedScheme,
                "no transport registered for '" + scheme + "'"});
        }
        factory = it->second;
    }
    return factory(remote);
}

} // namespace gitwire
