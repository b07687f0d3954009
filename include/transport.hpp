#pragma once

#include "smart_transport.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace gitwire {

// Opaque handle for the host engine's remote. The transport layer only
// looks at the URL to pick a backend.
class Remote {
public:
    Remote(std::string name, std::string url) : name_(std::move(name)), url_(std::move(url)) {}

    const std::string& name() const { return name_; }
    const std::string& url() const { return url_; }

private:
    std::string name_;
    std::string url_;
};

// A subtransport bound to a remote: the object the host engine drives.
class Transport {
public:
    // rpc is true for stateless protocols such as HTTP, where every action
    // gets its own stream.
    static std::expected<Transport, TransportErrorInfo> smart(
        const Remote& remote, bool rpc, std::unique_ptr<SmartSubtransport> subtransport);

    Transport(Transport&&) noexcept = default;
    Transport& operator=(Transport&&) noexcept = default;

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // Stateful transports reuse the listing stream for the data phase that
    // follows it. The stream stays owned by the transport until the next
    // action that creates a fresh one.
    std::expected<SmartSubtransportStream*, TransportErrorInfo> action(std::string_view url, Service service);
    std::expected<void, TransportErrorInfo> close();

    const std::string& remote_url() const { return remote_url_; }
    bool rpc() const { return rpc_; }

private:
    Transport(std::string remote_url, bool rpc, std::unique_ptr<SmartSubtransport> subtransport);

    std::string remote_url_;
    bool rpc_;
    std::unique_ptr<SmartSubtransport> subtransport_;
    std::unique_ptr<SmartSubtransportStream> stream_;
};

using TransportFactory = std::function<std::expected<Transport, TransportErrorInfo>(const Remote&)>;

// Process-wide table from URL scheme prefix to transport factory. There is no
// removal: connections may already exist against a registered factory.
class TransportRegistry {
public:
    static TransportRegistry& instance();

    // The first factory for a prefix wins; later ones are dropped. Returns
    // true when this call installed the factory.
    bool add(const std::string& prefix, TransportFactory factory);
    bool contains(const std::string& prefix) const;

    std::expected<Transport, TransportErrorInfo> create(const Remote& remote) const;

private:
    TransportRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, TransportFactory> factories_;
};

} // namespace gitwire
