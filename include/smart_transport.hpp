#pragma once

#include "body_reader.hpp"
#include "service.hpp"
#include "transport_error.hpp"
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gitwire {

// The channel the host engine reads pkt-lines from and writes requests to.
class SmartSubtransportStream {
public:
    virtual ~SmartSubtransportStream() = default;
    virtual std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) = 0;
    virtual std::expected<void, TransportErrorInfo> write(std::span<const char> data) = 0;
};

// Delegate of a smart transport. action() is called once per protocol phase;
// close() may be called between phases.
class SmartSubtransport {
public:
    virtual ~SmartSubtransport() = default;
    virtual std::expected<std::unique_ptr<SmartSubtransportStream>, TransportErrorInfo>
        action(std::string_view url, Service service) = 0;
    virtual std::expected<void, TransportErrorInfo> close() = 0;
};

// Base URL of a remote, shared by every stream of one transport. Empty until
// the first action; afterwards only a redirect changes it.
class BaseUrl {
public:
    // Stores url if nothing has been captured yet. Returns the current value.
    std::string capture(std::string_view url);
    std::string get() const;
    void set(std::string url);

private:
    mutable std::mutex mutex_;
    std::string url_;
};

struct ExchangeResult {
    std::unique_ptr<BodyReader> body;
    // Location the server reported (socket engine) or curl's effective URL
    // after following redirects.
    std::optional<std::string> location;
};

// One complete HTTP request/response cycle over some HTTP primitive. The
// status code and Content-Type are already validated when this returns.
class HttpExchanger {
public:
    virtual ~HttpExchanger() = default;
    virtual std::expected<ExchangeResult, TransportErrorInfo> perform(
        const std::string& url,
        const ServiceBinding& binding,
        std::optional<std::span<const char>> body) = 0;
};

} // namespace gitwire
