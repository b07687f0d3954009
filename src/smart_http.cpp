#include "smart_http.hpp"
#include "http_protocol.hpp"
#include "log.hpp"

namespace gitwire {

std::string BaseUrl::capture(std::string_view url) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (url_.empty()) url_ = std::string(url);
    return url_;
}

std::string BaseUrl::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return url_;
}

void BaseUrl::set(std::string url) {
    std::lock_guard<std::mutex> lock(mutex_);
    url_ = std::move(url);
}

SmartHttpStream::SmartHttpStream(ServiceBinding binding,
                                 std::shared_ptr<BaseUrl> base_url,
                                 std::shared_ptr<HttpExchanger> exchanger)
    : binding_(binding),
      base_url_(std::move(base_url)),
      exchanger_(std::move(exchanger)),
      state_(NotStarted{}) {}

SmartHttpStream::~SmartHttpStream() = default;

bool SmartHttpStream::executed() const {
    return std::holds_alternative<Done>(state_) || std::holds_alternative<Failed>(state_);
}

TransportErrorInfo SmartHttpStream::violation(std::string message) const {
    return TransportErrorInfo{TransportError::ProtocolViolation,
        std::move(message) + " (" + std::string(binding_.method) + " " + std::string(binding_.url_path) + ")"};
}

std::expected<void, TransportErrorInfo> SmartHttpStream::execute(std::optional<std::span<const char>> body) {
    state_ = Executing{};
    auto requested = base_url_->get() + std::string(binding_.url_path);

    auto result = exchanger_->perform(requested, binding_, body);
    if (!result) {
        Log::debug("exchange failed: " + describe(result.error()));
        state_ = Failed{result.error()};
        return std::unexpected(result.error());
    }

    if (result->location && *result->location != requested) {
        apply_redirect(requested, *result->location);
    }
    state_ = Done{std::move(result->body)};
    return {};
}

void SmartHttpStream::apply_redirect(const std::string& requested, const std::string& location) {
    auto new_base = redirect_base(location, binding_.url_path);

    auto from = HttpProtocol::parse_url(requested);
    auto to = HttpProtocol::parse_url(new_base);
    if (from && to && (from->scheme != to->scheme || from->host != to->host || from->port != to->port)) {
        Log::warn("redirect leaves origin " + from->scheme + "://" + from->host + " for " + new_base);
    }

    Log::info("got redirect, updating base url to " + new_base);
    base_url_->set(std::move(new_base));
}

std::expected<void, TransportErrorInfo> SmartHttpStream::write(std::span<const char> data) {
    Log::debug("write " + std::to_string(data.size()));

    if (!expects_request_body(binding_)) {
        return std::unexpected(violation("write on a service without a request body"));
    }
    if (std::holds_alternative<Failed>(state_)) {
        return std::unexpected(violation("write on a failed stream: " + std::get<Failed>(state_).error.message));
    }
    if (!std::holds_alternative<NotStarted>(state_)) {
        return std::unexpected(violation("already sent HTTP request"));
    }
    return execute(data);
}

std::expected<size_t, TransportErrorInfo> SmartHttpStream::read(std::span<char> buffer) {
    Log::debug("read " + std::to_string(buffer.size()));

    if (std::holds_alternative<NotStarted>(state_)) {
        if (expects_request_body(binding_)) {
            return std::unexpected(violation("read before the request body was written"));
        }
        if (auto r = execute(std::nullopt); !r) return std::unexpected(r.error());
    }

    if (std::holds_alternative<Executing>(state_)) {
        return std::unexpected(violation("read while the request is in flight"));
    }
    if (auto* failed = std::get_if<Failed>(&state_)) {
        return std::unexpected(violation("read on a failed stream: " + failed->error.message));
    }

    if (buffer.empty()) return 0;
    auto& done = std::get<Done>(state_);
    auto n = done.body->read(buffer);
    if (!n) {
        state_ = Failed{n.error()};
        return std::unexpected(n.error());
    }
    return *n;
}

SmartHttpTransport::SmartHttpTransport(std::shared_ptr<HttpExchanger> exchanger)
    : base_url_(std::make_shared<BaseUrl>()), exchanger_(std::move(exchanger)) {}

std::expected<std::unique_ptr<SmartSubtransportStream>, TransportErrorInfo>
SmartHttpTransport::action(std::string_view url, Service service) {
    base_url_->capture(url);
    auto binding = binding_for(service);
    Log::info("action " + std::string(binding.service) + " " + std::string(binding.url_path));
    return std::make_unique<SmartHttpStream>(binding, base_url_, exchanger_);
}

std::expected<void, TransportErrorInfo> SmartHttpTransport::close() {
    return {};
}

} // namespace gitwire
