#pragma once

#include "smart_transport.hpp"
#include <variant>

namespace gitwire {

// Stream for one action. The HTTP exchange runs exactly once, on the first
// read() or write().
class SmartHttpStream : public SmartSubtransportStream {
public:
    SmartHttpStream(ServiceBinding binding,
                    std::shared_ptr<BaseUrl> base_url,
                    std::shared_ptr<HttpExchanger> exchanger);
    ~SmartHttpStream() override;

    std::expected<size_t, TransportErrorInfo> read(std::span<char> buffer) override;
    std::expected<void, TransportErrorInfo> write(std::span<const char> data) override;

    const ServiceBinding& binding() const { return binding_; }
    bool executed() const;

private:
    struct NotStarted {};
    struct Executing {};
    struct Done { std::unique_ptr<BodyReader> body; };
    struct Failed { TransportErrorInfo error; };
    using State = std::variant<NotStarted, Executing, Done, Failed>;

    std::expected<void, TransportErrorInfo> execute(std::optional<std::span<const char>> body);
    void apply_redirect(const std::string& requested, const std::string& location);
    TransportErrorInfo violation(std::string message) const;

    ServiceBinding binding_;
    std::shared_ptr<BaseUrl> base_url_;
    std::shared_ptr<HttpExchanger> exchanger_;
    State state_;
};

// Subtransport speaking smart HTTP through one exchanger.
class SmartHttpTransport : public SmartSubtransport {
public:
    explicit SmartHttpTransport(std::shared_ptr<HttpExchanger> exchanger);

    std::expected<std::unique_ptr<SmartSubtransportStream>, TransportErrorInfo>
        action(std::string_view url, Service service) override;
    std::expected<void, TransportErrorInfo> close() override;

    std::string base_url() const { return base_url_->get(); }

private:
    std::shared_ptr<BaseUrl> base_url_;
    std::shared_ptr<HttpExchanger> exchanger_;
};

} // namespace gitwire
