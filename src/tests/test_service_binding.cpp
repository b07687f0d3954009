#include "service.hpp"
#include "smart_http.hpp"
#include <cassert>
#include <iostream>

using namespace gitwire;

namespace {

// Never called: these tests only create streams, they never perform I/O.
class UnreachableExchanger : public HttpExchanger {
public:
    int calls = 0;
    std::expected<ExchangeResult, TransportErrorInfo> perform(
        const std::string&, const ServiceBinding&, std::optional<std::span<const char>>) override {
        ++calls;
        return std::unexpected(TransportErrorInfo{TransportError::ConnectionError, "unexpected exchange"});
    }
};

void check(Service s, std::string_view name, std::string_view path, std::string_view method) {
    auto b = binding_for(s);
    assert(b.service == name);
    assert(b.url_path == path);
    assert(b.method == method);
}

} // namespace

int main() {
    check(Service::UploadPackLs, "upload-pack", "/info/refs?service=git-upload-pack", "GET");
    check(Service::UploadPack, "upload-pack", "/git-upload-pack", "POST");
    check(Service::ReceivePackLs, "receive-pack", "/info/refs?service=git-receive-pack", "GET");
    check(Service::ReceivePack, "receive-pack", "/git-receive-pack", "POST");

    assert(is_listing(Service::UploadPackLs));
    assert(is_listing(Service::ReceivePackLs));
    assert(!is_listing(Service::UploadPack));
    assert(!is_listing(Service::ReceivePack));

    auto ls = binding_for(Service::UploadPackLs);
    auto post = binding_for(Service::ReceivePack);
    assert(expected_content_type(ls) == "application/x-git-upload-pack-advertisement");
    assert(expected_content_type(post) == "application/x-git-receive-pack-result");
    assert(request_content_type(post) == "application/x-git-receive-pack-request");
    assert(!expects_request_body(ls));
    assert(expects_request_body(post));

    assert(redirect_base("https://example.com/new/info/refs?service=git-upload-pack",
                         "/info/refs?service=git-upload-pack") == "https://example.com/new");
    assert(redirect_base("https://example.com/elsewhere", "/git-upload-pack") == "https://example.com/elsewhere");

    // The first action fixes the base URL; later ones do not move it.
    auto exchanger = std::make_shared<UnreachableExchanger>();
    SmartHttpTransport transport(exchanger);
    assert(transport.base_url().empty());
    {
        auto stream = transport.action("https://example.com/repo", Service::UploadPackLs);
        assert(stream);
        auto* http = dynamic_cast<SmartHttpStream*>(stream->get());
        assert(http);
        assert(http->binding().url_path == "/info/refs?service=git-upload-pack");
        assert(!http->executed());
    }
    assert(transport.base_url() == "https://example.com/repo");
    {
        auto stream = transport.action("https://other.example/repo", Service::UploadPack);
        assert(stream);
        auto* http = dynamic_cast<SmartHttpStream*>(stream->get());
        assert(http->binding().method == "POST");
    }
    assert(transport.base_url() == "https://example.com/repo");
    assert(transport.close());

    // Streams that see no I/O never reach the network.
    assert(exchanger->calls == 0);

    std::cout << "✓ service bindings\n";
    return 0;
}
