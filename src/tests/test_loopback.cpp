#include "backends.hpp"
#include "smart_http.hpp"
#include "test_support.hpp"
#include <cassert>
#include <cstdio>
#include <iostream>

using namespace gitwire;
using namespace gitwire::test;

namespace {

const std::string kAdvertisement =
    "001e# service=git-upload-pack\n"
    "0000"
    "003f0123456789012345678901234567890123456789 refs/heads/main\n"
    "0000";
const std::string kResult = "0008NAK\n";

std::string chunked(const std::string& body) {
    std::string out;
    for (size_t i = 0; i < body.size(); i += 16) {
        auto piece = body.substr(i, 16);
        char size[16];
        std::snprintf(size, sizeof(size), "%zx", piece.size());
        out += std::string(size) + "\r\n" + piece + "\r\n";
    }
    return out + "0\r\n\r\n";
}

struct GitHttpServer {
    std::atomic<uint16_t> port{0};
    LoopbackServer server;

    GitHttpServer() : server([this](const ReceivedRequest& req) { return respond(req); }) {
        port = server.port();
    }

    std::string base() const { return "http://127.0.0.1:" + std::to_string(port.load()); }

    std::string respond(const ReceivedRequest& req) {
        const auto& head = req.head;
        if (head.starts_with("GET /repo/info/refs?service=git-upload-pack ")) {
            return "HTTP/1.1 200 OK\r\n"
                   "Content-Type: application/x-git-upload-pack-advertisement\r\n"
                   "Transfer-Encoding: chunked\r\n\r\n" + chunked(kAdvertisement);
        }
        if (head.starts_with("GET /alias/info/refs?service=git-upload-pack ")) {
            return "HTTP/1.0 200 OK\r\n"
                   "Content-Type: application/x-git-upload-pack-advertisement\r\n"
                   "Location: " + base() + "/repo/info/refs?service=git-upload-pack\r\n"
                   "Content-Length: " + std::to_string(kAdvertisement.size()) + "\r\n\r\n" + kAdvertisement;
        }
        if (head.starts_with("GET /moved/info/refs?service=git-upload-pack ")) {
            return "HTTP/1.1 302 Found\r\n"
                   "Location: /repo/info/refs?service=git-upload-pack\r\n"
                   "Content-Length: 0\r\n\r\n";
        }
        if (head.starts_with("POST /repo/git-upload-pack ")) {
            if (head.find("application/x-git-upload-pack-request") == std::string::npos || req.body.empty()) {
                return "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\n\r\n";
            }
            return "HTTP/1.1 200 OK\r\n"
                   "Content-Type: application/x-git-upload-pack-result\r\n"
                   "Content-Length: " + std::to_string(kResult.size()) + "\r\n\r\n" + kResult;
        }
        if (head.starts_with("GET /html/")) {
            return "HTTP/1.1 200 OK\r\nContent-Type: text/html\r\nContent-Length: 6\r\n\r\n<html>";
        }
        return "HTTP/1.1 404 Not Found\r\nContent-Type: text/plain\r\nContent-Length: 9\r\n\r\nnot found";
    }
};

TransportConfig test_config() {
    TransportConfig config;
    config.timeout_seconds = 5;
    config.proxy.clear();
    return config;
}

void fetch_round_trip(Backend backend) {
    GitHttpServer git;
    auto transport = make_subtransport(backend, test_config());

    auto ls = transport->action(git.base() + "/repo", Service::UploadPackLs);
    assert(ls);
    assert(drain(**ls, 11) == kAdvertisement);

    auto post = transport->action(git.base() + "/repo", Service::UploadPack);
    std::string request = "0032want 0123456789012345678901234567890123456789\n00000009done\n";
    assert((*post)->write(request));
    assert(drain(**post) == kResult);

    auto requests = git.server.requests();
    assert(requests.size() == 2);
    std::string agent = "User-Agent: git/1.0 (gitwire-" + std::string(to_string(backend)) + " 0.1.0)\r\n";
    assert(requests[0].head.find(agent) != std::string::npos);
    assert(requests[1].body == request);
    assert(requests[0].head.find("Host: 127.0.0.1:" + std::to_string(git.port.load()) + "\r\n") != std::string::npos);
}

void empty_post_has_no_body_headers(Backend backend) {
    LoopbackServer server([](const ReceivedRequest&) {
        return std::string("HTTP/1.1 200 OK\r\n"
                           "Content-Type: application/x-git-receive-pack-result\r\n"
                           "Content-Length: 4\r\n\r\n0000");
    });
    auto transport = make_subtransport(backend, test_config());
    auto push = transport->action(server.url("/repo"), Service::ReceivePack);
    assert((*push)->write(std::span<const char>()));
    assert(drain(**push) == "0000");

    auto requests = server.requests();
    assert(requests.size() == 1);
    const auto& head = requests[0].head;
    assert(head.starts_with("POST /repo/git-receive-pack "));
    assert(head.find("Accept: */*\r\n") != std::string::npos);
    assert(head.find("Content-Type:") == std::string::npos);
    assert(requests[0].body.empty());
}

void location_header_moves_base(Backend backend) {
    GitHttpServer git;
    auto transport = make_subtransport(backend, test_config());
    auto* http = static_cast<SmartHttpTransport*>(transport.get());

    auto ls = transport->action(git.base() + "/alias", Service::UploadPackLs);
    assert(drain(**ls) == kAdvertisement);
    assert(http->base_url() == git.base() + "/repo");

    auto post = transport->action(git.base() + "/alias", Service::UploadPack);
    std::string done = "0009done\n";
    assert((*post)->write(done));
    assert(drain(**post) == kResult);
}

void followed_redirect_moves_base() {
    GitHttpServer git;
    auto transport = make_subtransport(Backend::Curl, test_config());
    auto* http = static_cast<SmartHttpTransport*>(transport.get());

    auto ls = transport->action(git.base() + "/moved", Service::UploadPackLs);
    assert(drain(**ls) == kAdvertisement);
    assert(http->base_url() == git.base() + "/repo");
}

void redirect_status_is_fatal_for_socket_backend() {
    GitHttpServer git;
    auto transport = make_subtransport(Backend::Socket, test_config());
    auto ls = transport->action(git.base() + "/moved", Service::UploadPackLs);
    char buf[32];
    auto r = (*ls)->read(buf);
    assert(!r && r.error().error == TransportError::HttpStatusError && r.error().status_code == 302);
}

void errors_surface(Backend backend) {
    GitHttpServer git;
    auto transport = make_subtransport(backend, test_config());
    char buf[32];

    auto missing = transport->action(git.base() + "/absent", Service::UploadPackLs);
    auto r = (*missing)->read(buf);
    assert(!r && r.error().error == TransportError::HttpStatusError && r.error().status_code == 404);

    auto html_transport = make_subtransport(backend, test_config());
    auto html = html_transport->action(git.base() + "/html", Service::UploadPackLs);
    auto h = (*html)->read(buf);
    assert(!h && h.error().error == TransportError::ContentTypeMismatch);
}

void refused_connection() {
    uint16_t port = 0;
    {
        LoopbackServer closed([](const ReceivedRequest&) { return std::string(); });
        port = closed.port();
    }
    for (auto backend : {Backend::Socket, Backend::Curl}) {
        auto transport = make_subtransport(backend, test_config());
        auto ls = transport->action("http://127.0.0.1:" + std::to_string(port) + "/repo", Service::UploadPackLs);
        char buf[8];
        auto r = (*ls)->read(buf);
        assert(!r && r.error().error == TransportError::ConnectionError);
    }
}

void endless_header_line_is_cut_off() {
    LoopbackServer flood([](const ReceivedRequest&) {
        return "HTTP/1.1 200 OK\r\nX-Big: " + std::string(1 << 20, 'a');
    });
    auto config = test_config();
    config.max_header_line = 64;
    auto transport = make_subtransport(Backend::Socket, config);
    auto ls = transport->action(flood.url("/repo"), Service::UploadPackLs);
    char buf[8];
    auto r = (*ls)->read(buf);
    assert(!r && r.error().error == TransportError::ResponseParseError);
}

} // namespace

int main() {
    for (auto backend : {Backend::Socket, Backend::Curl}) {
        fetch_round_trip(backend);
        location_header_moves_base(backend);
        errors_surface(backend);
        empty_post_has_no_body_headers(backend);
    }
    followed_redirect_moves_base();
    redirect_status_is_fatal_for_socket_backend();
    refused_connection();
    endless_header_line_is_cut_off();
    std::cout << "✓ loopback exchanges\n";
    return 0;
}
