#include "curl_exchange.hpp"
#include "http_protocol.hpp"
#include "log.hpp"
#include <curl/curl.h>
#include <mutex>

namespace gitwire {

namespace {

struct ResponseCapture {
    std::string body;
    std::optional<std::string> content_type;
    std::optional<std::string> location;
};

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t write_body_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* capture = static_cast<ResponseCapture*>(userp);
    if (capture->body.size() + realsize > capture->body.max_size()) return 0;
    capture->body.append(static_cast<char*>(contents), realsize);
    return realsize;
}

// Called once per header line of every response, including redirect hops.
size_t header_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* capture = static_cast<ResponseCapture*>(userp);
    std::string line(static_cast<char*>(contents), realsize);
    if (line.starts_with("HTTP/")) {
        capture->content_type.reset();
        capture->location.reset();
        return realsize;
    }
    if (auto colon = line.find(':'); colon != std::string::npos) {
        auto key = line.substr(0, colon);
        auto value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        if (HttpProtocol::header_equals(key, "content-type")) capture->content_type = value;
        else if (HttpProtocol::header_equals(key, "location")) capture->location = value;
    }
    return realsize;
}

struct CurlHandle {
    CURL* curl = curl_easy_init();
    curl_slist* headers = nullptr;
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (curl) curl_easy_cleanup(curl);
    }
};

} // namespace

CurlExchange::CurlExchange(TransportConfig config) : config_(std::move(config)) {
    ensure_curl_global_init();
}

CurlExchange::~CurlExchange() = default;

std::expected<ExchangeResult, TransportErrorInfo> CurlExchange::perform(
    const std::string& url,
    const ServiceBinding& binding,
    std::optional<std::span<const char>> body) {

    auto parsed = HttpProtocol::parse_url(url);
    if (!parsed) return std::unexpected(parsed.error());

    CurlHandle h;
    if (!h.curl) return std::unexpected(TransportErrorInfo{TransportError::ConnectionError, "Failed to init CURL"});

    Log::debug("request to " + url);
    auto agent = user_agent(config_);
    curl_easy_setopt(h.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.curl, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(h.curl, CURLOPT_FOLLOWLOCATION, config_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(h.curl, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
    curl_easy_setopt(h.curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    curl_easy_setopt(h.curl, CURLOPT_SSL_VERIFYPEER, config_.verify_peer ? 1L : 0L);
    curl_easy_setopt(h.curl, CURLOPT_SSL_VERIFYHOST, config_.verify_peer ? 2L : 0L);
    if (!config_.ca_file.empty()) curl_easy_setopt(h.curl, CURLOPT_CAINFO, config_.ca_file.c_str());
    if (!config_.ca_path.empty()) curl_easy_setopt(h.curl, CURLOPT_CAPATH, config_.ca_path.c_str());
    if (!config_.proxy.empty()) curl_easy_setopt(h.curl, CURLOPT_PROXY, config_.proxy.c_str());

    if (body && !body->empty()) {
        curl_easy_setopt(h.curl, CURLOPT_POST, 1L);
        curl_easy_setopt(h.curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
        curl_easy_setopt(h.curl, CURLOPT_COPYPOSTFIELDS, body->data());
        h.headers = curl_slist_append(h.headers, ("Accept: " + result_content_type(binding)).c_str());
        h.headers = curl_slist_append(h.headers, ("Content-Type: " + request_content_type(binding)).c_str());
    } else if (body) {
        // Empty POST: no request body headers, and no form content type from curl.
        curl_easy_setopt(h.curl, CURLOPT_POST, 1L);
        curl_easy_setopt(h.curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
        curl_easy_setopt(h.curl, CURLOPT_COPYPOSTFIELDS, "");
        h.headers = curl_slist_append(h.headers, "Accept: */*");
        h.headers = curl_slist_append(h.headers, "Content-Type:");
    } else {
        curl_easy_setopt(h.curl, CURLOPT_HTTPGET, 1L);
        h.headers = curl_slist_append(h.headers, "Accept: */*");
    }
    h.headers = curl_slist_append(h.headers, "Expect:");
    curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);

    ResponseCapture capture;
    curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, write_body_callback);
    curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &capture);
    curl_easy_setopt(h.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(h.curl, CURLOPT_HEADERDATA, &capture);

    CURLcode res = curl_easy_perform(h.curl);
    if (res != CURLE_OK) {
        return std::unexpected(TransportErrorInfo{TransportError::ConnectionError, curl_easy_strerror(res)});
    }

    long http_code = 0;
    curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        return std::unexpected(TransportErrorInfo{TransportError::HttpStatusError,
            "failed to receive HTTP 200 response: got " + std::to_string(http_code),
            static_cast<int>(http_code)});
    }

    auto expected = expected_content_type(binding);
    if (!capture.content_type) {
        return std::unexpected(TransportErrorInfo{TransportError::ContentTypeMismatch,
            "expected a Content-Type header with `" + expected + "` but didn't find one"});
    }
    if (*capture.content_type != expected) {
        return std::unexpected(TransportErrorInfo{TransportError::ContentTypeMismatch,
            "expected a Content-Type header with `" + expected + "` but found `" + *capture.content_type + "`"});
    }

    // curl follows 3xx itself and reports where it ended up; a Location on
    // the final 200 is taken as well, as the socket engine does.
    ExchangeResult result;
    std::string final_url = url;
    char* effective_url = nullptr;
    if (curl_easy_getinfo(h.curl, CURLINFO_EFFECTIVE_URL, &effective_url) == CURLE_OK && effective_url) {
        final_url = effective_url;
    }
    if (capture.location) {
        auto final_parts = HttpProtocol::parse_url(final_url);
        result.location = HttpProtocol::resolve_location(final_parts ? *final_parts : *parsed, *capture.location);
    } else if (final_url != url) {
        result.location = final_url;
    }
    result.body = std::make_unique<BufferBodyReader>(std::move(capture.body));
    return result;
}

} // namespace gitwire
