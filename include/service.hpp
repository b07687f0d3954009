#pragma once

#include <string>
#include <string_view>

namespace gitwire {

// The four phases of the smart protocol the host engine can ask for.
enum class Service {
    UploadPackLs,
    UploadPack,
    ReceivePackLs,
    ReceivePack
};

struct ServiceBinding {
    std::string_view service;   // "upload-pack" / "receive-pack"
    std::string_view url_path;  // appended to the base URL
    std::string_view method;    // "GET" / "POST"
};

ServiceBinding binding_for(Service service);
std::string_view to_string(Service service);

// Listing services discover refs; the others carry pack data.
bool is_listing(Service service);
bool expects_request_body(const ServiceBinding& binding);

std::string request_content_type(const ServiceBinding& binding);
std::string result_content_type(const ServiceBinding& binding);
// advertisement for GET, result for POST
std::string expected_content_type(const ServiceBinding& binding);

// Base URL after a redirect: the location minus the action's path suffix,
// or the location verbatim when it does not end with that suffix.
std::string redirect_base(std::string_view location, std::string_view url_path);

} // namespace gitwire
