#include "service.hpp"

namespace gitwire {

ServiceBinding binding_for(Service service) {
    switch (service) {
        case Service::UploadPackLs:
            return {"upload-pack", "/info/refs?service=git-upload-pack", "GET"};
        case Service::UploadPack:
            return {"upload-pack", "/git-upload-pack", "POST"};
        case Service::ReceivePackLs:
            return {"receive-pack", "/info/refs?service=git-receive-pack", "GET"};
        case Service::ReceivePack:
            return {"receive-pack", "/git-receive-pack", "POST"};
    }
    return {"upload-pack", "/info/refs?service=git-upload-pack", "GET"};
}

std::string_view to_string(Service service) {
    switch (service) {
        case Service::UploadPackLs: return "upload-pack-ls";
        case Service::UploadPack: return "upload-pack";
        case Service::ReceivePackLs: return "receive-pack-ls";
        case Service::ReceivePack: return "receive-pack";
    }
    return "unknown";
}

bool is_listing(Service service) {
    return service == Service::UploadPackLs || service == Service::ReceivePackLs;
}

bool expects_request_body(const ServiceBinding& binding) {
    return binding.method == "POST";
}

std::string request_content_type(const ServiceBinding& binding) {
    return "application/x-git-" + std::string(binding.service) + "-request";
}

std::string result_content_type(const ServiceBinding& binding) {
    return "application/x-git-" + std::string(binding.service) + "-result";
}

std::string expected_content_type(const ServiceBinding& binding) {
    if (binding.method == "GET") {
        return "application/x-git-" + std::string(binding.service) + "-advertisement";
    }
    return result_content_type(binding);
}

std::string redirect_base(std::string_view location, std::string_view url_path) {
    if (location.ends_with(url_path)) {
        location.remove_suffix(url_path.size());
    }
    return std::string(location);
}

} // namespace gitwire
