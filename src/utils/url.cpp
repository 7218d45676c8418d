#include "utils/url.hpp"

#include <stdexcept>

namespace reagent::utils {
namespace {

int ParsePort(const std::string& text, const std::string& url) {
    std::size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size() || port <= 0 || port > 65535) {
        throw std::invalid_argument("invalid port in url '" + url + "'");
    }
    return port;
}

}  // namespace

std::string Url::Origin() const {
    return (https ? "https://" : "http://") + host + ":" + std::to_string(port);
}

Url ParseUrl(const std::string& url, const Url& defaults) {
    Url parsed{};
    parsed.https = defaults.https;
    parsed.port = defaults.port;
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        parsed.port = 443;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = ParsePort(host_port.substr(colon_pos + 1), url);
    } else {
        parsed.host = host_port;
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument("missing host in url '" + url + "'");
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

}  // namespace reagent::utils
