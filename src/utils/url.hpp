#pragma once

#include <string>

namespace reagent::utils {

struct Url {
    bool https = false;
    std::string host;
    int port = 80;
    std::string base_path;

    // "scheme://host:port", the form httplib::Client takes.
    std::string Origin() const;
};

// Splits "[http[s]://]host[:port][/path]". The scheme and port of
// `defaults` apply when the text omits them; a trailing '/' is dropped
// from the path. Throws std::invalid_argument on an empty host or a port
// that is not a number in 1..65535.
Url ParseUrl(const std::string& url, const Url& defaults);

}  // namespace reagent::utils
