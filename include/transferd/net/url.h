#ifndef TRANSFERD_NET_URL_H
#define TRANSFERD_NET_URL_H

#include <cstdint>
#include <optional>
#include <string>

namespace transferd {

// Parsed absolute URL (http, https, ws, wss)
struct Url {
    std::string scheme;    // lower case
    std::string host;
    uint16_t port = 0;
    std::string target;    // path + query, always starts with '/'

    bool is_tls() const { return scheme == "https" || scheme == "wss"; }

    // "host" or "host:port" when the port is not the scheme default
    std::string host_header() const;

    std::string to_string() const;
};

std::optional<Url> parse_url(const std::string& text);

// Percent-encode a query parameter value
std::string url_encode(const std::string& value);

// Append "name=value" to the URL's query string
std::string append_query_parameter(const std::string& url, const std::string& name,
                                   const std::string& value);

} // namespace transferd

#endif // TRANSFERD_NET_URL_H
