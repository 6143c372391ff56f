#include "transferd/net/url.h"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace transferd {

namespace {

uint16_t default_port(const std::string& scheme) {
    if (scheme == "http" || scheme == "ws") return 80;
    if (scheme == "https" || scheme == "wss") return 443;
    return 0;
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

std::string Url::host_header() const {
    bool ipv6 = host.find(':') != std::string::npos;
    std::string h = ipv6 ? "[" + host + "]" : host;
    if (port == default_port(scheme)) {
        return h;
    }
    return h + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + target;
}

std::optional<Url> parse_url(const std::string& text) {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }

    Url url;
    url.scheme = to_lower(text.substr(0, scheme_end));
    url.port = default_port(url.scheme);
    if (url.port == 0) {
        return std::nullopt;
    }

    std::string rest = text.substr(scheme_end + 3);
    auto target_start = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, target_start);
    std::string target = target_start == std::string::npos ? "/" : rest.substr(target_start);

    // Fragments never go on the wire
    auto hash = target.find('#');
    if (hash != std::string::npos) {
        target.erase(hash);
    }
    if (target.empty() || target[0] != '/') {
        target = "/" + target;
    }
    url.target = target;

    // Userinfo is not supported; strip it so it never reaches the Host header
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return std::nullopt;
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            url.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        } else {
            url.host = authority;
        }
    }

    if (url.host.empty()) {
        return std::nullopt;
    }

    if (!port_text.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), value);
        if (ec != std::errc() || ptr != port_text.data() + port_text.size() || value == 0 || value > 65535) {
            return std::nullopt;
        }
        url.port = static_cast<uint16_t>(value);
    }

    return url;
}

std::string url_encode(const std::string& value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string append_query_parameter(const std::string& url, const std::string& name,
                                   const std::string& value) {
    char separator = url.find('?') == std::string::npos ? '?' : '&';
    return url + separator + url_encode(name) + "=" + url_encode(value);
}

} // namespace transferd
