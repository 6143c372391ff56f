#ifndef TRANSFERD_NET_HTTP_H
#define TRANSFERD_NET_HTTP_H

#include "transferd/base/error_code.h"
#include "transferd/core/cancellation.h"
#include "transferd/net/connection.h"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace transferd {

// Header names are stored lower-cased
using HeaderMap = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HeaderMap headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
    // Redirects followed before the 3xx is handed back
    uint32_t max_redirects = 5;
    // Checked while waiting for bytes; may be null
    const CancellationToken* token = nullptr;

    void set_header(const std::string& name, const std::string& value);
};

struct HttpResponseHead {
    int status_code = 0;
    std::string reason;
    HeaderMap headers;

    std::string get_header(const std::string& name) const;
    bool has_header(const std::string& name) const;

    // Content-Length, if present and well formed
    std::optional<uint64_t> content_length() const;
};

// Parsed "Content-Range: bytes <first>-<last>/<total|*>"
struct ContentRange {
    uint64_t first = 0;
    uint64_t last = 0;
    std::optional<uint64_t> total;
};

std::optional<ContentRange> parse_content_range(const std::string& value);

// Parse a status line plus header block (without the terminating blank line)
std::optional<HttpResponseHead> parse_response_head(const std::string& head);

// Pull-style response body
class BodyReader {
public:
    virtual ~BodyReader() = default;

    // Ok with received > 0, Closed at end of body, or an error status
    virtual IoStatus read(char* buffer, size_t capacity, size_t& received) = 0;

    virtual std::string last_error() const = 0;
};

struct HttpResponse {
    HttpResponseHead head;
    std::unique_ptr<BodyReader> body;

    int status_code() const { return head.status_code; }

    // Read the remaining body into a string, up to `limit` bytes
    std::string read_all(size_t limit = 1024 * 1024);
};

struct HttpResult {
    ErrorCode error = ErrorCode::Success;
    std::string message;
    HttpResponse response;

    bool ok() const { return error == ErrorCode::Success; }
};

// Source of HTTP responses; the worker and the placement notifier go through it
class HttpSource {
public:
    virtual ~HttpSource() = default;

    // One request, following up to request.max_redirects redirects.
    // Returns once the final head is in; the body is pulled from the reader.
    // Must be callable from several threads.
    virtual HttpResult fetch(const HttpRequest& request) = 0;
};

// libcurl-backed source. Each fetch owns one easy handle driven through a
// multi handle, so the body can be pulled in pieces and the token is checked
// between pieces.
class CurlHttpSource : public HttpSource {
public:
    CurlHttpSource();

    HttpResult fetch(const HttpRequest& request) override;
};

} // namespace transferd

#endif // TRANSFERD_NET_HTTP_H
