#include "transferd/net/http.h"
#include "transferd/base/logger.h"
#include "transferd/net/url.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <curl/curl.h>

namespace transferd {

namespace {

constexpr size_t kReadBufferSize = 16 * 1024;
constexpr auto kPollSlice = std::chrono::milliseconds(100);

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::optional<uint64_t> parse_u64(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct MultiDeleter {
    void operator()(CURLM* handle) const { curl_multi_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

ErrorCode error_for_curl(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            return ErrorCode::ConnectionFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorCode::Timeout;
        case CURLE_SEND_ERROR:
            return ErrorCode::SendFailed;
        case CURLE_RECV_ERROR:
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
            return ErrorCode::ReceiveFailed;
        case CURLE_WEIRD_SERVER_REPLY:
            return ErrorCode::ProtocolError;
        case CURLE_TOO_MANY_REDIRECTS:
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            return ErrorCode::PermanentTransferError;
        default:
            return ErrorCode::TransientNetworkError;
    }
}

// One request in flight: an easy handle driven through its own multi handle.
// Header and body bytes land in buffers from curl's callbacks; readers pull
// from the body buffer and drive curl again when it runs dry.
class CurlTransfer {
public:
    explicit CurlTransfer(const HttpRequest& request)
        : timeout_(request.timeout), token_(request.token) {}

    ~CurlTransfer() {
        if (multi_ && easy_ && attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    CurlTransfer(const CurlTransfer&) = delete;
    CurlTransfer& operator=(const CurlTransfer&) = delete;

    bool start(const HttpRequest& request, std::string& error) {
        easy_.reset(curl_easy_init());
        multi_.reset(curl_multi_init());
        if (!easy_ || !multi_) {
            error = "Failed to create curl handles";
            return false;
        }

        CURL* curl = easy_.get();
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer_);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));
        curl_easy_setopt(curl, CURLOPT_NOPROXY, kNoProxyHosts);
        if (request.max_redirects > 0) {
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));
            curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
        }

        curl_slist* headers = nullptr;
        for (const auto& [name, value] : request.headers) {
            if (value.empty()) {
                continue;
            }
            headers = curl_slist_append(headers, (name + ": " + value).c_str());
        }
        // No 100-continue round trip for small bodies
        headers = curl_slist_append(headers, "Expect:");
        headers_.reset(headers);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_.get());

        if (request.method == "HEAD") {
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        } else if (request.method != "GET") {
            if (request.method != "POST") {
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            }
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, request.body.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlTransfer::on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &CurlTransfer::on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);

        if (curl_multi_add_handle(multi_.get(), curl) != CURLM_OK) {
            error = "Failed to schedule curl transfer";
            return false;
        }
        attached_ = true;
        return true;
    }

    // Run curl until `satisfied()` holds. Closed once the transfer is over,
    // TimedOut after `timeout` without a byte.
    template <typename Predicate>
    IoStatus drive(Predicate satisfied) {
        auto idle_deadline = std::chrono::steady_clock::now() + timeout_;
        while (!satisfied()) {
            if (done_) {
                return IoStatus::Closed;
            }
            if (token_ && token_->is_cancelled()) {
                error_ = "Cancelled";
                return IoStatus::Interrupted;
            }

            uint64_t seen = bytes_seen_;
            int running = 0;
            CURLMcode mc = curl_multi_perform(multi_.get(), &running);
            if (mc != CURLM_OK) {
                error_ = curl_multi_strerror(mc);
                return IoStatus::Error;
            }
            int queued = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &queued)) {
                if (msg->msg == CURLMSG_DONE) {
                    done_ = true;
                    result_ = msg->data.result;
                }
            }

            auto now = std::chrono::steady_clock::now();
            if (bytes_seen_ != seen || done_) {
                idle_deadline = now + timeout_;
                continue;
            }
            if (now >= idle_deadline) {
                error_ = "No data received for " + std::to_string(timeout_.count()) + "ms";
                return IoStatus::TimedOut;
            }
            auto wait = std::min(kPollSlice,
                std::chrono::duration_cast<std::chrono::milliseconds>(idle_deadline - now));
            mc = curl_multi_poll(multi_.get(), nullptr, 0, static_cast<int>(wait.count()), nullptr);
            if (mc != CURLM_OK) {
                error_ = curl_multi_strerror(mc);
                return IoStatus::Error;
            }
        }
        return IoStatus::Ok;
    }

    size_t buffered() const { return body_.size() - offset_; }

    size_t take(char* out, size_t capacity) {
        size_t n = std::min(capacity, buffered());
        std::copy_n(body_.data() + offset_, n, out);
        offset_ += n;
        if (offset_ == body_.size()) {
            body_.clear();
            offset_ = 0;
        }
        return n;
    }

    bool body_started() const { return body_started_; }
    bool done() const { return done_; }
    CURLcode result() const { return result_; }
    const std::string& head_block() const { return head_block_; }

    // Text for the last failure, curl's own detail when it has one
    std::string error() const {
        if (done_ && result_ != CURLE_OK) {
            return error_buffer_[0] != '\0' ? std::string(error_buffer_) : curl_easy_strerror(result_);
        }
        return error_;
    }

private:
    static size_t on_header(char* data, size_t size, size_t count, void* user) {
        auto* self = static_cast<CurlTransfer*>(user);
        size_t len = size * count;
        std::string line(data, len);
        // Each response along a redirect chain starts a fresh head
        if (line.rfind("HTTP/", 0) == 0) {
            self->head_block_.clear();
        }
        self->head_block_ += line;
        self->bytes_seen_ += len;
        return len;
    }

    static size_t on_body(char* data, size_t size, size_t count, void* user) {
        auto* self = static_cast<CurlTransfer*>(user);
        size_t len = size * count;
        self->body_.append(data, len);
        self->body_started_ = true;
        self->bytes_seen_ += len;
        return len;
    }

    std::chrono::milliseconds timeout_;
    const CancellationToken* token_;
    std::unique_ptr<CURLM, MultiDeleter> multi_;
    std::unique_ptr<CURL, EasyDeleter> easy_;
    std::unique_ptr<curl_slist, SlistDeleter> headers_;
    bool attached_ = false;
    char error_buffer_[CURL_ERROR_SIZE] = {};

    std::string head_block_;
    std::string body_;
    size_t offset_ = 0;
    uint64_t bytes_seen_ = 0;
    bool body_started_ = false;
    bool done_ = false;
    CURLcode result_ = CURLE_OK;
    std::string error_;
};

class CurlBodyReader : public BodyReader {
public:
    explicit CurlBodyReader(std::unique_ptr<CurlTransfer> transfer)
        : transfer_(std::move(transfer)) {}

    IoStatus read(char* buffer, size_t capacity, size_t& received) override {
        received = 0;
        IoStatus status = transfer_->drive([this] { return transfer_->buffered() > 0; });
        if (transfer_->buffered() > 0) {
            received = transfer_->take(buffer, capacity);
            return IoStatus::Ok;
        }
        if (status == IoStatus::Closed && transfer_->result() != CURLE_OK) {
            error_ = transfer_->error();
            return IoStatus::Error;
        }
        if (status != IoStatus::Closed) {
            error_ = transfer_->error();
        }
        return status;
    }

    std::string last_error() const override { return error_; }

private:
    std::unique_ptr<CurlTransfer> transfer_;
    std::string error_;
};

} // anonymous namespace

void HttpRequest::set_header(const std::string& name, const std::string& value) {
    headers[to_lower(name)] = value;
}

std::string HttpResponseHead::get_header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    if (it != headers.end()) {
        return it->second;
    }
    return {};
}

bool HttpResponseHead::has_header(const std::string& name) const {
    return headers.count(to_lower(name)) > 0;
}

std::optional<uint64_t> HttpResponseHead::content_length() const {
    if (!has_header("content-length")) {
        return std::nullopt;
    }
    return parse_u64(trim(get_header("content-length")));
}

std::optional<ContentRange> parse_content_range(const std::string& value) {
    std::string text = trim(value);
    if (to_lower(text.substr(0, 6)) != "bytes ") {
        return std::nullopt;
    }
    text = trim(text.substr(6));

    auto dash = text.find('-');
    auto slash = text.find('/');
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) {
        return std::nullopt;
    }

    auto first = parse_u64(text.substr(0, dash));
    auto last = parse_u64(text.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }

    ContentRange range;
    range.first = *first;
    range.last = *last;

    std::string total = text.substr(slash + 1);
    if (total != "*") {
        auto parsed = parse_u64(total);
        if (!parsed || *parsed <= *last) {
            return std::nullopt;
        }
        range.total = *parsed;
    }
    return range;
}

std::optional<HttpResponseHead> parse_response_head(const std::string& head) {
    std::istringstream stream(head);
    std::string line;
    if (!std::getline(stream, line)) {
        return std::nullopt;
    }
    line = trim(line);

    // HTTP/1.1 206 Partial Content
    if (line.rfind("HTTP/", 0) != 0) {
        return std::nullopt;
    }
    auto first_space = line.find(' ');
    if (first_space == std::string::npos) {
        return std::nullopt;
    }
    auto second_space = line.find(' ', first_space + 1);
    std::string code_text = line.substr(first_space + 1,
        second_space == std::string::npos ? std::string::npos : second_space - first_space - 1);
    auto code = parse_u64(code_text);
    if (!code || *code < 100 || *code > 999) {
        return std::nullopt;
    }

    HttpResponseHead result;
    result.status_code = static_cast<int>(*code);
    if (second_space != std::string::npos) {
        result.reason = line.substr(second_space + 1);
    }

    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        auto it = result.headers.find(name);
        if (it != result.headers.end()) {
            it->second += ", " + value;
        } else {
            result.headers.emplace(std::move(name), std::move(value));
        }
    }
    return result;
}

std::string HttpResponse::read_all(size_t limit) {
    std::string result;
    if (!body) {
        return result;
    }
    char buffer[kReadBufferSize];
    while (result.size() < limit) {
        size_t n = 0;
        if (body->read(buffer, sizeof(buffer), n) != IoStatus::Ok) {
            break;
        }
        result.append(buffer, std::min(n, limit - result.size()));
    }
    return result;
}

CurlHttpSource::CurlHttpSource() {
    ensure_curl_initialized();
}

HttpResult CurlHttpSource::fetch(const HttpRequest& request) {
    HttpResult result;

    auto url = parse_url(request.url);
    if (!url || (url->scheme != "http" && url->scheme != "https")) {
        result.error = ErrorCode::InvalidRequest;
        result.message = "Unsupported URL: " + request.url;
        return result;
    }

    auto transfer = std::make_unique<CurlTransfer>(request);
    std::string error;
    if (!transfer->start(request, error)) {
        result.error = ErrorCode::InternalError;
        result.message = error;
        return result;
    }

    Logger::instance().debug("{} {}", request.method, url->to_string());

    // The head is final once body bytes flow or the transfer ends
    IoStatus status = transfer->drive([&transfer] { return transfer->body_started(); });
    switch (status) {
        case IoStatus::Ok:
        case IoStatus::Closed:
            break;
        case IoStatus::Interrupted:
            result.error = ErrorCode::Cancelled;
            result.message = "Cancelled";
            return result;
        case IoStatus::TimedOut:
            result.error = ErrorCode::Timeout;
            result.message = "Timed out waiting for response: " + transfer->error();
            return result;
        case IoStatus::Error:
            result.error = ErrorCode::InternalError;
            result.message = transfer->error();
            return result;
    }

    if (transfer->done() && transfer->result() != CURLE_OK && !transfer->body_started()) {
        result.error = error_for_curl(transfer->result());
        result.message = transfer->error();
        return result;
    }

    auto head = parse_response_head(transfer->head_block());
    if (!head) {
        result.error = ErrorCode::ProtocolError;
        result.message = "Malformed HTTP response head";
        return result;
    }
    result.response.head = std::move(*head);
    result.response.body = std::make_unique<CurlBodyReader>(std::move(transfer));
    return result;
}

} // namespace transferd
