#include "transferd/net/connection.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <poll.h>
#include <curl/curl.h>

namespace transferd {

std::string to_string(IoStatus status) {
    switch (status) {
        case IoStatus::Ok: return "ok";
        case IoStatus::Closed: return "closed";
        case IoStatus::TimedOut: return "timed out";
        case IoStatus::Interrupted: return "interrupted";
        case IoStatus::Error: return "error";
    }
    return "error";
}

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw TransferdError(ErrorCode::InternalError, "Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

namespace {

enum class Readiness { Ready, TimedOut, Failed };

Readiness wait_socket(curl_socket_t fd, bool for_write, std::chrono::milliseconds timeout) {
    struct pollfd pfd{fd, static_cast<short>(for_write ? POLLOUT : POLLIN), 0};
    int rc;
    do {
        rc = ::poll(&pfd, 1, static_cast<int>(std::max<int64_t>(0, timeout.count())));
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) {
        return Readiness::TimedOut;
    }
    if (rc < 0 || (pfd.revents & POLLNVAL)) {
        return Readiness::Failed;
    }
    // POLLHUP and POLLERR are reported by the following curl call
    return Readiness::Ready;
}

std::chrono::milliseconds remaining_until(std::chrono::steady_clock::time_point deadline) {
    auto left = deadline - std::chrono::steady_clock::now();
    return std::max(std::chrono::milliseconds(0),
                    std::chrono::duration_cast<std::chrono::milliseconds>(left));
}

} // anonymous namespace

struct Connection::Impl {
    CURL* curl = nullptr;
    curl_socket_t socket = CURL_SOCKET_BAD;
    std::chrono::milliseconds timeout{30000};
    char error_buffer[CURL_ERROR_SIZE] = {};
    // An easy handle must not be used from two threads at once
    mutable std::mutex io_mutex;
    mutable std::mutex error_mutex;
    ErrorCode error_code = ErrorCode::Success;
    std::string error;

    void fail(ErrorCode code, std::string message) {
        std::lock_guard<std::mutex> lock(error_mutex);
        error_code = code;
        error = std::move(message);
    }

    std::string describe(CURLcode rc) const {
        return error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(rc);
    }

    void release() {
        if (curl) {
            curl_easy_cleanup(curl);
            curl = nullptr;
        }
        socket = CURL_SOCKET_BAD;
    }
};

Connection::Connection() : impl_(std::make_unique<Impl>()) {}

Connection::~Connection() {
    close();
}

bool Connection::connect(const std::string& host, uint16_t port, bool use_tls,
                         std::chrono::milliseconds timeout) {
    close();
    ensure_curl_initialized();

    std::lock_guard<std::mutex> lock(impl_->io_mutex);
    impl_->curl = curl_easy_init();
    if (!impl_->curl) {
        impl_->fail(ErrorCode::ConnectionFailed, "Failed to create curl handle");
        return false;
    }
    impl_->timeout = timeout;
    impl_->error_buffer[0] = '\0';

    std::string authority = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    std::string url = std::string(use_tls ? "https://" : "http://") + authority + ":" +
                      std::to_string(port) + "/";

    CURL* curl = impl_->curl;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
    // Through a configured proxy the stream must be a CONNECT tunnel
    curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROXY, kNoProxyHosts);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, impl_->error_buffer);
    // Only offer http/1.1 in ALPN; the caller speaks HTTP/1.1 on the raw stream
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_1_1));

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        impl_->fail(rc == CURLE_OPERATION_TIMEDOUT ? ErrorCode::Timeout : ErrorCode::ConnectionFailed,
                    "Failed to connect to " + authority + ":" + std::to_string(port) + ": " +
                    impl_->describe(rc));
        impl_->release();
        return false;
    }

    curl_socket_t socket = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &socket) != CURLE_OK ||
        socket == CURL_SOCKET_BAD) {
        impl_->fail(ErrorCode::ConnectionFailed, "No active socket after connect");
        impl_->release();
        return false;
    }
    impl_->socket = socket;
    impl_->fail(ErrorCode::Success, "");
    return true;
}

bool Connection::send_all(const std::string& data) {
    auto deadline = std::chrono::steady_clock::now() + impl_->timeout;
    size_t sent = 0;

    while (sent < data.size()) {
        curl_socket_t socket;
        {
            std::lock_guard<std::mutex> lock(impl_->io_mutex);
            if (!impl_->curl) {
                impl_->fail(ErrorCode::ConnectionClosed, "Connection is closed");
                return false;
            }
            size_t n = 0;
            CURLcode rc = curl_easy_send(impl_->curl, data.data() + sent, data.size() - sent, &n);
            if (rc == CURLE_OK) {
                sent += n;
                continue;
            }
            if (rc != CURLE_AGAIN) {
                impl_->fail(ErrorCode::SendFailed, "Send failed: " + impl_->describe(rc));
                return false;
            }
            socket = impl_->socket;
        }

        auto ready = wait_socket(socket, true, remaining_until(deadline));
        if (ready == Readiness::TimedOut) {
            impl_->fail(ErrorCode::Timeout, "Send timed out");
            return false;
        }
        if (ready == Readiness::Failed) {
            impl_->fail(ErrorCode::SendFailed, std::string("poll failed: ") + std::strerror(errno));
            return false;
        }
    }
    return true;
}

IoStatus Connection::receive(char* buffer, size_t capacity, size_t& received,
                             std::chrono::milliseconds timeout) {
    received = 0;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        curl_socket_t socket;
        {
            std::lock_guard<std::mutex> lock(impl_->io_mutex);
            if (!impl_->curl) {
                impl_->fail(ErrorCode::ConnectionClosed, "Connection is closed");
                return IoStatus::Error;
            }
            // TLS may hold decrypted bytes the socket no longer shows, so read before polling
            size_t n = 0;
            CURLcode rc = curl_easy_recv(impl_->curl, buffer, capacity, &n);
            if (rc == CURLE_OK) {
                if (n == 0) {
                    return IoStatus::Closed;
                }
                received = n;
                return IoStatus::Ok;
            }
            if (rc != CURLE_AGAIN) {
                impl_->fail(ErrorCode::ReceiveFailed, "Receive failed: " + impl_->describe(rc));
                return IoStatus::Error;
            }
            socket = impl_->socket;
        }

        auto left = remaining_until(deadline);
        if (left.count() == 0) {
            return IoStatus::TimedOut;
        }
        auto ready = wait_socket(socket, false, left);
        if (ready == Readiness::TimedOut) {
            return IoStatus::TimedOut;
        }
        if (ready == Readiness::Failed) {
            impl_->fail(ErrorCode::ReceiveFailed, "Connection is closed");
            return IoStatus::Error;
        }
    }
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(impl_->io_mutex);
    impl_->release();
}

bool Connection::is_open() const {
    std::lock_guard<std::mutex> lock(impl_->io_mutex);
    return impl_->curl != nullptr;
}

ErrorCode Connection::last_error_code() const {
    std::lock_guard<std::mutex> lock(impl_->error_mutex);
    return impl_->error_code;
}

std::string Connection::last_error() const {
    std::lock_guard<std::mutex> lock(impl_->error_mutex);
    return impl_->error;
}

} // namespace transferd
