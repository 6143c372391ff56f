#ifndef TRANSFERD_TEST_LOOPBACK_SERVER_H
#define TRANSFERD_TEST_LOOPBACK_SERVER_H

#include "transferd/net/websocket.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace transferd::test {

// TCP server on 127.0.0.1 with an ephemeral port. Accepts `connections`
// connections one after another and runs `script` on each from the server
// thread. Scripts record what they saw; assertions stay on the test thread.
class LoopbackServer {
public:
    using Script = std::function<void(int fd, size_t index)>;

    LoopbackServer(size_t connections, Script script) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        int one = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 8) != 0) {
            return;
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this, connections, script = std::move(script)]() {
            for (size_t i = 0; i < connections; ++i) {
                struct pollfd pfd{listen_fd_, POLLIN, 0};
                if (::poll(&pfd, 1, 5000) <= 0) {
                    return;
                }
                int fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
                if (fd < 0) {
                    return;
                }
                struct timeval tv{5, 0};
                ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
                script(fd, i);
                ::close(fd);
            }
        });
    }

    ~LoopbackServer() {
        join();
        if (listen_fd_ >= 0) {
            ::close(listen_fd_);
        }
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return port_; }

    std::string url(const std::string& scheme, const std::string& target) const {
        return scheme + "://127.0.0.1:" + std::to_string(port_) + target;
    }

private:
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
};

inline bool write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

// Request head up to and excluding the blank line, read a byte at a time
// so nothing past it is consumed
inline std::string read_head(int fd) {
    std::string head;
    char c;
    while (head.size() < 64 * 1024 && ::recv(fd, &c, 1, 0) == 1) {
        head += c;
        if (head.size() >= 4 && head.compare(head.size() - 4, 4, "\r\n\r\n") == 0) {
            head.resize(head.size() - 4);
            break;
        }
    }
    return head;
}

inline std::string read_exact(int fd, size_t size) {
    std::string data(size, '\0');
    size_t got = 0;
    while (got < size) {
        ssize_t n = ::recv(fd, data.data() + got, size - got, 0);
        if (n <= 0) {
            break;
        }
        got += static_cast<size_t>(n);
    }
    data.resize(got);
    return data;
}

inline std::string request_line(const std::string& head) {
    return head.substr(0, head.find("\r\n"));
}

// Case-insensitive header lookup in a raw request head
inline std::string header_value(const std::string& head, const std::string& name) {
    auto lower = [](std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    };
    std::istringstream stream(head);
    std::string line;
    std::getline(stream, line);
    while (std::getline(stream, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos || lower(line.substr(0, colon)) != lower(name)) {
            continue;
        }
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        value.erase(value.find_last_not_of("\r ") + 1);
        return value;
    }
    return {};
}

// Next WebSocket frame from the client, unmasked
inline std::optional<WsFrame> read_frame(int fd, WsFrameParser& parser) {
    char buffer[4096];
    while (true) {
        if (auto frame = parser.next()) {
            return frame;
        }
        if (parser.failed()) {
            return std::nullopt;
        }
        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return std::nullopt;
        }
        parser.feed(buffer, static_cast<size_t>(n));
    }
}

} // namespace transferd::test

#endif // TRANSFERD_TEST_LOOPBACK_SERVER_H
