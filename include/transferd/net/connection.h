#ifndef TRANSFERD_NET_CONNECTION_H
#define TRANSFERD_NET_CONNECTION_H

#include "transferd/base/error_code.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace transferd {

// Outcome of a single socket operation
enum class IoStatus {
    Ok,
    Closed,       // orderly shutdown by the peer
    TimedOut,
    Interrupted,  // caller's cancellation token fired while waiting
    Error
};

std::string to_string(IoStatus status);

// One-time libcurl setup; safe to call from any thread
void ensure_curl_initialized();

// Hosts never sent through a proxy
inline constexpr const char* kNoProxyHosts = "localhost,127.0.0.1,::1";

// Raw byte stream over libcurl's connect-only mode: curl resolves, connects
// and runs the TLS handshake, the caller speaks the protocol.
// send_all and receive may run on two threads at once.
class Connection {
public:
    Connection();
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // `timeout` bounds the connect and every later send
    bool connect(const std::string& host, uint16_t port, bool use_tls,
                 std::chrono::milliseconds timeout);

    bool send_all(const std::string& data);

    // Wait up to `timeout` for data, then read whatever is available
    IoStatus receive(char* buffer, size_t capacity, size_t& received,
                     std::chrono::milliseconds timeout);

    void close();

    bool is_open() const;

    // Error kind and text of the last failed operation
    ErrorCode last_error_code() const;
    std::string last_error() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace transferd

#endif // TRANSFERD_NET_CONNECTION_H
