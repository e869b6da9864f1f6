#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <cerrno>
#include <cstring>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "client_protocol.h"
#include "cdc_errors.h"

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")
#define poll WSAPoll
#else
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#define INVALID_SOCKET -1
#define closesocket ::close
typedef int SOCKET;
#endif

// =============================================================================
// TRANSPORT INTERFACE
// =============================================================================
// One byte-stream connection. Bytes come out of receive() in the order the
// peer sent them. "No data yet" (Empty) and "peer closed" (Closed) are
// distinct results, never exceptions; hard socket failures throw IOError.
// =============================================================================
enum class RecvStatus { Data, Empty, Closed };
enum class RecvMode { Blocking, NonBlocking };

struct RecvResult {
    RecvStatus status = RecvStatus::Empty;
    std::string bytes;

    static RecvResult data(std::string b) { return {RecvStatus::Data, std::move(b)}; }
    static RecvResult empty() { return {RecvStatus::Empty, {}}; }
    static RecvResult closed() { return {RecvStatus::Closed, {}}; }
};

class Transport {
public:
    virtual ~Transport() = default;

    // Writes every byte or throws IOError.
    virtual void send(const std::string& bytes) = 0;

    // Blocking mode waits up to `timeout` (zero or negative waits forever);
    // NonBlocking mode returns Empty at once when nothing is buffered.
    virtual RecvResult receive(size_t max_bytes, RecvMode mode,
                               std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) = 0;

    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

// =============================================================================
// SOCKET HELPERS
// =============================================================================
inline std::string last_socket_error() {
#ifdef _WIN32
    return "WSA error " + std::to_string(WSAGetLastError());
#else
    return std::strerror(errno);
#endif
}

inline bool socket_would_block() {
#ifdef _WIN32
    int e = WSAGetLastError();
    return e == WSAEWOULDBLOCK || e == WSAEINTR;
#else
    return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
#endif
}

inline bool set_socket_blocking(SOCKET s, bool blocking) {
#ifdef _WIN32
    u_long mode = blocking ? 0 : 1;
    return ioctlsocket(s, FIONBIO, &mode) == 0;
#else
    int flags = fcntl(s, F_GETFL, 0);
    if (flags < 0) return false;
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(s, F_SETFL, flags) == 0;
#endif
}

// Non-blocking connect bounded by timeout_ms; leaves the socket blocking.
// Returns 0 on success, otherwise the socket error code.
inline int connect_with_timeout(SOCKET s, const sockaddr* addr, socklen_t addr_len, int timeout_ms) {
    if (!set_socket_blocking(s, false)) return -1;

    int res = ::connect(s, addr, addr_len);
    if (res != 0) {
#ifdef _WIN32
        if (WSAGetLastError() != WSAEWOULDBLOCK) return WSAGetLastError();
#else
        if (errno != EINPROGRESS) return errno;
#endif
        pollfd pfd{};
        pfd.fd = s;
        pfd.events = POLLOUT;

        int ret = poll(&pfd, 1, timeout_ms);
        if (ret == 0) return ETIMEDOUT;
        if (ret < 0) return errno;

        int err = 0;
        socklen_t len = sizeof(err);
        getsockopt(s, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&err), &len);
        if (err != 0) return err;
    }
    return set_socket_blocking(s, true) ? 0 : -1;
}

// =============================================================================
// TCP TRANSPORT
// =============================================================================
class TcpTransport : public Transport {
public:
    // Resolves host (IPv4 or IPv6) and tries every address in turn.
    // Throws ConnectionError when no address accepts the connection.
    static std::unique_ptr<TcpTransport> connect(const std::string& host, int port,
                                                 std::chrono::milliseconds timeout,
                                                 AsyncLogger* logger = nullptr) {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* res = nullptr;
        std::string port_str = std::to_string(port);
        int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
        if (rc != 0) {
            throw ConnectionError("cannot resolve " + host + ": " + gai_strerror(rc));
        }

        std::string peer = host + ":" + port_str;
        std::string last_error = "no usable address";
        SOCKET connected = INVALID_SOCKET;

        for (addrinfo* ai = res; ai; ai = ai->ai_next) {
            SOCKET s = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (s == INVALID_SOCKET) { last_error = "socket() failed: " + last_socket_error(); continue; }

            int err = connect_with_timeout(s, ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen),
                                           static_cast<int>(timeout.count()));
            if (err == 0) { connected = s; break; }

            last_error = (err == ETIMEDOUT) ? std::string("connect timed out")
                                            : std::string(err > 0 ? std::strerror(err) : "connect failed");
            log_to(logger, AsyncLogger::DEBUG, "Connect to " + peer + " failed on one address: " + last_error);
            closesocket(s);
        }
        ::freeaddrinfo(res);

        if (connected == INVALID_SOCKET) {
            throw ConnectionError("cannot connect to " + peer + ": " + last_error);
        }
        log_to(logger, AsyncLogger::INFO, "Connected to " + peer);
        return std::unique_ptr<TcpTransport>(new TcpTransport(connected, peer));
    }

    ~TcpTransport() override { close(); }
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    void send(const std::string& bytes) override {
        if (sock_ == INVALID_SOCKET) throw IOError("send on closed connection to " + peer_);
        int flags = 0;
#ifdef MSG_NOSIGNAL
        flags |= MSG_NOSIGNAL;
#endif
        size_t total = 0;
        while (total < bytes.size()) {
            auto n = ::send(sock_, bytes.data() + total, static_cast<int>(bytes.size() - total), flags);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) throw IOError("send to " + peer_ + " failed: " + last_socket_error());
            total += static_cast<size_t>(n);
        }
    }

    RecvResult receive(size_t max_bytes, RecvMode mode,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(0)) override {
        if (sock_ == INVALID_SOCKET) throw IOError("receive on closed connection to " + peer_);

        int wait_ms = 0;
        if (mode == RecvMode::Blocking) wait_ms = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;

        pollfd pfd{};
        pfd.fd = sock_;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) return RecvResult::empty();
            throw IOError("poll on " + peer_ + " failed: " + last_socket_error());
        }
        if (ret == 0) return RecvResult::empty();

        std::vector<char> buf(max_bytes);
        auto n = ::recv(sock_, buf.data(), static_cast<int>(buf.size()), 0);
        if (n == 0) return RecvResult::closed();
        if (n < 0) {
            if (socket_would_block()) return RecvResult::empty();
            throw IOError("recv from " + peer_ + " failed: " + last_socket_error());
        }
        return RecvResult::data(std::string(buf.data(), static_cast<size_t>(n)));
    }

    bool is_open() const override { return sock_ != INVALID_SOCKET; }

    void close() override {
        if (sock_ != INVALID_SOCKET) {
            closesocket(sock_);
            sock_ = INVALID_SOCKET;
        }
    }

    const std::string& peer() const { return peer_; }

private:
    TcpTransport(SOCKET s, std::string peer) : sock_(s), peer_(std::move(peer)) {}

    SOCKET sock_;
    std::string peer_;
};

#endif
