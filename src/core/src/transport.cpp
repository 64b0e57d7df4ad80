#include "../include/sniax_transport.hpp"

#include <cerrno>
#include <system_error>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>

namespace sniax {

// Thread-safe errno description
static std::string errno_text(int err) {
    return std::system_category().message(err);
}

// ==================== TcpStream ====================

TcpStream::TcpStream(int fd) : fd_(fd) {}

TcpStream::~TcpStream() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

void TcpStream::write_all(const std::vector<uint8_t>& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("send failed: ") + errno_text(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

size_t TcpStream::read_some(uint8_t* buf, size_t len,
                            std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);

        struct pollfd pfd = {fd_, POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll failed: ") + errno_text(errno));
        }
        if (rc == 0) {
            throw TransportError("read timed out after " +
                                 std::to_string(timeout.count()) + "ms", true);
        }

        ssize_t n = recv(fd_, buf, len, 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw TransportError(std::string("recv failed: ") + errno_text(errno));
        }
        if (n == 0) {
            throw TransportError("connection closed by peer");
        }
        return static_cast<size_t>(n);
    }
}

// ==================== TcpConnector ====================

std::unique_ptr<IDnsStream> TcpConnector::connect(const std::string& host,
                                                  uint16_t port) {
    struct addrinfo hints = {}, *result = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (gai != 0) {
        throw TransportError("resolve " + host + ": " + gai_strerror(gai));
    }

    std::string last_error = "no addresses";
    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno_text(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            freeaddrinfo(result);
            return std::make_unique<TcpStream>(fd);
        }
        last_error = errno_text(errno);
        close(fd);
    }

    freeaddrinfo(result);
    throw TransportError("connect " + host + ":" + service + ": " + last_error);
}

} // namespace sniax
