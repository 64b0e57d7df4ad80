#ifndef SNIAX_TRANSPORT_HPP
#define SNIAX_TRANSPORT_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <chrono>
#include <memory>
#include <stdexcept>

namespace sniax {

/**
 * @brief Raised on connect, write, read or timeout failures of a stream
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what, bool timeout = false)
        : std::runtime_error(what), timeout_(timeout) {}

    bool is_timeout() const { return timeout_; }

private:
    bool timeout_;
};

/**
 * @brief Connected byte stream owned by one AXFR session
 */
class IDnsStream {
public:
    virtual ~IDnsStream() = default;

    /// Write the whole buffer or throw TransportError
    virtual void write_all(const std::vector<uint8_t>& data) = 0;

    /**
     * @brief Read up to `len` bytes, waiting at most `timeout`
     * @return bytes read, always > 0
     * @throws TransportError on timeout, peer close or socket error
     */
    virtual size_t read_some(uint8_t* buf, size_t len,
                             std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Opens streams to host:port
 */
class IStreamConnector {
public:
    virtual ~IStreamConnector() = default;

    /// @throws TransportError if no address accepts the connection
    virtual std::unique_ptr<IDnsStream> connect(const std::string& host,
                                                uint16_t port) = 0;
};

/**
 * @brief Blocking TCP socket with poll()-based read deadlines
 */
class TcpStream : public IDnsStream {
public:
    explicit TcpStream(int fd);
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    void write_all(const std::vector<uint8_t>& data) override;
    size_t read_some(uint8_t* buf, size_t len,
                     std::chrono::milliseconds timeout) override;

private:
    int fd_;
};

/**
 * @brief Resolves the host with getaddrinfo and connects over TCP,
 *        relying on the system connect timeout
 */
class TcpConnector : public IStreamConnector {
public:
    std::unique_ptr<IDnsStream> connect(const std::string& host,
                                        uint16_t port) override;
};

} // namespace sniax

#endif // SNIAX_TRANSPORT_HPP
