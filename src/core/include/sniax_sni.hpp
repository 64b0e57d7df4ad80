#ifndef SNIAX_SNI_HPP
#define SNIAX_SNI_HPP

#include <string>
#include <vector>
#include <cstdint>

// OpenSSL forward declaration keeps ssl.h out of the public headers
typedef struct ssl_ctx_st SSL_CTX;

namespace sniax {

class ThreadPool;

/**
 * @brief Attempts a TLS handshake presenting `host` as SNI
 */
class ITlsDialer {
public:
    virtual ~ITlsDialer() = default;

    /// true if the handshake completed; failure is an expected outcome
    virtual bool handshake(const std::string& host, uint16_t port) = 0;
};

/**
 * @brief OpenSSL dialer with certificate verification disabled
 *
 * One SSL_CTX is shared by every handshake; SSL_CTX is safe to use
 * from several threads once configured.
 */
class OpenSslDialer : public ITlsDialer {
public:
    OpenSslDialer();
    ~OpenSslDialer() override;

    OpenSslDialer(const OpenSslDialer&) = delete;
    OpenSslDialer& operator=(const OpenSslDialer&) = delete;

    bool handshake(const std::string& host, uint16_t port) override;

private:
    SSL_CTX* ssl_ctx_ = nullptr;
};

/**
 * @brief Probes `label.domain` for every label of a fixed wordlist
 *
 * Results keep wordlist order whether the candidates run inline or on
 * a worker pool.
 */
class SniProbeSweep {
public:
    explicit SniProbeSweep(ITlsDialer& dialer, uint16_t port = 443);
    SniProbeSweep(ITlsDialer& dialer, std::vector<std::string> wordlist,
                  uint16_t port = 443);

    /**
     * @param pool when non-null, candidates are submitted to it and the
     *             call blocks until all of them finish
     */
    std::vector<std::string> sweep(const std::string& domain,
                                   ThreadPool* pool = nullptr) const;

    const std::vector<std::string>& wordlist() const { return wordlist_; }

    /// Common service labels probed by default
    static const std::vector<std::string>& default_wordlist();

private:
    ITlsDialer& dialer_;
    std::vector<std::string> wordlist_;
    uint16_t port_;
};

} // namespace sniax

#endif // SNIAX_SNI_HPP
