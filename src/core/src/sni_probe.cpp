#include "../include/sniax_sni.hpp"
#include "../include/sniax_logger.hpp"
#include "../include/sniax_thread_pool.hpp"

#include <future>
#include <stdexcept>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/bio.h>

namespace sniax {

// ==================== OpenSslDialer ====================

OpenSslDialer::OpenSslDialer() {
    SSL_library_init();
    SSL_load_error_strings();

    ssl_ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ssl_ctx_) {
        throw std::runtime_error("SSL_CTX_new failed");
    }
    SSL_CTX_set_options(ssl_ctx_, SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3);
    // Any certificate is accepted: only the handshake outcome matters
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_NONE, nullptr);
}

OpenSslDialer::~OpenSslDialer() {
    if (ssl_ctx_) {
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
    }
}

bool OpenSslDialer::handshake(const std::string& host, uint16_t port) {
    // BIO_new_ssl_connect takes its own reference on ssl_ctx_
    BIO* bio = BIO_new_ssl_connect(ssl_ctx_);
    if (!bio) return false;

    std::string connect_str = host + ":" + std::to_string(port);
    BIO_set_conn_hostname(bio, connect_str.c_str());

    SSL* ssl = nullptr;
    BIO_get_ssl(bio, &ssl);
    if (ssl) {
        SSL_set_tlsext_host_name(ssl, host.c_str());
    }

    bool ok = BIO_do_connect(bio) > 0;
    if (!ok) {
        ERR_clear_error();
    }
    BIO_free_all(bio);
    return ok;
}

// ==================== SniProbeSweep ====================

const std::vector<std::string>& SniProbeSweep::default_wordlist() {
    static const std::vector<std::string> labels = {
        "www", "mail", "ftp", "webmail", "smtp", "portal", "vpn", "api", "dev", "test",
        "staging", "beta", "alpha", "dev-api", "sandbox", "preprod", "prod", "uat", "qa", "demo",
        "auth", "login", "register", "signup", "accounts", "user", "profile", "admin", "adminpanel",
        "help", "support", "docs", "documentation", "contact", "knowledgebase", "kb", "faq",
        "blog", "news", "media", "static", "images", "img", "cdn", "video", "assets", "resources",
        "shop", "store", "cart", "checkout", "order", "payments", "billing", "invoice", "pay",
        "analytics", "track", "tracking", "stats", "metrics", "data", "insights", "reports",
        "status", "monitor", "dashboard", "gateway", "node", "cdn", "proxy", "edge", "backup",
        "community", "forum", "discuss", "discussion", "social", "events", "meetup", "groups",
        "internal", "devtools", "tools", "config", "settings", "configurations",
        "developers", "developer", "api-docs", "api-portal", "graphql", "rest",
        "marketing", "promo", "offers", "campaign", "landing", "sales",
        "client", "userportal", "account", "my", "myaccount", "customer", "members", "portal",
        "app", "test1", "test2", "api-staging", "dashboard", "console", "manage", "sso",
        "single-sign-on", "backup", "service", "sync",
    };
    return labels;
}

SniProbeSweep::SniProbeSweep(ITlsDialer& dialer, uint16_t port)
    : SniProbeSweep(dialer, default_wordlist(), port) {}

SniProbeSweep::SniProbeSweep(ITlsDialer& dialer, std::vector<std::string> wordlist,
                             uint16_t port)
    : dialer_(dialer), wordlist_(std::move(wordlist)), port_(port) {}

std::vector<std::string> SniProbeSweep::sweep(const std::string& domain,
                                              ThreadPool* pool) const {
    std::vector<std::string> result;
    const LogContext log("SNI", domain);

    if (!pool) {
        for (const auto& label : wordlist_) {
            std::string host = label + "." + domain;
            if (dialer_.handshake(host, port_)) {
                log.debug("handshake accepted for " + host);
                result.push_back(host);
            }
        }
        return result;
    }

    std::vector<std::pair<std::string, std::future<bool>>> pending;
    pending.reserve(wordlist_.size());
    for (const auto& label : wordlist_) {
        std::string host = label + "." + domain;
        pending.emplace_back(host, pool->submit([this, host] {
            return dialer_.handshake(host, port_);
        }));
    }
    for (auto& entry : pending) {
        if (entry.second.get()) {
            log.debug("handshake accepted for " + entry.first);
            result.push_back(entry.first);
        }
    }
    return result;
}

} // namespace sniax
