#ifndef SNIAX_AXFR_HPP
#define SNIAX_AXFR_HPP

#include "sniax_transport.hpp"

#include <string>
#include <vector>
#include <cstdint>
#include <chrono>

namespace sniax {

class Config;

/**
 * @brief Zone transfer probe against one (domain, name server) pair
 *
 * Sends a single AXFR query, then spends a fixed budget of read
 * attempts collecting A and CNAME owner names. A failed read costs a
 * fixed backoff sleep and counts against the budget. The probe does
 * not look for the closing SOA; it ends when the budget is spent or a
 * message fails to decode.
 *
 * Every failure is logged and yields the names gathered so far.
 */
class AxfrProber {
public:
    struct Options {
        std::chrono::milliseconds read_timeout{1000};
        int attempts = 3;
        std::chrono::milliseconds backoff{2000};
        size_t read_size = 512;
        uint16_t port = 53;

        /// Reads the axfr.* keys. @throws ConfigError on a bad value
        static Options from_config(const Config& cfg);
    };

    explicit AxfrProber(IStreamConnector& connector);
    AxfrProber(IStreamConnector& connector, const Options& options);

    /// Ordered owner names, trailing dot stripped, duplicates kept
    std::vector<std::string> probe(const std::string& domain,
                                   const std::string& nameserver) const;

    const Options& options() const { return options_; }

private:
    IStreamConnector& connector_;
    Options options_;
};

} // namespace sniax

#endif // SNIAX_AXFR_HPP
