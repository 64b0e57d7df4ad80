#ifndef SNIAX_RESOLVER_HPP
#define SNIAX_RESOLVER_HPP

#include "sniax_dns_codec.hpp"

#include <string>
#include <vector>
#include <stdexcept>

namespace sniax {

/**
 * @brief Raised when a lookup fails or returns no usable record
 */
class ResolveError : public std::runtime_error {
public:
    explicit ResolveError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Name server and single-hop CNAME lookups
 *
 * Returned names carry no trailing dot.
 */
class IResolver {
public:
    virtual ~IResolver() = default;

    /// @throws ResolveError if the domain has no NS records
    virtual std::vector<std::string> lookup_ns(const std::string& domain) = 0;

    /// One hop only. @throws ResolveError if `host` has no CNAME
    virtual std::string lookup_cname(const std::string& host) = 0;
};

/// NS targets whose owner is `domain`, in answer order.
/// @throws ResolveError if the answer section holds none
std::vector<std::string> select_ns(const dns::Message& msg, const std::string& domain);

/// First CNAME target owned by `host`. @throws ResolveError if absent
std::string select_cname(const dns::Message& msg, const std::string& host);

/**
 * @brief Queries the system recursive resolver through res_nquery and
 *        decodes the answers with the DNS codec
 */
class SystemResolver : public IResolver {
public:
    std::vector<std::string> lookup_ns(const std::string& domain) override;
    std::string lookup_cname(const std::string& host) override;
};

} // namespace sniax

#endif // SNIAX_RESOLVER_HPP
