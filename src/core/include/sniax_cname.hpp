#ifndef SNIAX_CNAME_HPP
#define SNIAX_CNAME_HPP

#include "sniax_resolver.hpp"

#include <string>
#include <vector>

namespace sniax {

/**
 * @brief Follows a CNAME chain one hop at a time
 *
 * Stops when the chain returns to the starting domain, revisits a
 * target, or a lookup fails. Only a failure on the first hop is logged.
 */
class CnameWalker {
public:
    explicit CnameWalker(IResolver& resolver) : resolver_(resolver) {}

    /// Distinct intermediate hostnames in chain order
    std::vector<std::string> walk(const std::string& domain) const;

private:
    IResolver& resolver_;
};

} // namespace sniax

#endif // SNIAX_CNAME_HPP
