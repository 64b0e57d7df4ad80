#include "../include/sniax_cname.hpp"
#include "../include/sniax_dns_codec.hpp"
#include "../include/sniax_logger.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace sniax {

static std::string visit_key(const std::string& name) {
    std::string key = dns::strip_trailing_dot(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

std::vector<std::string> CnameWalker::walk(const std::string& domain) const {
    std::vector<std::string> result;
    const LogContext log("CNAME", domain);

    std::string cname;
    try {
        cname = resolver_.lookup_cname(domain);
    } catch (const ResolveError& e) {
        log.warn(e.what());
        return result;
    }

    std::set<std::string> visited;
    while (!dns::names_equal(cname, domain)) {
        if (!visited.insert(visit_key(cname)).second) {
            log.debug("cycle at " + cname);
            break;
        }
        result.push_back(cname);

        try {
            cname = resolver_.lookup_cname(cname);
        } catch (const ResolveError&) {
            break;  // end of chain
        }
    }
    return result;
}

} // namespace sniax
