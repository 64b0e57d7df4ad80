#include "../include/sniax_resolver.hpp"

#include <cstring>
#include <netinet/in.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <resolv.h>

namespace sniax {

namespace {

static constexpr size_t ANSWER_BUFFER_SIZE = 8192;

// res_state is per call so concurrent domain workers never share it
dns::Message query_system(const std::string& name, dns::RecordType type) {
    struct __res_state state;
    std::memset(&state, 0, sizeof(state));
    if (res_ninit(&state) != 0) {
        throw ResolveError("resolver initialisation failed");
    }

    std::vector<uint8_t> answer(ANSWER_BUFFER_SIZE);
    int len = res_nquery(&state, name.c_str(), ns_c_in, static_cast<int>(type),
                         answer.data(), static_cast<int>(answer.size()));
    int herr = state.res_h_errno;
    res_nclose(&state);

    if (len < 0) {
        throw ResolveError("lookup " + dns::type_to_string(static_cast<uint16_t>(type)) +
                           " " + name + ": " + hstrerror(herr));
    }
    if (static_cast<size_t>(len) > answer.size()) {
        len = static_cast<int>(answer.size());
    }
    answer.resize(static_cast<size_t>(len));

    try {
        return dns::parse_message(answer);
    } catch (const dns::DecodeError& e) {
        throw ResolveError("lookup " + name + ": malformed answer: " + e.what());
    }
}

} // namespace

std::vector<std::string> select_ns(const dns::Message& msg, const std::string& domain) {
    std::vector<std::string> servers;
    for (const auto& rr : msg.answers) {
        if (rr.type == static_cast<uint16_t>(dns::RecordType::NS) &&
            dns::names_equal(rr.name, domain) && !rr.target.empty()) {
            servers.push_back(dns::strip_trailing_dot(rr.target));
        }
    }
    if (servers.empty()) {
        throw ResolveError("no NS records for " + domain);
    }
    return servers;
}

std::string select_cname(const dns::Message& msg, const std::string& host) {
    for (const auto& rr : msg.answers) {
        if (rr.type == static_cast<uint16_t>(dns::RecordType::CNAME) &&
            dns::names_equal(rr.name, host) && !rr.target.empty()) {
            return dns::strip_trailing_dot(rr.target);
        }
    }
    throw ResolveError("no CNAME record for " + host);
}

std::vector<std::string> SystemResolver::lookup_ns(const std::string& domain) {
    return select_ns(query_system(domain, dns::RecordType::NS), domain);
}

std::string SystemResolver::lookup_cname(const std::string& host) {
    return select_cname(query_system(host, dns::RecordType::CNAME), host);
}

} // namespace sniax
