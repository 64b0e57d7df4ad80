#include "../include/sniax_domains.hpp"

#include <fstream>

namespace sniax {

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\v\f";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> load_domains(const std::string& domain_file,
                                      const std::string& single_domain) {
    std::vector<std::string> domains;

    if (!domain_file.empty()) {
        std::ifstream file(domain_file);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open domain file: " + domain_file);
        }
        std::string line;
        while (std::getline(file, line)) {
            std::string domain = trim(line);
            if (!domain.empty()) {
                domains.push_back(domain);
            }
        }
        if (file.bad()) {
            throw std::runtime_error("Failed to read domain file: " + domain_file);
        }
    } else if (!single_domain.empty()) {
        domains.push_back(single_domain);
    }
    return domains;
}

std::string normalize_domain(const std::string& domain) {
    std::string out = domain;

    if (starts_with(out, "https://")) {
        out = out.substr(8);
    } else if (starts_with(out, "http://")) {
        out = out.substr(7);
    }

    if (starts_with(out, "www.")) {
        out = out.substr(4);
    }
    return out;
}

} // namespace sniax
