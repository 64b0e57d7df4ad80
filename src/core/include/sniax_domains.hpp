#ifndef SNIAX_DOMAINS_HPP
#define SNIAX_DOMAINS_HPP

#include <string>
#include <vector>
#include <stdexcept>

namespace sniax {

/**
 * @brief Collect target domains from a list file or a single argument
 *
 * The file wins when both are given. Lines are trimmed and blank lines
 * skipped.
 * @throws std::runtime_error if the file cannot be opened or read
 */
std::vector<std::string> load_domains(const std::string& domain_file,
                                      const std::string& single_domain);

/**
 * @brief Strip one http:// or https:// scheme, then one leading "www."
 */
std::string normalize_domain(const std::string& domain);

} // namespace sniax

#endif // SNIAX_DOMAINS_HPP
