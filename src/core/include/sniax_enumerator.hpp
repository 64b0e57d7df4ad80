#ifndef SNIAX_ENUMERATOR_HPP
#define SNIAX_ENUMERATOR_HPP

#include "sniax_axfr.hpp"
#include "sniax_cname.hpp"
#include "sniax_output.hpp"
#include "sniax_resolver.hpp"
#include "sniax_sni.hpp"
#include "sniax_thread_pool.hpp"

#include <string>
#include <vector>

namespace sniax {

/**
 * @brief Runs every discovery technique for one domain
 *
 * 1. Resolve the name servers; on failure the domain is abandoned.
 * 2. One AXFR probe per name server on the probe pool; each probe
 *    writes its names to the sink when it finishes.
 * 3. CNAME walk, then SNI sweep, each after the previous phase.
 */
class Enumerator {
public:
    struct Options {
        bool sni_parallel = false;   // run SNI candidates on the probe pool
    };

    struct Report {
        std::string domain;
        bool ns_resolved = false;
        size_t nameservers = 0;
        size_t axfr_names = 0;
        size_t cname_names = 0;
        size_t sni_names = 0;

        size_t total() const { return axfr_names + cname_names + sni_names; }
    };

    Enumerator(IResolver& resolver,
               const AxfrProber& prober,
               const CnameWalker& walker,
               const SniProbeSweep& sni,
               ThreadPool& probe_pool,
               OutputSink& sink);
    Enumerator(IResolver& resolver,
               const AxfrProber& prober,
               const CnameWalker& walker,
               const SniProbeSweep& sni,
               ThreadPool& probe_pool,
               OutputSink& sink,
               const Options& options);

    Report enumerate(const std::string& domain);

private:
    IResolver& resolver_;
    const AxfrProber& prober_;
    const CnameWalker& walker_;
    const SniProbeSweep& sni_;
    ThreadPool& probe_pool_;
    OutputSink& sink_;
    Options options_;
};

/**
 * @brief Enumerates many domains on a bounded domain pool
 *
 * Each input is normalized once, then handed to the Enumerator. run()
 * returns only after every domain, including its nested probes, is
 * done. A failing domain never stops the others.
 */
class FanoutDriver {
public:
    FanoutDriver(Enumerator& enumerator, ThreadPool& domain_pool)
        : enumerator_(enumerator), domain_pool_(domain_pool) {}

    /// Reports in input order
    std::vector<Enumerator::Report> run(const std::vector<std::string>& domains);

private:
    Enumerator& enumerator_;
    ThreadPool& domain_pool_;
};

} // namespace sniax

#endif // SNIAX_ENUMERATOR_HPP
