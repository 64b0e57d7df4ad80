#include "../include/sniax_enumerator.hpp"
#include "../include/sniax_domains.hpp"
#include "../include/sniax_logger.hpp"

#include <future>
#include <utility>

namespace sniax {

// ==================== Enumerator ====================

Enumerator::Enumerator(IResolver& resolver,
                       const AxfrProber& prober,
                       const CnameWalker& walker,
                       const SniProbeSweep& sni,
                       ThreadPool& probe_pool,
                       OutputSink& sink)
    : Enumerator(resolver, prober, walker, sni, probe_pool, sink, Options()) {}

Enumerator::Enumerator(IResolver& resolver,
                       const AxfrProber& prober,
                       const CnameWalker& walker,
                       const SniProbeSweep& sni,
                       ThreadPool& probe_pool,
                       OutputSink& sink,
                       const Options& options)
    : resolver_(resolver)
    , prober_(prober)
    , walker_(walker)
    , sni_(sni)
    , probe_pool_(probe_pool)
    , sink_(sink)
    , options_(options)
{}

Enumerator::Report Enumerator::enumerate(const std::string& domain) {
    Report report;
    report.domain = domain;

    const LogContext log("ENUM", domain);
    log.info("enumerating subdomains");

    std::vector<std::string> nameservers;
    try {
        nameservers = resolver_.lookup_ns(domain);
    } catch (const ResolveError& e) {
        LogContext("NS", domain).error(std::string("failed to get NS records: ") + e.what());
        return report;
    }
    report.ns_resolved = true;
    report.nameservers = nameservers.size();

    // AXFR: one probe per name server, results written as each finishes
    const LogContext axfr_log("AXFR", domain);
    std::vector<std::pair<std::string, std::future<size_t>>> probes;
    probes.reserve(nameservers.size());
    for (const auto& ns : nameservers) {
        axfr_log.via(ns).info("attempting zone transfer");
        probes.emplace_back(ns, probe_pool_.submit([this, domain, ns] {
            std::vector<std::string> names = prober_.probe(domain, ns);
            if (names.empty()) {
                LogContext("AXFR", domain, ns).info("failed or timed out");
            } else {
                sink_.write(names);
            }
            return names.size();
        }));
    }
    // A failing probe costs only its own name server
    for (auto& probe : probes) {
        try {
            report.axfr_names += probe.second.get();
        } catch (const std::exception& e) {
            axfr_log.via(probe.first).error(std::string("probe aborted: ") + e.what());
        }
    }

    LogContext("CNAME", domain).info("attempting CNAME chaining");
    std::vector<std::string> chained = walker_.walk(domain);
    sink_.write(chained);
    report.cname_names = chained.size();

    LogContext("SNI", domain).info("attempting SNI enumeration");
    std::vector<std::string> sni_hosts =
        sni_.sweep(domain, options_.sni_parallel ? &probe_pool_ : nullptr);
    sink_.write(sni_hosts);
    report.sni_names = sni_hosts.size();

    log.info("finished: " + std::to_string(report.total()) + " names");
    return report;
}

// ==================== FanoutDriver ====================

std::vector<Enumerator::Report> FanoutDriver::run(const std::vector<std::string>& domains) {
    std::vector<std::pair<std::string, std::future<Enumerator::Report>>> tasks;
    tasks.reserve(domains.size());

    for (const auto& raw : domains) {
        const std::string domain = normalize_domain(raw);
        tasks.emplace_back(domain, domain_pool_.submit([this, domain] {
            return enumerator_.enumerate(domain);
        }));
    }

    std::vector<Enumerator::Report> reports;
    reports.reserve(tasks.size());
    for (auto& task : tasks) {
        try {
            reports.push_back(task.second.get());
        } catch (const std::exception& e) {
            LogContext("ENUM", task.first).error(std::string("aborted: ") + e.what());
            Enumerator::Report failed;
            failed.domain = task.first;
            reports.push_back(failed);
        }
    }
    return reports;
}

} // namespace sniax
