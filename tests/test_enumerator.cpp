/**
 * @file test_enumerator.cpp
 * @brief Per-domain orchestration and multi-domain fan-out
 */

#include <gtest/gtest.h>
#include "sniax_dns_codec.hpp"
#include "sniax_enumerator.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

using namespace sniax;
using namespace std::chrono_literals;

namespace {

class FakeResolver : public IResolver {
public:
    std::vector<std::string> lookup_ns(const std::string& domain) override {
        std::lock_guard<std::mutex> lock(mtx_);
        ns_queries.push_back(domain);
        auto it = ns.find(domain);
        if (it == ns.end()) throw ResolveError("no NS records for " + domain);
        return it->second;
    }

    std::string lookup_cname(const std::string& host) override {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = cnames.find(host);
        if (it == cnames.end()) throw ResolveError("no CNAME record for " + host);
        return it->second;
    }

    std::map<std::string, std::vector<std::string>> ns;
    std::map<std::string, std::string> cnames;
    std::vector<std::string> ns_queries;

private:
    std::mutex mtx_;
};

// Serves one framed AXFR response, then times out
class ZoneStream : public IDnsStream {
public:
    explicit ZoneStream(std::vector<uint8_t> reply) : reply_(std::move(reply)) {}

    void write_all(const std::vector<uint8_t>&) override {}

    size_t read_some(uint8_t* buf, size_t len, std::chrono::milliseconds) override {
        if (reply_.empty()) throw TransportError("read timed out", true);
        size_t n = std::min(len, reply_.size());
        std::memcpy(buf, reply_.data(), n);
        reply_.erase(reply_.begin(), reply_.begin() + static_cast<long>(n));
        return n;
    }

private:
    std::vector<uint8_t> reply_;
};

class ZoneConnector : public IStreamConnector {
public:
    std::unique_ptr<IDnsStream> connect(const std::string& host, uint16_t) override {
        if (broken.count(host)) throw std::length_error("cannot allocate read buffer");
        auto it = zones.find(host);
        if (it == zones.end()) throw TransportError("connect " + host + ": refused");

        dns::Message msg;
        msg.header.response = true;
        for (const auto& name : it->second) {
            dns::ResourceRecord rr;
            rr.name = name + ".";
            rr.type = static_cast<uint16_t>(dns::RecordType::A);
            rr.address = "192.0.2.7";
            msg.answers.push_back(rr);
        }
        return std::make_unique<ZoneStream>(dns::frame_tcp(dns::encode_message(msg)));
    }

    std::map<std::string, std::vector<std::string>> zones;
    std::set<std::string> broken;
};

class AcceptDialer : public ITlsDialer {
public:
    explicit AcceptDialer(std::set<std::string> accept) : accept_(std::move(accept)) {}
    bool handshake(const std::string& host, uint16_t) override {
        return accept_.count(host) > 0;
    }

private:
    std::set<std::string> accept_;
};

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) lines.push_back(line);
    return lines;
}

size_t index_of(const std::vector<std::string>& lines, const std::string& value) {
    auto it = std::find(lines.begin(), lines.end(), value);
    return static_cast<size_t>(it - lines.begin());
}

} // namespace

class EnumeratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        resolver.ns = {
            {"good1.com", {"ns1.good1.com", "ns2.good1.com"}},
            {"good2.com", {"ns1.good2.com"}},
        };
        resolver.cnames = {{"good1.com", "alias.good1.net"}};

        connector.zones = {
            {"ns1.good1.com", {"a.good1.com"}},
            {"ns1.good2.com", {"b.good2.com", "c.good2.com"}},
        };

        axfr_opts.read_timeout = 5ms;
        axfr_opts.backoff = 1ms;
    }

    FakeResolver resolver;
    ZoneConnector connector;
    AcceptDialer dialer{std::set<std::string>{"www.good2.com", "api.good1.com", "www.shaky.com"}};
    AxfrProber::Options axfr_opts;
    std::ostringstream console;
};

TEST_F(EnumeratorTest, PhasesRunInOrder) {
    AxfrProber prober(connector, axfr_opts);
    CnameWalker walker(resolver);
    SniProbeSweep sni(dialer);
    OutputSink sink(console);
    ThreadPool probes("probe", 4);
    Enumerator enumerator(resolver, prober, walker, sni, probes, sink);

    auto report = enumerator.enumerate("good1.com");

    EXPECT_TRUE(report.ns_resolved);
    EXPECT_EQ(report.nameservers, 2u);
    EXPECT_EQ(report.axfr_names, 1u);
    EXPECT_EQ(report.cname_names, 1u);
    EXPECT_EQ(report.sni_names, 1u);

    auto lines = lines_of(console.str());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_LT(index_of(lines, "a.good1.com"), index_of(lines, "alias.good1.net"));
    EXPECT_LT(index_of(lines, "alias.good1.net"), index_of(lines, "api.good1.com"));
}

TEST_F(EnumeratorTest, NameServerFailureAbandonsDomain) {
    AxfrProber prober(connector, axfr_opts);
    CnameWalker walker(resolver);
    SniProbeSweep sni(dialer);
    OutputSink sink(console);
    ThreadPool probes("probe", 2);
    Enumerator enumerator(resolver, prober, walker, sni, probes, sink);

    resolver.cnames["missing.com"] = "should.not.be.walked";
    auto report = enumerator.enumerate("missing.com");

    EXPECT_FALSE(report.ns_resolved);
    EXPECT_EQ(report.total(), 0u);
    EXPECT_TRUE(console.str().empty());
}

TEST_F(EnumeratorTest, FailedProbeKeepsLaterPhases) {
    resolver.ns["shaky.com"] = {"ns1.shaky.com", "ns2.shaky.com"};
    resolver.cnames["shaky.com"] = "edge.shaky.net";
    connector.zones["ns1.shaky.com"] = {"a.shaky.com"};
    connector.broken = {"ns2.shaky.com"};

    AxfrProber prober(connector, axfr_opts);
    CnameWalker walker(resolver);
    SniProbeSweep sni(dialer);
    OutputSink sink(console);
    ThreadPool probes("probe", 2);
    ThreadPool domains("domain", 1);
    Enumerator enumerator(resolver, prober, walker, sni, probes, sink);
    FanoutDriver driver(enumerator, domains);

    auto reports = driver.run({"shaky.com"});

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_TRUE(reports[0].ns_resolved);
    EXPECT_EQ(reports[0].axfr_names, 1u);
    EXPECT_EQ(reports[0].cname_names, 1u);
    EXPECT_EQ(reports[0].sni_names, 1u);
    EXPECT_EQ(lines_of(console.str()),
              (std::vector<std::string>{"a.shaky.com", "edge.shaky.net", "www.shaky.com"}));
}

TEST_F(EnumeratorTest, FanoutCompletesEveryDomain) {
    AxfrProber prober(connector, axfr_opts);
    CnameWalker walker(resolver);
    SniProbeSweep sni(dialer);
    OutputSink sink(console);
    ThreadPool probes("probe", 4);
    ThreadPool domains("domain", 3);
    Enumerator enumerator(resolver, prober, walker, sni, probes, sink);
    FanoutDriver driver(enumerator, domains);

    auto reports = driver.run({"https://good1.com", "bad.com", "www.good2.com"});

    ASSERT_EQ(reports.size(), 3u);
    EXPECT_EQ(reports[0].domain, "good1.com");
    EXPECT_EQ(reports[1].domain, "bad.com");
    EXPECT_EQ(reports[2].domain, "good2.com");

    EXPECT_GT(reports[0].total(), 0u);
    EXPECT_FALSE(reports[1].ns_resolved);
    EXPECT_EQ(reports[1].total(), 0u);
    EXPECT_EQ(reports[2].axfr_names, 2u);
    EXPECT_EQ(reports[2].sni_names, 1u);

    auto lines = lines_of(console.str());
    std::multiset<std::string> got(lines.begin(), lines.end());
    std::multiset<std::string> expected = {
        "a.good1.com", "alias.good1.net", "api.good1.com",
        "b.good2.com", "c.good2.com", "www.good2.com",
    };
    EXPECT_EQ(got, expected);
    EXPECT_EQ(sink.lines_written(), expected.size());
}

TEST_F(EnumeratorTest, DomainsNormalizedOnceBeforeLookup) {
    AxfrProber prober(connector, axfr_opts);
    CnameWalker walker(resolver);
    SniProbeSweep sni(dialer);
    OutputSink sink(console);
    ThreadPool probes("probe", 2);
    ThreadPool domains("domain", 2);
    Enumerator enumerator(resolver, prober, walker, sni, probes, sink);
    FanoutDriver driver(enumerator, domains);

    driver.run({"http://www.good2.com"});

    ASSERT_EQ(resolver.ns_queries.size(), 1u);
    EXPECT_EQ(resolver.ns_queries[0], "good2.com");
}

TEST_F(EnumeratorTest, ParallelSniMatchesSequential) {
    AxfrProber prober(connector, axfr_opts);
    CnameWalker walker(resolver);
    SniProbeSweep sni(dialer);
    OutputSink sink(console);
    ThreadPool probes("probe", 4);
    Enumerator::Options opts;
    opts.sni_parallel = true;
    Enumerator enumerator(resolver, prober, walker, sni, probes, sink, opts);

    auto report = enumerator.enumerate("good2.com");
    EXPECT_EQ(report.sni_names, 1u);
    EXPECT_EQ(lines_of(console.str()).back(), "www.good2.com");
}

TEST_F(EnumeratorTest, SingleWorkerPoolsStillFinish) {
    AxfrProber prober(connector, axfr_opts);
    CnameWalker walker(resolver);
    SniProbeSweep sni(dialer);
    OutputSink sink(console);
    ThreadPool probes("probe", 1);
    ThreadPool domains("domain", 1);
    Enumerator::Options opts;
    opts.sni_parallel = true;
    Enumerator enumerator(resolver, prober, walker, sni, probes, sink, opts);
    FanoutDriver driver(enumerator, domains);

    auto reports = driver.run({"good1.com", "good2.com", "bad.com", "good1.com"});
    ASSERT_EQ(reports.size(), 4u);
    EXPECT_EQ(reports[0].total(), reports[3].total());
    EXPECT_EQ(sink.lines_written(), 3u + 3u + 0u + 3u);
}
