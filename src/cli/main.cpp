#include "sniax_axfr.hpp"
#include "sniax_cname.hpp"
#include "sniax_config.hpp"
#include "sniax_domains.hpp"
#include "sniax_enumerator.hpp"
#include "sniax_logger.hpp"
#include "sniax_output.hpp"
#include "sniax_resolver.hpp"
#include "sniax_sni.hpp"
#include "sniax_thread_pool.hpp"
#include "sniax_transport.hpp"

#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <cstdlib>
#include <stdexcept>
#include <sodium.h>

using namespace sniax;

static const char* PROG_NAME = "sniax";
static const char* VERSION = "v1.0.0";
static constexpr int MAX_POOL_SIZE = 1024;

// ============================================================================
// Argument parsing
// ============================================================================

// Flags that consume a value: -name value, --name value or -name=value
static const std::set<std::string> VALUE_FLAGS = {
    "d", "f", "delay", "o", "config", "workers", "probes", "log-level"
};

static const std::set<std::string> BOOL_FLAGS = {
    "sni-parallel", "h", "help", "version"
};

static void print_usage() {
    std::cout << "Usage: " << PROG_NAME
              << " -f <domain_file> or -d <single_domain> [-delay <ms>] [-o <output>]\n\n"
              << "Options:\n"
              << "  -d <domain>        single target domain\n"
              << "  -f <path>          file of newline-separated domains\n"
              << "  -delay <ms>        AXFR read timeout in milliseconds (default 1000)\n"
              << "  -o <path>          also write discovered names to this file\n"
              << "  -config <path>     key = value configuration file\n"
              << "  -workers <n>       domains enumerated at once (default 8)\n"
              << "  -probes <n>        AXFR/SNI probes running at once (default 16)\n"
              << "  -log-level <lvl>   trace, debug, info, warn, error, none\n"
              << "  -sni-parallel      run SNI candidates on the probe pool\n"
              << "  -version           print version\n";
}

static bool parse_args(int argc, char* argv[],
                       std::map<std::string, std::string>& opts,
                       std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            error = "unexpected argument: " + arg;
            return false;
        }

        std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
        std::string value;
        bool has_value = false;
        auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            has_value = true;
        }

        if (VALUE_FLAGS.count(name)) {
            if (!has_value) {
                if (i + 1 >= argc) {
                    error = "flag needs an argument: -" + name;
                    return false;
                }
                value = argv[++i];
            }
            opts[name] = value;
        } else if (BOOL_FLAGS.count(name)) {
            opts[name] = has_value ? value : "true";
        } else {
            error = "flag provided but not defined: -" + name;
            return false;
        }
    }
    return true;
}

static int parse_positive(const std::string& flag, const std::string& value) {
    int parsed = 0;
    try {
        size_t used = 0;
        parsed = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("invalid value \"" + value + "\" for flag -" + flag);
    }
    if (parsed <= 0) {
        throw std::invalid_argument("value for flag -" + flag + " must be positive");
    }
    return parsed;
}

// ============================================================================
// Setup helpers
// ============================================================================

static void apply_cli_overrides(const std::map<std::string, std::string>& opts) {
    auto& cfg = Config::instance();

    auto it = opts.find("delay");
    if (it != opts.end()) cfg.setInt("axfr.delay_ms", parse_positive("delay", it->second));

    it = opts.find("workers");
    if (it != opts.end()) cfg.setInt("scan.max_domains", parse_positive("workers", it->second));

    it = opts.find("probes");
    if (it != opts.end()) cfg.setInt("scan.max_probes", parse_positive("probes", it->second));

    it = opts.find("log-level");
    if (it != opts.end()) cfg.set("log.level", it->second);

    it = opts.find("sni-parallel");
    if (it != opts.end()) cfg.set("sni.parallel", it->second);
}

static void initialize_logging() {
    auto& log = Logger::instance();
    auto& cfg = Config::instance();

    log.setLevel(Logger::levelFromString(cfg.get("log.level", "info")));
    log.setConsoleOutput(cfg.getBool("log.console", true));

    std::string log_file = cfg.get("log.file");
    if (!log_file.empty() && !log.setFileOutput(log_file)) {
        SNIAX_LOG_WARN("Cannot open log file " + log_file + ", logging to console only");
    }
}

// ============================================================================
// main()
// ============================================================================

int main(int argc, char* argv[]) {
    std::map<std::string, std::string> opts;
    std::string error;
    if (!parse_args(argc, argv, opts, error)) {
        std::cerr << error << "\n";
        print_usage();
        return 2;
    }
    if (opts.count("h") || opts.count("help")) {
        print_usage();
        return 0;
    }
    if (opts.count("version")) {
        std::cout << PROG_NAME << " " << VERSION << std::endl;
        return 0;
    }

    try {
        auto& cfg = Config::instance();

        std::string config_path;
        if (opts.count("config")) {
            config_path = opts["config"];
        } else if (const char* env = std::getenv("SNIAX_CONFIG")) {
            config_path = env;
        }
        if (!config_path.empty() && !cfg.loadFromFile(config_path)) {
            SNIAX_LOG_FATAL("Failed to load config file: " + config_path);
            return EXIT_FAILURE;
        }

        try {
            apply_cli_overrides(opts);
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << "\n";
            print_usage();
            return 2;
        }
        initialize_logging();

        // Numeric settings are checked before any file or socket is opened
        const AxfrProber::Options axfr_opts = AxfrProber::Options::from_config(cfg);
        const auto sni_port = static_cast<uint16_t>(cfg.getIntInRange("sni.port", 443, 1, 65535));
        const auto max_probes = static_cast<size_t>(
            cfg.getIntInRange("scan.max_probes", 16, 1, MAX_POOL_SIZE));
        const auto max_domains = static_cast<size_t>(
            cfg.getIntInRange("scan.max_domains", 8, 1, MAX_POOL_SIZE));

        if (sodium_init() < 0) {
            SNIAX_LOG_FATAL("libsodium initialisation failed");
            return EXIT_FAILURE;
        }

        std::vector<std::string> domains = load_domains(opts["f"], opts["d"]);
        if (domains.empty()) {
            print_usage();
            return EXIT_FAILURE;
        }

        OutputSink sink(std::cout, opts["o"]);

        TcpConnector connector;
        AxfrProber prober(connector, axfr_opts);
        SystemResolver resolver;
        CnameWalker walker(resolver);
        OpenSslDialer dialer;
        SniProbeSweep sni(dialer, sni_port);

        Enumerator::Options enum_opts;
        enum_opts.sni_parallel = cfg.getBool("sni.parallel", false);

        // Domain workers block on probe futures, so the probe pool outlives them
        ThreadPool probe_pool("probe", max_probes);
        ThreadPool domain_pool("domain", max_domains);

        Enumerator enumerator(resolver, prober, walker, sni, probe_pool, sink, enum_opts);
        FanoutDriver driver(enumerator, domain_pool);

        SNIAX_LOG_DEBUG("Enumerating " + std::to_string(domains.size()) + " domain(s)");
        std::vector<Enumerator::Report> reports = driver.run(domains);

        size_t total = 0;
        for (const auto& report : reports) total += report.total();
        SNIAX_LOG_INFO("Done: " + std::to_string(reports.size()) + " domain(s), " +
                       std::to_string(total) + " name(s) discovered");
        return 0;

    } catch (const std::exception& e) {
        SNIAX_LOG_FATAL(e.what());
        return EXIT_FAILURE;
    }
}
