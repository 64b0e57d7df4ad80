#include "../include/sniax_axfr.hpp"
#include "../include/sniax_config.hpp"
#include "../include/sniax_dns_codec.hpp"
#include "../include/sniax_logger.hpp"

#include <thread>

namespace sniax {

static constexpr int MAX_WAIT_MS = 10 * 60 * 1000;

AxfrProber::Options AxfrProber::Options::from_config(const Config& cfg) {
    Options opts;
    opts.read_timeout = std::chrono::milliseconds(
        cfg.getIntInRange("axfr.delay_ms", 1000, 1, MAX_WAIT_MS));
    opts.attempts = cfg.getIntInRange("axfr.attempts", 3, 1, 100);
    opts.backoff = std::chrono::milliseconds(
        cfg.getIntInRange("axfr.backoff_ms", 2000, 0, MAX_WAIT_MS));
    opts.read_size = static_cast<size_t>(
        cfg.getIntInRange("axfr.read_size", 512, 2, 65535));
    opts.port = static_cast<uint16_t>(cfg.getIntInRange("axfr.port", 53, 1, 65535));
    return opts;
}

AxfrProber::AxfrProber(IStreamConnector& connector)
    : AxfrProber(connector, Options()) {}

AxfrProber::AxfrProber(IStreamConnector& connector, const Options& options)
    : connector_(connector), options_(options) {
    if (options_.read_size < 2) options_.read_size = 2;
}

std::vector<std::string> AxfrProber::probe(const std::string& domain,
                                           const std::string& nameserver) const {
    std::vector<std::string> result;
    const LogContext log("AXFR", domain, nameserver);

    std::unique_ptr<IDnsStream> stream;
    try {
        stream = connector_.connect(nameserver, options_.port);
    } catch (const TransportError& e) {
        log.warn(std::string("connect failed: ") + e.what());
        return result;
    }

    std::vector<uint8_t> query;
    try {
        query = dns::frame_tcp(dns::build_axfr_query(domain));
    } catch (const dns::EncodeError& e) {
        log.error(std::string("failed to pack request: ") + e.what());
        return result;
    }

    try {
        stream->write_all(query);
    } catch (const TransportError& e) {
        log.warn(std::string("failed to send request: ") + e.what());
        return result;
    }

    dns::TcpFrameBuffer frames;
    std::vector<uint8_t> buf(options_.read_size);
    std::vector<uint8_t> message;

    for (int attempt = 1; attempt <= options_.attempts; ++attempt) {
        size_t n = 0;
        try {
            n = stream->read_some(buf.data(), buf.size(), options_.read_timeout);
        } catch (const TransportError& e) {
            log.debug("read attempt " + std::to_string(attempt) + "/" +
                      std::to_string(options_.attempts) + " failed: " + e.what());
            std::this_thread::sleep_for(options_.backoff);
            continue;
        }

        frames.append(buf.data(), n);
        while (frames.next(message)) {
            std::vector<dns::Answer> answers;
            try {
                answers = dns::parse_response(message);
            } catch (const dns::DecodeError& e) {
                log.warn(std::string("failed to unpack response: ") + e.what());
                return result;
            }
            for (const auto& answer : answers) {
                std::string name = dns::strip_trailing_dot(answer.name);
                log.debug(dns::type_to_string(static_cast<uint16_t>(answer.type)) + " " + name);
                result.push_back(name);
            }
        }
    }

    return result;
}

} // namespace sniax
