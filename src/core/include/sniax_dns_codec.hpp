#ifndef SNIAX_DNS_CODEC_HPP
#define SNIAX_DNS_CODEC_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

namespace sniax {
namespace dns {

/**
 * @brief DNS record types used by the enumerator (RFC 1035, RFC 5936)
 */
enum class RecordType : uint16_t {
    A     = 1,
    NS    = 2,
    CNAME = 5,
    SOA   = 6,
    PTR   = 12,
    MX    = 15,
    TXT   = 16,
    AAAA  = 28,
    AXFR  = 252
};

static constexpr uint16_t CLASS_INET = 1;
static constexpr uint8_t  OPCODE_QUERY = 0;

/// Maximum presentation length of a name, without the trailing dot
static constexpr size_t MAX_NAME_LENGTH = 253;
static constexpr size_t MAX_LABEL_LENGTH = 63;
static constexpr size_t HEADER_SIZE = 12;

/**
 * @brief Raised when a name or message cannot be represented on the wire
 */
class EncodeError : public std::runtime_error {
public:
    explicit EncodeError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Raised when a buffer is not a well-formed DNS message
 */
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

struct Header {
    uint16_t id = 0;
    bool response = false;
    uint8_t opcode = OPCODE_QUERY;
    bool authoritative = false;
    bool truncated = false;
    bool recursion_desired = false;
    bool recursion_available = false;
    uint8_t rcode = 0;
};

struct Question {
    std::string name;    // FQDN, trailing dot included
    uint16_t type = 0;
    uint16_t qclass = CLASS_INET;
};

/**
 * @brief Decoded resource record
 *
 * `target` holds the decoded domain name for NS, CNAME, PTR, MX
 * (exchange) and SOA (primary server) records. `address` holds the
 * textual address for A and AAAA. `rdata` always keeps the raw bytes.
 */
struct ResourceRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t rclass = CLASS_INET;
    uint32_t ttl = 0;
    std::vector<uint8_t> rdata;
    std::string target;
    std::string address;
};

struct Message {
    Header header;
    std::vector<Question> questions;
    std::vector<ResourceRecord> answers;
    std::vector<ResourceRecord> authorities;
    std::vector<ResourceRecord> additionals;
};

/**
 * @brief Answer surfaced to the AXFR prober (A and CNAME only)
 */
struct Answer {
    std::string name;     // owner name, trailing dot included
    RecordType type;
    std::string data;     // address for A, target for CNAME
};

// ==================== Encoding ====================

/**
 * @brief Encode a presentation-format name into wire labels
 *
 * Accepts an optional trailing dot. "." encodes the root.
 * @throws EncodeError on empty or oversized labels, characters outside
 *         [A-Za-z0-9_-], or names longer than 253 characters.
 */
std::vector<uint8_t> encode_name(const std::string& name);

/**
 * @brief Serialize a message (no name compression)
 * @throws EncodeError if any name or record cannot be represented
 */
std::vector<uint8_t> encode_message(const Message& msg);

/**
 * @brief Build a single-question query with a random ID
 */
std::vector<uint8_t> build_query(const std::string& name, RecordType type,
                                 bool recursion_desired = true);

/**
 * @brief Build the zone transfer request for `domain`
 *
 * Standard query opcode, RD set, one question of type AXFR, class IN,
 * question name `domain + "."`.
 */
std::vector<uint8_t> build_axfr_query(const std::string& domain);

/// Prefix a message with its 2-byte big-endian length (RFC 1035 §4.2.2)
std::vector<uint8_t> frame_tcp(const std::vector<uint8_t>& message);

// ==================== Decoding ====================

/**
 * @throws DecodeError if the buffer is truncated or malformed
 */
Message parse_message(const uint8_t* data, size_t len);
Message parse_message(const std::vector<uint8_t>& data);

/**
 * @brief Decode a message and keep only its A and CNAME answers
 * @throws DecodeError if the buffer is truncated or malformed
 */
std::vector<Answer> parse_response(const std::vector<uint8_t>& data);

std::string strip_trailing_dot(const std::string& name);

/// Case-insensitive comparison ignoring a trailing dot
bool names_equal(const std::string& a, const std::string& b);

std::string type_to_string(uint16_t type);

/**
 * @brief Reassembles length-prefixed DNS messages from a TCP byte stream
 */
class TcpFrameBuffer {
public:
    void append(const uint8_t* data, size_t len);

    /// Pop the next complete message into `out`; false if none is complete
    bool next(std::vector<uint8_t>& out);

    size_t buffered() const { return buffer_.size() - consumed_; }

private:
    std::vector<uint8_t> buffer_;
    size_t consumed_ = 0;
};

} // namespace dns
} // namespace sniax

#endif // SNIAX_DNS_CODEC_HPP
