/**
 * @file dns_codec.cpp
 * @brief DNS wire format encoding and decoding (RFC 1035)
 */

#include "../include/sniax_dns_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <set>
#include <sstream>
#include <sodium.h>
#include <arpa/inet.h>

namespace sniax {
namespace dns {

// Maximum compression pointer follows per name (RFC 1035 §4.1.4)
static constexpr size_t MAX_COMPRESSION_DEPTH = 128;

// Maximum wire length of an encoded name
static constexpr size_t MAX_WIRE_NAME_LENGTH = 255;

// ==================== Helpers ====================

static void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

static void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

static bool is_label_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

std::string strip_trailing_dot(const std::string& name) {
    if (name.size() > 1 && name.back() == '.') {
        return name.substr(0, name.size() - 1);
    }
    return name;
}

bool names_equal(const std::string& a, const std::string& b) {
    std::string x = strip_trailing_dot(a);
    std::string y = strip_trailing_dot(b);
    if (x.size() != y.size()) return false;
    return std::equal(x.begin(), x.end(), y.begin(), [](char l, char r) {
        return std::tolower(static_cast<unsigned char>(l)) ==
               std::tolower(static_cast<unsigned char>(r));
    });
}

std::string type_to_string(uint16_t type) {
    switch (static_cast<RecordType>(type)) {
        case RecordType::A:     return "A";
        case RecordType::NS:    return "NS";
        case RecordType::CNAME: return "CNAME";
        case RecordType::SOA:   return "SOA";
        case RecordType::PTR:   return "PTR";
        case RecordType::MX:    return "MX";
        case RecordType::TXT:   return "TXT";
        case RecordType::AAAA:  return "AAAA";
        case RecordType::AXFR:  return "AXFR";
    }
    return "TYPE" + std::to_string(type);
}

// ==================== Encoding ====================

std::vector<uint8_t> encode_name(const std::string& name) {
    std::vector<uint8_t> wire;
    if (name == ".") {
        wire.push_back(0);
        return wire;
    }
    if (name.empty()) {
        throw EncodeError("empty domain name");
    }

    std::string body = name;
    if (body.back() == '.') body.pop_back();
    if (body.size() > MAX_NAME_LENGTH) {
        throw EncodeError("domain name exceeds 253 characters: " + name);
    }

    std::istringstream iss(body);
    std::string label;
    size_t labels = 0;
    while (std::getline(iss, label, '.')) {
        if (label.empty()) {
            throw EncodeError("empty label in domain name: " + name);
        }
        if (label.size() > MAX_LABEL_LENGTH) {
            throw EncodeError("DNS label too long (max 63 bytes): " + label);
        }
        if (!std::all_of(label.begin(), label.end(), is_label_char)) {
            throw EncodeError("invalid character in label: " + label);
        }
        wire.push_back(static_cast<uint8_t>(label.size()));
        wire.insert(wire.end(), label.begin(), label.end());
        ++labels;
    }
    // getline drops a final empty token, so "a..b." is caught above but "a." is not
    if (labels == 0 || body.back() == '.') {
        throw EncodeError("empty label in domain name: " + name);
    }
    wire.push_back(0);

    if (wire.size() > MAX_WIRE_NAME_LENGTH) {
        throw EncodeError("domain name exceeds 255 wire bytes: " + name);
    }
    return wire;
}

static std::vector<uint8_t> encode_rdata(const ResourceRecord& rr) {
    switch (static_cast<RecordType>(rr.type)) {
        case RecordType::A:
            if (!rr.address.empty()) {
                uint8_t addr[4];
                if (inet_pton(AF_INET, rr.address.c_str(), addr) != 1) {
                    throw EncodeError("invalid IPv4 address: " + rr.address);
                }
                return std::vector<uint8_t>(addr, addr + 4);
            }
            break;
        case RecordType::AAAA:
            if (!rr.address.empty()) {
                uint8_t addr[16];
                if (inet_pton(AF_INET6, rr.address.c_str(), addr) != 1) {
                    throw EncodeError("invalid IPv6 address: " + rr.address);
                }
                return std::vector<uint8_t>(addr, addr + 16);
            }
            break;
        case RecordType::NS:
        case RecordType::CNAME:
        case RecordType::PTR:
            if (!rr.target.empty()) {
                return encode_name(rr.target);
            }
            break;
        default:
            break;
    }
    return rr.rdata;
}

static void encode_record(std::vector<uint8_t>& out, const ResourceRecord& rr) {
    std::vector<uint8_t> owner = encode_name(rr.name);
    out.insert(out.end(), owner.begin(), owner.end());
    put_u16(out, rr.type);
    put_u16(out, rr.rclass);
    put_u32(out, rr.ttl);

    std::vector<uint8_t> rdata = encode_rdata(rr);
    if (rdata.size() > 0xFFFF) {
        throw EncodeError("RDATA exceeds 65535 bytes");
    }
    put_u16(out, static_cast<uint16_t>(rdata.size()));
    out.insert(out.end(), rdata.begin(), rdata.end());
}

std::vector<uint8_t> encode_message(const Message& msg) {
    const Header& h = msg.header;
    if (msg.questions.size() > 0xFFFF || msg.answers.size() > 0xFFFF ||
        msg.authorities.size() > 0xFFFF || msg.additionals.size() > 0xFFFF) {
        throw EncodeError("too many records in one section");
    }

    uint16_t flags = 0;
    if (h.response)            flags |= 0x8000;
    flags |= static_cast<uint16_t>((h.opcode & 0x0F) << 11);
    if (h.authoritative)       flags |= 0x0400;
    if (h.truncated)           flags |= 0x0200;
    if (h.recursion_desired)   flags |= 0x0100;
    if (h.recursion_available) flags |= 0x0080;
    flags |= static_cast<uint16_t>(h.rcode & 0x0F);

    std::vector<uint8_t> out;
    out.reserve(HEADER_SIZE + 64);
    put_u16(out, h.id);
    put_u16(out, flags);
    put_u16(out, static_cast<uint16_t>(msg.questions.size()));
    put_u16(out, static_cast<uint16_t>(msg.answers.size()));
    put_u16(out, static_cast<uint16_t>(msg.authorities.size()));
    put_u16(out, static_cast<uint16_t>(msg.additionals.size()));

    for (const auto& q : msg.questions) {
        std::vector<uint8_t> qname = encode_name(q.name);
        out.insert(out.end(), qname.begin(), qname.end());
        put_u16(out, q.type);
        put_u16(out, q.qclass);
    }
    for (const auto& rr : msg.answers)     encode_record(out, rr);
    for (const auto& rr : msg.authorities) encode_record(out, rr);
    for (const auto& rr : msg.additionals) encode_record(out, rr);
    return out;
}

std::vector<uint8_t> build_query(const std::string& name, RecordType type,
                                 bool recursion_desired) {
    Message msg;
    // Random query ID - using libsodium CSPRNG
    msg.header.id = static_cast<uint16_t>(randombytes_uniform(65535) + 1);
    msg.header.opcode = OPCODE_QUERY;
    msg.header.recursion_desired = recursion_desired;

    Question q;
    q.name = name;
    if (q.name.empty() || q.name.back() != '.') q.name += '.';
    q.type = static_cast<uint16_t>(type);
    q.qclass = CLASS_INET;
    msg.questions.push_back(q);

    return encode_message(msg);
}

std::vector<uint8_t> build_axfr_query(const std::string& domain) {
    if (domain.empty() || domain == ".") {
        throw EncodeError("zone transfer requires a non-root domain");
    }
    return build_query(domain, RecordType::AXFR, true);
}

std::vector<uint8_t> frame_tcp(const std::vector<uint8_t>& message) {
    if (message.size() > 0xFFFF) {
        throw EncodeError("message exceeds 65535 bytes");
    }
    std::vector<uint8_t> framed;
    framed.reserve(message.size() + 2);
    put_u16(framed, static_cast<uint16_t>(message.size()));
    framed.insert(framed.end(), message.begin(), message.end());
    return framed;
}

// ==================== Decoding ====================

namespace {

class Reader {
public:
    Reader(const uint8_t* data, size_t len) : data_(data), len_(len) {}

    size_t offset() const { return pos_; }

    void require(size_t n, const char* what) const {
        if (pos_ + n > len_) {
            throw DecodeError(std::string("truncated message reading ") + what);
        }
    }

    uint16_t u16(const char* what) {
        require(2, what);
        uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    uint32_t u32(const char* what) {
        require(4, what);
        uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 24) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return v;
    }

    void skip(size_t n, const char* what) {
        require(n, what);
        pos_ += n;
    }

    /**
     * Decompress the name at the current offset and advance past it.
     * Circular pointers and overlong names are rejected.
     */
    std::string name() {
        std::string out = name_at(pos_, &pos_);
        return out;
    }

    std::string name_at(size_t start, size_t* end) const {
        std::string name;
        size_t pos = start;
        size_t wire_len = 0;
        size_t depth = 0;
        bool pointer_followed = false;
        std::set<size_t> visited;

        while (true) {
            if (pos >= len_) throw DecodeError("truncated domain name");
            uint8_t len = data_[pos];

            if (len == 0) {
                if (!pointer_followed && end) *end = pos + 1;
                break;
            }

            if ((len & 0xC0) == 0xC0) {
                if (pos + 1 >= len_) throw DecodeError("truncated compression pointer");
                size_t ptr = (static_cast<size_t>(len & 0x3F) << 8) | data_[pos + 1];
                if (!pointer_followed && end) *end = pos + 2;
                if (ptr >= len_ || visited.count(ptr) || ++depth > MAX_COMPRESSION_DEPTH) {
                    throw DecodeError("invalid compression pointer");
                }
                visited.insert(ptr);
                pos = ptr;
                pointer_followed = true;
                continue;
            }

            if ((len & 0xC0) != 0) {
                throw DecodeError("invalid label type");
            }
            if (pos + 1 + len > len_) throw DecodeError("truncated label");

            wire_len += 1 + len;
            if (wire_len + 1 > MAX_WIRE_NAME_LENGTH) {
                throw DecodeError("domain name exceeds 255 bytes");
            }
            name.append(reinterpret_cast<const char*>(&data_[pos + 1]), len);
            name += '.';
            pos += 1 + len;
        }

        return name.empty() ? std::string(".") : name;
    }

private:
    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

ResourceRecord read_record(Reader& r, const uint8_t* data) {
    ResourceRecord rr;
    rr.name = r.name();
    rr.type = r.u16("record type");
    rr.rclass = r.u16("record class");
    rr.ttl = r.u32("record ttl");
    uint16_t rdlength = r.u16("rdlength");
    r.require(rdlength, "rdata");

    size_t rdata_start = r.offset();
    rr.rdata.assign(data + rdata_start, data + rdata_start + rdlength);

    switch (static_cast<RecordType>(rr.type)) {
        case RecordType::A: {
            if (rdlength != 4) throw DecodeError("A record with rdlength " + std::to_string(rdlength));
            char ip_str[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, rr.rdata.data(), ip_str, sizeof(ip_str));
            rr.address = ip_str;
            break;
        }
        case RecordType::AAAA: {
            if (rdlength != 16) throw DecodeError("AAAA record with rdlength " + std::to_string(rdlength));
            char ip_str[INET6_ADDRSTRLEN];
            inet_ntop(AF_INET6, rr.rdata.data(), ip_str, sizeof(ip_str));
            rr.address = ip_str;
            break;
        }
        case RecordType::NS:
        case RecordType::CNAME:
        case RecordType::PTR:
        case RecordType::SOA: {
            size_t end = 0;
            rr.target = r.name_at(rdata_start, &end);
            if (end > rdata_start + rdlength) throw DecodeError("name overruns rdata");
            break;
        }
        case RecordType::MX: {
            if (rdlength < 3) throw DecodeError("MX record too short");
            size_t end = 0;
            rr.target = r.name_at(rdata_start + 2, &end);
            if (end > rdata_start + rdlength) throw DecodeError("name overruns rdata");
            break;
        }
        default:
            break;
    }

    r.skip(rdlength, "rdata");
    return rr;
}

} // namespace

Message parse_message(const uint8_t* data, size_t len) {
    if (data == nullptr || len < HEADER_SIZE) {
        throw DecodeError("message shorter than DNS header");
    }

    Reader r(data, len);
    Message msg;
    msg.header.id = r.u16("id");
    uint16_t flags = r.u16("flags");
    msg.header.response            = (flags & 0x8000) != 0;
    msg.header.opcode              = static_cast<uint8_t>((flags >> 11) & 0x0F);
    msg.header.authoritative       = (flags & 0x0400) != 0;
    msg.header.truncated           = (flags & 0x0200) != 0;
    msg.header.recursion_desired   = (flags & 0x0100) != 0;
    msg.header.recursion_available = (flags & 0x0080) != 0;
    msg.header.rcode               = static_cast<uint8_t>(flags & 0x000F);

    uint16_t qdcount = r.u16("qdcount");
    uint16_t ancount = r.u16("ancount");
    uint16_t nscount = r.u16("nscount");
    uint16_t arcount = r.u16("arcount");

    for (uint16_t i = 0; i < qdcount; ++i) {
        Question q;
        q.name = r.name();
        q.type = r.u16("question type");
        q.qclass = r.u16("question class");
        msg.questions.push_back(q);
    }
    for (uint16_t i = 0; i < ancount; ++i) msg.answers.push_back(read_record(r, data));
    for (uint16_t i = 0; i < nscount; ++i) msg.authorities.push_back(read_record(r, data));
    for (uint16_t i = 0; i < arcount; ++i) msg.additionals.push_back(read_record(r, data));

    return msg;
}

Message parse_message(const std::vector<uint8_t>& data) {
    return parse_message(data.data(), data.size());
}

std::vector<Answer> parse_response(const std::vector<uint8_t>& data) {
    Message msg = parse_message(data);

    std::vector<Answer> answers;
    for (const auto& rr : msg.answers) {
        if (rr.type == static_cast<uint16_t>(RecordType::A)) {
            answers.push_back({rr.name, RecordType::A, rr.address});
        } else if (rr.type == static_cast<uint16_t>(RecordType::CNAME)) {
            answers.push_back({rr.name, RecordType::CNAME, rr.target});
        }
    }
    return answers;
}

// ==================== TCP framing ====================

void TcpFrameBuffer::append(const uint8_t* data, size_t len) {
    if (consumed_ > 0 && consumed_ == buffer_.size()) {
        buffer_.clear();
        consumed_ = 0;
    }
    buffer_.insert(buffer_.end(), data, data + len);
}

bool TcpFrameBuffer::next(std::vector<uint8_t>& out) {
    if (buffered() < 2) return false;
    size_t msg_len = (static_cast<size_t>(buffer_[consumed_]) << 8) | buffer_[consumed_ + 1];
    if (buffered() < 2 + msg_len) return false;

    auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(consumed_ + 2);
    out.assign(begin, begin + static_cast<std::ptrdiff_t>(msg_len));
    consumed_ += 2 + msg_len;

    if (consumed_ == buffer_.size()) {
        buffer_.clear();
        consumed_ = 0;
    }
    return true;
}

} // namespace dns
} // namespace sniax
