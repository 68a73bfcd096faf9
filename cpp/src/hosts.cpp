#include "pomelo/hosts.hpp"
#include "pomelo/domain_trie.hpp"
#include "pomelo/ip_network.hpp"
#include <algorithm>
#include <cctype>

namespace pomelo {

namespace {

const char IPV4_REVERSE_SUFFIX[] = ".in-addr.arpa";
const char IPV6_REVERSE_SUFFIX[] = ".ip6.arpa";

bool endsWith(const std::string& s, const char* suffix, size_t suffix_len) {
    return s.size() > suffix_len && s.compare(s.size() - suffix_len, suffix_len, suffix) == 0;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

// 域名转为未压缩的线上格式
std::vector<uint8_t> nameToWire(const std::string& name) {
    std::vector<uint8_t> wire;
    size_t start = 0;
    while (start < name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) {
            dot = name.size();
        }
        wire.push_back(static_cast<uint8_t>(dot - start));
        wire.insert(wire.end(), name.begin() + start, name.begin() + dot);
        start = dot + 1;
    }
    wire.push_back(0);
    return wire;
}

} // anonymous namespace

// ==================== HostsTable ====================

void HostsTable::add(const std::string& name, const boost::asio::ip::address& addr) {
    std::string normalized_name = normalizeDomain(name);
    auto& addrs = entries_[normalized_name];
    auto normalized = normalizeAddress(addr);
    if (std::find(addrs.begin(), addrs.end(), normalized) == addrs.end()) {
        addrs.push_back(normalized);
    }
    reverse_.emplace(normalized, normalized_name);
}

std::vector<boost::asio::ip::address> HostsTable::lookup(
    const std::string& name,
    uint16_t qtype
) const {
    std::vector<boost::asio::ip::address> result;
    if (qtype != dns_type::A && qtype != dns_type::AAAA) {
        return result;
    }

    auto it = entries_.find(normalizeDomain(name));
    if (it == entries_.end()) {
        return result;
    }

    bool want_v4 = qtype == dns_type::A;
    for (const auto& addr : it->second) {
        if (addr.is_v4() == want_v4) {
            result.push_back(addr);
        }
    }
    return result;
}

std::string HostsTable::hostnameOf(const boost::asio::ip::address& addr) const {
    auto it = reverse_.find(normalizeAddress(addr));
    return it == reverse_.end() ? std::string() : it->second;
}

bool HostsTable::answer(const Query& query, ResolvedAnswer* out) const {
    if (query.qtype == dns_type::PTR) {
        boost::asio::ip::address addr;
        if (!parseReverseName(query.name, &addr)) {
            return false;
        }
        std::string hostname = hostnameOf(addr);
        if (hostname.empty()) {
            return false;
        }

        CandidateRecord rr;
        rr.name = query.name;
        rr.rrtype = dns_type::PTR;
        rr.ttl = HOSTS_TTL;
        rr.rdata = nameToWire(hostname);

        out->rcode = dns_rcode::NOERROR;
        out->records.assign(1, rr);
        return true;
    }

    auto addrs = lookup(query.name, query.qtype);
    if (addrs.empty()) {
        return false;
    }

    out->rcode = dns_rcode::NOERROR;
    out->records.clear();
    for (const auto& addr : addrs) {
        out->records.push_back(makeAddressRecord(query.name, addr, HOSTS_TTL));
    }
    return true;
}

// ==================== 反查域名 ====================

bool parseReverseName(const std::string& name, boost::asio::ip::address* out) {
    std::string dom = normalizeDomain(name);
    constexpr size_t v4_len = sizeof(IPV4_REVERSE_SUFFIX) - 1;
    constexpr size_t v6_len = sizeof(IPV6_REVERSE_SUFFIX) - 1;

    if (endsWith(dom, IPV4_REVERSE_SUFFIX, v4_len)) {
        std::string body = dom.substr(0, dom.size() - v4_len);
        boost::asio::ip::address_v4::bytes_type bytes;
        size_t index = 0;
        size_t start = 0;
        // 标签顺序与地址相反
        while (start <= body.size()) {
            size_t dot = body.find('.', start);
            if (dot == std::string::npos) {
                dot = body.size();
            }
            std::string label = body.substr(start, dot - start);
            if (index >= 4 || label.empty() || label.size() > 3 ||
                !std::all_of(label.begin(), label.end(),
                             [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
                return false;
            }
            int value = std::stoi(label);
            if (value > 255) {
                return false;
            }
            bytes[3 - index] = static_cast<uint8_t>(value);
            index++;
            start = dot + 1;
        }
        if (index != 4) {
            return false;
        }
        *out = boost::asio::ip::address_v4(bytes);
        return true;
    }

    if (endsWith(dom, IPV6_REVERSE_SUFFIX, v6_len)) {
        std::string body = dom.substr(0, dom.size() - v6_len);
        // 32 个半字节, 以点分隔
        if (body.size() != 63) {
            return false;
        }
        boost::asio::ip::address_v6::bytes_type bytes{};
        for (size_t i = 0; i < 32; i++) {
            int nibble = hexValue(body[i * 2]);
            if (nibble < 0 || (i < 31 && body[i * 2 + 1] != '.')) {
                return false;
            }
            size_t pos = 31 - i;
            if (pos % 2 == 0) {
                bytes[pos / 2] |= static_cast<uint8_t>(nibble << 4);
            } else {
                bytes[pos / 2] |= static_cast<uint8_t>(nibble);
            }
        }
        *out = boost::asio::ip::address_v6(bytes);
        return true;
    }

    return false;
}

std::string reverseName(const boost::asio::ip::address& addr) {
    static const char hex[] = "0123456789abcdef";
    std::string out;

    auto normalized = normalizeAddress(addr);
    if (normalized.is_v4()) {
        auto bytes = normalized.to_v4().to_bytes();
        for (size_t i = bytes.size(); i-- > 0;) {
            out += std::to_string(bytes[i]);
            out += '.';
        }
        out += "in-addr.arpa";
        return out;
    }

    auto bytes = normalized.to_v6().to_bytes();
    for (size_t i = bytes.size(); i-- > 0;) {
        out += hex[bytes[i] & 0x0F];
        out += '.';
        out += hex[bytes[i] >> 4];
        out += '.';
    }
    out += "ip6.arpa";
    return out;
}

} // namespace pomelo
