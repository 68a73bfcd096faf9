#include "pomelo/types.hpp"
#include <cstdlib>

namespace pomelo {

CandidateRecord makeAddressRecord(
    const std::string& name,
    const boost::asio::ip::address& addr,
    uint32_t ttl,
    size_t upstream_index
) {
    CandidateRecord rr;
    rr.name = name;
    rr.ttl = ttl;
    rr.address = addr;
    rr.upstream_index = upstream_index;

    if (addr.is_v4()) {
        rr.rrtype = dns_type::A;
        auto bytes = addr.to_v4().to_bytes();
        rr.rdata.assign(bytes.begin(), bytes.end());
    } else {
        rr.rrtype = dns_type::AAAA;
        auto bytes = addr.to_v6().to_bytes();
        rr.rdata.assign(bytes.begin(), bytes.end());
    }
    return rr;
}

Error parseUpstream(const std::string& text, UpstreamTarget* out) {
    if (!out || text.empty()) {
        return Error::InvalidConfig;
    }

    std::string rest = text;
    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        // DoT/DoH 尚未实现
        if (rest.compare(0, scheme_end, "udp") != 0) {
            return Error::InvalidConfig;
        }
        rest = rest.substr(scheme_end + 3);
    }

    std::string host;
    std::string port;
    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) {
            return Error::InvalidConfig;
        }
        host = rest.substr(1, close - 1);
        if (close + 1 < rest.size()) {
            if (rest[close + 1] != ':') {
                return Error::InvalidConfig;
            }
            port = rest.substr(close + 2);
        }
    } else if (rest.find(':') != rest.rfind(':')) {
        // 不带方括号的 IPv6, 无端口
        host = rest;
    } else {
        auto colon = rest.find(':');
        host = rest.substr(0, colon);
        if (colon != std::string::npos) {
            port = rest.substr(colon + 1);
        }
    }

    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(host, ec);
    if (ec) {
        return Error::InvalidConfig;
    }

    unsigned long port_num = 53;
    if (!port.empty()) {
        char* end = nullptr;
        port_num = std::strtoul(port.c_str(), &end, 10);
        if (*end != '\0' || port_num == 0 || port_num > 65535) {
            return Error::InvalidConfig;
        }
    }

    out->endpoint = boost::asio::ip::udp::endpoint(addr, static_cast<uint16_t>(port_num));
    out->protocol = UpstreamTarget::Protocol::Udp;
    return Error::Success;
}

std::string toString(const UpstreamTarget& target) {
    const auto& addr = target.endpoint.address();
    std::string host = addr.is_v6() ? "[" + addr.to_string() + "]" : addr.to_string();
    return "udp://" + host + ":" + std::to_string(target.endpoint.port());
}

} // namespace pomelo
