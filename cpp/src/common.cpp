#include "pomelo/common.hpp"
#include <strings.h>

namespace pomelo {

const char* errorString(Error err) {
    switch (err) {
        case Error::Success:            return "success";
        case Error::PacketTooShort:     return "packet too short";
        case Error::InvalidHeader:      return "invalid header";
        case Error::TruncatedMessage:   return "truncated message";
        case Error::PointerLoop:        return "compression pointer loop";
        case Error::InvalidLabel:       return "invalid label";
        case Error::BufferTooSmall:     return "buffer too small";
        case Error::NotQuery:           return "not a query";
        case Error::NotResponse:        return "not a response";
        case Error::IdMismatch:         return "id mismatch";
        case Error::InvalidConfig:      return "invalid configuration";
        case Error::GeoDatabase:        return "geoip database error";
        case Error::SocketError:        return "socket error";
        case Error::AllUpstreamsFailed: return "all upstreams failed";
        case Error::Timeout:            return "timeout";
        case Error::InvalidRecord:      return "invalid resource record";
    }
    return "unknown error";
}

namespace {

struct TypeEntry {
    uint16_t type;
    const char* name;
};

constexpr TypeEntry kTypes[] = {
    {dns_type::A, "A"},
    {dns_type::NS, "NS"},
    {dns_type::CNAME, "CNAME"},
    {dns_type::SOA, "SOA"},
    {dns_type::PTR, "PTR"},
    {dns_type::MX, "MX"},
    {dns_type::TXT, "TXT"},
    {dns_type::AAAA, "AAAA"},
    {dns_type::SRV, "SRV"},
    {dns_type::DNAME, "DNAME"},
    {dns_type::OPT, "OPT"},
    {dns_type::ANY, "ANY"},
};

} // anonymous namespace

const char* typeName(uint16_t rrtype) {
    for (const auto& entry : kTypes) {
        if (entry.type == rrtype) return entry.name;
    }
    return "TYPE?";
}

uint16_t typeFromName(const char* name) {
    if (!name) return 0;
    for (const auto& entry : kTypes) {
        if (strcasecmp(entry.name, name) == 0) return entry.type;
    }
    return 0;
}

const char* rcodeName(uint8_t rcode) {
    switch (rcode) {
        case dns_rcode::NOERROR:  return "NOERROR";
        case dns_rcode::FORMERR:  return "FORMERR";
        case dns_rcode::SERVFAIL: return "SERVFAIL";
        case dns_rcode::NXDOMAIN: return "NXDOMAIN";
        case dns_rcode::NOTIMP:   return "NOTIMP";
        case dns_rcode::REFUSED:  return "REFUSED";
        default:                  return "RCODE?";
    }
}

} // namespace pomelo
