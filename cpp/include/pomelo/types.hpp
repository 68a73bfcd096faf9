#pragma once

#include "common.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>
#include <string>
#include <vector>

namespace pomelo {

// 解析后的查询 (只读)
struct Query {
    uint16_t id = 0;
    std::string name;               // 小写, 无结尾点
    uint16_t qtype = dns_type::A;
    uint16_t qclass = dns_class::IN;
    bool recursion_desired = true;
    uint16_t udp_payload_size = 0;  // EDNS UDP 大小, 0 = 无 OPT
};

// 请求方身份
struct RequesterIdentity {
    boost::asio::ip::address source_ip;
};

// 上游目标 (当前只支持 UDP)
struct UpstreamTarget {
    enum class Protocol : uint8_t {
        Udp = 0,
    };

    boost::asio::ip::udp::endpoint endpoint;
    Protocol protocol = Protocol::Udp;

    bool operator==(const UpstreamTarget& other) const {
        return endpoint == other.endpoint && protocol == other.protocol;
    }
};

// 候选记录
struct CandidateRecord {
    std::string name;
    uint16_t rrtype = 0;
    uint16_t rrclass = dns_class::IN;
    uint32_t ttl = 0;
    boost::asio::ip::address address;   // 仅 A/AAAA
    std::vector<uint8_t> rdata;         // 未压缩的线上格式
    size_t upstream_index = 0;          // 来自哪个上游

    bool isAddress() const {
        return rrtype == dns_type::A || rrtype == dns_type::AAAA;
    }

    bool operator==(const CandidateRecord& other) const {
        return name == other.name && rrtype == other.rrtype &&
               rrclass == other.rrclass && ttl == other.ttl &&
               rdata == other.rdata && upstream_index == other.upstream_index;
    }
};

// 上游提交的答案
struct AggregatedAnswer {
    uint8_t rcode = dns_rcode::NOERROR;
    std::vector<CandidateRecord> records;
    size_t upstream_index = 0;
};

// 最终答案
struct ResolvedAnswer {
    uint8_t rcode = dns_rcode::NOERROR;
    std::vector<CandidateRecord> records;

    bool operator==(const ResolvedAnswer& other) const {
        return rcode == other.rcode && records == other.records;
    }
};

// 构造 A/AAAA 记录
CandidateRecord makeAddressRecord(const std::string& name,
                                  const boost::asio::ip::address& addr,
                                  uint32_t ttl,
                                  size_t upstream_index = 0);

// "1.2.3.4", "1.2.3.4:5353", "[::1]:53", "udp://9.9.9.9"
Error parseUpstream(const std::string& text, UpstreamTarget* out);

std::string toString(const UpstreamTarget& target);

} // namespace pomelo
