#pragma once

#include "types.hpp"
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace pomelo {

// 本地应答的 TTL
constexpr uint32_t HOSTS_TTL = 1;

// 静态主机表, 构建后只读
class HostsTable {
public:
    HostsTable() = default;

    // 同一地址的第一个名字作为反查结果
    void add(const std::string& name, const boost::asio::ip::address& addr);

    // A 返回 IPv4, AAAA 返回 IPv6, 其他类型返回空
    std::vector<boost::asio::ip::address> lookup(const std::string& name, uint16_t qtype) const;

    // 地址 -> 主机名, 未登记返回空串
    std::string hostnameOf(const boost::asio::ip::address& addr) const;

    // 构造本地应答 (A/AAAA/PTR), 无对应记录时返回 false
    bool answer(const Query& query, ResolvedAnswer* out) const;

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, std::vector<boost::asio::ip::address>> entries_;
    std::map<boost::asio::ip::address, std::string> reverse_;
};

// "4.3.2.1.in-addr.arpa" / 32 个半字节的 "ip6.arpa" -> 地址
bool parseReverseName(const std::string& name, boost::asio::ip::address* out);

// 地址 -> 反查域名 (小写, 无结尾点)
std::string reverseName(const boost::asio::ip::address& addr);

} // namespace pomelo
