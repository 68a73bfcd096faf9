#pragma once

#include "common.hpp"
#include <boost/asio/ip/address.hpp>
#include <array>
#include <string>
#include <vector>

namespace pomelo {

// CIDR 网段. IPv4 与 IPv4-mapped IPv6 视为同一地址
class IpNetwork {
public:
    IpNetwork() = default;

    // "10.0.0.0/24", "2001:db8::/32", 单个地址视为 /32 或 /128
    static Error parse(const std::string& text, IpNetwork* out);

    bool contains(const boost::asio::ip::address& addr) const;

    bool isV4() const { return v4_; }
    unsigned prefixLength() const { return prefix_; }
    std::string toString() const;

    bool operator==(const IpNetwork& other) const {
        return v4_ == other.v4_ && prefix_ == other.prefix_ && bytes_ == other.bytes_;
    }
    bool operator!=(const IpNetwork& other) const { return !(*this == other); }

private:
    std::array<uint8_t, 16> bytes_{};
    unsigned prefix_ = 0;
    bool v4_ = true;
};

// 去掉 IPv4-mapped 包装
boost::asio::ip::address normalizeAddress(const boost::asio::ip::address& addr);

// 网段列表, 任一命中即可. 空列表匹配任意地址
bool anyContains(const std::vector<IpNetwork>& networks,
                 const boost::asio::ip::address& addr);

} // namespace pomelo
