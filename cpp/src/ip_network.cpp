#include "pomelo/ip_network.hpp"
#include <algorithm>
#include <cstdlib>

namespace pomelo {

boost::asio::ip::address normalizeAddress(const boost::asio::ip::address& addr) {
    if (addr.is_v6()) {
        auto v6 = addr.to_v6();
        if (v6.is_v4_mapped()) {
            return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, v6);
        }
    }
    return addr;
}

Error IpNetwork::parse(const std::string& text, IpNetwork* out) {
    if (!out || text.empty()) {
        return Error::InvalidConfig;
    }

    auto slash = text.find('/');
    std::string host = text.substr(0, slash);

    boost::system::error_code ec;
    auto addr = normalizeAddress(boost::asio::ip::make_address(host, ec));
    if (ec) {
        return Error::InvalidConfig;
    }

    IpNetwork net;
    net.v4_ = addr.is_v4();
    unsigned max_prefix = net.v4_ ? 32 : 128;

    if (slash == std::string::npos) {
        net.prefix_ = max_prefix;
    } else {
        std::string prefix = text.substr(slash + 1);
        if (prefix.empty()) {
            return Error::InvalidConfig;
        }
        char* end = nullptr;
        unsigned long len = std::strtoul(prefix.c_str(), &end, 10);
        if (*end != '\0' || len > max_prefix) {
            return Error::InvalidConfig;
        }
        net.prefix_ = static_cast<unsigned>(len);
    }

    if (net.v4_) {
        auto b = addr.to_v4().to_bytes();
        std::copy(b.begin(), b.end(), net.bytes_.begin());
    } else {
        net.bytes_ = addr.to_v6().to_bytes();
    }

    // 清除主机位
    for (unsigned bit = net.prefix_; bit < max_prefix; bit++) {
        net.bytes_[bit / 8] &= static_cast<uint8_t>(~(0x80u >> (bit % 8)));
    }

    *out = net;
    return Error::Success;
}

bool IpNetwork::contains(const boost::asio::ip::address& addr) const {
    auto a = normalizeAddress(addr);
    if (a.is_v4() != v4_) {
        return false;
    }

    std::array<uint8_t, 16> bytes{};
    if (v4_) {
        auto b = a.to_v4().to_bytes();
        std::copy(b.begin(), b.end(), bytes.begin());
    } else {
        bytes = a.to_v6().to_bytes();
    }

    unsigned full = prefix_ / 8;
    for (unsigned i = 0; i < full; i++) {
        if (bytes[i] != bytes_[i]) return false;
    }

    unsigned rem = prefix_ % 8;
    if (rem != 0) {
        uint8_t mask = static_cast<uint8_t>(0xFF << (8 - rem));
        if ((bytes[full] & mask) != bytes_[full]) return false;
    }
    return true;
}

std::string IpNetwork::toString() const {
    std::string host;
    if (v4_) {
        boost::asio::ip::address_v4::bytes_type b;
        std::copy(bytes_.begin(), bytes_.begin() + 4, b.begin());
        host = boost::asio::ip::address_v4(b).to_string();
    } else {
        host = boost::asio::ip::address_v6(bytes_).to_string();
    }
    return host + "/" + std::to_string(prefix_);
}

bool anyContains(
    const std::vector<IpNetwork>& networks,
    const boost::asio::ip::address& addr
) {
    if (networks.empty()) return true;
    for (const auto& net : networks) {
        if (net.contains(addr)) return true;
    }
    return false;
}

} // namespace pomelo
