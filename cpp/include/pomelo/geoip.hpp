#pragma once

#include "common.hpp"
#include <boost/asio/ip/address.hpp>
#include <memory>
#include <optional>
#include <string>

struct MMDB_s;

namespace pomelo {

// 地址 -> ISO 国家代码. 实现必须可并发调用
class GeoLookup {
public:
    virtual ~GeoLookup() = default;

    // nullopt = 未知
    virtual std::optional<std::string> countryOf(
        const boost::asio::ip::address& addr) const = 0;
};

// MaxMind MMDB 数据库, 启动时打开, 只读
class MaxMindGeoLookup : public GeoLookup {
public:
    MaxMindGeoLookup();
    ~MaxMindGeoLookup() override;

    // 禁止拷贝
    MaxMindGeoLookup(const MaxMindGeoLookup&) = delete;
    MaxMindGeoLookup& operator=(const MaxMindGeoLookup&) = delete;

    Error open(const std::string& path);

    bool isOpen() const { return open_; }

    std::optional<std::string> countryOf(
        const boost::asio::ip::address& addr) const override;

private:
    std::unique_ptr<MMDB_s> db_;
    bool open_;
};

} // namespace pomelo
