#pragma once

#include "common.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <atomic>
#include <chrono>
#include <functional>

namespace pomelo {

// 探测结果
enum class ProbeResult : uint8_t {
    Reachable = 0,
    Unreachable = 1,       // 超时未收到回复
    Indeterminate = 2,     // 无法发起探测 (无权限, 发送失败)
};

const char* probeResultName(ProbeResult result);

// 可达性探测. handler 恰好调用一次, 可能在任意线程
class Prober {
public:
    using Handler = std::function<void(ProbeResult)>;

    virtual ~Prober() = default;

    virtual void asyncProbe(const boost::asio::ip::address& addr,
                            std::chrono::milliseconds timeout,
                            Handler handler) = 0;
};

// ICMP / ICMPv6 echo 探测, 使用原始套接字
class IcmpProber : public Prober {
public:
    explicit IcmpProber(boost::asio::io_context& io);
    ~IcmpProber() override = default;

    // 禁止拷贝
    IcmpProber(const IcmpProber&) = delete;
    IcmpProber& operator=(const IcmpProber&) = delete;

    void asyncProbe(const boost::asio::ip::address& addr,
                    std::chrono::milliseconds timeout,
                    Handler handler) override;

    // 获取统计
    struct Stats {
        uint64_t probes;
        uint64_t reachable;
        uint64_t unreachable;
        uint64_t indeterminate;
    };
    Stats getStats() const;
    void resetStats();

    // Internet checksum (RFC 1071)
    static uint16_t checksum(const uint8_t* data, size_t len);

private:
    class Echo;

    void record(ProbeResult result);

    boost::asio::io_context& io_;
    uint16_t identifier_;
    std::atomic<uint16_t> sequence_{0};

    std::atomic<uint64_t> probes_{0};
    std::atomic<uint64_t> reachable_{0};
    std::atomic<uint64_t> unreachable_{0};
    std::atomic<uint64_t> indeterminate_{0};
};

} // namespace pomelo
