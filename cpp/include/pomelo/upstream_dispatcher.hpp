#pragma once

#include "types.hpp"
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <vector>

namespace pomelo {

// 上游分发器
//
// 并发向所有上游发送同一查询, 每个上游独立超时.
// 上游 k 的成功答案在其之前的上游全部失败后提交; 超时后提交序号最小的成功答案.
// NOERROR / NXDOMAIN 为成功, 其余响应码, 畸形报文和套接字错误为失败.
class UpstreamDispatcher {
public:
    // 每个成功的上游答案到达时调用 (提交前)
    using PartialHandler = std::function<void(const AggregatedAnswer&)>;
    // 恰好调用一次. 失败时 err = AllUpstreamsFailed
    using Handler = std::function<void(Error err, AggregatedAnswer answer)>;

    UpstreamDispatcher(boost::asio::io_context& io, std::chrono::milliseconds timeout);
    ~UpstreamDispatcher() = default;

    // 禁止拷贝
    UpstreamDispatcher(const UpstreamDispatcher&) = delete;
    UpstreamDispatcher& operator=(const UpstreamDispatcher&) = delete;

    void asyncResolve(const Query& query,
                      const std::vector<UpstreamTarget>& upstreams,
                      PartialHandler on_partial,
                      Handler handler);

    std::chrono::milliseconds timeout() const { return timeout_; }

    // 获取统计
    struct Stats {
        uint64_t exchanges;
        uint64_t successes;
        uint64_t failures;
        uint64_t timeouts;
        uint64_t all_failed;
    };
    Stats getStats() const;
    void resetStats();

private:
    class FanOut;

    boost::asio::io_context& io_;
    std::chrono::milliseconds timeout_;

    // 统计计数器 (原子操作)
    std::atomic<uint64_t> exchanges_{0};
    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> all_failed_{0};
};

// NOERROR 和 NXDOMAIN 视为成功
bool isSuccessRcode(uint8_t rcode);

} // namespace pomelo
