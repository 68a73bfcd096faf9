#pragma once

#include "hosts.hpp"
#include "policy_engine.hpp"
#include "prober.hpp"
#include "response_filter.hpp"
#include "upstream_dispatcher.hpp"
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

namespace pomelo {

// 单个查询的状态
enum class QueryState : uint8_t {
    Received = 0,
    PolicyDecided = 1,
    Dispatching = 2,
    Filtering = 3,
    Answered = 4,
    Failed = 5,
};

const char* queryStateName(QueryState state);

// 解析流水线: 主机表 -> 策略 -> 上游 (+ 探测) -> 过滤 -> 应答
//
// 每个查询在自己的 strand 上执行, 总截止时间为 upstream_timeout + probe_timeout.
// 客户端总会得到 成功 / 空成功 / SERVFAIL 之一.
class ResolutionPipeline {
public:
    using Handler = std::function<void(const ResolvedAnswer&)>;

    struct Options {
        std::chrono::milliseconds probe_timeout = DEFAULT_PROBE_TIMEOUT;
        FilterPolicy filter;
    };

    // prober / geo 可以为空
    ResolutionPipeline(boost::asio::io_context& io,
                       PolicyEngine& engine,
                       UpstreamDispatcher& dispatcher,
                       Prober* prober,
                       const GeoLookup* geo,
                       Options options);
    ~ResolutionPipeline() = default;

    // 禁止拷贝
    ResolutionPipeline(const ResolutionPipeline&) = delete;
    ResolutionPipeline& operator=(const ResolutionPipeline&) = delete;

    // handler 恰好调用一次
    void asyncResolve(const RequesterIdentity& requester,
                      const Query& query,
                      Handler handler);

    // 原子替换主机表
    void reloadHosts(std::shared_ptr<const HostsTable> hosts);
    std::shared_ptr<const HostsTable> hosts() const;

    std::chrono::milliseconds deadline() const;

    // 获取统计
    struct Stats {
        uint64_t queries;
        uint64_t answered;
        uint64_t failed;
        uint64_t local;         // 主机表应答
        uint64_t suppressed;    // 至少一条记录被策略拦截
    };
    Stats getStats() const;
    void resetStats();

private:
    class Context;

    boost::asio::io_context& io_;
    PolicyEngine& engine_;
    UpstreamDispatcher& dispatcher_;
    Prober* prober_;
    ResponseFilter filter_;
    Options options_;

    std::shared_ptr<const HostsTable> hosts_;

    // 统计计数器 (原子操作)
    std::atomic<uint64_t> queries_{0};
    std::atomic<uint64_t> answered_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> local_{0};
    std::atomic<uint64_t> suppressed_{0};
};

} // namespace pomelo
