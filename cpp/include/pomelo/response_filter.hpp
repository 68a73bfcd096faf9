#pragma once

#include "geoip.hpp"
#include "policy_engine.hpp"
#include "prober.hpp"
#include <map>
#include <vector>

namespace pomelo {

// 未知情况的处理方式
struct FilterPolicy {
    bool unknown_country_allowed = true;    // 国家未知: 放行
    bool indeterminate_allowed = false;     // 探测不确定: 丢弃
};

using ProbeResults = std::map<boost::asio::ip::address, ProbeResult>;

// 响应过滤器 - 纯函数, 可并发调用
//
// 顺序: 记录类型 -> 目标网段 -> 国家 -> 可达性. 后三步只作用于 AAAA.
class ResponseFilter {
public:
    ResponseFilter(const GeoLookup* geo, FilterPolicy policy);

    // 需要探测的 AAAA 地址 (已通过前三步)
    std::vector<boost::asio::ip::address> probeTargets(
        const AggregatedAnswer& answer,
        const PolicyDecision& decision) const;

    // 缺少探测结果的地址视为 Indeterminate
    ResolvedAnswer apply(const AggregatedAnswer& answer,
                         const PolicyDecision& decision,
                         const ProbeResults& probes) const;

    // 单条记录是否通过类型/网段/国家过滤
    bool passesStatic(const CandidateRecord& record,
                      const PolicyDecision& decision) const;

    const FilterPolicy& policy() const { return policy_; }

private:
    bool countryAllowed(const boost::asio::ip::address& addr,
                        const PolicyDecision& decision) const;

    bool probeAllowed(const boost::asio::ip::address& addr,
                      const ProbeResults& probes) const;

    const GeoLookup* geo_;
    FilterPolicy policy_;
};

} // namespace pomelo
