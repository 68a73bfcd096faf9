#pragma once

#include "rule_store.hpp"
#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace pomelo {

// 允许的记录类型. 只有被显式拒绝的类型不在集合中
class TypeSet {
public:
    static TypeSet all() { return TypeSet(); }

    TypeSet without(uint16_t rrtype) const {
        TypeSet copy(*this);
        copy.denied_.insert(rrtype);
        return copy;
    }

    bool contains(uint16_t rrtype) const { return denied_.count(rrtype) == 0; }

    const std::set<uint16_t>& denied() const { return denied_; }

    bool operator==(const TypeSet& other) const { return denied_ == other.denied_; }

private:
    std::set<uint16_t> denied_;
};

// 针对单个查询的决策
struct PolicyDecision {
    std::vector<UpstreamTarget> upstreams;      // 非空, 按优先级排序
    TypeSet allowed_types;
    std::set<std::string> country_filter;
    std::vector<IpNetwork> destination_deny;
    bool reachability_required = false;
    std::string rule_id;                        // 命中的规则, 空 = 默认决策

    bool operator==(const PolicyDecision& other) const {
        return upstreams == other.upstreams &&
               allowed_types == other.allowed_types &&
               country_filter == other.country_filter &&
               destination_deny == other.destination_deny &&
               reachability_required == other.reachability_required &&
               rule_id == other.rule_id;
    }
};

// 策略引擎
class PolicyEngine {
public:
    explicit PolicyEngine(std::shared_ptr<const RuleStore> store);
    ~PolicyEngine() = default;

    // 禁止拷贝
    PolicyEngine(const PolicyEngine&) = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;

    // 总是返回一个决策, 无命中时使用默认决策
    PolicyDecision decide(const RequesterIdentity& requester, const Query& query) const;

    // 原子替换规则快照
    void reload(std::shared_ptr<const RuleStore> store);

    std::shared_ptr<const RuleStore> snapshot() const;

    // 获取统计
    struct Stats {
        uint64_t total_decisions;
        uint64_t matched;
        uint64_t defaulted;
        uint64_t reloads;
    };
    Stats getStats() const;
    void resetStats();

private:
    static PolicyDecision fromRule(const PolicyRule* rule, const RuleStore& store);

    std::shared_ptr<const RuleStore> store_;

    // 统计计数器 (原子操作)
    mutable std::atomic<uint64_t> total_decisions_{0};
    mutable std::atomic<uint64_t> matched_{0};
    mutable std::atomic<uint64_t> defaulted_{0};
    std::atomic<uint64_t> reloads_{0};
};

} // namespace pomelo
