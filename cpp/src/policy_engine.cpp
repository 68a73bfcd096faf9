#include "pomelo/policy_engine.hpp"
#include <spdlog/spdlog.h>

namespace pomelo {

// ==================== PolicyEngine ====================

PolicyEngine::PolicyEngine(std::shared_ptr<const RuleStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        store_ = std::make_shared<const RuleStore>(
            std::vector<PolicyRule>{}, std::vector<UpstreamTarget>{});
    }
}

PolicyDecision PolicyEngine::decide(
    const RequesterIdentity& requester,
    const Query& query
) const {
    total_decisions_.fetch_add(1, std::memory_order_relaxed);

    // 整个查询期间持有同一份快照
    auto store = std::atomic_load(&store_);
    const PolicyRule* rule = store->match(requester, query);

    if (rule) {
        matched_.fetch_add(1, std::memory_order_relaxed);
        spdlog::trace("policy: {} {} from {} matched {} (priority {})",
                      query.name, typeName(query.qtype),
                      requester.source_ip.to_string(), rule->rule_id, rule->priority);
    } else {
        defaulted_.fetch_add(1, std::memory_order_relaxed);
        spdlog::trace("policy: {} {} from {} uses default decision",
                      query.name, typeName(query.qtype),
                      requester.source_ip.to_string());
    }

    return fromRule(rule, *store);
}

PolicyDecision PolicyEngine::fromRule(const PolicyRule* rule, const RuleStore& store) {
    PolicyDecision decision;
    decision.upstreams = store.defaultUpstreams();

    if (!rule) {
        return decision;
    }

    decision.rule_id = rule->rule_id;

    if (!rule->upstream.empty()) {
        decision.upstreams = rule->upstream;
    }

    switch (rule->record_filter) {
        case RecordFilter::DenyAAAA:
            decision.allowed_types = TypeSet::all().without(dns_type::AAAA);
            break;
        case RecordFilter::DenyA:
            decision.allowed_types = TypeSet::all().without(dns_type::A);
            break;
        default:
            break;
    }

    decision.country_filter = rule->country_filter;
    decision.destination_deny = rule->destination_deny;
    decision.reachability_required = rule->reachability_required;
    return decision;
}

void PolicyEngine::reload(std::shared_ptr<const RuleStore> store) {
    if (!store) {
        spdlog::warn("policy: reload called without a rule store, keeping current rules");
        return;
    }
    spdlog::info("policy: reloading {} rules, {} default upstreams",
                 store->size(), store->defaultUpstreams().size());
    std::atomic_store(&store_, std::move(store));
    reloads_.fetch_add(1, std::memory_order_relaxed);
}

std::shared_ptr<const RuleStore> PolicyEngine::snapshot() const {
    return std::atomic_load(&store_);
}

PolicyEngine::Stats PolicyEngine::getStats() const {
    return Stats{
        total_decisions_.load(std::memory_order_relaxed),
        matched_.load(std::memory_order_relaxed),
        defaulted_.load(std::memory_order_relaxed),
        reloads_.load(std::memory_order_relaxed)
    };
}

void PolicyEngine::resetStats() {
    total_decisions_.store(0, std::memory_order_relaxed);
    matched_.store(0, std::memory_order_relaxed);
    defaulted_.store(0, std::memory_order_relaxed);
    reloads_.store(0, std::memory_order_relaxed);
}

} // namespace pomelo
