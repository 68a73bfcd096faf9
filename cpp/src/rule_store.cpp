#include "pomelo/rule_store.hpp"
#include <algorithm>
#include <strings.h>

namespace pomelo {

// ==================== DomainMatch ====================

DomainMatch DomainMatch::any() {
    return DomainMatch{};
}

DomainMatch DomainMatch::exact(const std::string& domain) {
    DomainMatch m;
    m.kind = Kind::Exact;
    m.domain = normalizeDomain(domain);
    return m;
}

DomainMatch DomainMatch::suffix(const std::string& domain) {
    DomainMatch m;
    m.kind = Kind::Suffix;
    m.domain = normalizeDomain(domain);
    return m;
}

Error DomainMatch::parse(const std::string& text, DomainMatch* out) {
    if (!out || text.empty()) {
        return Error::InvalidConfig;
    }

    if (text == "*" || strcasecmp(text.c_str(), "any") == 0 ||
        strcasecmp(text.c_str(), "all") == 0) {
        *out = any();
        return Error::Success;
    }

    std::string dom = text;
    bool is_suffix = false;
    if (dom.size() > 2 && dom[0] == '*' && dom[1] == '.') {
        is_suffix = true;
        dom = dom.substr(2);
    }

    dom = normalizeDomain(dom);
    if (!isValidDomainName(dom) || dom.find('*') != std::string::npos) {
        return Error::InvalidConfig;
    }

    *out = is_suffix ? suffix(dom) : exact(dom);
    return Error::Success;
}

bool DomainMatch::matches(const std::string& name) const {
    switch (kind) {
        case Kind::Any:
            return true;
        case Kind::Exact:
            return normalizeDomain(name) == domain;
        case Kind::Suffix:
            return domainMatchesSuffix(name, domain);
    }
    return false;
}

// ==================== RecordFilter ====================

Error parseRecordFilter(const std::string& text, RecordFilter* out) {
    if (!out) return Error::InvalidConfig;

    if (strcasecmp(text.c_str(), "allow-all") == 0 || strcasecmp(text.c_str(), "allow") == 0) {
        *out = RecordFilter::AllowAll;
    } else if (strcasecmp(text.c_str(), "deny-aaaa") == 0) {
        *out = RecordFilter::DenyAAAA;
    } else if (strcasecmp(text.c_str(), "deny-a") == 0) {
        *out = RecordFilter::DenyA;
    } else {
        return Error::InvalidConfig;
    }
    return Error::Success;
}

const char* recordFilterName(RecordFilter filter) {
    switch (filter) {
        case RecordFilter::AllowAll: return "allow-all";
        case RecordFilter::DenyAAAA: return "deny-AAAA";
        case RecordFilter::DenyA:    return "deny-A";
    }
    return "unknown";
}

// ==================== PolicyRule ====================

bool PolicyRule::matchesClient(const boost::asio::ip::address& addr) const {
    return anyContains(client_match, addr);
}

bool PolicyRule::matchesQuery(const Query& query) const {
    if (!qtype_match.empty() && qtype_match.count(query.qtype) == 0) {
        return false;
    }
    return domain_match.matches(query.name);
}

// ==================== RuleStore ====================

RuleStore::RuleStore(
    std::vector<PolicyRule> rules,
    std::vector<UpstreamTarget> default_upstreams
)
    : rules_(std::move(rules)),
      default_upstreams_(std::move(default_upstreams)) {

    for (size_t i = 0; i < rules_.size(); i++) {
        rules_[i].declaration_index = i;
        if (rules_[i].rule_id.empty()) {
            rules_[i].rule_id = "rule#" + std::to_string(i);
        }
    }

    // 全序: priority 升序, 相同则保持声明顺序
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const PolicyRule& a, const PolicyRule& b) {
                         return a.priority < b.priority;
                     });

    for (size_t pos = 0; pos < rules_.size(); pos++) {
        const auto& dm = rules_[pos].domain_match;
        switch (dm.kind) {
            case DomainMatch::Kind::Any:
                any_domain_rules_.push_back(pos);
                break;
            case DomainMatch::Kind::Exact:
                trie_.insertExact(dm.domain, pos);
                break;
            case DomainMatch::Kind::Suffix:
                trie_.insertSuffix(dm.domain, pos);
                break;
        }
    }
}

const PolicyRule* RuleStore::match(
    const RequesterIdentity& requester,
    const Query& query
) const {
    std::vector<size_t> candidates(any_domain_rules_);
    trie_.collect(query.name, &candidates);

    // 全序位置越小越优先
    std::sort(candidates.begin(), candidates.end());

    for (size_t pos : candidates) {
        const PolicyRule& rule = rules_[pos];
        if (!rule.qtype_match.empty() && rule.qtype_match.count(query.qtype) == 0) {
            continue;
        }
        if (rule.matchesClient(requester.source_ip)) {
            return &rule;
        }
    }
    return nullptr;
}

const PolicyRule* RuleStore::matchLinear(
    const RequesterIdentity& requester,
    const Query& query
) const {
    for (const auto& rule : rules_) {
        if (rule.matchesClient(requester.source_ip) && rule.matchesQuery(query)) {
            return &rule;
        }
    }
    return nullptr;
}

} // namespace pomelo
