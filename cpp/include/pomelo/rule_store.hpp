#pragma once

#include "types.hpp"
#include "ip_network.hpp"
#include "domain_trie.hpp"
#include <set>
#include <string>
#include <vector>

namespace pomelo {

// 域名匹配方式
struct DomainMatch {
    enum class Kind : uint8_t {
        Any = 0,
        Exact = 1,
        Suffix = 2,
    };

    Kind kind = Kind::Any;
    std::string domain;     // 规范化后的域名

    static DomainMatch any();
    static DomainMatch exact(const std::string& domain);
    static DomainMatch suffix(const std::string& domain);

    // "*" / "any" / "*.example.com" / "example.com"
    static Error parse(const std::string& text, DomainMatch* out);

    bool matches(const std::string& name) const;
};

// 记录类型过滤
enum class RecordFilter : uint8_t {
    AllowAll = 0,
    DenyAAAA = 1,
    DenyA = 2,
};

Error parseRecordFilter(const std::string& text, RecordFilter* out);
const char* recordFilterName(RecordFilter filter);

// 策略规则
struct PolicyRule {
    int priority = 0;
    std::vector<IpNetwork> client_match;        // 空 = 任意
    DomainMatch domain_match;
    std::set<uint16_t> qtype_match;             // 空 = 任意
    RecordFilter record_filter = RecordFilter::AllowAll;
    std::vector<UpstreamTarget> upstream;       // 空 = 默认上游
    std::set<std::string> country_filter;       // 空 = 不过滤
    std::vector<IpNetwork> destination_deny;
    bool reachability_required = false;

    size_t declaration_index = 0;               // 由 RuleStore 填写
    std::string rule_id;                        // 日志用

    bool matchesClient(const boost::asio::ip::address& addr) const;
    bool matchesQuery(const Query& query) const;
};

// 规则存储 - 不可变快照
//
// 规则按 (priority 升序, 声明顺序) 排成全序, 第一个命中的规则胜出.
// 域名模式用 Trie 索引, 结果与线性扫描一致.
class RuleStore {
public:
    RuleStore(std::vector<PolicyRule> rules,
              std::vector<UpstreamTarget> default_upstreams);
    ~RuleStore() = default;

    // 禁止拷贝
    RuleStore(const RuleStore&) = delete;
    RuleStore& operator=(const RuleStore&) = delete;

    // 匹配规则, nullptr 表示无命中
    const PolicyRule* match(const RequesterIdentity& requester, const Query& query) const;

    // 参考实现: 按全序线性扫描
    const PolicyRule* matchLinear(const RequesterIdentity& requester, const Query& query) const;

    // 按全序排列的规则
    const std::vector<PolicyRule>& rules() const { return rules_; }

    const std::vector<UpstreamTarget>& defaultUpstreams() const { return default_upstreams_; }

    size_t size() const { return rules_.size(); }

private:
    std::vector<PolicyRule> rules_;
    std::vector<UpstreamTarget> default_upstreams_;

    DomainTrie trie_;
    std::vector<size_t> any_domain_rules_;
};

} // namespace pomelo
