#include <benchmark/benchmark.h>
#include "pomelo/dns_parser.hpp"
#include "pomelo/domain_trie.hpp"
#include "pomelo/response_filter.hpp"
#include "pomelo/rule_store.hpp"
#include <random>
#include <vector>

using namespace pomelo;

// 构造 DNS 查询包
std::vector<uint8_t> buildQuery(const std::string& domain) {
    std::vector<uint8_t> packet = {
        0x12, 0x34, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00
    };

    size_t start = 0;
    for (size_t i = 0; i <= domain.size(); i++) {
        if (i == domain.size() || domain[i] == '.') {
            size_t len = i - start;
            packet.push_back(static_cast<uint8_t>(len));
            for (size_t j = start; j < i; j++) {
                packet.push_back(domain[j]);
            }
            start = i + 1;
        }
    }
    packet.push_back(0);
    packet.insert(packet.end(), {0x00, 0x01, 0x00, 0x01});

    return packet;
}

// 1000 条规则: 精确域名, 后缀, 客户端网段混合
std::vector<PolicyRule> buildRules() {
    std::vector<PolicyRule> rules;
    std::mt19937 rng(7);
    for (int i = 0; i < 1000; i++) {
        PolicyRule rule;
        rule.priority = static_cast<int>(rng() % 100);
        std::string domain = "domain" + std::to_string(i) + ".example.com";
        rule.domain_match = (i % 3 == 0) ? DomainMatch::suffix(domain) : DomainMatch::exact(domain);
        if (i % 5 == 0) {
            IpNetwork net;
            IpNetwork::parse("10." + std::to_string(i % 256) + ".0.0/16", &net);
            rule.client_match.push_back(net);
        }
        rules.push_back(rule);
    }
    return rules;
}

// ==================== DNS 解析基准测试 ====================

static void BM_DNSParse(benchmark::State& state) {
    auto packet = buildQuery("www.example.com");

    for (auto _ : state) {
        DNSParseResult result;
        auto err = DNSParser::parse(packet.data(), packet.size(), &result);
        benchmark::DoNotOptimize(err);
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DNSParse);

static void BM_DNSDecodeName(benchmark::State& state) {
    auto packet = buildQuery("subdomain.example.com");
    DNSParseResult parsed;
    DNSParser::parse(packet.data(), packet.size(), &parsed);

    char domain[256];
    size_t domain_len;

    for (auto _ : state) {
        DNSParser::decodeName(
            packet.data(), packet.size(),
            parsed.question.name_offset,
            domain, sizeof(domain), &domain_len
        );
        benchmark::DoNotOptimize(domain);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DNSDecodeName);

static void BM_DNSParseQuery(benchmark::State& state) {
    auto packet = buildQuery("www.example.com");

    for (auto _ : state) {
        Query query;
        auto err = DNSParser::parseQuery(packet.data(), packet.size(), &query);
        benchmark::DoNotOptimize(err);
        benchmark::DoNotOptimize(query);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DNSParseQuery);

// ==================== 域名 Trie 基准测试 ====================

static void BM_TrieCollect(benchmark::State& state) {
    DomainTrie trie;

    // 插入 1000 条规则
    for (size_t i = 0; i < 1000; i++) {
        trie.insertExact("domain" + std::to_string(i) + ".example.com", i);
    }

    // 添加通配符规则
    trie.insertSuffix("test.com", 1000);

    std::vector<size_t> out;
    for (auto _ : state) {
        out.clear();
        trie.collect("domain500.example.com", &out);
        benchmark::DoNotOptimize(out);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_TrieCollect);

static void BM_TrieCollectWildcard(benchmark::State& state) {
    DomainTrie trie;
    trie.insertSuffix("example.com", 0);

    std::vector<size_t> out;
    for (auto _ : state) {
        out.clear();
        trie.collect("sub.domain.example.com", &out);
        benchmark::DoNotOptimize(out);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_TrieCollectWildcard);

// ==================== 规则匹配基准测试 ====================

static void BM_RuleStoreMatch(benchmark::State& state) {
    RuleStore store(buildRules(), {});
    RequesterIdentity requester{boost::asio::ip::make_address("10.20.1.1")};
    Query query;
    query.name = "www.domain600.example.com";

    for (auto _ : state) {
        auto rule = store.match(requester, query);
        benchmark::DoNotOptimize(rule);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RuleStoreMatch);

static void BM_RuleStoreMatchLinear(benchmark::State& state) {
    RuleStore store(buildRules(), {});
    RequesterIdentity requester{boost::asio::ip::make_address("10.20.1.1")};
    Query query;
    query.name = "www.domain600.example.com";

    for (auto _ : state) {
        auto rule = store.matchLinear(requester, query);
        benchmark::DoNotOptimize(rule);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RuleStoreMatchLinear);

// ==================== 响应构建基准测试 ====================

static void BM_BuildResponse(benchmark::State& state) {
    Query query;
    query.name = "www.example.com";
    query.qtype = dns_type::AAAA;

    ResolvedAnswer answer;
    for (int i = 1; i <= 8; i++) {
        auto addr = boost::asio::ip::make_address("2001:db8::" + std::to_string(i));
        answer.records.push_back(makeAddressRecord(query.name, addr, 300));
    }

    for (auto _ : state) {
        auto packet = DNSResponseBuilder::buildResponse(query, answer);
        benchmark::DoNotOptimize(packet);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildResponse);

static void BM_ResponseFilter(benchmark::State& state) {
    ResponseFilter filter(nullptr, FilterPolicy{});
    PolicyDecision decision;
    IpNetwork deny;
    IpNetwork::parse("2001:db8:bad::/48", &deny);
    decision.destination_deny.push_back(deny);

    AggregatedAnswer answer;
    for (int i = 1; i <= 8; i++) {
        auto addr = boost::asio::ip::make_address("2001:db8::" + std::to_string(i));
        answer.records.push_back(makeAddressRecord("www.example.com", addr, 300));
    }

    for (auto _ : state) {
        auto resolved = filter.apply(answer, decision, {});
        benchmark::DoNotOptimize(resolved);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ResponseFilter);

BENCHMARK_MAIN();
