#pragma once

#include "common.hpp"
#include <string>
#include <unordered_map>
#include <memory>
#include <vector>

namespace pomelo {

// Trie 节点, 保存规则在全序中的位置
struct TrieNode {
    std::unordered_map<std::string, std::unique_ptr<TrieNode>> children;
    std::vector<size_t> exact_rules;     // 精确匹配规则
    std::vector<size_t> suffix_rules;    // 后缀匹配规则 (含顶点)

    TrieNode() = default;
};

// 域名 Trie. 构建完成后只读, 可并发查询
class DomainTrie {
public:
    DomainTrie();
    ~DomainTrie() = default;

    // 禁止拷贝
    DomainTrie(const DomainTrie&) = delete;
    DomainTrie& operator=(const DomainTrie&) = delete;

    DomainTrie(DomainTrie&&) = default;
    DomainTrie& operator=(DomainTrie&&) = default;

    // 插入规则位置, 域名需已规范化
    void insertExact(const std::string& domain, size_t position);
    void insertSuffix(const std::string& domain, size_t position);

    // 收集所有域名命中的规则位置 (未排序)
    void collect(const char* domain, size_t domain_len, std::vector<size_t>* out) const;
    void collect(const std::string& domain, std::vector<size_t>* out) const;

    // 获取规则数量
    size_t size() const;

    // 将域名分割为标签并反转 (小写). 中间的空标签保留, 与字符串比较一致
    static std::vector<std::string> splitAndReverse(const char* domain, size_t len);

private:
    // 内部插入实现
    void insertImpl(const std::vector<std::string>& labels,
                    bool is_suffix,
                    size_t position);

    std::unique_ptr<TrieNode> root_;
    size_t rule_count_;
};

// 后缀匹配 (按标签边界, 含顶点)
bool domainMatchesSuffix(const std::string& domain, const std::string& suffix);

// 规范化域名: 小写, 去掉结尾点
std::string normalizeDomain(const std::string& domain);

// 已规范化的域名: 非空, 无空标签, 标签不超过 MAX_LABEL_LENGTH, 总长不超过 MAX_DOMAIN_LENGTH
bool isValidDomainName(const std::string& domain);

} // namespace pomelo
