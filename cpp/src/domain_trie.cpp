#include "pomelo/domain_trie.hpp"
#include <algorithm>

namespace pomelo {

// ==================== DomainTrie ====================

DomainTrie::DomainTrie()
    : root_(std::make_unique<TrieNode>()), rule_count_(0) {}

void DomainTrie::insertExact(const std::string& domain, size_t position) {
    auto labels = splitAndReverse(domain.c_str(), domain.size());
    if (labels.empty()) return;
    insertImpl(labels, false, position);
}

void DomainTrie::insertSuffix(const std::string& domain, size_t position) {
    auto labels = splitAndReverse(domain.c_str(), domain.size());
    if (labels.empty()) return;
    insertImpl(labels, true, position);
}

void DomainTrie::collect(
    const char* domain,
    size_t domain_len,
    std::vector<size_t>* out
) const {
    if (!domain || domain_len == 0 || !out) return;

    auto labels = splitAndReverse(domain, domain_len);
    const TrieNode* node = root_.get();
    size_t depth = 0;

    for (const auto& label : labels) {
        auto it = node->children.find(label);
        if (it == node->children.end()) {
            break;
        }
        node = it->second.get();
        depth++;

        // 沿途的后缀规则都命中
        out->insert(out->end(), node->suffix_rules.begin(), node->suffix_rules.end());
    }

    // 完整走完才算精确命中
    if (depth == labels.size() && depth > 0) {
        out->insert(out->end(), node->exact_rules.begin(), node->exact_rules.end());
    }
}

void DomainTrie::collect(const std::string& domain, std::vector<size_t>* out) const {
    collect(domain.c_str(), domain.size(), out);
}

size_t DomainTrie::size() const {
    return rule_count_;
}

std::vector<std::string> DomainTrie::splitAndReverse(const char* domain, size_t len) {
    std::vector<std::string> labels;
    std::string current;

    // 结尾点与 normalizeDomain 一样去掉
    while (len > 0 && domain[len - 1] == '.') {
        len--;
    }
    if (len == 0) {
        return labels;
    }

    for (size_t i = 0; i < len; i++) {
        if (domain[i] == '.') {
            labels.push_back(std::move(current));
            current.clear();
        } else {
            current += static_cast<char>(std::tolower(static_cast<unsigned char>(domain[i])));
        }
    }

    labels.push_back(std::move(current));

    // 反转
    std::reverse(labels.begin(), labels.end());
    return labels;
}

void DomainTrie::insertImpl(
    const std::vector<std::string>& labels,
    bool is_suffix,
    size_t position
) {
    TrieNode* node = root_.get();
    for (const auto& label : labels) {
        auto& child = node->children[label];
        if (!child) {
            child = std::make_unique<TrieNode>();
        }
        node = child.get();
    }

    if (is_suffix) {
        node->suffix_rules.push_back(position);
    } else {
        node->exact_rules.push_back(position);
    }
    rule_count_++;
}

// ==================== 辅助函数 ====================

std::string normalizeDomain(const std::string& domain) {
    std::string out;
    out.reserve(domain.size());
    for (char c : domain) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    while (!out.empty() && out.back() == '.') {
        out.pop_back();
    }
    return out;
}

bool isValidDomainName(const std::string& domain) {
    if (domain.empty() || domain.size() > MAX_DOMAIN_LENGTH) {
        return false;
    }

    size_t label_len = 0;
    for (char c : domain) {
        if (c == '.') {
            if (label_len == 0) return false;
            label_len = 0;
        } else if (++label_len > MAX_LABEL_LENGTH) {
            return false;
        }
    }
    return label_len > 0;
}

bool domainMatchesSuffix(const std::string& domain, const std::string& suffix) {
    std::string dom = normalizeDomain(domain);
    std::string suf = normalizeDomain(suffix);

    if (suf.empty()) return false;
    if (dom.size() < suf.size()) return false;

    size_t start = dom.size() - suf.size();
    if (dom.compare(start, suf.size(), suf) != 0) {
        return false;
    }

    // 确保是完整的标签匹配
    return start == 0 || dom[start - 1] == '.';
}

} // namespace pomelo
