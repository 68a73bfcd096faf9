#pragma once

#include "hosts.hpp"
#include "response_filter.hpp"
#include "rule_store.hpp"
#include <boost/asio/ip/udp.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace pomelo {

constexpr const char* DEFAULT_CONFIG_PATH = "/etc/pomelo/pomelo.yaml";
constexpr size_t DEFAULT_MAX_INFLIGHT = 1024;

// 监听与进程设置
struct ServerConfig {
    boost::asio::ip::udp::endpoint bind{boost::asio::ip::address_v4::any(), 53};
    bool access_log = true;
    std::string log_level = "info";
    size_t worker_threads = 0;          // 0 = 硬件并发数
    size_t max_inflight = DEFAULT_MAX_INFLIGHT;
};

// 完整配置
struct Config {
    ServerConfig server;

    std::vector<UpstreamTarget> default_upstreams;
    std::chrono::milliseconds upstream_timeout = DEFAULT_UPSTREAM_TIMEOUT;
    std::chrono::milliseconds probe_timeout = DEFAULT_PROBE_TIMEOUT;

    std::string mmdb;                   // 空 = 不加载
    FilterPolicy filter;

    std::vector<PolicyRule> rules;      // 声明顺序
    HostsTable hosts;

    // 构建不可变的规则快照
    std::shared_ptr<const RuleStore> buildRuleStore() const;
};

// 从 YAML 文本加载, 失败时 error 说明出错的键
Error loadConfig(const char* yaml_content, size_t len, Config* config, std::string* error);

Error loadConfigFile(const std::string& path, Config* config, std::string* error);

// 时长上限: 一天
constexpr unsigned long long MAX_DURATION_MS = 24ULL * 3600 * 1000;

// "250" / "250ms" / "2s", 必须为正
Error parseDuration(const std::string& text, std::chrono::milliseconds* out);

} // namespace pomelo
