#include "pomelo/config.hpp"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <strings.h>

namespace pomelo {

namespace {

// 出错时填写消息并返回 InvalidConfig
Error invalid(std::string* error, const std::string& key, const std::string& what) {
    if (error) {
        *error = key + ": " + what;
    }
    return Error::InvalidConfig;
}

// 标量或序列都视为字符串列表
Error readStringList(const YAML::Node& node, const std::string& key,
                     std::vector<std::string>* out, std::string* error) {
    out->clear();
    if (!node || node.IsNull()) {
        return Error::Success;
    }
    if (node.IsScalar()) {
        out->push_back(node.as<std::string>());
        return Error::Success;
    }
    if (!node.IsSequence()) {
        return invalid(error, key, "expected a string or a list");
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return invalid(error, key, "list items must be strings");
        }
        out->push_back(item.as<std::string>());
    }
    return Error::Success;
}

Error readUpstreams(const YAML::Node& node, const std::string& key,
                    std::vector<UpstreamTarget>* out, std::string* error) {
    std::vector<std::string> items;
    Error err = readStringList(node, key, &items, error);
    if (err != Error::Success) {
        return err;
    }
    out->clear();
    for (const auto& item : items) {
        UpstreamTarget target;
        if (parseUpstream(item, &target) != Error::Success) {
            return invalid(error, key, "invalid upstream '" + item +
                           "' (only plain udp upstreams are supported)");
        }
        out->push_back(target);
    }
    return Error::Success;
}

Error readNetworks(const YAML::Node& node, const std::string& key,
                   std::vector<IpNetwork>* out, std::string* error) {
    std::vector<std::string> items;
    Error err = readStringList(node, key, &items, error);
    if (err != Error::Success) {
        return err;
    }
    out->clear();
    for (const auto& item : items) {
        if (item == "*" || strcasecmp(item.c_str(), "any") == 0) {
            out->clear();
            return Error::Success;
        }
        IpNetwork net;
        if (IpNetwork::parse(item, &net) != Error::Success) {
            return invalid(error, key, "invalid network '" + item + "'");
        }
        out->push_back(net);
    }
    return Error::Success;
}

Error readDuration(const YAML::Node& node, const std::string& key,
                   std::chrono::milliseconds* out, std::string* error) {
    if (!node || node.IsNull()) {
        return Error::Success;
    }
    if (!node.IsScalar() || parseDuration(node.as<std::string>(), out) != Error::Success) {
        return invalid(error, key, "invalid duration");
    }
    return Error::Success;
}

Error readAllowDeny(const YAML::Node& node, const std::string& key,
                    bool* allowed, std::string* error) {
    if (!node || node.IsNull()) {
        return Error::Success;
    }
    std::string value = node.as<std::string>();
    if (strcasecmp(value.c_str(), "allow") == 0) {
        *allowed = true;
    } else if (strcasecmp(value.c_str(), "deny") == 0) {
        *allowed = false;
    } else {
        return invalid(error, key, "expected 'allow' or 'deny', got '" + value + "'");
    }
    return Error::Success;
}

void warnUnknownKeys(const YAML::Node& node, const std::string& where,
                     std::initializer_list<const char*> known) {
    for (const auto& kv : node) {
        std::string name = kv.first.as<std::string>();
        bool found = std::any_of(known.begin(), known.end(),
                                 [&](const char* k) { return name == k; });
        if (!found) {
            spdlog::warn("config: ignoring unknown key '{}{}'", where, name);
        }
    }
}

Error parseServer(const YAML::Node& node, ServerConfig* server, std::string* error) {
    if (!node || node.IsNull()) {
        return Error::Success;
    }
    if (!node.IsMap()) {
        return invalid(error, "server", "expected a mapping");
    }
    warnUnknownKeys(node, "server.",
                    {"bind", "access_log", "log_level", "worker_threads", "max_inflight"});

    if (node["bind"]) {
        std::string text = node["bind"].as<std::string>();
        UpstreamTarget target;
        if (parseUpstream(text, &target) != Error::Success) {
            return invalid(error, "server.bind", "invalid address '" + text + "'");
        }
        server->bind = target.endpoint;
    }
    if (node["access_log"]) {
        server->access_log = node["access_log"].as<bool>();
    }
    if (node["log_level"]) {
        std::string level = node["log_level"].as<std::string>();
        if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
            return invalid(error, "server.log_level", "unknown level '" + level + "'");
        }
        server->log_level = level;
    }
    if (node["worker_threads"]) {
        server->worker_threads = node["worker_threads"].as<size_t>();
    }
    if (node["max_inflight"]) {
        server->max_inflight = node["max_inflight"].as<size_t>();
        if (server->max_inflight == 0) {
            return invalid(error, "server.max_inflight", "must be positive");
        }
    }
    return Error::Success;
}

Error parseHosts(const YAML::Node& node, HostsTable* hosts, std::string* error) {
    if (!node || node.IsNull()) {
        return Error::Success;
    }
    if (!node.IsMap()) {
        return invalid(error, "hosts", "expected a mapping of name to addresses");
    }
    for (const auto& kv : node) {
        std::string name = kv.first.as<std::string>();
        std::string key = "hosts." + name;
        std::vector<std::string> addrs;
        Error err = readStringList(kv.second, key, &addrs, error);
        if (err != Error::Success) {
            return err;
        }
        for (const auto& text : addrs) {
            boost::system::error_code ec;
            auto addr = boost::asio::ip::make_address(text, ec);
            if (ec) {
                return invalid(error, key, "invalid address '" + text + "'");
            }
            hosts->add(name, addr);
        }
    }
    return Error::Success;
}

Error parseRule(const YAML::Node& node, size_t index, PolicyRule* rule, std::string* error) {
    std::string prefix = "rules[" + std::to_string(index) + "]";
    if (!node.IsMap()) {
        return invalid(error, prefix, "expected a mapping");
    }
    warnUnknownKeys(node, prefix + ".",
                    {"id", "priority", "client_match", "domain_match", "qtype_match",
                     "record_filter", "upstream", "country_filter", "destination_deny",
                     "reachability_required"});

    Error err = Error::Success;

    if (node["id"]) {
        rule->rule_id = node["id"].as<std::string>();
    }
    if (node["priority"]) {
        rule->priority = node["priority"].as<int>();
    }

    err = readNetworks(node["client_match"], prefix + ".client_match", &rule->client_match, error);
    if (err != Error::Success) return err;

    if (node["domain_match"]) {
        std::string text = node["domain_match"].as<std::string>();
        if (DomainMatch::parse(text, &rule->domain_match) != Error::Success) {
            return invalid(error, prefix + ".domain_match", "invalid pattern '" + text + "'");
        }
    }

    std::vector<std::string> items;
    err = readStringList(node["qtype_match"], prefix + ".qtype_match", &items, error);
    if (err != Error::Success) return err;
    for (const auto& item : items) {
        uint16_t qtype = typeFromName(item.c_str());
        if (qtype == 0) {
            return invalid(error, prefix + ".qtype_match", "unknown record type '" + item + "'");
        }
        rule->qtype_match.insert(qtype);
    }

    if (node["record_filter"]) {
        std::string text = node["record_filter"].as<std::string>();
        if (parseRecordFilter(text, &rule->record_filter) != Error::Success) {
            return invalid(error, prefix + ".record_filter", "unknown filter '" + text + "'");
        }
    }

    err = readUpstreams(node["upstream"], prefix + ".upstream", &rule->upstream, error);
    if (err != Error::Success) return err;

    err = readStringList(node["country_filter"], prefix + ".country_filter", &items, error);
    if (err != Error::Success) return err;
    for (auto code : items) {
        std::transform(code.begin(), code.end(), code.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (code.empty()) {
            return invalid(error, prefix + ".country_filter", "empty country code");
        }
        rule->country_filter.insert(code);
    }

    err = readNetworks(node["destination_deny"], prefix + ".destination_deny",
                       &rule->destination_deny, error);
    if (err != Error::Success) return err;

    if (node["reachability_required"]) {
        rule->reachability_required = node["reachability_required"].as<bool>();
    }
    return Error::Success;
}

Error parseRoot(const YAML::Node& root, Config* config, std::string* error) {
    if (!root.IsMap()) {
        return invalid(error, "<root>", "expected a mapping");
    }
    warnUnknownKeys(root, "",
                    {"server", "default_upstream", "upstream_timeout", "probe_timeout",
                     "mmdb", "unknown_country", "indeterminate_probe", "hosts", "rules"});

    Error err = parseServer(root["server"], &config->server, error);
    if (err != Error::Success) return err;

    err = readUpstreams(root["default_upstream"], "default_upstream",
                        &config->default_upstreams, error);
    if (err != Error::Success) return err;
    if (config->default_upstreams.empty()) {
        return invalid(error, "default_upstream", "at least one upstream is required");
    }

    err = readDuration(root["upstream_timeout"], "upstream_timeout",
                       &config->upstream_timeout, error);
    if (err != Error::Success) return err;
    err = readDuration(root["probe_timeout"], "probe_timeout", &config->probe_timeout, error);
    if (err != Error::Success) return err;

    if (root["mmdb"]) {
        config->mmdb = root["mmdb"].as<std::string>();
    }

    err = readAllowDeny(root["unknown_country"], "unknown_country",
                        &config->filter.unknown_country_allowed, error);
    if (err != Error::Success) return err;
    err = readAllowDeny(root["indeterminate_probe"], "indeterminate_probe",
                        &config->filter.indeterminate_allowed, error);
    if (err != Error::Success) return err;

    err = parseHosts(root["hosts"], &config->hosts, error);
    if (err != Error::Success) return err;

    const YAML::Node rules = root["rules"];
    if (rules && !rules.IsNull()) {
        if (!rules.IsSequence()) {
            return invalid(error, "rules", "expected a list");
        }
        for (size_t i = 0; i < rules.size(); i++) {
            PolicyRule rule;
            err = parseRule(rules[i], i, &rule, error);
            if (err != Error::Success) return err;
            if (!rule.country_filter.empty() && config->mmdb.empty()) {
                return invalid(error, "rules[" + std::to_string(i) + "].country_filter",
                               "requires 'mmdb' to be configured");
            }
            config->rules.push_back(std::move(rule));
        }
    }
    return Error::Success;
}

} // anonymous namespace

std::shared_ptr<const RuleStore> Config::buildRuleStore() const {
    return std::make_shared<const RuleStore>(rules, default_upstreams);
}

Error parseDuration(const std::string& text, std::chrono::milliseconds* out) {
    if (text.empty() || !out) {
        return Error::InvalidConfig;
    }
    // strtoull 会接受负号并回绕
    if (!std::isdigit(static_cast<unsigned char>(text[0]))) {
        return Error::InvalidConfig;
    }

    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (end == text.c_str() || errno == ERANGE) {
        return Error::InvalidConfig;
    }

    std::string unit(end);
    unsigned long long ms = 0;
    if (unit.empty() || unit == "ms") {
        ms = value;
    } else if (unit == "s") {
        if (value > MAX_DURATION_MS / 1000) {
            return Error::InvalidConfig;
        }
        ms = value * 1000;
    } else {
        return Error::InvalidConfig;
    }

    if (ms == 0 || ms > MAX_DURATION_MS) {
        return Error::InvalidConfig;
    }
    *out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
    return Error::Success;
}

Error loadConfig(const char* yaml_content, size_t len, Config* config, std::string* error) {
    if (!yaml_content || !config) {
        return invalid(error, "<root>", "no configuration");
    }

    Config parsed;
    try {
        YAML::Node root = YAML::Load(std::string(yaml_content, len));
        Error err = parseRoot(root, &parsed, error);
        if (err != Error::Success) {
            return err;
        }
    } catch (const YAML::Exception& e) {
        return invalid(error, "yaml", e.what());
    }

    *config = std::move(parsed);
    return Error::Success;
}

Error loadConfigFile(const std::string& path, Config* config, std::string* error) {
    std::ifstream in(path);
    if (!in) {
        return invalid(error, path, "cannot open configuration file");
    }
    std::stringstream buf;
    buf << in.rdbuf();
    std::string content = buf.str();
    return loadConfig(content.data(), content.size(), config, error);
}

} // namespace pomelo
