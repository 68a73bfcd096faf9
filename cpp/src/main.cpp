#include "pomelo/config.hpp"
#include "pomelo/geoip.hpp"
#include "pomelo/logging.hpp"
#include "pomelo/policy_engine.hpp"
#include "pomelo/prober.hpp"
#include "pomelo/resolution_pipeline.hpp"
#include "pomelo/server.hpp"
#include "pomelo/upstream_dispatcher.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace pomelo;

namespace {

// 重新加载规则和主机表, 失败时保留当前快照
void reload(const std::string& path, PolicyEngine& engine, ResolutionPipeline& pipeline) {
    Config config;
    std::string error;
    Error err = loadConfigFile(path, &config, &error);
    if (err != Error::Success) {
        spdlog::error("reload: {} ({}), keeping current configuration", error, errorString(err));
        return;
    }
    // server, 超时和 mmdb 只在启动时读取
    engine.reload(config.buildRuleStore());
    pipeline.reloadHosts(std::make_shared<const HostsTable>(config.hosts));
}

void waitForSignal(boost::asio::signal_set& signals,
                   boost::asio::io_context& io,
                   UdpServer& server,
                   const std::string& path,
                   PolicyEngine& engine,
                   ResolutionPipeline& pipeline) {
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        if (signo == SIGHUP) {
            spdlog::info("received SIGHUP, reloading {}", path);
            reload(path, engine, pipeline);
            waitForSignal(signals, io, server, path, engine, pipeline);
            return;
        }
        spdlog::info("received signal {}, shutting down", signo);
        server.stop();
        io.stop();
    });
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string path = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

    Config config;
    std::string error;
    Error err = loadConfigFile(path, &config, &error);
    if (err != Error::Success) {
        setupLogging("info", false);
        spdlog::critical("failed to load {}: {}", path, error);
        return 1;
    }

    setupLogging(config.server.log_level, config.server.access_log);
    spdlog::info("loaded {}: {} rules, {} default upstreams, {} hosts",
                 path, config.rules.size(), config.default_upstreams.size(),
                 config.hosts.size());

    std::unique_ptr<MaxMindGeoLookup> geo;
    if (!config.mmdb.empty()) {
        geo = std::make_unique<MaxMindGeoLookup>();
        if (geo->open(config.mmdb) != Error::Success) {
            spdlog::critical("failed to open geoip database {}", config.mmdb);
            return 1;
        }
    }

    boost::asio::io_context io;

    PolicyEngine engine(config.buildRuleStore());
    UpstreamDispatcher dispatcher(io, config.upstream_timeout);
    IcmpProber prober(io);

    ResolutionPipeline::Options options;
    options.probe_timeout = config.probe_timeout;
    options.filter = config.filter;
    ResolutionPipeline pipeline(io, engine, dispatcher, &prober, geo.get(), options);
    pipeline.reloadHosts(std::make_shared<const HostsTable>(config.hosts));

    UdpServer server(io, pipeline, config.server);
    if (server.start() != Error::Success) {
        return 1;
    }

    boost::asio::signal_set signals(io, SIGINT, SIGTERM, SIGHUP);
    waitForSignal(signals, io, server, path, engine, pipeline);

    size_t threads = config.server.worker_threads;
    if (threads == 0) {
        threads = std::max(1u, std::thread::hardware_concurrency());
    }
    spdlog::info("running with {} worker threads", threads);

    std::vector<std::thread> workers;
    for (size_t i = 1; i < threads; i++) {
        workers.emplace_back([&io] { io.run(); });
    }
    io.run();
    for (auto& t : workers) {
        t.join();
    }

    auto ps = pipeline.getStats();
    spdlog::info("stopped: {} queries, {} answered, {} failed, {} local, {} suppressed",
                 ps.queries, ps.answered, ps.failed, ps.local, ps.suppressed);
    return 0;
}
