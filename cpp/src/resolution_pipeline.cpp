#include "pomelo/resolution_pipeline.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <optional>
#include <set>

namespace pomelo {

const char* queryStateName(QueryState state) {
    switch (state) {
        case QueryState::Received:      return "received";
        case QueryState::PolicyDecided: return "policy-decided";
        case QueryState::Dispatching:   return "dispatching";
        case QueryState::Filtering:     return "filtering";
        case QueryState::Answered:      return "answered";
        case QueryState::Failed:        return "failed";
    }
    return "unknown";
}

// ==================== Context ====================

// 单个查询的上下文, 所有回调都转发到 strand_
class ResolutionPipeline::Context : public std::enable_shared_from_this<ResolutionPipeline::Context> {
public:
    Context(ResolutionPipeline& owner,
            const RequesterIdentity& requester,
            const Query& query,
            Handler handler)
        : owner_(owner),
          strand_(boost::asio::make_strand(owner.io_)),
          deadline_(strand_),
          requester_(requester),
          query_(query),
          handler_(std::move(handler)) {}

    void start() {
        auto self = shared_from_this();
        boost::asio::post(strand_, [self] { self->run(); });
    }

private:
    void transition(QueryState next) {
        spdlog::trace("pipeline: {} {} id {}: {} -> {}",
                      query_.name, typeName(query_.qtype), query_.id,
                      queryStateName(state_), queryStateName(next));
        state_ = next;
    }

    void run() {
        // 主机表优先于策略
        auto hosts = owner_.hosts();
        ResolvedAnswer local;
        if (hosts && hosts->answer(query_, &local)) {
            owner_.local_.fetch_add(1, std::memory_order_relaxed);
            finish(local);
            return;
        }

        decision_ = owner_.engine_.decide(requester_, query_);
        transition(QueryState::PolicyDecided);

        // 查询类型被拒绝: 空成功, 不访问上游
        if (!decision_.allowed_types.contains(query_.qtype)) {
            owner_.suppressed_.fetch_add(1, std::memory_order_relaxed);
            ResolvedAnswer empty;
            empty.rcode = dns_rcode::NOERROR;
            finish(empty);
            return;
        }

        transition(QueryState::Dispatching);

        auto self = shared_from_this();
        deadline_.expires_after(owner_.deadline());
        deadline_.async_wait([self](const boost::system::error_code& ec) {
            if (!ec) {
                self->onDeadline();
            }
        });

        owner_.dispatcher_.asyncResolve(
            query_, decision_.upstreams,
            [self](const AggregatedAnswer& partial) {
                boost::asio::post(self->strand_, [self, partial] {
                    self->startProbes(partial);
                });
            },
            [self](Error err, AggregatedAnswer answer) {
                boost::asio::post(self->strand_, [self, err, answer = std::move(answer)]() mutable {
                    self->onDispatched(err, std::move(answer));
                });
            });
    }

    // 对尚未探测的 AAAA 候选发起探测
    void startProbes(const AggregatedAnswer& answer) {
        if (done_ || !decision_.reachability_required) {
            return;
        }

        auto self = shared_from_this();
        for (const auto& addr : owner_.filter_.probeTargets(answer, decision_)) {
            if (!probed_.insert(addr).second) {
                continue;
            }
            if (!owner_.prober_) {
                probes_[addr] = ProbeResult::Indeterminate;
                continue;
            }
            owner_.prober_->asyncProbe(
                addr, owner_.options_.probe_timeout,
                [self, addr](ProbeResult result) {
                    boost::asio::post(self->strand_, [self, addr, result] {
                        self->onProbe(addr, result);
                    });
                });
        }
    }

    void onProbe(const boost::asio::ip::address& addr, ProbeResult result) {
        if (done_) {
            return;
        }
        probes_[addr] = result;
        maybeFinish();
    }

    void onDispatched(Error err, AggregatedAnswer answer) {
        if (done_) {
            return;
        }

        if (err != Error::Success) {
            fail(err);
            return;
        }

        committed_ = std::move(answer);
        transition(QueryState::Filtering);
        startProbes(*committed_);
        maybeFinish();
    }

    // 提交的答案所需的探测全部完成后应答
    void maybeFinish() {
        if (!committed_) {
            return;
        }
        for (const auto& addr : owner_.filter_.probeTargets(*committed_, decision_)) {
            if (probes_.count(addr) == 0) {
                return;
            }
        }
        respond();
    }

    void onDeadline() {
        if (done_) {
            return;
        }
        if (!committed_) {
            spdlog::warn("pipeline: {} {} id {} missed deadline without an upstream answer",
                         query_.name, typeName(query_.qtype), query_.id);
            fail(Error::Timeout);
            return;
        }
        spdlog::debug("pipeline: {} {} id {} deadline reached with {} of {} probes",
                      query_.name, typeName(query_.qtype), query_.id,
                      probes_.size(), probed_.size());
        respond();
    }

    void respond() {
        ResolvedAnswer resolved = owner_.filter_.apply(*committed_, decision_, probes_);
        if (resolved.records.size() < committed_->records.size()) {
            owner_.suppressed_.fetch_add(1, std::memory_order_relaxed);
        }
        finish(resolved);
    }

    void fail(Error err) {
        transition(QueryState::Failed);
        owner_.failed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("pipeline: {} {} id {} failed: {}",
                      query_.name, typeName(query_.qtype), query_.id, errorString(err));

        ResolvedAnswer servfail;
        servfail.rcode = dns_rcode::SERVFAIL;
        deliver(servfail);
    }

    void finish(const ResolvedAnswer& resolved) {
        transition(QueryState::Answered);
        owner_.answered_.fetch_add(1, std::memory_order_relaxed);
        deliver(resolved);
    }

    void deliver(const ResolvedAnswer& resolved) {
        done_ = true;
        deadline_.cancel();
        Handler handler = std::move(handler_);
        handler(resolved);
    }

    ResolutionPipeline& owner_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer deadline_;

    RequesterIdentity requester_;
    Query query_;
    Handler handler_;

    QueryState state_ = QueryState::Received;
    PolicyDecision decision_;
    std::optional<AggregatedAnswer> committed_;
    std::set<boost::asio::ip::address> probed_;
    ProbeResults probes_;
    bool done_ = false;
};

// ==================== ResolutionPipeline ====================

ResolutionPipeline::ResolutionPipeline(
    boost::asio::io_context& io,
    PolicyEngine& engine,
    UpstreamDispatcher& dispatcher,
    Prober* prober,
    const GeoLookup* geo,
    Options options
)
    : io_(io),
      engine_(engine),
      dispatcher_(dispatcher),
      prober_(prober),
      filter_(geo, options.filter),
      options_(options),
      hosts_(std::make_shared<const HostsTable>()) {}

void ResolutionPipeline::asyncResolve(
    const RequesterIdentity& requester,
    const Query& query,
    Handler handler
) {
    queries_.fetch_add(1, std::memory_order_relaxed);

    RequesterIdentity normalized{normalizeAddress(requester.source_ip)};
    auto context = std::make_shared<Context>(*this, normalized, query, std::move(handler));
    context->start();
}

void ResolutionPipeline::reloadHosts(std::shared_ptr<const HostsTable> hosts) {
    if (!hosts) {
        hosts = std::make_shared<const HostsTable>();
    }
    spdlog::info("pipeline: reloading hosts table ({} names)", hosts->size());
    std::atomic_store(&hosts_, std::move(hosts));
}

std::shared_ptr<const HostsTable> ResolutionPipeline::hosts() const {
    return std::atomic_load(&hosts_);
}

std::chrono::milliseconds ResolutionPipeline::deadline() const {
    return dispatcher_.timeout() + options_.probe_timeout;
}

ResolutionPipeline::Stats ResolutionPipeline::getStats() const {
    return Stats{
        queries_.load(std::memory_order_relaxed),
        answered_.load(std::memory_order_relaxed),
        failed_.load(std::memory_order_relaxed),
        local_.load(std::memory_order_relaxed),
        suppressed_.load(std::memory_order_relaxed)
    };
}

void ResolutionPipeline::resetStats() {
    queries_.store(0, std::memory_order_relaxed);
    answered_.store(0, std::memory_order_relaxed);
    failed_.store(0, std::memory_order_relaxed);
    local_.store(0, std::memory_order_relaxed);
    suppressed_.store(0, std::memory_order_relaxed);
}

} // namespace pomelo
