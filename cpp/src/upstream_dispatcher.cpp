#include "pomelo/upstream_dispatcher.hpp"
#include "pomelo/dns_parser.hpp"
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <memory>

namespace pomelo {

bool isSuccessRcode(uint8_t rcode) {
    return rcode == dns_rcode::NOERROR || rcode == dns_rcode::NXDOMAIN;
}

// ==================== FanOut ====================

// 一次分发的全部状态, 在自己的 strand 上串行执行
class UpstreamDispatcher::FanOut : public std::enable_shared_from_this<UpstreamDispatcher::FanOut> {
public:
    FanOut(UpstreamDispatcher& owner,
           const Query& query,
           const std::vector<UpstreamTarget>& upstreams,
           PartialHandler on_partial,
           Handler handler)
        : owner_(owner),
          strand_(boost::asio::make_strand(owner.io_)),
          query_(query),
          packet_(DNSResponseBuilder::buildQuery(query)),
          on_partial_(std::move(on_partial)),
          handler_(std::move(handler)) {
        exchanges_.reserve(upstreams.size());
        for (const auto& target : upstreams) {
            exchanges_.push_back(std::make_unique<Exchange>(strand_, target));
        }
    }

    void start() {
        auto self = shared_from_this();
        boost::asio::post(strand_, [self] { self->doStart(); });
    }

private:
    enum class State : uint8_t {
        Pending = 0,
        Succeeded = 1,
        Failed = 2,
    };

    struct Exchange {
        Exchange(boost::asio::strand<boost::asio::io_context::executor_type>& strand,
                 const UpstreamTarget& t)
            : target(t), socket(strand), timer(strand) {}

        UpstreamTarget target;
        boost::asio::ip::udp::socket socket;
        boost::asio::steady_timer timer;
        State state = State::Pending;
        AggregatedAnswer answer;
        std::array<uint8_t, MAX_UDP_PACKET_SIZE> buffer{};
        boost::asio::ip::udp::endpoint sender;
    };

    void doStart() {
        for (size_t i = 0; i < exchanges_.size(); i++) {
            startExchange(i);
            if (committed_) {
                return;
            }
        }
    }

    void startExchange(size_t index) {
        Exchange& ex = *exchanges_[index];
        owner_.exchanges_.fetch_add(1, std::memory_order_relaxed);

        boost::system::error_code ec;
        ex.socket.open(ex.target.endpoint.protocol(), ec);
        if (ec) {
            fail(index, "open", ec.message());
            return;
        }

        auto self = shared_from_this();
        ex.timer.expires_after(owner_.timeout_);
        ex.timer.async_wait([self, index](const boost::system::error_code& wait_ec) {
            if (wait_ec || self->committed_) {
                return;
            }
            Exchange& e = *self->exchanges_[index];
            if (e.state != State::Pending) {
                return;
            }
            self->owner_.timeouts_.fetch_add(1, std::memory_order_relaxed);
            self->fail(index, "timeout", "no response");
        });

        ex.socket.async_send_to(
            boost::asio::buffer(packet_), ex.target.endpoint,
            [self, index](const boost::system::error_code& send_ec, size_t) {
                if (self->committed_ || self->exchanges_[index]->state != State::Pending) {
                    return;
                }
                if (send_ec) {
                    self->fail(index, "send", send_ec.message());
                    return;
                }
                self->receive(index);
            });
    }

    void receive(size_t index) {
        Exchange& ex = *exchanges_[index];
        auto self = shared_from_this();
        ex.socket.async_receive_from(
            boost::asio::buffer(ex.buffer), ex.sender,
            [self, index](const boost::system::error_code& ec, size_t n) {
                self->onReceive(index, ec, n);
            });
    }

    void onReceive(size_t index, const boost::system::error_code& ec, size_t n) {
        if (committed_) {
            return;
        }
        Exchange& ex = *exchanges_[index];
        if (ex.state != State::Pending) {
            return;
        }
        if (ec) {
            fail(index, "receive", ec.message());
            return;
        }

        // 来源不符, 继续等待
        if (ex.sender != ex.target.endpoint) {
            spdlog::debug("upstream: ignoring packet from {} while waiting for {}",
                          ex.sender.address().to_string(), toString(ex.target));
            receive(index);
            return;
        }

        UpstreamResponse response;
        Error err = DNSParser::parseResponse(ex.buffer.data(), n, query_.id, &response);
        if (err == Error::IdMismatch || err == Error::NotResponse) {
            receive(index);
            return;
        }
        if (err != Error::Success) {
            fail(index, "parse", errorString(err));
            return;
        }
        if (!isSuccessRcode(response.rcode)) {
            fail(index, "rcode", rcodeName(response.rcode));
            return;
        }
        if (response.truncated) {
            spdlog::debug("upstream: {} truncated answer for {}", toString(ex.target), query_.name);
        }

        ex.state = State::Succeeded;
        ex.timer.cancel();
        ex.answer.rcode = response.rcode;
        ex.answer.upstream_index = index;
        ex.answer.records = std::move(response.records);
        for (auto& rr : ex.answer.records) {
            rr.upstream_index = index;
        }
        owner_.successes_.fetch_add(1, std::memory_order_relaxed);

        spdlog::trace("upstream: {} answered {} {} with {} ({} records)",
                      toString(ex.target), query_.name, typeName(query_.qtype),
                      rcodeName(ex.answer.rcode), ex.answer.records.size());

        if (on_partial_) {
            on_partial_(ex.answer);
        }
        evaluate();
    }

    void fail(size_t index, const char* stage, const std::string& reason) {
        Exchange& ex = *exchanges_[index];
        if (ex.state != State::Pending) {
            return;
        }
        ex.state = State::Failed;
        owner_.failures_.fetch_add(1, std::memory_order_relaxed);

        boost::system::error_code ignored;
        ex.timer.cancel();
        ex.socket.close(ignored);

        spdlog::debug("upstream: {} failed for {} {} ({}: {})",
                      toString(ex.target), query_.name, typeName(query_.qtype), stage, reason);
        evaluate();
    }

    // 按序号检查: 遇到成功即提交, 遇到未决则等待
    void evaluate() {
        if (committed_) {
            return;
        }
        for (size_t i = 0; i < exchanges_.size(); i++) {
            switch (exchanges_[i]->state) {
                case State::Succeeded:
                    commit(Error::Success, std::move(exchanges_[i]->answer));
                    return;
                case State::Pending:
                    return;
                case State::Failed:
                    break;
            }
        }

        owner_.all_failed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("upstream: all {} upstreams failed for {} {}",
                     exchanges_.size(), query_.name, typeName(query_.qtype));
        commit(Error::AllUpstreamsFailed, AggregatedAnswer{});
    }

    void commit(Error err, AggregatedAnswer answer) {
        committed_ = true;

        // 放弃其余交换
        boost::system::error_code ignored;
        for (auto& ex : exchanges_) {
            ex->timer.cancel();
            ex->socket.close(ignored);
        }

        Handler handler = std::move(handler_);
        on_partial_ = nullptr;
        handler(err, std::move(answer));
    }

    UpstreamDispatcher& owner_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    Query query_;
    std::vector<uint8_t> packet_;
    std::vector<std::unique_ptr<Exchange>> exchanges_;
    PartialHandler on_partial_;
    Handler handler_;
    bool committed_ = false;
};

// ==================== UpstreamDispatcher ====================

UpstreamDispatcher::UpstreamDispatcher(
    boost::asio::io_context& io,
    std::chrono::milliseconds timeout
)
    : io_(io), timeout_(timeout) {}

void UpstreamDispatcher::asyncResolve(
    const Query& query,
    const std::vector<UpstreamTarget>& upstreams,
    PartialHandler on_partial,
    Handler handler
) {
    if (upstreams.empty()) {
        all_failed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("upstream: no upstreams configured for {}", query.name);
        boost::asio::post(io_, [handler = std::move(handler)] {
            handler(Error::AllUpstreamsFailed, AggregatedAnswer{});
        });
        return;
    }

    auto fan_out = std::make_shared<FanOut>(*this, query, upstreams,
                                            std::move(on_partial), std::move(handler));
    fan_out->start();
}

UpstreamDispatcher::Stats UpstreamDispatcher::getStats() const {
    return Stats{
        exchanges_.load(std::memory_order_relaxed),
        successes_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed),
        timeouts_.load(std::memory_order_relaxed),
        all_failed_.load(std::memory_order_relaxed)
    };
}

void UpstreamDispatcher::resetStats() {
    exchanges_.store(0, std::memory_order_relaxed);
    successes_.store(0, std::memory_order_relaxed);
    failures_.store(0, std::memory_order_relaxed);
    timeouts_.store(0, std::memory_order_relaxed);
    all_failed_.store(0, std::memory_order_relaxed);
}

} // namespace pomelo
