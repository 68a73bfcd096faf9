#include "pomelo/prober.hpp"
#include "pomelo/ip_network.hpp"
#include <boost/asio/ip/icmp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <memory>
#include <vector>
#include <unistd.h>

namespace pomelo {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr uint8_t ICMPV6_ECHO_REQUEST = 128;
constexpr uint8_t ICMPV6_ECHO_REPLY = 129;

// 类型1 + 代码1 + 校验和2 + 标识符2 + 序号2
constexpr size_t ICMP_HEADER_SIZE = 8;
constexpr char ECHO_PAYLOAD[] = "pomelo-probe";

} // anonymous namespace

const char* probeResultName(ProbeResult result) {
    switch (result) {
        case ProbeResult::Reachable:     return "reachable";
        case ProbeResult::Unreachable:   return "unreachable";
        case ProbeResult::Indeterminate: return "indeterminate";
    }
    return "unknown";
}

uint16_t IcmpProber::checksum(const uint8_t* data, size_t len) {
    uint32_t sum = 0;
    while (len > 1) {
        sum += (static_cast<uint32_t>(data[0]) << 8) | data[1];
        data += 2;
        len -= 2;
    }
    if (len == 1) {
        sum += static_cast<uint32_t>(data[0]) << 8;
    }
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum & 0xFFFF);
}

// ==================== Echo ====================

// 单次探测上下文, 回调持有 shared_ptr 直到完成
class IcmpProber::Echo : public std::enable_shared_from_this<IcmpProber::Echo> {
public:
    Echo(IcmpProber& owner,
         const boost::asio::ip::address& target,
         uint16_t sequence,
         Handler handler)
        : owner_(owner),
          strand_(boost::asio::make_strand(owner.io_)),
          socket_(strand_),
          timer_(strand_),
          target_(target),
          sequence_(sequence),
          handler_(std::move(handler)) {}

    void start(std::chrono::milliseconds timeout) {
        auto self = shared_from_this();
        boost::asio::post(strand_, [self, timeout] { self->doStart(timeout); });
    }

private:
    void doStart(std::chrono::milliseconds timeout) {
        using boost::asio::ip::icmp;

        boost::system::error_code ec;
        socket_.open(target_.is_v4() ? icmp::v4() : icmp::v6(), ec);
        if (ec) {
            spdlog::debug("probe: cannot open icmp socket for {}: {}",
                          target_.to_string(), ec.message());
            finish(ProbeResult::Indeterminate);
            return;
        }

        buildRequest();

        socket_.send_to(boost::asio::buffer(request_), icmp::endpoint(target_, 0), 0, ec);
        if (ec) {
            spdlog::debug("probe: send to {} failed: {}", target_.to_string(), ec.message());
            finish(ProbeResult::Indeterminate);
            return;
        }

        auto self = shared_from_this();
        timer_.expires_after(timeout);
        timer_.async_wait([self](const boost::system::error_code& wait_ec) {
            if (wait_ec || self->done_) {
                return;
            }
            self->finish(ProbeResult::Unreachable);
        });

        receive();
    }

    void buildRequest() {
        request_.assign(ICMP_HEADER_SIZE, 0);
        request_[0] = target_.is_v4() ? ICMP_ECHO_REQUEST : ICMPV6_ECHO_REQUEST;
        request_[1] = 0;
        request_[4] = static_cast<uint8_t>(owner_.identifier_ >> 8);
        request_[5] = static_cast<uint8_t>(owner_.identifier_ & 0xFF);
        request_[6] = static_cast<uint8_t>(sequence_ >> 8);
        request_[7] = static_cast<uint8_t>(sequence_ & 0xFF);
        request_.insert(request_.end(), ECHO_PAYLOAD, ECHO_PAYLOAD + sizeof(ECHO_PAYLOAD) - 1);

        // ICMPv6 校验和由内核计算
        if (target_.is_v4()) {
            uint16_t sum = IcmpProber::checksum(request_.data(), request_.size());
            request_[2] = static_cast<uint8_t>(sum >> 8);
            request_[3] = static_cast<uint8_t>(sum & 0xFF);
        }
    }

    void receive() {
        auto self = shared_from_this();
        socket_.async_receive_from(
            boost::asio::buffer(reply_), sender_,
            [self](const boost::system::error_code& ec, size_t n) {
                if (self->done_) {
                    return;
                }
                if (ec) {
                    self->finish(ProbeResult::Indeterminate);
                    return;
                }
                if (self->isReply(n)) {
                    self->finish(ProbeResult::Reachable);
                    return;
                }
                // 原始套接字会收到其他 ICMP 报文
                self->receive();
            });
    }

    bool isReply(size_t n) const {
        if (normalizeAddress(sender_.address()) != target_) {
            return false;
        }

        const uint8_t* p = reply_.data();
        uint8_t expected_type = ICMPV6_ECHO_REPLY;
        if (target_.is_v4()) {
            // IPv4 原始套接字带 IP 头部
            if (n < 20) return false;
            size_t ihl = static_cast<size_t>(p[0] & 0x0F) * 4;
            if (ihl < 20 || n < ihl) return false;
            p += ihl;
            n -= ihl;
            expected_type = ICMP_ECHO_REPLY;
        }

        if (n < ICMP_HEADER_SIZE || p[0] != expected_type || p[1] != 0) {
            return false;
        }
        uint16_t id = static_cast<uint16_t>((p[4] << 8) | p[5]);
        uint16_t seq = static_cast<uint16_t>((p[6] << 8) | p[7]);
        return id == owner_.identifier_ && seq == sequence_;
    }

    void finish(ProbeResult result) {
        if (done_) {
            return;
        }
        done_ = true;

        boost::system::error_code ignored;
        timer_.cancel();
        socket_.close(ignored);

        owner_.record(result);
        spdlog::trace("probe: {} seq {} -> {}", target_.to_string(), sequence_,
                      probeResultName(result));

        Handler handler = std::move(handler_);
        handler(result);
    }

    IcmpProber& owner_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::icmp::socket socket_;
    boost::asio::steady_timer timer_;
    boost::asio::ip::address target_;
    uint16_t sequence_;
    Handler handler_;
    bool done_ = false;

    std::vector<uint8_t> request_;
    std::array<uint8_t, MAX_UDP_PACKET_SIZE> reply_{};
    boost::asio::ip::icmp::endpoint sender_;
};

// ==================== IcmpProber ====================

IcmpProber::IcmpProber(boost::asio::io_context& io)
    : io_(io),
      identifier_(static_cast<uint16_t>(::getpid() & 0xFFFF)) {}

void IcmpProber::asyncProbe(
    const boost::asio::ip::address& addr,
    std::chrono::milliseconds timeout,
    Handler handler
) {
    probes_.fetch_add(1, std::memory_order_relaxed);
    uint16_t seq = sequence_.fetch_add(1, std::memory_order_relaxed);
    auto echo = std::make_shared<Echo>(*this, normalizeAddress(addr), seq, std::move(handler));
    echo->start(timeout);
}

void IcmpProber::record(ProbeResult result) {
    switch (result) {
        case ProbeResult::Reachable:
            reachable_.fetch_add(1, std::memory_order_relaxed);
            break;
        case ProbeResult::Unreachable:
            unreachable_.fetch_add(1, std::memory_order_relaxed);
            break;
        case ProbeResult::Indeterminate:
            indeterminate_.fetch_add(1, std::memory_order_relaxed);
            break;
    }
}

IcmpProber::Stats IcmpProber::getStats() const {
    return Stats{
        probes_.load(std::memory_order_relaxed),
        reachable_.load(std::memory_order_relaxed),
        unreachable_.load(std::memory_order_relaxed),
        indeterminate_.load(std::memory_order_relaxed)
    };
}

void IcmpProber::resetStats() {
    probes_.store(0, std::memory_order_relaxed);
    reachable_.store(0, std::memory_order_relaxed);
    unreachable_.store(0, std::memory_order_relaxed);
    indeterminate_.store(0, std::memory_order_relaxed);
}

} // namespace pomelo
