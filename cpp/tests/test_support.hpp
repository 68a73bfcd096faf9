#pragma once

#include "pomelo/dns_parser.hpp"
#include "pomelo/geoip.hpp"
#include "pomelo/prober.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <array>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pomelo {
namespace test {

// 构造测试 DNS 查询包
inline std::vector<uint8_t> buildDNSQuery(const std::string& domain,
                                          uint16_t qtype = dns_type::A,
                                          uint16_t id = 0x1234) {
    std::vector<uint8_t> packet;

    // 头部
    packet.insert(packet.end(), {
        static_cast<uint8_t>(id >> 8), static_cast<uint8_t>(id & 0xFF),
        0x01, 0x00,  // Flags (standard query, RD=1)
        0x00, 0x01,  // QDCount = 1
        0x00, 0x00,  // ANCount = 0
        0x00, 0x00,  // NSCount = 0
        0x00, 0x00   // ARCount = 0
    });

    // 域名
    size_t start = 0;
    for (size_t i = 0; i <= domain.size(); i++) {
        if (i == domain.size() || domain[i] == '.') {
            size_t len = i - start;
            if (len > 0) {
                packet.push_back(static_cast<uint8_t>(len));
                for (size_t j = start; j < i; j++) {
                    packet.push_back(static_cast<uint8_t>(domain[j]));
                }
            }
            start = i + 1;
        }
    }
    packet.push_back(0);  // 结束符

    // 类型和类别
    packet.push_back(static_cast<uint8_t>(qtype >> 8));
    packet.push_back(static_cast<uint8_t>(qtype & 0xFF));
    packet.push_back(0x00);
    packet.push_back(0x01);  // Class IN

    return packet;
}

inline Query makeQuery(const std::string& name, uint16_t qtype, uint16_t id = 0x1234) {
    Query q;
    q.id = id;
    q.name = name;
    q.qtype = qtype;
    return q;
}

inline boost::asio::ip::address addr(const char* text) {
    return boost::asio::ip::make_address(text);
}

// 单线程驱动 io_context 直到条件满足或超时
inline bool runUntil(boost::asio::io_context& io,
                     const std::function<bool()>& done,
                     std::chrono::milliseconds limit = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        io.restart();
        io.run_one_for(std::chrono::milliseconds(10));
    }
    return true;
}

// 环回地址上的模拟上游
class MockUpstream {
public:
    struct Behavior {
        uint8_t rcode = dns_rcode::NOERROR;
        std::vector<CandidateRecord> records;
        std::chrono::milliseconds delay{0};
        bool silent = false;            // 从不应答
        bool garbage_first = false;     // 先发送一个 ID 不符的响应
    };

    explicit MockUpstream(boost::asio::io_context& io)
        : io_(io),
          socket_(io, boost::asio::ip::udp::endpoint(
                          boost::asio::ip::make_address("127.0.0.1"), 0)) {
        receive();
    }

    ~MockUpstream() {
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

    void setBehavior(Behavior behavior) { behavior_ = std::move(behavior); }

    UpstreamTarget target() const {
        UpstreamTarget t;
        t.endpoint = socket_.local_endpoint();
        return t;
    }

    size_t queries() const { return queries_; }
    const Query& lastQuery() const { return last_query_; }

private:
    void receive() {
        socket_.async_receive_from(
            boost::asio::buffer(buffer_), sender_,
            [this](const boost::system::error_code& ec, size_t n) {
                if (ec) {
                    return;
                }
                onQuery(n);
                receive();
            });
    }

    void onQuery(size_t n) {
        Query query;
        if (DNSParser::parseQuery(buffer_.data(), n, &query) != Error::Success) {
            return;
        }
        queries_++;
        last_query_ = query;
        if (behavior_.silent) {
            return;
        }

        // 允许超过 512 字节的应答
        Query reply_to = query;
        reply_to.udp_payload_size = MAX_UDP_PACKET_SIZE;
        ResolvedAnswer answer;
        answer.rcode = behavior_.rcode;
        answer.records = behavior_.records;
        auto packet = std::make_shared<std::vector<uint8_t>>(
            DNSResponseBuilder::buildResponse(reply_to, answer));
        auto to = sender_;

        if (behavior_.garbage_first) {
            Query other = reply_to;
            other.id = static_cast<uint16_t>(query.id + 1);
            auto bogus = std::make_shared<std::vector<uint8_t>>(
                DNSResponseBuilder::buildResponse(other, ResolvedAnswer{}));
            socket_.async_send_to(boost::asio::buffer(*bogus), to,
                                  [bogus](const boost::system::error_code&, size_t) {});
        }

        if (behavior_.delay.count() == 0) {
            socket_.async_send_to(boost::asio::buffer(*packet), to,
                                  [packet](const boost::system::error_code&, size_t) {});
            return;
        }

        auto timer = std::make_shared<boost::asio::steady_timer>(io_, behavior_.delay);
        timer->async_wait([this, timer, packet, to](const boost::system::error_code& ec) {
            if (ec || !socket_.is_open()) {
                return;
            }
            socket_.async_send_to(boost::asio::buffer(*packet), to,
                                  [packet](const boost::system::error_code&, size_t) {});
        });
    }

    boost::asio::io_context& io_;
    boost::asio::ip::udp::socket socket_;
    std::array<uint8_t, MAX_UDP_PACKET_SIZE> buffer_{};
    boost::asio::ip::udp::endpoint sender_;
    Behavior behavior_;
    size_t queries_ = 0;
    Query last_query_;
};

// 固定映射的 GeoIP
class FakeGeoLookup : public GeoLookup {
public:
    void set(const char* ip, const std::string& country) { table_[addr(ip)] = country; }

    std::optional<std::string> countryOf(const boost::asio::ip::address& a) const override {
        auto it = table_.find(a);
        if (it == table_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<boost::asio::ip::address, std::string> table_;
};

// 固定结果的探测器, 未设置的地址返回 fallback.
// hang 为 true 时保存 handler 且从不调用
class FakeProber : public Prober {
public:
    explicit FakeProber(boost::asio::io_context& io) : io_(io) {}

    void set(const char* ip, ProbeResult result) { results_[addr(ip)] = result; }

    void asyncProbe(const boost::asio::ip::address& a,
                    std::chrono::milliseconds,
                    Handler handler) override {
        probed.push_back(a);
        probed_at.push_back(std::chrono::steady_clock::now());
        if (hang) {
            pending.push_back(std::move(handler));
            return;
        }
        auto it = results_.find(a);
        ProbeResult result = it == results_.end() ? fallback : it->second;
        boost::asio::post(io_, [handler = std::move(handler), result] { handler(result); });
    }

    ProbeResult fallback = ProbeResult::Indeterminate;
    bool hang = false;
    std::vector<boost::asio::ip::address> probed;
    std::vector<std::chrono::steady_clock::time_point> probed_at;
    std::vector<Handler> pending;

private:
    boost::asio::io_context& io_;
    std::map<boost::asio::ip::address, ProbeResult> results_;
};

} // namespace test
} // namespace pomelo
