#pragma once

#include "config.hpp"
#include "dns_parser.hpp"
#include "logging.hpp"
#include "resolution_pipeline.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/strand.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

namespace pomelo {

// UDP 监听器
//
// 套接字操作都在 strand_ 上. 在途查询达到 max_inflight 时暂停接收.
class UdpServer {
public:
    UdpServer(boost::asio::io_context& io,
              ResolutionPipeline& pipeline,
              const ServerConfig& config);
    ~UdpServer() = default;

    // 禁止拷贝
    UdpServer(const UdpServer&) = delete;
    UdpServer& operator=(const UdpServer&) = delete;

    // 打开并绑定套接字, 开始接收
    Error start();
    void stop();

    boost::asio::ip::udp::endpoint localEndpoint() const;

    // 访问日志在构造时确定
    bool accessLogEnabled() const { return access_ != nullptr; }

    // 获取统计
    struct Stats {
        uint64_t received;
        uint64_t responded;
        uint64_t dropped;
        uint64_t formerr;
        uint64_t notimp;
    };
    Stats getStats() const;
    void resetStats();

private:
    void receive();
    void onReceive(const boost::system::error_code& ec, size_t n);
    void handlePacket(const uint8_t* data, size_t len,
                      const boost::asio::ip::udp::endpoint& sender);
    void onAnswered(const Query& query,
                    const boost::asio::ip::udp::endpoint& sender,
                    std::chrono::steady_clock::time_point started,
                    const ResolvedAnswer& answer);
    void send(std::vector<uint8_t> packet, const boost::asio::ip::udp::endpoint& to);

    ResolutionPipeline& pipeline_;
    ServerConfig config_;
    std::shared_ptr<spdlog::logger> access_;

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::udp::socket socket_;
    std::array<uint8_t, MAX_UDP_PACKET_SIZE> buffer_{};
    boost::asio::ip::udp::endpoint sender_;

    size_t inflight_ = 0;
    bool receiving_ = false;
    bool running_ = false;

    // 统计计数器 (原子操作)
    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> responded_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> formerr_{0};
    std::atomic<uint64_t> notimp_{0};
};

} // namespace pomelo
