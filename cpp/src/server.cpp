#include "pomelo/server.hpp"
#include "pomelo/logging.hpp"
#include <boost/asio/ip/v6_only.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace pomelo {

UdpServer::UdpServer(
    boost::asio::io_context& io,
    ResolutionPipeline& pipeline,
    const ServerConfig& config
)
    : pipeline_(pipeline),
      config_(config),
      access_(config.access_log ? accessLogger() : nullptr),
      strand_(boost::asio::make_strand(io)),
      socket_(strand_) {}

Error UdpServer::start() {
    boost::system::error_code ec;
    socket_.open(config_.bind.protocol(), ec);
    if (!ec && config_.bind.address().is_v6()) {
        // [::] 同时接收 IPv4
        socket_.set_option(boost::asio::ip::v6_only(false), ec);
    }
    if (!ec) {
        socket_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        socket_.bind(config_.bind, ec);
    }
    if (ec) {
        spdlog::error("server: cannot listen on {}:{}: {}",
                      config_.bind.address().to_string(), config_.bind.port(), ec.message());
        boost::system::error_code ignored;
        socket_.close(ignored);
        return Error::SocketError;
    }

    auto local = socket_.local_endpoint(ec);
    spdlog::info("server: listening on udp {}:{} (max inflight {})",
                 local.address().to_string(), local.port(), config_.max_inflight);

    boost::asio::post(strand_, [this] {
        running_ = true;
        receive();
    });
    return Error::Success;
}

void UdpServer::stop() {
    boost::asio::post(strand_, [this] {
        running_ = false;
        boost::system::error_code ignored;
        socket_.close(ignored);
    });
}

boost::asio::ip::udp::endpoint UdpServer::localEndpoint() const {
    boost::system::error_code ec;
    return socket_.local_endpoint(ec);
}

void UdpServer::receive() {
    if (!running_ || receiving_) {
        return;
    }
    if (inflight_ >= config_.max_inflight) {
        spdlog::debug("server: {} queries in flight, pausing receive", inflight_);
        return;
    }

    receiving_ = true;
    socket_.async_receive_from(
        boost::asio::buffer(buffer_), sender_,
        [this](const boost::system::error_code& ec, size_t n) {
            onReceive(ec, n);
        });
}

void UdpServer::onReceive(const boost::system::error_code& ec, size_t n) {
    receiving_ = false;
    if (ec) {
        if (ec == boost::asio::error::operation_aborted || !running_) {
            return;
        }
        spdlog::warn("server: receive failed: {}", ec.message());
        receive();
        return;
    }

    received_.fetch_add(1, std::memory_order_relaxed);
    handlePacket(buffer_.data(), n, sender_);
    receive();
}

void UdpServer::handlePacket(
    const uint8_t* data,
    size_t len,
    const boost::asio::ip::udp::endpoint& sender
) {
    // 头部不可读或不是查询: 丢弃
    if (len < DNS_HEADER_SIZE ||
        reinterpret_cast<const DNSHeader*>(data)->isResponse()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    uint8_t error_buf[MAX_UDP_PACKET_SIZE];

    DNSParseResult parsed;
    Error err = DNSParser::parse(data, len, &parsed);
    if (err != Error::Success) {
        formerr_.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("server: malformed query from {}: {}",
                      sender.address().to_string(), errorString(err));
        size_t n = DNSResponseBuilder::buildHeaderError(
            data, len, dns_rcode::FORMERR, error_buf, sizeof(error_buf));
        send(std::vector<uint8_t>(error_buf, error_buf + n), sender);
        return;
    }

    if (parsed.header->getOpcode() != 0) {
        notimp_.fetch_add(1, std::memory_order_relaxed);
        size_t n = DNSResponseBuilder::buildError(
            data, len, parsed, dns_rcode::NOTIMP, error_buf, sizeof(error_buf));
        send(std::vector<uint8_t>(error_buf, error_buf + n), sender);
        return;
    }

    Query query;
    err = DNSParser::toQuery(data, len, parsed, &query);
    if (err != Error::Success) {
        formerr_.fetch_add(1, std::memory_order_relaxed);
        size_t n = DNSResponseBuilder::buildError(
            data, len, parsed, dns_rcode::FORMERR, error_buf, sizeof(error_buf));
        send(std::vector<uint8_t>(error_buf, error_buf + n), sender);
        return;
    }

    inflight_++;
    auto started = std::chrono::steady_clock::now();
    RequesterIdentity requester{sender.address()};
    pipeline_.asyncResolve(
        requester, query,
        [this, query, sender, started](const ResolvedAnswer& answer) {
            boost::asio::post(strand_, [this, query, sender, started, answer] {
                onAnswered(query, sender, started, answer);
            });
        });
}

void UdpServer::onAnswered(
    const Query& query,
    const boost::asio::ip::udp::endpoint& sender,
    std::chrono::steady_clock::time_point started,
    const ResolvedAnswer& answer
) {
    inflight_--;

    if (running_) {
        send(DNSResponseBuilder::buildResponse(query, answer), sender);
    }

    if (access_) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        access_->info("udp {}:{} id {} {} {} {} answers {} {}ms",
                     sender.address().to_string(), sender.port(), query.id,
                     query.name.empty() ? "." : query.name, typeName(query.qtype),
                     rcodeName(answer.rcode), answer.records.size(), elapsed.count());
    }

    // 释放名额后恢复接收
    receive();
}

void UdpServer::send(std::vector<uint8_t> packet, const boost::asio::ip::udp::endpoint& to) {
    if (packet.empty()) {
        return;
    }
    auto data = std::make_shared<std::vector<uint8_t>>(std::move(packet));
    socket_.async_send_to(
        boost::asio::buffer(*data), to,
        [this, data, to](const boost::system::error_code& ec, size_t) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    spdlog::debug("server: send to {} failed: {}",
                                  to.address().to_string(), ec.message());
                }
                return;
            }
            responded_.fetch_add(1, std::memory_order_relaxed);
        });
}

UdpServer::Stats UdpServer::getStats() const {
    return Stats{
        received_.load(std::memory_order_relaxed),
        responded_.load(std::memory_order_relaxed),
        dropped_.load(std::memory_order_relaxed),
        formerr_.load(std::memory_order_relaxed),
        notimp_.load(std::memory_order_relaxed)
    };
}

void UdpServer::resetStats() {
    received_.store(0, std::memory_order_relaxed);
    responded_.store(0, std::memory_order_relaxed);
    dropped_.store(0, std::memory_order_relaxed);
    formerr_.store(0, std::memory_order_relaxed);
    notimp_.store(0, std::memory_order_relaxed);
}

} // namespace pomelo
