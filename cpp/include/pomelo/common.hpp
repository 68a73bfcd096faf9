#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <cctype>
#include <chrono>
#include <arpa/inet.h>   // ntohs/htons, 优化编译时 glibc 以宏实现

namespace pomelo {

// 错误码
enum class Error : int {
    Success = 0,
    PacketTooShort = -1,
    InvalidHeader = -2,
    TruncatedMessage = -3,
    PointerLoop = -4,
    InvalidLabel = -5,
    BufferTooSmall = -6,
    NotQuery = -7,
    NotResponse = -8,
    IdMismatch = -9,
    InvalidConfig = -10,
    GeoDatabase = -11,
    SocketError = -12,
    AllUpstreamsFailed = -13,
    Timeout = -14,
    InvalidRecord = -15,
};

const char* errorString(Error err);

// DNS 类型
namespace dns_type {
    constexpr uint16_t A     = 1;
    constexpr uint16_t NS    = 2;
    constexpr uint16_t CNAME = 5;
    constexpr uint16_t SOA   = 6;
    constexpr uint16_t PTR   = 12;
    constexpr uint16_t MX    = 15;
    constexpr uint16_t TXT   = 16;
    constexpr uint16_t AAAA  = 28;
    constexpr uint16_t SRV   = 33;
    constexpr uint16_t DNAME = 39;
    constexpr uint16_t OPT   = 41;
    constexpr uint16_t ANY   = 255;
}

// 类型名 <-> 数值, 用于配置和日志
const char* typeName(uint16_t rrtype);
uint16_t typeFromName(const char* name);   // 未知返回 0

// DNS 类别
namespace dns_class {
    constexpr uint16_t IN = 1;
}

// DNS 响应码
namespace dns_rcode {
    constexpr uint8_t NOERROR  = 0;
    constexpr uint8_t FORMERR  = 1;
    constexpr uint8_t SERVFAIL = 2;
    constexpr uint8_t NXDOMAIN = 3;
    constexpr uint8_t NOTIMP   = 4;
    constexpr uint8_t REFUSED  = 5;
}

const char* rcodeName(uint8_t rcode);

// 域名最大长度
constexpr size_t MAX_DOMAIN_LENGTH = 255;
constexpr size_t MAX_LABEL_LENGTH = 63;
constexpr size_t MAX_LABELS = 128;

// DNS 头部大小
constexpr size_t DNS_HEADER_SIZE = 12;

// 最小 DNS 查询大小: 头部 + 最小域名(1字节) + 类型(2) + 类别(2)
constexpr size_t MIN_DNS_QUERY_SIZE = DNS_HEADER_SIZE + 5;

// 无 EDNS 时的 UDP 报文上限
constexpr size_t CLASSIC_UDP_SIZE = 512;

// 上游响应接收缓冲区
constexpr size_t MAX_UDP_PACKET_SIZE = 4096;

// 默认超时
constexpr std::chrono::milliseconds DEFAULT_UPSTREAM_TIMEOUT{2000};
constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{600};

} // namespace pomelo
