#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace pomelo {

// DNS 头部结构 (网络字节序)
struct DNSHeader {
    uint16_t id;
    uint16_t flags;
    uint16_t qd_count;
    uint16_t an_count;
    uint16_t ns_count;
    uint16_t ar_count;

    // 获取解析后的值
    uint16_t getId() const { return ntohs(id); }
    uint16_t getFlags() const { return ntohs(flags); }
    uint16_t getQDCount() const { return ntohs(qd_count); }
    uint16_t getANCount() const { return ntohs(an_count); }
    uint16_t getNSCount() const { return ntohs(ns_count); }
    uint16_t getARCount() const { return ntohs(ar_count); }

    // 标志位检查
    bool isQuery() const { return (getFlags() & 0x8000) == 0; }
    bool isResponse() const { return !isQuery(); }
    uint8_t getOpcode() const { return (getFlags() >> 11) & 0x0F; }
    bool isTruncated() const { return (getFlags() & 0x0200) != 0; }
    uint8_t getRCode() const { return getFlags() & 0x000F; }
    bool isRecursionDesired() const { return (getFlags() & 0x0100) != 0; }
} __attribute__((packed));

static_assert(sizeof(DNSHeader) == 12, "DNSHeader size must be 12 bytes");

// DNS 问题结构 (零拷贝)
struct DNSQuestion {
    size_t name_offset;          // 相对于包开始的偏移
    uint16_t qtype;
    uint16_t qclass;
};

// DNS 解析结果
struct DNSParseResult {
    const DNSHeader* header;
    DNSQuestion question;
    size_t total_consumed;       // 消费的总字节数
    size_t question_end;         // 问题部分结束位置
    uint16_t id;                 // DNS ID (主机字节序)
    uint16_t flags;              // DNS flags (主机字节序)
    bool is_query;               // 是否是查询
    uint16_t edns_udp_size;      // OPT 记录声明的 UDP 大小, 0 = 无
};

// 上游响应
struct UpstreamResponse {
    uint8_t rcode = dns_rcode::NOERROR;
    bool truncated = false;
    std::vector<CandidateRecord> records;   // 回答部分, 名字已展开
};

// DNS 解析器类
class DNSParser {
public:
    // 解析头部和第一个问题, 并扫描 OPT 记录
    static Error parse(
        const uint8_t* data,
        size_t len,
        DNSParseResult* result
    );

    // 解析客户端查询 (QR=1 返回 NotQuery)
    static Error parseQuery(
        const uint8_t* data,
        size_t len,
        Query* query
    );

    // 由已解析的结果构造 Query
    static Error toQuery(
        const uint8_t* data,
        size_t len,
        const DNSParseResult& parsed,
        Query* query
    );

    // 解析上游响应, 校验 QR 与 ID
    static Error parseResponse(
        const uint8_t* data,
        size_t len,
        uint16_t expected_id,
        UpstreamResponse* response
    );

    // 解码域名到缓冲区 (小写, 无结尾点)
    static Error decodeName(
        const uint8_t* packet,
        size_t packet_len,
        size_t name_offset,
        char* out_buf,
        size_t buf_size,
        size_t* out_len
    );

private:
    // 解析域名，返回结束位置
    static Error parseName(
        const uint8_t* data,
        size_t len,
        size_t offset,
        size_t* end_offset,
        size_t* wire_len
    );

    // 读取域名并以未压缩线上格式追加到 out
    static Error readNameWire(
        const uint8_t* data,
        size_t len,
        size_t offset,
        size_t* end_offset,
        std::vector<uint8_t>* out
    );

    // 读取一条资源记录
    static Error readRecord(
        const uint8_t* data,
        size_t len,
        size_t* offset,
        CandidateRecord* record
    );

    // 展开 rdata 中的压缩域名
    static Error expandRData(
        const uint8_t* data,
        size_t len,
        size_t rdata_offset,
        size_t rdata_len,
        uint16_t rrtype,
        std::vector<uint8_t>* out
    );
};

// DNS 响应构建器
class DNSResponseBuilder {
public:
    // 客户端可接收的最大报文
    static size_t payloadLimit(const Query& query);

    // 构建发往上游的查询, 保留 ID 和 RD
    static std::vector<uint8_t> buildQuery(const Query& query);

    // 构建最终响应, 超出 payloadLimit 时设置 TC
    static std::vector<uint8_t> buildResponse(
        const Query& query,
        const ResolvedAnswer& answer
    );

    // 构建带问题的错误响应 (FORMERR / NOTIMP / REFUSED / SERVFAIL)
    static size_t buildError(
        const uint8_t* query,
        size_t query_len,
        const DNSParseResult& parsed,
        uint8_t rcode,
        uint8_t* response,
        size_t response_buf_size
    );

    // 问题无法解析时只回显头部
    static size_t buildHeaderError(
        const uint8_t* query,
        size_t query_len,
        uint8_t rcode,
        uint8_t* response,
        size_t response_buf_size
    );

private:
    // 写入未压缩域名
    static void writeName(std::vector<uint8_t>* out, const std::string& name);
};

} // namespace pomelo
