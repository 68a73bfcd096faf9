#include <gtest/gtest.h>
#include "pomelo/dns_parser.hpp"
#include "test_support.hpp"

using namespace pomelo;
using pomelo::test::addr;
using pomelo::test::buildDNSQuery;
using pomelo::test::makeQuery;

namespace {

void appendU16(std::vector<uint8_t>* p, uint16_t v) {
    p->push_back(static_cast<uint8_t>(v >> 8));
    p->push_back(static_cast<uint8_t>(v & 0xFF));
}

// www.example.com CNAME cdn.example.com (压缩), cdn.example.com A 1.2.3.4
std::vector<uint8_t> buildCompressedResponse(uint16_t id, uint8_t rcode = 0) {
    std::vector<uint8_t> p = buildDNSQuery("www.example.com", dns_type::A, id);
    p[2] = 0x81;                        // QR, RD
    p[3] = static_cast<uint8_t>(0x80 | rcode);
    p[7] = 2;                           // ANCount

    // 回答 1, 偏移 33
    p.insert(p.end(), {0xC0, 0x0C});
    appendU16(&p, dns_type::CNAME);
    appendU16(&p, dns_class::IN);
    p.insert(p.end(), {0x00, 0x00, 0x01, 0x2C});
    appendU16(&p, 6);
    p.insert(p.end(), {3, 'c', 'd', 'n', 0xC0, 0x10});   // rdata 起始偏移 45

    // 回答 2
    p.insert(p.end(), {0xC0, 45});
    appendU16(&p, dns_type::A);
    appendU16(&p, dns_class::IN);
    p.insert(p.end(), {0x00, 0x00, 0x00, 0x3C});
    appendU16(&p, 4);
    p.insert(p.end(), {1, 2, 3, 4});
    return p;
}

} // anonymous namespace

TEST(DNSParserTest, ParseSimpleQuery) {
    auto packet = buildDNSQuery("example.com");

    DNSParseResult result;
    auto err = DNSParser::parse(packet.data(), packet.size(), &result);

    ASSERT_EQ(err, Error::Success);
    EXPECT_EQ(result.header->getId(), 0x1234);
    EXPECT_TRUE(result.header->isQuery());
    EXPECT_EQ(result.header->getOpcode(), 0);
    EXPECT_EQ(result.question.qtype, dns_type::A);
    EXPECT_EQ(result.question.qclass, dns_class::IN);
    EXPECT_EQ(result.edns_udp_size, 0);
}

TEST(DNSParserTest, DecodeDomainName) {
    auto packet = buildDNSQuery("WWW.Example.com");

    DNSParseResult result;
    auto err = DNSParser::parse(packet.data(), packet.size(), &result);
    ASSERT_EQ(err, Error::Success);

    char domain[256];
    size_t domain_len = 0;
    err = DNSParser::decodeName(
        packet.data(), packet.size(),
        result.question.name_offset,
        domain, sizeof(domain), &domain_len
    );

    ASSERT_EQ(err, Error::Success);
    EXPECT_EQ(std::string(domain, domain_len), "www.example.com");
}

TEST(DNSParserTest, PacketTooShort) {
    uint8_t short_packet[] = {0x12, 0x34, 0x01};

    DNSParseResult result;
    auto err = DNSParser::parse(short_packet, sizeof(short_packet), &result);

    EXPECT_EQ(err, Error::PacketTooShort);
}

TEST(DNSParserTest, PointerLoopRejected) {
    std::vector<uint8_t> packet = {
        0x12, 0x34, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0xC0, 0x0C,     // 指向自己
        0x00, 0x01, 0x00, 0x01, 0x00
    };

    DNSParseResult result;
    EXPECT_EQ(DNSParser::parse(packet.data(), packet.size(), &result), Error::PointerLoop);
}

TEST(DNSParserTest, ReservedLabelTypeRejected) {
    auto packet = buildDNSQuery("example.com");
    packet[12] = 0x47;      // 0x40 扩展标签

    DNSParseResult result;
    EXPECT_EQ(DNSParser::parse(packet.data(), packet.size(), &result), Error::InvalidLabel);
}

TEST(DNSParserTest, ParseQueryReadsEdns) {
    Query q = makeQuery("example.com", dns_type::AAAA, 0xBEEF);
    q.recursion_desired = false;
    auto packet = DNSResponseBuilder::buildQuery(q);

    Query parsed;
    ASSERT_EQ(DNSParser::parseQuery(packet.data(), packet.size(), &parsed), Error::Success);
    EXPECT_EQ(parsed.id, 0xBEEF);
    EXPECT_EQ(parsed.name, "example.com");
    EXPECT_EQ(parsed.qtype, dns_type::AAAA);
    EXPECT_FALSE(parsed.recursion_desired);
    EXPECT_EQ(parsed.udp_payload_size, MAX_UDP_PACKET_SIZE);
}

TEST(DNSParserTest, ParseQueryRejectsResponse) {
    auto packet = buildCompressedResponse(0x1234);
    Query q;
    EXPECT_EQ(DNSParser::parseQuery(packet.data(), packet.size(), &q), Error::NotQuery);
}

TEST(DNSParserTest, ParseResponseExpandsCompressedNames) {
    auto packet = buildCompressedResponse(0x1234);

    UpstreamResponse resp;
    ASSERT_EQ(DNSParser::parseResponse(packet.data(), packet.size(), 0x1234, &resp), Error::Success);
    EXPECT_EQ(resp.rcode, dns_rcode::NOERROR);
    EXPECT_FALSE(resp.truncated);
    ASSERT_EQ(resp.records.size(), 2u);

    const auto& cname = resp.records[0];
    EXPECT_EQ(cname.name, "www.example.com");
    EXPECT_EQ(cname.rrtype, dns_type::CNAME);
    EXPECT_EQ(cname.ttl, 300u);
    std::vector<uint8_t> expanded = {3, 'c', 'd', 'n', 7, 'e', 'x', 'a', 'm', 'p', 'l', 'e',
                                     3, 'c', 'o', 'm', 0};
    EXPECT_EQ(cname.rdata, expanded);

    const auto& a = resp.records[1];
    EXPECT_EQ(a.name, "cdn.example.com");
    EXPECT_EQ(a.rrtype, dns_type::A);
    EXPECT_EQ(a.address, addr("1.2.3.4"));
    EXPECT_EQ(a.ttl, 60u);
}

TEST(DNSParserTest, ParseResponseChecksIdAndDirection) {
    auto packet = buildCompressedResponse(0x1234);
    UpstreamResponse resp;
    EXPECT_EQ(DNSParser::parseResponse(packet.data(), packet.size(), 0x4321, &resp),
              Error::IdMismatch);

    auto query = buildDNSQuery("example.com");
    EXPECT_EQ(DNSParser::parseResponse(query.data(), query.size(), 0x1234, &resp),
              Error::NotResponse);
}

TEST(DNSParserTest, ParseResponseRcode) {
    auto packet = buildCompressedResponse(0x1234, dns_rcode::SERVFAIL);
    UpstreamResponse resp;
    ASSERT_EQ(DNSParser::parseResponse(packet.data(), packet.size(), 0x1234, &resp), Error::Success);
    EXPECT_EQ(resp.rcode, dns_rcode::SERVFAIL);
}

TEST(DNSParserTest, ParseResponseBadAddressLength) {
    auto packet = buildCompressedResponse(0x1234);
    // 回答 2 的 RDLENGTH 改为 3, 并去掉最后一个字节
    packet[packet.size() - 5] = 3;
    packet.pop_back();

    UpstreamResponse resp;
    EXPECT_EQ(DNSParser::parseResponse(packet.data(), packet.size(), 0x1234, &resp),
              Error::InvalidRecord);
    EXPECT_TRUE(resp.records.empty());
}

TEST(DNSParserTest, ParseTruncatedResponseKeepsReadableRecords) {
    auto packet = buildCompressedResponse(0x1234);
    packet[2] |= 0x02;                      // TC
    packet.resize(packet.size() - 6);       // 第二条记录不完整

    UpstreamResponse resp;
    ASSERT_EQ(DNSParser::parseResponse(packet.data(), packet.size(), 0x1234, &resp), Error::Success);
    EXPECT_TRUE(resp.truncated);
    ASSERT_EQ(resp.records.size(), 1u);
    EXPECT_EQ(resp.records[0].rrtype, dns_type::CNAME);
}

// ==================== DNS Response Builder ====================

TEST(DNSResponseBuilderTest, BuildResponseCompressesOwner) {
    Query q = makeQuery("example.com", dns_type::A);
    ResolvedAnswer answer;
    answer.records.push_back(makeAddressRecord("example.com", addr("192.168.1.100"), 300));

    auto packet = DNSResponseBuilder::buildResponse(q, answer);

    auto* hdr = reinterpret_cast<const DNSHeader*>(packet.data());
    EXPECT_EQ(hdr->getId(), 0x1234);
    EXPECT_TRUE(hdr->isResponse());
    EXPECT_TRUE(hdr->isRecursionDesired());
    EXPECT_FALSE(hdr->isTruncated());
    EXPECT_EQ(hdr->getRCode(), dns_rcode::NOERROR);
    EXPECT_EQ(hdr->getANCount(), 1);
    EXPECT_EQ(hdr->getARCount(), 0);

    // 头部 12 + 问题 17 + 回答 16
    ASSERT_EQ(packet.size(), 45u);
    EXPECT_EQ(packet[29], 0xC0);
    EXPECT_EQ(packet[30], 0x0C);

    UpstreamResponse resp;
    ASSERT_EQ(DNSParser::parseResponse(packet.data(), packet.size(), 0x1234, &resp), Error::Success);
    ASSERT_EQ(resp.records.size(), 1u);
    EXPECT_EQ(resp.records[0].address, addr("192.168.1.100"));
}

TEST(DNSResponseBuilderTest, EmptySuccess) {
    Query q = makeQuery("example.com", dns_type::AAAA);
    auto packet = DNSResponseBuilder::buildResponse(q, ResolvedAnswer{});
    auto* hdr = reinterpret_cast<const DNSHeader*>(packet.data());
    EXPECT_EQ(hdr->getRCode(), dns_rcode::NOERROR);
    EXPECT_EQ(hdr->getANCount(), 0);
}

TEST(DNSResponseBuilderTest, TruncatesAtClassicLimit) {
    Query q = makeQuery("example.com", dns_type::AAAA);
    ResolvedAnswer answer;
    for (int i = 0; i < 30; i++) {
        std::string ip = "2001:db8::" + std::to_string(i + 1);
        answer.records.push_back(makeAddressRecord("example.com", addr(ip.c_str()), 60));
    }

    auto packet = DNSResponseBuilder::buildResponse(q, answer);
    auto* hdr = reinterpret_cast<const DNSHeader*>(packet.data());
    EXPECT_LE(packet.size(), CLASSIC_UDP_SIZE);
    EXPECT_TRUE(hdr->isTruncated());
    // (512 - 29) / 28 条完整记录
    EXPECT_EQ(hdr->getANCount(), 17);

    // 客户端声明了 EDNS 时放得下全部记录, 并回显 OPT
    q.udp_payload_size = 1232;
    packet = DNSResponseBuilder::buildResponse(q, answer);
    hdr = reinterpret_cast<const DNSHeader*>(packet.data());
    EXPECT_FALSE(hdr->isTruncated());
    EXPECT_EQ(hdr->getANCount(), 30);
    EXPECT_EQ(hdr->getARCount(), 1);
}

TEST(DNSResponseBuilderTest, PayloadLimit) {
    Query q;
    EXPECT_EQ(DNSResponseBuilder::payloadLimit(q), 512u);
    q.udp_payload_size = 100;
    EXPECT_EQ(DNSResponseBuilder::payloadLimit(q), 512u);
    q.udp_payload_size = 1232;
    EXPECT_EQ(DNSResponseBuilder::payloadLimit(q), 1232u);
    q.udp_payload_size = 65000;
    EXPECT_EQ(DNSResponseBuilder::payloadLimit(q), MAX_UDP_PACKET_SIZE);
}

TEST(DNSResponseBuilderTest, BuildError) {
    auto query = buildDNSQuery("blocked.example.com");

    DNSParseResult parsed;
    ASSERT_EQ(DNSParser::parse(query.data(), query.size(), &parsed), Error::Success);

    uint8_t response[512];
    size_t resp_len = DNSResponseBuilder::buildError(
        query.data(), query.size(), parsed, dns_rcode::NOTIMP,
        response, sizeof(response)
    );

    EXPECT_EQ(resp_len, query.size());

    // 验证响应
    auto* hdr = reinterpret_cast<const DNSHeader*>(response);
    EXPECT_EQ(hdr->getId(), 0x1234);
    EXPECT_TRUE(hdr->isResponse());
    EXPECT_EQ(hdr->getRCode(), dns_rcode::NOTIMP);
    EXPECT_EQ(hdr->getQDCount(), 1);
    EXPECT_EQ(hdr->getANCount(), 0);
}

TEST(DNSResponseBuilderTest, BuildHeaderError) {
    std::vector<uint8_t> garbage = {
        0xAB, 0xCD, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x3F
    };

    uint8_t response[512];
    size_t n = DNSResponseBuilder::buildHeaderError(
        garbage.data(), garbage.size(), dns_rcode::FORMERR, response, sizeof(response));
    ASSERT_EQ(n, DNS_HEADER_SIZE);

    auto* hdr = reinterpret_cast<const DNSHeader*>(response);
    EXPECT_EQ(hdr->getId(), 0xABCD);
    EXPECT_TRUE(hdr->isResponse());
    EXPECT_EQ(hdr->getRCode(), dns_rcode::FORMERR);
    EXPECT_EQ(hdr->getQDCount(), 0);
}
