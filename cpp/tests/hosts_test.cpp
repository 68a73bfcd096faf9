#include <gtest/gtest.h>
#include "pomelo/hosts.hpp"
#include "test_support.hpp"

using namespace pomelo;
using pomelo::test::addr;
using pomelo::test::makeQuery;

TEST(HostsTableTest, LookupByFamily) {
    HostsTable hosts;
    hosts.add("NAS.lan.", addr("192.168.1.10"));
    hosts.add("nas.lan", addr("fd00::10"));
    hosts.add("nas.lan", addr("::ffff:192.168.1.11"));

    EXPECT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts.lookup("nas.lan", dns_type::A),
              (std::vector<boost::asio::ip::address>{addr("192.168.1.10"), addr("192.168.1.11")}));
    EXPECT_EQ(hosts.lookup("Nas.Lan", dns_type::AAAA),
              std::vector<boost::asio::ip::address>{addr("fd00::10")});
    EXPECT_TRUE(hosts.lookup("nas.lan", dns_type::MX).empty());
    EXPECT_TRUE(hosts.lookup("other.lan", dns_type::A).empty());
}

TEST(HostsTableTest, DuplicatesIgnored) {
    HostsTable hosts;
    hosts.add("router.lan", addr("192.168.1.1"));
    hosts.add("router.lan", addr("192.168.1.1"));
    EXPECT_EQ(hosts.lookup("router.lan", dns_type::A).size(), 1u);
}

TEST(HostsTableTest, Answer) {
    HostsTable hosts;
    hosts.add("router.lan", addr("192.168.1.1"));

    ResolvedAnswer answer;
    ASSERT_TRUE(hosts.answer(makeQuery("router.lan", dns_type::A), &answer));
    EXPECT_EQ(answer.rcode, dns_rcode::NOERROR);
    ASSERT_EQ(answer.records.size(), 1u);
    EXPECT_EQ(answer.records[0].name, "router.lan");
    EXPECT_EQ(answer.records[0].rrtype, dns_type::A);
    EXPECT_EQ(answer.records[0].ttl, HOSTS_TTL);

    // 没有 IPv6 地址时交给上游
    EXPECT_FALSE(hosts.answer(makeQuery("router.lan", dns_type::AAAA), &answer));
}

TEST(HostsTableTest, ReverseLookup) {
    HostsTable hosts;
    hosts.add("NAS.lan", addr("192.168.1.10"));
    hosts.add("nas-alias.lan", addr("192.168.1.10"));
    hosts.add("nas.lan", addr("fd00::10"));

    // 第一个名字优先
    EXPECT_EQ(hosts.hostnameOf(addr("192.168.1.10")), "nas.lan");
    EXPECT_EQ(hosts.hostnameOf(addr("::ffff:192.168.1.10")), "nas.lan");
    EXPECT_EQ(hosts.hostnameOf(addr("fd00::10")), "nas.lan");
    EXPECT_EQ(hosts.hostnameOf(addr("192.168.1.11")), "");
}

TEST(HostsTableTest, AnswerPtr) {
    HostsTable hosts;
    hosts.add("router.lan", addr("192.168.1.1"));
    hosts.add("router.lan", addr("fd00::1"));

    ResolvedAnswer answer;
    ASSERT_TRUE(hosts.answer(makeQuery("1.1.168.192.in-addr.arpa", dns_type::PTR), &answer));
    EXPECT_EQ(answer.rcode, dns_rcode::NOERROR);
    ASSERT_EQ(answer.records.size(), 1u);
    EXPECT_EQ(answer.records[0].name, "1.1.168.192.in-addr.arpa");
    EXPECT_EQ(answer.records[0].rrtype, dns_type::PTR);
    EXPECT_EQ(answer.records[0].ttl, HOSTS_TTL);
    EXPECT_EQ(answer.records[0].rdata,
              (std::vector<uint8_t>{6, 'r', 'o', 'u', 't', 'e', 'r', 3, 'l', 'a', 'n', 0}));

    ASSERT_TRUE(hosts.answer(makeQuery(reverseName(addr("fd00::1")), dns_type::PTR), &answer));
    EXPECT_EQ(answer.records.size(), 1u);

    // 未登记或格式错误的反查名交给上游
    EXPECT_FALSE(hosts.answer(makeQuery("2.1.168.192.in-addr.arpa", dns_type::PTR), &answer));
    EXPECT_FALSE(hosts.answer(makeQuery("router.lan", dns_type::PTR), &answer));
}

TEST(ReverseNameTest, Parse) {
    boost::asio::ip::address a;
    ASSERT_TRUE(parseReverseName("4.3.2.1.in-addr.arpa", &a));
    EXPECT_EQ(a, addr("1.2.3.4"));
    ASSERT_TRUE(parseReverseName("10.1.168.192.IN-ADDR.ARPA.", &a));
    EXPECT_EQ(a, addr("192.168.1.10"));

    ASSERT_TRUE(parseReverseName(
        "1.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.b.d.0.1.0.0.2.ip6.arpa", &a));
    EXPECT_EQ(a, addr("2001:db8::1"));

    EXPECT_FALSE(parseReverseName("3.2.1.in-addr.arpa", &a));
    EXPECT_FALSE(parseReverseName("5.4.3.2.1.in-addr.arpa", &a));
    EXPECT_FALSE(parseReverseName("256.3.2.1.in-addr.arpa", &a));
    EXPECT_FALSE(parseReverseName("x.3.2.1.in-addr.arpa", &a));
    EXPECT_FALSE(parseReverseName("3..1.in-addr.arpa", &a));
    EXPECT_FALSE(parseReverseName("1.0.ip6.arpa", &a));
    EXPECT_FALSE(parseReverseName("in-addr.arpa", &a));
    EXPECT_FALSE(parseReverseName("example.com", &a));
}

TEST(ReverseNameTest, Format) {
    EXPECT_EQ(reverseName(addr("192.168.1.10")), "10.1.168.192.in-addr.arpa");
    EXPECT_EQ(reverseName(addr("::ffff:10.0.0.1")), "1.0.0.10.in-addr.arpa");
    EXPECT_EQ(reverseName(addr("2001:db8::1")),
              "1.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.b.d.0.1.0.0.2.ip6.arpa");

    boost::asio::ip::address a;
    ASSERT_TRUE(parseReverseName(reverseName(addr("fd00::abcd")), &a));
    EXPECT_EQ(a, addr("fd00::abcd"));
}
