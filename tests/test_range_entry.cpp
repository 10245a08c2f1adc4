#include <catch2/catch_test_macros.hpp>
#include "range/range_entry.hpp"
#include "range/ip_address.hpp"

#include <stop_token>

using namespace cdnlocator;

namespace {

IpAddress ip(const char* text) {
    auto parsed = IpAddress::parse(text);
    REQUIRE(parsed.has_value());
    return *parsed;
}

} // namespace

// ============================================================================
// normalize
// ============================================================================

TEST_CASE("RangeEntry: normalize drops empty and whitespace-only lines", "[range][normalize]") {
    const std::vector<std::string> lines = {"", "a", "  ", "b\r\n"};
    const auto result = RangeEntry::normalize(lines);
    REQUIRE(result.size() == 2);
    CHECK(result[0] == "a");
    CHECK(result[1] == "b");
}

TEST_CASE("RangeEntry: normalize trims tabs and carriage returns, keeps order", "[range][normalize]") {
    const std::vector<std::string> lines = {"\t10.0.0.0/8\r", " 192.0.2.1 ", "\r", "203.0.113.0/24"};
    const auto result = RangeEntry::normalize(lines);
    REQUIRE(result.size() == 3);
    CHECK(result[0] == "10.0.0.0/8");
    CHECK(result[1] == "192.0.2.1");
    CHECK(result[2] == "203.0.113.0/24");
}

TEST_CASE("RangeEntry: normalize is idempotent", "[range][normalize]") {
    const std::vector<std::string> lines = {" x ", "", "\t", "y\r", "z"};
    const auto once = RangeEntry::normalize(lines);
    CHECK(RangeEntry::normalize(once) == once);
}

TEST_CASE("RangeEntry: normalize of empty input is empty", "[range][normalize]") {
    CHECK(RangeEntry::normalize({}).empty());
    CHECK(RangeEntry::normalize({"", " ", "\r\n"}).empty());
}

// ============================================================================
// IpAddress
// ============================================================================

TEST_CASE("IpAddress: parses IPv4 and prints dotted quad", "[range][ip]") {
    const auto addr = IpAddress::parse("203.0.113.5");
    REQUIRE(addr.has_value());
    CHECK(addr->is_v4());
    CHECK(addr->to_string() == "203.0.113.5");
}

TEST_CASE("IpAddress: IPv6 canonical form is compressed lowercase", "[range][ip]") {
    const auto addr = IpAddress::parse("2001:DB8:0:0:0:0:0:1");
    REQUIRE(addr.has_value());
    CHECK_FALSE(addr->is_v4());
    CHECK(addr->to_string() == "2001:db8::1");
}

TEST_CASE("IpAddress: IPv4-mapped IPv6 compares as IPv4", "[range][ip]") {
    const auto mapped = IpAddress::parse("::ffff:10.1.2.3");
    REQUIRE(mapped.has_value());
    CHECK(mapped->is_v4());
    CHECK(*mapped == ip("10.1.2.3"));
    CHECK(mapped->to_string() == "10.1.2.3");
}

TEST_CASE("IpAddress: surrounding whitespace is tolerated", "[range][ip]") {
    const auto addr = IpAddress::parse("  8.8.8.8\n");
    REQUIRE(addr.has_value());
    CHECK(addr->to_string() == "8.8.8.8");
}

TEST_CASE("IpAddress: rejects malformed input", "[range][ip]") {
    CHECK_FALSE(IpAddress::parse("").has_value());
    CHECK_FALSE(IpAddress::parse("not-an-ip").has_value());
    CHECK_FALSE(IpAddress::parse("256.1.1.1").has_value());
    CHECK_FALSE(IpAddress::parse("1.2.3").has_value());
    CHECK_FALSE(IpAddress::parse("1.2.3.4/8").has_value());
    CHECK_FALSE(IpAddress::parse("1.2. 3.4").has_value());
    CHECK_FALSE(IpAddress::parse("2001:db8:::1").has_value());
}

// ============================================================================
// CidrBlock
// ============================================================================

TEST_CASE("CidrBlock: /8 contains addresses in range only", "[range][cidr]") {
    const auto block = CidrBlock::parse("10.0.0.0/8");
    REQUIRE(block.has_value());
    CHECK(block->contains(ip("10.0.0.1")));
    CHECK(block->contains(ip("10.255.255.255")));
    CHECK(block->contains(ip("10.1.2.3")));
    CHECK_FALSE(block->contains(ip("11.0.0.1")));
    CHECK_FALSE(block->contains(ip("9.255.255.255")));
}

TEST_CASE("CidrBlock: non-octet prefix boundaries", "[range][cidr]") {
    const auto block = CidrBlock::parse("172.16.0.0/12");
    REQUIRE(block.has_value());
    CHECK(block->contains(ip("172.16.0.0")));
    CHECK(block->contains(ip("172.31.255.255")));
    CHECK_FALSE(block->contains(ip("172.32.0.0")));
    CHECK_FALSE(block->contains(ip("172.15.255.255")));
}

TEST_CASE("CidrBlock: host bits are masked off", "[range][cidr]") {
    const auto block = CidrBlock::parse("192.168.1.77/24");
    REQUIRE(block.has_value());
    CHECK(block->to_string() == "192.168.1.0/24");
    CHECK(block->contains(ip("192.168.1.200")));
}

TEST_CASE("CidrBlock: /0 and /32 extremes", "[range][cidr]") {
    const auto all = CidrBlock::parse("0.0.0.0/0");
    REQUIRE(all.has_value());
    CHECK(all->contains(ip("1.2.3.4")));
    CHECK(all->contains(ip("255.255.255.255")));

    const auto single = CidrBlock::parse("198.51.100.7/32");
    REQUIRE(single.has_value());
    CHECK(single->contains(ip("198.51.100.7")));
    CHECK_FALSE(single->contains(ip("198.51.100.8")));
}

TEST_CASE("CidrBlock: IPv6 blocks", "[range][cidr]") {
    const auto block = CidrBlock::parse("2606:4700::/32");
    REQUIRE(block.has_value());
    CHECK(block->contains(ip("2606:4700:10::6816:1")));
    CHECK_FALSE(block->contains(ip("2606:4701::1")));
    CHECK(block->to_string() == "2606:4700::/32");
}

TEST_CASE("CidrBlock: families never cross", "[range][cidr]") {
    const auto v4 = CidrBlock::parse("0.0.0.0/0");
    const auto v6 = CidrBlock::parse("::/0");
    REQUIRE(v4.has_value());
    REQUIRE(v6.has_value());
    CHECK_FALSE(v4->contains(ip("2001:db8::1")));
    CHECK_FALSE(v6->contains(ip("10.0.0.1")));
}

TEST_CASE("CidrBlock: rejects bare addresses and bad prefixes", "[range][cidr]") {
    CHECK_FALSE(CidrBlock::parse("10.0.0.1").has_value());
    CHECK_FALSE(CidrBlock::parse("10.0.0.0/").has_value());
    CHECK_FALSE(CidrBlock::parse("10.0.0.0/33").has_value());
    CHECK_FALSE(CidrBlock::parse("10.0.0.0/-1").has_value());
    CHECK_FALSE(CidrBlock::parse("10.0.0.0/8x").has_value());
    CHECK_FALSE(CidrBlock::parse("2001:db8::/129").has_value());
    CHECK_FALSE(CidrBlock::parse(" 10.0.0.0/8").has_value());
    CHECK_FALSE(CidrBlock::parse("garbage/8").has_value());
}

// ============================================================================
// Entry matching
// ============================================================================

TEST_CASE("RangeEntry: CIDR entries match by containment", "[range][match]") {
    CHECK(RangeEntry::matches("10.0.0.0/8", ip("10.1.2.3")));
    CHECK_FALSE(RangeEntry::matches("10.0.0.0/8", ip("8.8.8.8")));
}

TEST_CASE("RangeEntry: bare addresses match by canonical text", "[range][match]") {
    CHECK(RangeEntry::matches("203.0.113.5", ip("203.0.113.5")));
    CHECK_FALSE(RangeEntry::matches("203.0.113.5", ip("203.0.113.6")));
    CHECK(RangeEntry::matches("2001:db8::1", ip("2001:0db8:0:0::1")));
}

TEST_CASE("RangeEntry: malformed entries never match", "[range][match]") {
    CHECK_FALSE(RangeEntry::matches("not a range", ip("10.0.0.1")));
    CHECK_FALSE(RangeEntry::matches("10.0.0.0/99", ip("10.0.0.1")));
    CHECK_FALSE(RangeEntry::matches("", ip("10.0.0.1")));
}

TEST_CASE("RangeEntry: find_match returns the first matching index", "[range][match]") {
    const std::vector<std::string> entries = {
        "junk", "192.0.2.0/24", "10.0.0.0/8", "10.1.0.0/16"
    };
    const auto idx = RangeEntry::find_match(entries, ip("10.1.2.3"));
    REQUIRE(idx.has_value());
    CHECK(*idx == 2);
    CHECK_FALSE(RangeEntry::find_match(entries, ip("8.8.8.8")).has_value());
}

TEST_CASE("RangeEntry: find_match agrees with matches for each entry", "[range][match]") {
    const std::vector<std::string> entries = {
        "junk", "10.0.0.0/99", "2001:db8::1", "2001:db8::/32", "192.0.2.7",
        "192.0.2.0/30", "0.0.0.0/0", "::/0", ""
    };
    for (const char* text : {"192.0.2.7", "192.0.2.3", "2001:db8::1", "2001:db8:1::5",
                             "8.8.8.8", "::ffff:192.0.2.7"}) {
        const auto target = ip(text);
        std::optional<size_t> expected;
        for (size_t i = 0; i < entries.size(); ++i) {
            if (RangeEntry::matches(entries[i], target)) {
                expected = i;
                break;
            }
        }
        CHECK(RangeEntry::find_match(entries, target) == expected);
    }
}

TEST_CASE("RangeEntry: find_match honours a stop request", "[range][match]") {
    const std::vector<std::string> entries = {"10.0.0.0/8"};
    std::stop_source source;
    source.request_stop();
    CHECK_FALSE(RangeEntry::find_match(entries, ip("10.1.2.3"), source.get_token()).has_value());
}
