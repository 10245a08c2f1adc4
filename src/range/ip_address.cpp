#include "range/ip_address.hpp"
#include "core/utils.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <format>

namespace cdnlocator {

namespace {

constexpr std::array<uint8_t, 12> kV4MappedPrefix = {
    0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff
};

bool has_whitespace(std::string_view text) {
    return std::any_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

} // anonymous namespace

// ============================================================================
// IpAddress
// ============================================================================

std::optional<IpAddress> IpAddress::parse(std::string_view text) {
    const std::string literal = utils::trim(text);
    if (literal.empty() || has_whitespace(literal)) return std::nullopt;

    IpAddress addr;
    if (literal.find(':') == std::string::npos) {
        in_addr v4{};
        if (::inet_pton(AF_INET, literal.c_str(), &v4) != 1) return std::nullopt;
        addr.family_ = AddressFamily::V4;
        std::memcpy(addr.bytes_.data(), &v4, 4);
        return addr;
    }

    in6_addr v6{};
    if (::inet_pton(AF_INET6, literal.c_str(), &v6) != 1) return std::nullopt;
    std::array<uint8_t, 16> raw{};
    std::memcpy(raw.data(), &v6, 16);

    if (std::equal(kV4MappedPrefix.begin(), kV4MappedPrefix.end(), raw.begin())) {
        addr.family_ = AddressFamily::V4;
        std::copy(raw.begin() + 12, raw.end(), addr.bytes_.begin());
        return addr;
    }

    addr.family_ = AddressFamily::V6;
    addr.bytes_ = raw;
    return addr;
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {};
    if (is_v4()) {
        in_addr v4{};
        std::memcpy(&v4, bytes_.data(), 4);
        if (!::inet_ntop(AF_INET, &v4, buf, sizeof(buf))) return {};
    } else {
        in6_addr v6{};
        std::memcpy(&v6, bytes_.data(), 16);
        if (!::inet_ntop(AF_INET6, &v6, buf, sizeof(buf))) return {};
    }
    return std::string(buf);
}

// ============================================================================
// CidrBlock
// ============================================================================

std::optional<CidrBlock> CidrBlock::parse(std::string_view text) {
    if (text.empty() || has_whitespace(text)) return std::nullopt;

    const auto slash = text.find('/');
    if (slash == std::string_view::npos) return std::nullopt;

    const auto addr_part = text.substr(0, slash);
    const auto prefix_part = text.substr(slash + 1);
    if (prefix_part.empty()) return std::nullopt;

    auto addr = IpAddress::parse(addr_part);
    if (!addr) return std::nullopt;

    auto prefix = utils::try_parse_int<int>(prefix_part);
    if (!prefix || *prefix < 0) return std::nullopt;

    // An IPv4-mapped literal carries an IPv6 prefix length
    const bool written_as_v6 = addr_part.find(':') != std::string_view::npos;
    if (addr->is_v4() && written_as_v6) {
        if (*prefix < 96 || *prefix > 128) return std::nullopt;
        *prefix -= 96;
    }
    if (*prefix > addr->bit_length()) return std::nullopt;

    CidrBlock block;
    block.prefix_length_ = *prefix;
    block.network_ = *addr;

    // Mask off host bits (normalize)
    const int full_bytes = *prefix / 8;
    const int rem_bits = *prefix % 8;
    const int total_bytes = addr->bit_length() / 8;
    for (int i = full_bytes; i < total_bytes; ++i) {
        if (i == full_bytes && rem_bits != 0) {
            block.network_.bytes_[i] &= static_cast<uint8_t>(0xFF << (8 - rem_bits));
        } else {
            block.network_.bytes_[i] = 0;
        }
    }
    return block;
}

bool CidrBlock::contains(const IpAddress& ip) const {
    if (ip.family() != network_.family()) return false;

    const auto& net = network_.bytes();
    const auto& addr = ip.bytes();
    const int full_bytes = prefix_length_ / 8;
    const int rem_bits = prefix_length_ % 8;

    if (!std::equal(net.begin(), net.begin() + full_bytes, addr.begin())) {
        return false;
    }
    if (rem_bits == 0) return true;

    const auto mask = static_cast<uint8_t>(0xFF << (8 - rem_bits));
    return (addr[full_bytes] & mask) == net[full_bytes];
}

std::string CidrBlock::to_string() const {
    return std::format("{}/{}", network_.to_string(), prefix_length_);
}

} // namespace cdnlocator
