#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cdnlocator {

enum class AddressFamily : uint8_t { V4, V6 };

/**
 * @brief IPv4 or IPv6 address in network byte order.
 *
 * IPv4 addresses occupy the first 4 bytes. IPv4-mapped IPv6 literals
 * (::ffff:a.b.c.d) are stored as IPv4 so both spellings compare equal.
 */
class IpAddress {
public:
    IpAddress() = default;

    /**
     * @brief Parse an address literal (surrounding whitespace tolerated)
     * @return nullopt if the text is neither IPv4 nor IPv6
     */
    [[nodiscard]] static std::optional<IpAddress> parse(std::string_view text);

    [[nodiscard]] AddressFamily family() const { return family_; }
    [[nodiscard]] bool is_v4() const { return family_ == AddressFamily::V4; }

    /// Address width in bits (32 or 128)
    [[nodiscard]] int bit_length() const { return is_v4() ? 32 : 128; }

    [[nodiscard]] const std::array<uint8_t, 16>& bytes() const { return bytes_; }

    /// Canonical textual form (dotted quad, or RFC 5952 compressed IPv6)
    [[nodiscard]] std::string to_string() const;

    bool operator==(const IpAddress& other) const = default;

private:
    friend class CidrBlock;

    AddressFamily family_ = AddressFamily::V4;
    std::array<uint8_t, 16> bytes_{};
};

/**
 * @brief Network block in address/prefix notation.
 */
class CidrBlock {
public:
    /**
     * @brief Parse "address/prefix". A bare address is not a block.
     * Host bits are masked off, so "10.1.2.3/8" becomes 10.0.0.0/8.
     */
    [[nodiscard]] static std::optional<CidrBlock> parse(std::string_view text);

    /// False when the address family differs from the block's
    [[nodiscard]] bool contains(const IpAddress& ip) const;

    [[nodiscard]] const IpAddress& network() const { return network_; }
    [[nodiscard]] int prefix_length() const { return prefix_length_; }

    [[nodiscard]] std::string to_string() const;

private:
    IpAddress network_;
    int prefix_length_ = 0;
};

} // namespace cdnlocator
