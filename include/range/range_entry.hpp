#pragma once

#include "range/ip_address.hpp"

#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace cdnlocator {

class RangeEntry {
public:
    /**
     * @brief Trim every line and drop the ones left empty.
     * Order of surviving entries is preserved. Idempotent.
     */
    [[nodiscard]] static std::vector<std::string> normalize(
        const std::vector<std::string>& lines);

    /**
     * @brief Test one published entry against a target address
     *
     * Entries that parse as CIDR blocks are tested for containment.
     * Anything else is compared verbatim with the target's canonical text,
     * so bare addresses match and malformed entries never do.
     */
    [[nodiscard]] static bool matches(std::string_view entry, const IpAddress& ip);

    /// Index of the first matching entry, or nullopt (also when stopped early)
    [[nodiscard]] static std::optional<size_t> find_match(
        const std::vector<std::string>& entries, const IpAddress& ip,
        std::stop_token stop = {});
};

} // namespace cdnlocator
