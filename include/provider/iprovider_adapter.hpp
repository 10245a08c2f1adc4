#pragma once

#include "core/error.hpp"

#include <string>
#include <vector>

namespace cdnlocator {

/**
 * @brief Source of one provider's published IP ranges
 *
 * Implementations perform the network request and turn the vendor's
 * payload into a flat list of range strings. Caching and normalization
 * are layered on top by CachedProvider.
 */
class IProviderAdapter {
public:
    virtual ~IProviderAdapter() = default;

    [[nodiscard]] virtual Result<std::vector<std::string>> fetch() = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace cdnlocator
