#pragma once

#include "core/error.hpp"
#include "provider/cached_provider.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cdnlocator {

/**
 * @brief Name -> provider mapping built once at startup.
 *
 * Registration happens before seal(); afterwards the registry is read-only
 * and may be queried from any number of threads without locking.
 *
 * Usage:
 *   ProviderRegistry registry;
 *   registry.register_provider(std::make_shared<CachedProvider>(...));
 *   registry.seal();
 *   MembershipEngine engine(registry);
 */
class ProviderRegistry {
public:
    using ProviderPtr = std::shared_ptr<CachedProvider>;
    using ProviderMap = std::map<std::string, ProviderPtr>;

    /// @throws std::logic_error on duplicate name, null provider or after seal()
    void register_provider(const std::string& name, ProviderPtr provider);

    /// Registers under provider->name()
    void register_provider(ProviderPtr provider);

    /// Replace or add; used when configuration overrides a built-in
    void register_or_replace(const std::string& name, ProviderPtr provider);

    void seal() { sealed_ = true; }
    [[nodiscard]] bool sealed() const { return sealed_; }

    [[nodiscard]] Result<ProviderPtr> get(const std::string& name) const;

    [[nodiscard]] const ProviderMap& all() const { return providers_; }

    /// Registered names in sorted order
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] bool contains(const std::string& name) const {
        return providers_.count(name) > 0;
    }

    [[nodiscard]] size_t size() const { return providers_.size(); }
    [[nodiscard]] bool empty() const { return providers_.empty(); }

private:
    void check_mutable(const std::string& name, const ProviderPtr& provider) const;

    ProviderMap providers_;
    bool sealed_ = false;
};

} // namespace cdnlocator
