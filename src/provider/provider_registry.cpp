#include "provider/provider_registry.hpp"

#include <format>
#include <stdexcept>

namespace cdnlocator {

void ProviderRegistry::check_mutable(const std::string& name, const ProviderPtr& provider) const {
    if (sealed_) {
        throw std::logic_error(
            std::format("Cannot register provider '{}': registry is sealed", name));
    }
    if (!provider) {
        throw std::logic_error(std::format("Cannot register null provider '{}'", name));
    }
    if (name.empty()) {
        throw std::logic_error("Cannot register provider with an empty name");
    }
}

void ProviderRegistry::register_provider(const std::string& name, ProviderPtr provider) {
    check_mutable(name, provider);
    const auto [it, inserted] = providers_.try_emplace(name, std::move(provider));
    if (!inserted) {
        throw std::logic_error(std::format("Provider '{}' is already registered", name));
    }
}

void ProviderRegistry::register_provider(ProviderPtr provider) {
    const std::string name = provider ? provider->name() : std::string{};
    register_provider(name, std::move(provider));
}

void ProviderRegistry::register_or_replace(const std::string& name, ProviderPtr provider) {
    check_mutable(name, provider);
    providers_.insert_or_assign(name, std::move(provider));
}

Result<ProviderRegistry::ProviderPtr> ProviderRegistry::get(const std::string& name) const {
    const auto it = providers_.find(name);
    if (it == providers_.end()) {
        return Result<ProviderPtr>::error(ErrorCategory::NOT_FOUND,
            std::format("CDN provider not found: {}", name));
    }
    return Result<ProviderPtr>::ok(it->second);
}

std::vector<std::string> ProviderRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(providers_.size());
    for (const auto& [name, provider] : providers_) {
        result.push_back(name);
    }
    return result;
}

} // namespace cdnlocator
