#pragma once

#include "cache/cache_store.hpp"
#include "config/config_types.hpp"
#include "provider/http_provider_adapter.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace cdnlocator {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        LocatorConfig config;

        static LoadResult ok(LocatorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to cdn-locator.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    [[nodiscard]] static std::vector<std::string> validate_config(const LocatorConfig& config);

    // ---- Conversions to component configs --------------------------------

    [[nodiscard]] static CacheStore::Config cache_store_config(const LocatorConfig& config);
    [[nodiscard]] static HttpSettings http_settings(const LocatorConfig& config);

    /// Built-ins (minus exclusions) followed by [[providers]] overrides/additions
    [[nodiscard]] static std::vector<HttpProviderAdapter::Config> provider_configs(
        const LocatorConfig& config);

private:
    static LocatorConfig extract_all_sections(const toml::table& tbl);
    static LoadResult validate_and_return(LocatorConfig config);

    static LoggingConfig extract_logging(const toml::table& root);
    static CacheConfig extract_cache(const toml::table& root);
    static LookupConfig extract_lookup(const toml::table& root);
    static HttpConfig extract_http(const toml::table& root);
    static BuiltinProvidersConfig extract_builtin_providers(const toml::table& root);
    static std::vector<ProviderConfig> extract_providers(const toml::table& root);
};

} // namespace cdnlocator
