#include "config/config_loader.hpp"
#include "lookup/membership_engine.hpp"
#include "provider/builtin_providers.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace cdnlocator {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

CacheConfig ConfigLoader::extract_cache(const toml::table& root) {
    CacheConfig cfg;
    const auto* cache = root["cache"].as_table();
    if (!cache) return cfg;
    const auto& c = *cache;

    cfg.directory = c["directory"].value_or(""s);
    cfg.ttl_seconds = c["ttl_seconds"].value_or(cfg.ttl_seconds);
    return cfg;
}

LookupConfig ConfigLoader::extract_lookup(const toml::table& root) {
    LookupConfig cfg;
    const auto* lookup = root["lookup"].as_table();
    if (!lookup) return cfg;

    cfg.query_timeout_ms = (*lookup)["query_timeout_ms"].value_or(cfg.query_timeout_ms);
    return cfg;
}

HttpConfig ConfigLoader::extract_http(const toml::table& root) {
    HttpConfig cfg;
    const auto* http = root["http"].as_table();
    if (!http) return cfg;
    const auto& h = *http;

    cfg.connect_timeout_ms = h["connect_timeout_ms"].value_or(cfg.connect_timeout_ms);
    cfg.read_timeout_ms = h["read_timeout_ms"].value_or(cfg.read_timeout_ms);
    cfg.user_agent = h["user_agent"].value_or(cfg.user_agent);
    return cfg;
}

BuiltinProvidersConfig ConfigLoader::extract_builtin_providers(const toml::table& root) {
    BuiltinProvidersConfig cfg;
    const auto* builtin = root["builtin_providers"].as_table();
    if (!builtin) return cfg;

    cfg.enabled = (*builtin)["enabled"].value_or(true);
    cfg.exclude = toml_string_array(*builtin, "exclude");
    return cfg;
}

std::vector<ProviderConfig> ConfigLoader::extract_providers(const toml::table& root) {
    std::vector<ProviderConfig> result;
    const auto* arr = root["providers"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* tbl = elem.as_table();
        if (!tbl) continue;
        const auto& p = *tbl;

        ProviderConfig cfg;
        cfg.name = p["name"].value_or(""s);
        cfg.url = p["url"].value_or(""s);
        cfg.format = p["format"].value_or(cfg.format);
        cfg.field = p["field"].value_or(""s);
        cfg.member = p["member"].value_or(""s);
        cfg.delimiter = p["delimiter"].value_or(cfg.delimiter);
        cfg.selector = p["selector"].value_or(""s);
        cfg.index = p["index"].value_or(cfg.index);
        result.push_back(std::move(cfg));
    }
    return result;
}

LocatorConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    LocatorConfig config;
    config.logging = extract_logging(tbl);
    config.cache = extract_cache(tbl);
    config.lookup = extract_lookup(tbl);
    config.http = extract_http(tbl);
    config.builtin_providers = extract_builtin_providers(tbl);
    config.providers = extract_providers(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(LocatorConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const LocatorConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    if (config.cache.ttl_seconds <= 0) {
        errors.push_back(std::format("cache.ttl_seconds must be > 0, got {}", config.cache.ttl_seconds));
    }

    const int64_t max_query_timeout_ms = MembershipEngine::kMaxQueryTimeout.count();
    if (config.lookup.query_timeout_ms < 0 || config.lookup.query_timeout_ms > max_query_timeout_ms) {
        errors.push_back(std::format("lookup.query_timeout_ms must be between 0 and {}, got {}",
            max_query_timeout_ms, config.lookup.query_timeout_ms));
    }
    if (config.http.connect_timeout_ms <= 0) {
        errors.push_back(std::format("http.connect_timeout_ms must be > 0, got {}",
            config.http.connect_timeout_ms));
    }
    if (config.http.read_timeout_ms <= 0) {
        errors.push_back(std::format("http.read_timeout_ms must be > 0, got {}",
            config.http.read_timeout_ms));
    }

    std::unordered_set<std::string> builtin_names;
    for (const auto& cfg : builtin_provider_configs()) {
        builtin_names.insert(cfg.name);
    }
    for (const auto& name : config.builtin_providers.exclude) {
        if (!builtin_names.contains(name)) {
            errors.push_back(std::format("builtin_providers.exclude: unknown provider '{}'", name));
        }
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.providers.size(); ++i) {
        const auto& p = config.providers[i];
        if (p.name.empty()) {
            errors.push_back(std::format("providers[{}].name must not be empty", i));
        } else if (!seen.insert(p.name).second) {
            errors.push_back(std::format("providers[{}]: duplicate provider name '{}'", i, p.name));
        }

        if (!HttpProviderAdapter::split_url(p.url)) {
            errors.push_back(std::format("providers[{}].url must be an http(s) URL, got '{}'", i, p.url));
        }

        const auto format = parse_response_format(p.format);
        if (!format) {
            errors.push_back(std::format("providers[{}].format: unknown format '{}'", i, p.format));
            continue;
        }
        switch (*format) {
            case ResponseFormat::JSON_ARRAY:
                if (p.field.empty()) {
                    errors.push_back(std::format("providers[{}].field required for json_array", i));
                }
                break;
            case ResponseFormat::JSON_OBJECTS:
                if (p.field.empty() || p.member.empty()) {
                    errors.push_back(std::format(
                        "providers[{}].field and member required for json_objects", i));
                }
                break;
            case ResponseFormat::DELIMITED:
                if (p.delimiter.empty()) {
                    errors.push_back(std::format("providers[{}].delimiter must not be empty", i));
                }
                break;
            case ResponseFormat::HTML_CODE:
                if (p.selector.empty()) {
                    errors.push_back(std::format("providers[{}].selector required for html_code", i));
                }
                if (p.index < 0) {
                    errors.push_back(std::format("providers[{}].index must be >= 0", i));
                }
                break;
            case ResponseFormat::LINES:
                break;
        }
    }

    return errors;
}

// ============================================================================
// Conversions
// ============================================================================

CacheStore::Config ConfigLoader::cache_store_config(const LocatorConfig& config) {
    CacheStore::Config cfg;
    cfg.directory = config.cache.directory;
    cfg.ttl = std::chrono::seconds(config.cache.ttl_seconds);
    return cfg;
}

HttpSettings ConfigLoader::http_settings(const LocatorConfig& config) {
    HttpSettings http;
    http.connect_timeout = std::chrono::milliseconds(config.http.connect_timeout_ms);
    http.read_timeout = std::chrono::milliseconds(config.http.read_timeout_ms);
    http.user_agent = config.http.user_agent;
    return http;
}

std::vector<HttpProviderAdapter::Config> ConfigLoader::provider_configs(
    const LocatorConfig& config) {
    const auto http = http_settings(config);
    std::vector<HttpProviderAdapter::Config> result;

    if (config.builtin_providers.enabled) {
        const auto& exclude = config.builtin_providers.exclude;
        for (auto& cfg : builtin_provider_configs(http)) {
            if (std::find(exclude.begin(), exclude.end(), cfg.name) != exclude.end()) continue;
            result.push_back(std::move(cfg));
        }
    }

    for (const auto& p : config.providers) {
        HttpProviderAdapter::Config cfg;
        cfg.name = p.name;
        cfg.url = p.url;
        cfg.format = parse_response_format(p.format).value_or(ResponseFormat::LINES);
        cfg.field = p.field;
        cfg.member = p.member;
        cfg.delimiter = p.delimiter;
        cfg.selector = p.selector;
        cfg.index = static_cast<size_t>(std::max<int64_t>(p.index, 0));
        cfg.http = http;

        const auto existing = std::find_if(result.begin(), result.end(),
            [&p](const HttpProviderAdapter::Config& c) { return c.name == p.name; });
        if (existing != result.end()) {
            *existing = std::move(cfg);
        } else {
            result.push_back(std::move(cfg));
        }
    }
    return result;
}

} // namespace cdnlocator
