#include "provider/builtin_providers.hpp"
#include "provider/cached_provider.hpp"

#include <memory>

namespace cdnlocator {

namespace {

HttpProviderAdapter::Config make_config(const char* name, std::string url,
                                        ResponseFormat format, const HttpSettings& http) {
    HttpProviderAdapter::Config cfg;
    cfg.name = name;
    cfg.url = std::move(url);
    cfg.format = format;
    cfg.http = http;
    return cfg;
}

} // anonymous namespace

std::vector<HttpProviderAdapter::Config> builtin_provider_configs(const HttpSettings& http) {
    std::vector<HttpProviderAdapter::Config> configs;
    configs.reserve(10);

    auto akamai = make_config(providers::AKAMAI,
        "https://techdocs.akamai.com/origin-ip-acl/docs/update-your-origin-server",
        ResponseFormat::HTML_CODE, http);
    akamai.selector = "rdmd-code";
    akamai.index = 0;
    configs.push_back(std::move(akamai));

    configs.push_back(make_config(providers::BUNNY,
        "https://api.bunny.net/system/edgeserverlist/plain", ResponseFormat::LINES, http));

    configs.push_back(make_config(providers::CACHEFLY,
        "https://cachefly.cachefly.net/ips/cdn.txt", ResponseFormat::LINES, http));

    configs.push_back(make_config(providers::CLOUDFLARE,
        "https://www.cloudflare.com/ips-v4", ResponseFormat::LINES, http));

    auto cloudfront = make_config(providers::CLOUDFRONT,
        "https://d7uri8nf7uskq.cloudfront.net/tools/list-cloudfront-ips",
        ResponseFormat::JSON_ARRAY, http);
    cloudfront.field = "CLOUDFRONT_GLOBAL_IP_LIST";
    configs.push_back(std::move(cloudfront));

    auto fastly = make_config(providers::FASTLY,
        "https://api.fastly.com/public-ip-list", ResponseFormat::JSON_ARRAY, http);
    fastly.field = "addresses";
    configs.push_back(std::move(fastly));

    auto gcore = make_config(providers::GCORE,
        "https://api.gcore.com/cdn/public-ip-list", ResponseFormat::JSON_ARRAY, http);
    gcore.field = "addresses";
    configs.push_back(std::move(gcore));

    auto google = make_config(providers::GOOGLE,
        "https://www.gstatic.com/ipranges/cloud.json", ResponseFormat::JSON_OBJECTS, http);
    google.field = "prefixes";
    google.member = "ipv4Prefix";
    configs.push_back(std::move(google));

    auto keycdn = make_config(providers::KEYCDN,
        "https://www.keycdn.com/shield-prefixes.json", ResponseFormat::JSON_ARRAY, http);
    keycdn.field = "prefixes";
    configs.push_back(std::move(keycdn));

    auto quic = make_config(providers::QUIC,
        "https://quic.cloud/ips", ResponseFormat::DELIMITED, http);
    quic.delimiter = "<br />";
    configs.push_back(std::move(quic));

    return configs;
}

void register_http_providers(ProviderRegistry& registry,
                             const std::vector<HttpProviderAdapter::Config>& configs,
                             const CacheStore::Config& cache_config) {
    for (const auto& cfg : configs) {
        auto provider = std::make_shared<CachedProvider>(
            std::make_unique<HttpProviderAdapter>(cfg),
            CacheStore(cfg.name, cache_config));
        registry.register_or_replace(cfg.name, std::move(provider));
    }
}

} // namespace cdnlocator
