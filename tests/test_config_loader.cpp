#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "mocks/temp_dir.hpp"

#include <algorithm>
#include <cstdlib>

using namespace cdnlocator;
using namespace cdnlocator::testing;

namespace {

const HttpProviderAdapter::Config* find_provider(
    const std::vector<HttpProviderAdapter::Config>& configs, const std::string& name) {
    const auto it = std::find_if(configs.begin(), configs.end(),
        [&name](const HttpProviderAdapter::Config& c) { return c.name == name; });
    return it == configs.end() ? nullptr : &*it;
}

} // namespace

// ============================================================================
// Defaults and overrides
// ============================================================================

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.cache.directory.empty());
    CHECK(cfg.cache.ttl_seconds == 604800);
    CHECK(cfg.lookup.query_timeout_ms == 30000);
    CHECK(cfg.builtin_providers.enabled);
    CHECK(cfg.providers.empty());

    CHECK(ConfigLoader::provider_configs(cfg).size() == 10);
    CHECK(ConfigLoader::cache_store_config(cfg).ttl == CacheStore::kDefaultTtl);
}

TEST_CASE("ConfigLoader: section values override defaults", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "debug"

[cache]
directory = "/var/cache/cdn-locator"
ttl_seconds = 3600

[lookup]
query_timeout_ms = 0

[http]
connect_timeout_ms = 2000
read_timeout_ms = 5000
user_agent = "cdn-locator/1.0"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.lookup.query_timeout_ms == 0);

    const auto cache = ConfigLoader::cache_store_config(cfg);
    CHECK(cache.directory == std::filesystem::path("/var/cache/cdn-locator"));
    CHECK(cache.ttl == std::chrono::seconds(3600));

    const auto http = ConfigLoader::http_settings(cfg);
    CHECK(http.connect_timeout == std::chrono::milliseconds(2000));
    CHECK(http.read_timeout == std::chrono::milliseconds(5000));
    CHECK(http.user_agent == "cdn-locator/1.0");

    for (const auto& p : ConfigLoader::provider_configs(cfg)) {
        CHECK(p.http.user_agent == "cdn-locator/1.0");
    }
}

// ============================================================================
// Providers
// ============================================================================

TEST_CASE("ConfigLoader: custom providers are appended", "[config][providers]") {
    auto result = ConfigLoader::load_from_string(R"(
[[providers]]
name = "examplecdn"
url = "https://example.net/ranges.json"
format = "json_objects"
field = "prefixes"
member = "cidr"

[[providers]]
name = "plaincdn"
url = "http://example.org/ips"
)");
    REQUIRE(result.success);

    const auto configs = ConfigLoader::provider_configs(result.config);
    CHECK(configs.size() == 12);

    const auto* example = find_provider(configs, "examplecdn");
    REQUIRE(example != nullptr);
    CHECK(example->format == ResponseFormat::JSON_OBJECTS);
    CHECK(example->field == "prefixes");
    CHECK(example->member == "cidr");

    const auto* plain = find_provider(configs, "plaincdn");
    REQUIRE(plain != nullptr);
    CHECK(plain->format == ResponseFormat::LINES);
}

TEST_CASE("ConfigLoader: a custom entry replaces a built-in of the same name", "[config][providers]") {
    auto result = ConfigLoader::load_from_string(R"(
[[providers]]
name = "cloudflare"
url = "https://mirror.example.com/cloudflare.txt"
)");
    REQUIRE(result.success);

    const auto configs = ConfigLoader::provider_configs(result.config);
    CHECK(configs.size() == 10);
    const auto* cloudflare = find_provider(configs, "cloudflare");
    REQUIRE(cloudflare != nullptr);
    CHECK(cloudflare->url == "https://mirror.example.com/cloudflare.txt");
}

TEST_CASE("ConfigLoader: built-ins can be excluded or disabled", "[config][providers]") {
    SECTION("exclude") {
        auto result = ConfigLoader::load_from_string(R"(
[builtin_providers]
exclude = ["akamai", "quic"]
)");
        REQUIRE(result.success);
        const auto configs = ConfigLoader::provider_configs(result.config);
        CHECK(configs.size() == 8);
        CHECK(find_provider(configs, "akamai") == nullptr);
        CHECK(find_provider(configs, "fastly") != nullptr);
    }

    SECTION("disable") {
        auto result = ConfigLoader::load_from_string(R"(
[builtin_providers]
enabled = false

[[providers]]
name = "only"
url = "https://example.com/ips"
)");
        REQUIRE(result.success);
        const auto configs = ConfigLoader::provider_configs(result.config);
        REQUIRE(configs.size() == 1);
        CHECK(configs[0].name == "only");
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigLoader: invalid values are rejected", "[config][validation]") {
    SECTION("unknown log level") {
        auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"loud\"\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("logging.level") != std::string::npos);
    }

    SECTION("non-positive ttl") {
        CHECK_FALSE(ConfigLoader::load_from_string("[cache]\nttl_seconds = 0\n").success);
    }

    SECTION("negative query timeout") {
        CHECK_FALSE(ConfigLoader::load_from_string("[lookup]\nquery_timeout_ms = -1\n").success);
    }

    SECTION("query timeout above one day") {
        auto result = ConfigLoader::load_from_string("[lookup]\nquery_timeout_ms = 86400001\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("lookup.query_timeout_ms") != std::string::npos);
        CHECK_FALSE(ConfigLoader::load_from_string(
            "[lookup]\nquery_timeout_ms = 9223372036854775807\n").success);
    }

    SECTION("zero http timeout") {
        CHECK_FALSE(ConfigLoader::load_from_string("[http]\nread_timeout_ms = 0\n").success);
    }

    SECTION("unknown exclusion") {
        CHECK_FALSE(ConfigLoader::load_from_string(
            "[builtin_providers]\nexclude = [\"nosuchcdn\"]\n").success);
    }

    SECTION("unknown format") {
        CHECK_FALSE(ConfigLoader::load_from_string(R"(
[[providers]]
name = "x"
url = "https://example.com"
format = "xml"
)").success);
    }

    SECTION("json_objects without member") {
        CHECK_FALSE(ConfigLoader::load_from_string(R"(
[[providers]]
name = "x"
url = "https://example.com"
format = "json_objects"
field = "prefixes"
)").success);
    }

    SECTION("html_code without selector") {
        CHECK_FALSE(ConfigLoader::load_from_string(R"(
[[providers]]
name = "x"
url = "https://example.com"
format = "html_code"
)").success);
    }

    SECTION("bad url") {
        CHECK_FALSE(ConfigLoader::load_from_string(R"(
[[providers]]
name = "x"
url = "ftp://example.com"
)").success);
    }

    SECTION("duplicate provider names") {
        auto result = ConfigLoader::load_from_string(R"(
[[providers]]
name = "x"
url = "https://a.example.com"

[[providers]]
name = "x"
url = "https://b.example.com"
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("duplicate") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: query timeout of exactly one day is accepted", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[lookup]\nquery_timeout_ms = 86400000\n");
    REQUIRE(result.success);
    CHECK(result.config.lookup.query_timeout_ms == 86400000);
}

TEST_CASE("ConfigLoader: malformed TOML is an error", "[config]") {
    auto result = ConfigLoader::load_from_string("[cache\nttl_seconds = ");
    CHECK_FALSE(result.success);
    CHECK_FALSE(result.error_message.empty());
}

// ============================================================================
// Files and environment
// ============================================================================

TEST_CASE("ConfigLoader: loads from a file", "[config][file]") {
    TmpDir dir("config_file");
    const auto path = dir.file("cdn-locator.toml", "[lookup]\nquery_timeout_ms = 1500\n");

    auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.lookup.query_timeout_ms == 1500);

    CHECK_FALSE(ConfigLoader::load_from_file((dir.path / "missing.toml").string()).success);
}

TEST_CASE("ConfigLoader: ${VAR} is expanded from the environment", "[config][env]") {
    ::setenv("CDN_LOCATOR_TEST_CACHE_DIR", "/tmp/cdn-cache", 1);
    auto result = ConfigLoader::load_from_string(
        "[cache]\ndirectory = \"${CDN_LOCATOR_TEST_CACHE_DIR}/ranges\"\n");
    ::unsetenv("CDN_LOCATOR_TEST_CACHE_DIR");

    REQUIRE(result.success);
    CHECK(result.config.cache.directory == "/tmp/cdn-cache/ranges");
}
