#pragma once

#include "core/error.hpp"
#include "provider/iprovider_adapter.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cdnlocator {

// How a provider publishes its list
enum class ResponseFormat : uint8_t {
    LINES,          // plain text, one entry per line
    DELIMITED,      // plain text split on a custom delimiter
    JSON_ARRAY,     // {"<field>": ["...", ...]}
    JSON_OBJECTS,   // {"<field>": [{"<member>": "..."}, ...]}
    HTML_CODE       // text of an HTML element selected by class name
};

[[nodiscard]] inline const char* response_format_to_string(ResponseFormat format) {
    switch (format) {
        case ResponseFormat::LINES:        return "lines";
        case ResponseFormat::DELIMITED:    return "delimited";
        case ResponseFormat::JSON_ARRAY:   return "json_array";
        case ResponseFormat::JSON_OBJECTS: return "json_objects";
        case ResponseFormat::HTML_CODE:    return "html_code";
        default:                           return "unknown";
    }
}

[[nodiscard]] std::optional<ResponseFormat> parse_response_format(const std::string& name);

struct HttpSettings {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{30000};
    std::string user_agent =
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
        "(KHTML, like Gecko) Chrome/58.0.3029.110 Safari/537.3";
};

/**
 * @brief Provider adapter that GETs a URL and decodes the published list.
 *
 * Uses httplib::Client (HTTPS via OpenSSL). Connection errors, non-2xx
 * responses and payloads that do not decode are FETCH_ERRORs. Entries are
 * returned raw; CachedProvider normalizes them.
 */
class HttpProviderAdapter : public IProviderAdapter {
public:
    struct Config {
        std::string name;
        std::string url;
        ResponseFormat format = ResponseFormat::LINES;
        std::string field;             // JSON_ARRAY / JSON_OBJECTS
        std::string member;            // JSON_OBJECTS
        std::string delimiter = "\n";  // DELIMITED
        std::string selector;          // HTML_CODE class name
        size_t index = 0;              // HTML_CODE: which matching element
        HttpSettings http;
    };

    explicit HttpProviderAdapter(Config config);

    [[nodiscard]] Result<std::vector<std::string>> fetch() override;
    [[nodiscard]] std::string name() const override { return config_.name; }

    [[nodiscard]] const Config& config() const { return config_; }

    /// Decode a response body according to config.format
    [[nodiscard]] static Result<std::vector<std::string>> parse_body(
        const Config& config, const std::string& body);

    /// Split "https://host[:port]/path?q" into {"https://host[:port]", "/path?q"}
    [[nodiscard]] static std::optional<std::pair<std::string, std::string>> split_url(
        const std::string& url);

    /// Text content of the index-th element whose class list contains css_class
    [[nodiscard]] static std::optional<std::string> extract_html_text(
        const std::string& html, const std::string& css_class, size_t index);

private:
    Config config_;
};

} // namespace cdnlocator
