#include "provider/http_provider_adapter.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <cctype>
#include <format>
#include <sstream>
#include <unordered_map>

namespace cdnlocator {

std::optional<ResponseFormat> parse_response_format(const std::string& name) {
    static const std::unordered_map<std::string, ResponseFormat> lookup = {
        {"lines",        ResponseFormat::LINES},
        {"delimited",    ResponseFormat::DELIMITED},
        {"json_array",   ResponseFormat::JSON_ARRAY},
        {"json_objects", ResponseFormat::JSON_OBJECTS},
        {"html_code",    ResponseFormat::HTML_CODE},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

HttpProviderAdapter::HttpProviderAdapter(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// URL Handling
// ============================================================================

std::optional<std::pair<std::string, std::string>> HttpProviderAdapter::split_url(
    const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    const std::string scheme = utils::to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") return std::nullopt;

    const auto host_start = scheme_end + 3;
    const auto path_start = url.find_first_of("/?", host_start);
    const std::string host = url.substr(host_start,
        path_start == std::string::npos ? std::string::npos : path_start - host_start);
    if (host.empty()) return std::nullopt;

    std::string path = path_start == std::string::npos ? "/" : url.substr(path_start);
    if (path.front() == '?') path.insert(0, "/");

    return std::make_pair(scheme + "://" + host, std::move(path));
}

// ============================================================================
// HTML Extraction
// ============================================================================

namespace {

std::string decode_entities(const std::string& text) {
    static const std::unordered_map<std::string, std::string> named = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""},
        {"apos", "'"}, {"nbsp", " "},
    };

    std::string result;
    result.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            const auto semi = text.find(';', i + 1);
            if (semi != std::string::npos && semi - i <= 10) {
                const std::string entity = text.substr(i + 1, semi - i - 1);
                if (const auto it = named.find(entity); it != named.end()) {
                    result += it->second;
                    i = semi + 1;
                    continue;
                }
                if (entity.size() > 1 && entity[0] == '#') {
                    const auto code = utils::try_parse_int<int>(std::string_view(entity).substr(1));
                    if (code && *code > 0 && *code < 128) {
                        result += static_cast<char>(*code);
                        i = semi + 1;
                        continue;
                    }
                }
            }
        }
        result += text[i++];
    }
    return result;
}

bool class_list_contains(std::string_view class_attr, const std::string& css_class) {
    std::istringstream iss{std::string(class_attr)};
    std::string token;
    while (iss >> token) {
        if (token == css_class) return true;
    }
    return false;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

struct HtmlTag {
    std::string name;          // lower-case; empty for comments and declarations
    std::string_view attrs;    // text between the name and '>'
    size_t begin = 0;          // '<'
    size_t end = 0;            // one past '>'
    bool closing = false;
    bool self_closing = false;
};

// Next markup construct at or after pos. A '<' that does not start a tag is text.
std::optional<HtmlTag> next_tag(std::string_view html, size_t pos) {
    while (true) {
        const auto lt = html.find('<', pos);
        if (lt == std::string_view::npos) return std::nullopt;

        HtmlTag tag;
        tag.begin = lt;

        if (html.substr(lt, 4) == "<!--") {
            const auto close = html.find("-->", lt + 4);
            tag.end = close == std::string_view::npos ? html.size() : close + 3;
            return tag;
        }

        const auto gt = html.find('>', lt + 1);
        if (gt == std::string_view::npos) return std::nullopt;

        size_t i = lt + 1;
        if (html[i] == '!' || html[i] == '?') {
            tag.end = gt + 1;
            return tag;
        }
        if (html[i] == '/') {
            tag.closing = true;
            ++i;
        }
        const size_t name_start = i;
        if (i < gt && std::isalpha(static_cast<unsigned char>(html[i]))) {
            while (i < gt && (std::isalnum(static_cast<unsigned char>(html[i])) || html[i] == '-')) ++i;
        }
        if (i == name_start) {
            pos = lt + 1;
            continue;
        }

        tag.name = utils::to_lower(std::string(html.substr(name_start, i - name_start)));
        tag.attrs = html.substr(i, gt - i);
        tag.self_closing = !tag.attrs.empty() && tag.attrs.back() == '/';
        tag.end = gt + 1;
        return tag;
    }
}

// Value of the class attribute (quoted or bare), if present
std::optional<std::string_view> class_attribute(std::string_view attrs) {
    const std::string lower = utils::to_lower(std::string(attrs));
    size_t pos = 0;
    while ((pos = lower.find("class", pos)) != std::string::npos) {
        const bool at_boundary = pos == 0 || is_space(lower[pos - 1]);
        size_t i = pos + 5;
        pos = i;
        if (!at_boundary) continue;

        while (i < attrs.size() && is_space(attrs[i])) ++i;
        if (i >= attrs.size() || attrs[i] != '=') continue;
        ++i;
        while (i < attrs.size() && is_space(attrs[i])) ++i;
        if (i >= attrs.size()) return std::nullopt;

        const char quote = attrs[i];
        if (quote == '"' || quote == '\'') {
            const auto close = attrs.find(quote, i + 1);
            if (close == std::string_view::npos) return std::nullopt;
            return attrs.substr(i + 1, close - i - 1);
        }
        size_t j = i;
        while (j < attrs.size() && !is_space(attrs[j]) && attrs[j] != '/') ++j;
        return attrs.substr(i, j - i);
    }
    return std::nullopt;
}

// Drop markup, turning <br> into a line break
std::string strip_tags(std::string_view fragment) {
    std::string text;
    text.reserve(fragment.size());
    size_t pos = 0;
    while (pos < fragment.size()) {
        const auto tag = next_tag(fragment, pos);
        if (!tag) {
            text.append(fragment.substr(pos));
            break;
        }
        text.append(fragment.substr(pos, tag->begin - pos));
        if (tag->name == "br") text += '\n';
        pos = tag->end;
    }
    return text;
}

} // anonymous namespace

std::optional<std::string> HttpProviderAdapter::extract_html_text(
    const std::string& html, const std::string& css_class, size_t index) {
    const std::string_view doc(html);

    size_t seen = 0;
    size_t pos = 0;
    while (const auto tag = next_tag(doc, pos)) {
        pos = tag->end;
        if (tag->name.empty() || tag->closing) continue;

        const auto classes = class_attribute(tag->attrs);
        if (!classes || !class_list_contains(*classes, css_class)) continue;
        if (seen++ != index) continue;

        if (tag->self_closing) return std::string{};

        // Find the matching close tag, tracking nested tags of the same name
        int depth = 1;
        size_t content_end = doc.size();
        size_t scan = tag->end;
        while (const auto inner = next_tag(doc, scan)) {
            scan = inner->end;
            if (inner->name != tag->name || inner->self_closing) continue;
            depth += inner->closing ? -1 : 1;
            if (depth == 0) {
                content_end = inner->begin;
                break;
            }
        }

        return decode_entities(strip_tags(doc.substr(tag->end, content_end - tag->end)));
    }
    return std::nullopt;
}

// ============================================================================
// Body Decoding
// ============================================================================

Result<std::vector<std::string>> HttpProviderAdapter::parse_body(
    const Config& config, const std::string& body) {
    using R = Result<std::vector<std::string>>;

    switch (config.format) {
        case ResponseFormat::LINES:
            return R::ok(utils::split(body, '\n'));

        case ResponseFormat::DELIMITED:
            return R::ok(utils::split(std::string_view(body), std::string_view(config.delimiter)));

        case ResponseFormat::HTML_CODE: {
            auto text = extract_html_text(body, config.selector, config.index);
            if (!text) {
                return R::error(ErrorCategory::FETCH_ERROR,
                    std::format("[{}] no element with class '{}' at index {}",
                        config.name, config.selector, config.index));
            }
            return R::ok(utils::split(*text, '\n'));
        }

        case ResponseFormat::JSON_ARRAY:
        case ResponseFormat::JSON_OBJECTS:
            break;
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return R::error(ErrorCategory::FETCH_ERROR,
            std::format("[{}] invalid JSON: {}", config.name, e.what()));
    }

    if (!doc.is_object()) {
        return R::error(ErrorCategory::FETCH_ERROR,
            std::format("[{}] JSON document is not an object", config.name));
    }
    const auto field = doc.find(config.field);
    if (field == doc.end() || field->is_null()) {
        // Absent list decodes as empty
        return R::ok({});
    }
    if (!field->is_array()) {
        return R::error(ErrorCategory::FETCH_ERROR,
            std::format("[{}] field '{}' is not an array", config.name, config.field));
    }

    std::vector<std::string> entries;
    entries.reserve(field->size());
    for (const auto& elem : *field) {
        if (config.format == ResponseFormat::JSON_ARRAY) {
            if (!elem.is_string()) {
                return R::error(ErrorCategory::FETCH_ERROR,
                    std::format("[{}] field '{}' holds a non-string entry", config.name, config.field));
            }
            entries.push_back(elem.get<std::string>());
            continue;
        }

        if (!elem.is_object()) {
            return R::error(ErrorCategory::FETCH_ERROR,
                std::format("[{}] field '{}' holds a non-object entry", config.name, config.field));
        }
        // Mixed IPv4/IPv6 lists leave the other member out
        const auto member = elem.find(config.member);
        if (member != elem.end() && member->is_string()) {
            entries.push_back(member->get<std::string>());
        }
    }
    return R::ok(std::move(entries));
}

// ============================================================================
// Fetch
// ============================================================================

Result<std::vector<std::string>> HttpProviderAdapter::fetch() {
    using R = Result<std::vector<std::string>>;

    const auto parts = split_url(config_.url);
    if (!parts) {
        return R::error(ErrorCategory::FETCH_ERROR,
            std::format("[{}] invalid URL: {}", config_.name, config_.url));
    }
    const auto& [base, path] = *parts;

    httplib::Client cli(base);
    cli.set_connection_timeout(config_.http.connect_timeout);
    cli.set_read_timeout(config_.http.read_timeout);
    cli.set_follow_location(true);

    httplib::Headers headers;
    if (!config_.http.user_agent.empty()) {
        headers.emplace("User-Agent", config_.http.user_agent);
    }

    utils::Timer timer;
    const auto res = cli.Get(path, headers);
    if (!res) {
        return R::error(ErrorCategory::FETCH_ERROR,
            std::format("[{}] GET {} failed: {}", config_.name, config_.url,
                httplib::to_string(res.error())));
    }

    if (res->status < 200 || res->status >= 300) {
        return R::error(ErrorCategory::FETCH_ERROR,
            std::format("[{}] GET {} returned HTTP {}", config_.name, config_.url, res->status));
    }

    utils::log::debug(std::format("[{}] fetched {} bytes in {}ms",
        config_.name, res->body.size(), timer.elapsed_ms().count()));

    return parse_body(config_, res->body);
}

} // namespace cdnlocator
