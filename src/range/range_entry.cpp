#include "range/range_entry.hpp"
#include "core/utils.hpp"

namespace cdnlocator {

std::vector<std::string> RangeEntry::normalize(const std::vector<std::string>& lines) {
    std::vector<std::string> result;
    result.reserve(lines.size());
    for (const auto& line : lines) {
        if (line.empty()) continue;
        auto trimmed = utils::trim(line);
        if (trimmed.empty()) continue;
        result.emplace_back(std::move(trimmed));
    }
    return result;
}

namespace {

// Shared by matches() and find_match(); canonical is ip.to_string()
bool entry_contains(std::string_view entry, const IpAddress& ip, std::string_view canonical) {
    const auto block = CidrBlock::parse(entry);
    return block ? block->contains(ip) : entry == canonical;
}

} // anonymous namespace

bool RangeEntry::matches(std::string_view entry, const IpAddress& ip) {
    return entry_contains(entry, ip, ip.to_string());
}

std::optional<size_t> RangeEntry::find_match(
    const std::vector<std::string>& entries, const IpAddress& ip,
    std::stop_token stop) {
    const auto canonical = ip.to_string();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (stop.stop_requested()) return std::nullopt;
        if (entry_contains(entries[i], ip, canonical)) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace cdnlocator
