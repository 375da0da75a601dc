#include "enricher/enrichment_types.hpp"
#include <cctype>
#include <cstdlib>
#include <limits>

namespace enricher {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Scraped payloads mix numbers and numeric strings for the same key.
std::string get_string(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return "";
    if (it->is_string()) return trim(it->get<std::string>());
    if (it->is_number() || it->is_boolean()) return it->dump();
    return "";
}

std::optional<double> get_double(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        const std::string s = it->get<std::string>();
        char* end = nullptr;
        double v = std::strtod(s.c_str(), &end);
        if (end != s.c_str() && trim(end).empty()) return v;
    }
    return std::nullopt;
}

std::optional<int> get_int(const nlohmann::json& obj, const char* key) {
    auto v = get_double(obj, key);
    if (!v || !(*v >= std::numeric_limits<int>::min() && *v <= std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

} // namespace

std::string normalize_country(const std::string& value) {
    std::string code = trim(value);
    if (code.size() < 2) return "XX";
    code = code.substr(0, 2);
    for (auto& c : code) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return "XX";
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return code;
}

std::optional<WorkItem> parse_work_item(int64_t id, const std::string& payload) {
    nlohmann::json data = nlohmann::json::parse(payload, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return std::nullopt;
    }

    WorkItem item;
    item.id = id;
    item.source_url = get_string(data, "web_site");
    item.business_key = get_string(data, "link");
    if (item.source_url.empty() || item.business_key.empty()) {
        return std::nullopt;
    }

    item.name = get_string(data, "title");
    item.category = get_string(data, "category");
    item.address = get_string(data, "address");

    auto addr = data.find("complete_address");
    if (addr != data.end() && addr->is_object()) {
        item.country = normalize_country(get_string(*addr, "country"));
    } else {
        item.country = "XX";
    }

    item.latitude = get_double(data, "latitude");
    // Upstream scraper spells it "longtitude"; accept both.
    item.longitude = get_double(data, "longtitude");
    if (!item.longitude) {
        item.longitude = get_double(data, "longitude");
    }
    item.review_count = get_int(data, "review_count");
    item.review_rating = get_double(data, "review_rating");
    item.raw_payload = std::move(data);
    return item;
}

} // namespace enricher
