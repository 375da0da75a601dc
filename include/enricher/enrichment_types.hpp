#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace enricher {

// ============================================================================
// Shared Enrichment Types
// Used by the claim coordinator, the result sink and the runner
// ============================================================================

// One backlog row. Read-only to this service.
struct WorkItem {
    int64_t id = 0;
    std::string source_url;
    std::string business_key;
    std::string name;
    std::string category;
    std::string country = "XX";
    std::string address;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<int> review_count;
    std::optional<double> review_rating;
    nlohmann::json raw_payload;
};

struct EnrichmentRecord {
    std::string business_key;
    int64_t source_id = 0;

    // Descriptive fields copied from the work item
    std::string business_name;
    std::string business_category;
    std::string business_website;
    std::string country = "XX";
    std::string address;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<int> review_count;
    std::optional<double> review_rating;

    // Scraped contact data
    std::vector<std::string> emails;
    std::vector<std::string> phones;
    std::vector<std::string> whatsapp;
    std::string facebook;
    std::string instagram;
    std::string linkedin;
    std::string tiktok;
    std::string youtube;
    nlohmann::json validated_emails;      // null when absent
    nlohmann::json validated_whatsapp;

    std::string final_url;
    bool was_redirected = false;
    std::string status;                   // "success", "no_contacts_found", "failed"
    std::string error;
    double processing_time_seconds = 0.0;
    int pages_scraped = 0;
    std::string scrape_server;
};

// Result of one sink write (single row or batch).
struct WriteReport {
    size_t written = 0;
    std::vector<std::string> failed_keys;
    // Source ids of failed records that a retry cannot fix
    std::vector<int64_t> rejected_ids;

    bool ok() const { return failed_keys.empty(); }
};

struct SinkStats {
    int64_t total = 0;
    int64_t with_email = 0;
    int64_t with_phone = 0;
    int64_t with_whatsapp = 0;
    int64_t countries = 0;
    int64_t successful = 0;
    int64_t failed = 0;
};

struct CountryStats {
    std::string country;
    int64_t total = 0;
    int64_t with_email = 0;
    int64_t with_phone = 0;
    int64_t with_whatsapp = 0;
};

/**
 * Normalizes a country value to an upper-case ISO-3166 alpha-2 code.
 * Anything that is not two ASCII letters after trimming becomes "XX".
 */
std::string normalize_country(const std::string& value);

/**
 * Builds a WorkItem from a backlog row.
 *
 * Returns std::nullopt when the payload is not a JSON object or lacks a
 * non-empty "web_site" (source URL) or "link" (business key).
 */
std::optional<WorkItem> parse_work_item(int64_t id, const std::string& payload);

} // namespace enricher
