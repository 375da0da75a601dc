#include "enricher/enrichment_runner.hpp"
#include "enricher/async_database.hpp"
#include "enricher/browser_pool.hpp"
#include "enricher/config.hpp"
#include "enricher/result_sink.hpp"
#include "enricher/work_claim_coordinator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

namespace enricher {

namespace {

nlohmann::json raw_blob(const std::vector<std::string>& values) {
    if (values.empty()) {
        return nullptr;
    }
    return nlohmann::json{{"raw", values}};
}

} // namespace

EnrichmentRunner::EnrichmentRunner(EnricherContext& ctx) : ctx_(ctx) {}

EnrichmentRecord EnrichmentRunner::build_record(const WorkItem& item,
                                                const PageResult& page,
                                                const ExtractedContacts& contacts,
                                                const std::string& server_id) {
    EnrichmentRecord record;
    record.business_key = item.business_key;
    record.source_id = item.id;
    record.business_name = item.name;
    record.business_category = item.category;
    record.business_website = item.source_url;
    record.country = item.country;
    record.address = item.address;
    record.latitude = item.latitude;
    record.longitude = item.longitude;
    record.review_count = item.review_count;
    record.review_rating = item.review_rating;

    record.final_url = page.final_url;
    record.was_redirected = page.was_redirected();
    record.pages_scraped = page.pages_scraped;
    record.processing_time_seconds = page.load_time_seconds;
    record.scrape_server = server_id;

    if (!page.ok()) {
        record.status = "failed";
        record.error = page.error.empty() ? "fetch failed" : page.error;
        return record;
    }

    record.emails = contacts.emails;
    record.phones = contacts.phones;
    record.whatsapp = contacts.whatsapp;
    record.facebook = contacts.facebook;
    record.instagram = contacts.instagram;
    record.linkedin = contacts.linkedin;
    record.tiktok = contacts.tiktok;
    record.youtube = contacts.youtube;
    record.validated_emails = raw_blob(contacts.emails);
    record.validated_whatsapp = raw_blob(contacts.whatsapp);

    record.status = contacts.has_contacts() ? "success" : "no_contacts_found";
    return record;
}

std::vector<EnrichmentRecord> EnrichmentRunner::enrich_items(const std::vector<WorkItem>& items) {
    std::vector<std::future<PageResult>> pages;
    pages.reserve(items.size());
    for (const auto& item : items) {
        pages.push_back(ctx_.browser_pool->scrape_async(item.source_url));
    }

    std::vector<EnrichmentRecord> records;
    records.reserve(items.size());

    for (size_t i = 0; i < items.size(); ++i) {
        PageResult page = pages[i].get();

        ExtractedContacts contacts;
        if (page.ok()) {
            auto start = std::chrono::steady_clock::now();
            contacts = ctx_.extractor->extract(page.html, page.final_url.empty() ? page.url : page.final_url);
            page.load_time_seconds += std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start).count();
        }

        records.push_back(build_record(items[i], page, contacts, ctx_.config.server.server_id));

        const auto& record = records.back();
        if (record.status == "failed") {
            spdlog::debug("[EnrichmentRunner] {} failed: {}", items[i].source_url, record.error);
        } else {
            spdlog::debug("[EnrichmentRunner] {} -> {} emails, {} phones, {} whatsapp",
                          items[i].source_url, record.emails.size(), record.phones.size(),
                          record.whatsapp.size());
        }
    }

    return records;
}

RunSummary EnrichmentRunner::run() {
    const auto& claim = ctx_.config.claim;
    RunSummary summary;
    int consecutive_failures = 0;

    if (ctx_.db_pool->size() < MIN_DB_CONNECTIONS) {
        throw std::invalid_argument("Database pool has " + std::to_string(ctx_.db_pool->size()) +
                                    " connections, at least " + std::to_string(MIN_DB_CONNECTIONS) +
                                    " are needed to write results while a claim is held");
    }

    spdlog::info("[EnrichmentRunner] Starting: batch_size={}, limit={}, country={}",
                 claim.batch_size, claim.row_limit,
                 claim.country_filter.empty() ? "all" : claim.country_filter);

    while (!ctx_.stop_requested.load()) {
        int size = claim.batch_size;
        if (claim.row_limit > 0) {
            if (summary.processed >= static_cast<uint64_t>(claim.row_limit)) {
                spdlog::info("[EnrichmentRunner] Row limit {} reached", claim.row_limit);
                break;
            }
            size = std::min<int>(size, claim.row_limit - static_cast<int>(summary.processed));
        }

        set_status("online", "claiming");

        ClaimedBatch batch;
        try {
            batch = ctx_.coordinator->claim_batch(size, claim.country_filter);
            consecutive_failures = 0;
        } catch (const DbError& e) {
            ++summary.claim_failures;
            ++consecutive_failures;
            spdlog::error("[EnrichmentRunner] Claim attempt {}/{} failed: {}",
                          consecutive_failures, claim.max_consecutive_failures, e.what());
            if (consecutive_failures >= claim.max_consecutive_failures) {
                set_status("error", "");
                throw std::runtime_error("Giving up after " + std::to_string(consecutive_failures) +
                                         " consecutive claim failures: " + e.what());
            }
            set_status("paused", "waiting for database");
            pause(claim.retry_delay_ms);
            continue;
        }

        if (batch.empty()) {
            if (batch.skipped() > 0) {
                // Only unparseable rows were locked; they are excluded from now on
                try {
                    batch.commit();
                } catch (const DbError& e) {
                    spdlog::warn("[EnrichmentRunner] Claim commit failed: {}", e.what());
                }
                continue;
            }
            summary.drained = true;
            spdlog::info("[EnrichmentRunner] Backlog drained");
            break;
        }

        ++summary.batches;
        set_status("online", "processing batch of " + std::to_string(batch.size()));

        auto batch_start = std::chrono::steady_clock::now();
        auto records = enrich_items(batch.items());

        set_status("online", "writing batch");
        WriteReport report = ctx_.sink->upsert_batch(records);
        for (const auto& key : report.failed_keys) {
            spdlog::error("[EnrichmentRunner] Result for {} was not written", key);
        }
        // Rejected rows would come back as the lowest ids of every later claim
        ctx_.coordinator->exclude(report.rejected_ids);

        try {
            batch.commit();
        } catch (const DbError& e) {
            // The transaction is gone either way, so the locks are released
            spdlog::warn("[EnrichmentRunner] Claim commit failed: {}", e.what());
        }

        summary.processed += records.size();
        summary.written += report.written;
        summary.write_failures += report.failed_keys.size();
        summary.rejected += report.rejected_ids.size();
        record_batch(records);

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - batch_start).count();
        spdlog::info("[EnrichmentRunner] Batch {} done: {} items, {} written, {} failed in {:.1f}s",
                     summary.batches, records.size(), report.written, report.failed_keys.size(), elapsed);
    }

    set_status("online", "");
    spdlog::info("[EnrichmentRunner] Finished: {} batches, {} processed, {} written, {} write failures",
                 summary.batches, summary.processed, summary.written, summary.write_failures);
    return summary;
}

ServerStats EnrichmentRunner::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void EnrichmentRunner::record_batch(const std::vector<EnrichmentRecord>& records) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    for (const auto& record : records) {
        ++stats_.processed;
        if (record.status == "failed") {
            ++stats_.failed;
        } else {
            ++stats_.success;
        }
        stats_.emails_found += record.emails.size();
        stats_.phones_found += record.phones.size();
        stats_.whatsapp_found += record.whatsapp.size();
        stats_.total_processing_seconds += record.processing_time_seconds;
    }
}

void EnrichmentRunner::set_status(const std::string& status, const std::string& task) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.status = status;
    stats_.current_task = task;
}

void EnrichmentRunner::pause(int delay_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
    while (!ctx_.stop_requested.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

} // namespace enricher
