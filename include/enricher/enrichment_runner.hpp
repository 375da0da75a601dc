#pragma once

#include "enricher/browser.hpp"
#include "enricher/contact_extractor.hpp"
#include "enricher/enricher_context.hpp"
#include "enricher/enrichment_types.hpp"
#include "enricher/server_registry.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace enricher {

struct RunSummary {
    uint64_t batches = 0;
    uint64_t processed = 0;
    uint64_t written = 0;
    uint64_t write_failures = 0;
    uint64_t rejected = 0;          // failed rows excluded from later claims
    uint64_t claim_failures = 0;
    bool drained = false;           // backlog exhausted (as opposed to limit or stop)
};

/**
 * EnrichmentRunner - the claim -> fetch -> extract -> write loop
 *
 * Each iteration claims a batch, fetches every item concurrently through
 * the browser pool, assembles records in id order, writes them with one
 * batch upsert and commits the claim. Runs until the backlog is drained,
 * the row limit is reached or a stop is requested. Claim failures pause
 * and retry; too many in a row end the run with an exception.
 */
class EnrichmentRunner {
public:
    // The claim transaction holds one connection for the whole batch
    static constexpr size_t MIN_DB_CONNECTIONS = 2;

    explicit EnrichmentRunner(EnricherContext& ctx);

    /**
     * @throws std::invalid_argument if the database pool has fewer than MIN_DB_CONNECTIONS
     * @throws std::runtime_error after claim_max_failures consecutive claim failures
     */
    RunSummary run();

    // Fetches and extracts each item; the result keeps the input order
    std::vector<EnrichmentRecord> enrich_items(const std::vector<WorkItem>& items);

    // Snapshot for heartbeats
    ServerStats stats() const;

    static EnrichmentRecord build_record(const WorkItem& item,
                                         const PageResult& page,
                                         const ExtractedContacts& contacts,
                                         const std::string& server_id);

private:
    void record_batch(const std::vector<EnrichmentRecord>& records);
    void set_status(const std::string& status, const std::string& task);

    // Sleeps in short steps so a stop request is honoured promptly
    void pause(int delay_ms);

    EnricherContext& ctx_;

    mutable std::mutex stats_mutex_;
    ServerStats stats_;
};

} // namespace enricher
