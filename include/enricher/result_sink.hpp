#pragma once

#include "enricher/async_database.hpp"
#include "enricher/enrichment_types.hpp"
#include "enricher/retry_policy.hpp"
#include <memory>
#include <string>
#include <vector>

namespace enricher {

/**
 * ResultSink - idempotent write-back of enrichment results
 *
 * Rows are keyed by business_key and written with INSERT ... ON CONFLICT.
 * On conflict:
 * - emails, whatsapp: new values are appended to the stored array (duplicates kept)
 * - facebook, instagram, linkedin: stored value wins unless it is NULL
 * - phones, tiktok, youtube, validation blobs, status/error/timing: overwritten
 * - *_count: recomputed from the resulting arrays
 * - scrape_count: incremented by one
 *
 * Transient failures are retried by the RetryPolicy. Neither upsert path
 * throws; failures are logged and reported per key.
 */
class ResultSink {
public:
    // Number of bind parameters per row in the upsert statement
    static constexpr int PARAMS_PER_ROW = 28;

    ResultSink(std::shared_ptr<AsyncDbPool> db_pool,
               std::string sink_table,
               RetryPolicy retry_policy = RetryPolicy(),
               int max_batch_rows = 200);

    /**
     * Upserts one record.
     * @return true when the row was written
     */
    bool upsert(const EnrichmentRecord& record);

    /**
     * Upserts many records with one multi-row statement per chunk.
     *
     * A chunk that fails with a non-transient error is replayed row by row
     * so that one bad record does not sink the others. Records that fail
     * for a non-transient reason, or carry no business key, are listed in
     * rejected_ids.
     */
    WriteReport upsert_batch(const std::vector<EnrichmentRecord>& records);

    /**
     * Checks that the sink table exists with the columns the upsert writes.
     * @throws std::runtime_error naming the missing table or columns
     */
    void verify_schema();

    SinkStats total_stats();
    std::vector<CountryStats> country_stats(int limit = 20);

    /**
     * Splits records into waves in which every business_key appears at most
     * once, preserving order. PostgreSQL rejects an ON CONFLICT statement
     * that touches the same key twice.
     */
    static std::vector<std::vector<const EnrichmentRecord*>> split_duplicate_keys(
        const std::vector<const EnrichmentRecord*>& records);

    // Bind parameters for one record, in upsert column order
    static std::vector<std::string> record_params(const EnrichmentRecord& record);

private:
    enum class WriteOutcome { Written, Transient, Rejected };

    WriteOutcome write_one(const EnrichmentRecord& record);
    std::string build_upsert_sql(size_t rows) const;
    void write_rows(PGconn* conn, const std::vector<const EnrichmentRecord*>& rows);
    void write_chunk(const std::vector<const EnrichmentRecord*>& chunk);

    std::shared_ptr<AsyncDbPool> db_pool_;
    std::string sink_table_;
    RetryPolicy retry_policy_;
    size_t max_batch_rows_;
};

} // namespace enricher
