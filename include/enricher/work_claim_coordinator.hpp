#pragma once

#include "enricher/async_database.hpp"
#include "enricher/enrichment_types.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace enricher {

/**
 * ClaimedBatch - a batch of work items plus the transaction holding their locks
 *
 * The advisory locks taken while claiming are transaction-scoped, so the
 * batch owns the pooled connection with the open transaction. commit()
 * ends it and releases every lock; destroying an uncommitted batch rolls
 * back, which releases them as well. Move-only.
 */
class ClaimedBatch {
public:
    ClaimedBatch() = default;
    ClaimedBatch(AsyncDbPool::PooledConnection conn,
                 std::vector<WorkItem> items,
                 size_t skipped);
    ~ClaimedBatch();

    ClaimedBatch(ClaimedBatch&& other) noexcept;
    ClaimedBatch& operator=(ClaimedBatch&& other) noexcept;
    ClaimedBatch(const ClaimedBatch&) = delete;
    ClaimedBatch& operator=(const ClaimedBatch&) = delete;

    const std::vector<WorkItem>& items() const { return items_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    // Rows locked by the claim that were dropped because they failed to parse
    size_t skipped() const { return skipped_; }

    // True while the claim transaction is still open
    bool holds_locks() const { return conn_ != nullptr; }

    /**
     * Commits the claim transaction, releasing all locks.
     * @throws DbError if COMMIT fails (the locks are released either way)
     */
    void commit();

    void rollback() noexcept;

private:
    AsyncDbPool::PooledConnection conn_;
    std::vector<WorkItem> items_;
    size_t skipped_ = 0;
};

/**
 * WorkClaimCoordinator - hands out disjoint batches of backlog rows
 *
 * Each candidate row is locked with pg_try_advisory_xact_lock inside the
 * WHERE clause, so rows held by another in-flight transaction (this or any
 * other process) are skipped instead of waited on. Rows already present in
 * the sink, rows without a URL, and rows excluded in this process (failed
 * to parse, or their result was rejected by the sink) are never returned.
 */
class WorkClaimCoordinator {
public:
    /**
     * @param db_pool Shared connection pool
     * @param source_table Backlog table (id BIGINT, data JSONB), optionally schema-qualified
     * @param sink_table Sink table holding business_key
     * @param lock_namespace Empty to lock on the raw row id, otherwise mixed into the key
     */
    WorkClaimCoordinator(std::shared_ptr<AsyncDbPool> db_pool,
                         std::string source_table,
                         std::string sink_table,
                         std::string lock_namespace = "");

    /**
     * Claims up to @p size rows ordered by id.
     *
     * An empty batch with skipped() == 0 means the backlog is drained.
     *
     * @throws DbError on database failure; the claim transaction has been
     *         rolled back by then
     */
    ClaimedBatch claim_batch(int size, const std::string& country_filter = "");

    int64_t pending_count(const std::string& country_filter = "");
    int64_t total_count();
    int64_t completed_count();
    std::vector<std::pair<std::string, int64_t>> country_pending_counts();

    /**
     * Advisory lock key used for a backlog row id.
     *
     * With a namespace the upper 32 bits carry hashtext(namespace) and the
     * lower 32 bits the row id, so two rows collide only when their ids
     * differ by a multiple of 2^32.
     *
     * @param id_expr SQL expression yielding the row id
     * @param ns_param SQL expression yielding the namespace text (e.g. "$2")
     */
    static std::string lock_key_sql(const std::string& id_expr, const std::string& ns_param);

    // Keeps rows out of every later claim made by this coordinator
    void exclude(const std::vector<int64_t>& ids);
    size_t excluded_count() const;

private:
    std::string excluded_ids_literal() const;
    int64_t scalar_count(const std::string& sql, const std::vector<std::string>& params);

    std::shared_ptr<AsyncDbPool> db_pool_;
    std::string source_table_;
    std::string sink_table_;
    std::string lock_namespace_;

    std::string claim_sql_;

    mutable std::mutex excluded_mutex_;
    std::unordered_set<int64_t> excluded_ids_;
};

} // namespace enricher
