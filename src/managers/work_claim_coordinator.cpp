#include "enricher/work_claim_coordinator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>

namespace enricher {

// --- ClaimedBatch ---

ClaimedBatch::ClaimedBatch(AsyncDbPool::PooledConnection conn,
                           std::vector<WorkItem> items,
                           size_t skipped)
    : conn_(std::move(conn)), items_(std::move(items)), skipped_(skipped) {}

ClaimedBatch::~ClaimedBatch() {
    rollback();
}

ClaimedBatch::ClaimedBatch(ClaimedBatch&& other) noexcept
    : conn_(std::move(other.conn_)),
      items_(std::move(other.items_)),
      skipped_(other.skipped_) {
    other.items_.clear();
    other.skipped_ = 0;
}

ClaimedBatch& ClaimedBatch::operator=(ClaimedBatch&& other) noexcept {
    if (this != &other) {
        rollback();
        conn_ = std::move(other.conn_);
        items_ = std::move(other.items_);
        skipped_ = other.skipped_;
        other.items_.clear();
        other.skipped_ = 0;
    }
    return *this;
}

void ClaimedBatch::commit() {
    if (!conn_) return;
    // Returning the connection also returns the locks, even if COMMIT throws:
    // the pool rolls back anything still open on release.
    auto conn = std::move(conn_);
    execCommand(conn.get(), "COMMIT");
    spdlog::debug("[WorkClaimCoordinator] Released {} claim locks (commit)", items_.size());
}

void ClaimedBatch::rollback() noexcept {
    if (!conn_) return;
    auto conn = std::move(conn_);
    try {
        execCommand(conn.get(), "ROLLBACK");
        spdlog::debug("[WorkClaimCoordinator] Released {} claim locks (rollback)", items_.size());
    } catch (const std::exception& e) {
        spdlog::warn("[WorkClaimCoordinator] Rollback failed: {}", e.what());
    }
}

// --- WorkClaimCoordinator ---

std::string WorkClaimCoordinator::lock_key_sql(const std::string& id_expr, const std::string& ns_param) {
    return "CASE WHEN " + ns_param + " = '' THEN " + id_expr +
           " ELSE ((hashtext(" + ns_param + ")::bigint << 32) | (" + id_expr +
           " & 4294967295::bigint)) END";
}

WorkClaimCoordinator::WorkClaimCoordinator(std::shared_ptr<AsyncDbPool> db_pool,
                                           std::string source_table,
                                           std::string sink_table,
                                           std::string lock_namespace)
    : db_pool_(std::move(db_pool)),
      source_table_(require_identifier(source_table)),
      sink_table_(require_identifier(sink_table)),
      lock_namespace_(std::move(lock_namespace)) {

    // The lock attempt sits in the outer query so that it only runs on rows
    // that passed every filter, pulled in id order until the LIMIT is met.
    // OFFSET 0 keeps the planner from flattening the subquery.
    //   $1 limit, $2 lock namespace, $3 country filter, $4 skipped ids
    claim_sql_ =
        "SELECT c.id, c.data::text FROM ("
        "  SELECT r.id, r.data FROM " + source_table_ + " r"
        "  WHERE r.data->>'web_site' IS NOT NULL"
        "    AND btrim(r.data->>'web_site') <> ''"
        "    AND NOT EXISTS (SELECT 1 FROM " + sink_table_ + " s"
        "                    WHERE s.business_key = r.data->>'link')"
        "    AND ($3 = '' OR upper(left(r.data->'complete_address'->>'country', 2)) = $3)"
        "    AND NOT (r.id = ANY($4::bigint[]))"
        "  ORDER BY r.id"
        "  OFFSET 0"
        ") c "
        "WHERE pg_try_advisory_xact_lock(" + lock_key_sql("c.id", "$2") + ") "
        "LIMIT $1";

    spdlog::info("[WorkClaimCoordinator] Claiming from {} (sink {}, lock namespace '{}')",
                 source_table_, sink_table_, lock_namespace_);
}

void WorkClaimCoordinator::exclude(const std::vector<int64_t>& ids) {
    std::lock_guard<std::mutex> lock(excluded_mutex_);
    for (int64_t id : ids) {
        if (excluded_ids_.insert(id).second) {
            spdlog::warn("[WorkClaimCoordinator] Excluding row {} from further claims", id);
        }
    }
}

size_t WorkClaimCoordinator::excluded_count() const {
    std::lock_guard<std::mutex> lock(excluded_mutex_);
    return excluded_ids_.size();
}

std::string WorkClaimCoordinator::excluded_ids_literal() const {
    std::lock_guard<std::mutex> lock(excluded_mutex_);
    std::string out = "{";
    bool first = true;
    for (int64_t id : excluded_ids_) {
        if (!first) out += ',';
        out += std::to_string(id);
        first = false;
    }
    out += '}';
    return out;
}

ClaimedBatch WorkClaimCoordinator::claim_batch(int size, const std::string& country_filter) {
    if (size <= 0) {
        return ClaimedBatch();
    }

    std::string country;
    if (!country_filter.empty()) {
        country = normalize_country(country_filter);
    }

    auto conn = db_pool_->acquire();

    try {
        execCommand(conn.get(), "BEGIN");
        // Processing a batch can outlast the pool's idle-in-transaction timeout;
        // the locks must survive until commit.
        execCommand(conn.get(), "SET LOCAL idle_in_transaction_session_timeout = 0");

        sendQueryParamsAsync(conn.get(), claim_sql_, {
            std::to_string(size),
            lock_namespace_,
            country,
            excluded_ids_literal()
        });
        auto result = getTuplesResult(conn.get());

        int num_rows = PQntuples(result.get());
        std::vector<WorkItem> items;
        items.reserve(num_rows);
        size_t skipped = 0;

        for (int i = 0; i < num_rows; ++i) {
            int64_t id = std::strtoll(PQgetvalue(result.get(), i, 0), nullptr, 10);
            auto item = parse_work_item(id, PQgetvalue(result.get(), i, 1));
            if (!item) {
                spdlog::warn("[WorkClaimCoordinator] Skipping row {}: missing URL or business key", id);
                std::lock_guard<std::mutex> lock(excluded_mutex_);
                excluded_ids_.insert(id);
                ++skipped;
                continue;
            }
            items.push_back(std::move(*item));
        }

        std::sort(items.begin(), items.end(),
                  [](const WorkItem& a, const WorkItem& b) { return a.id < b.id; });

        if (num_rows == 0) {
            execCommand(conn.get(), "COMMIT");
            spdlog::debug("[WorkClaimCoordinator] Nothing to claim");
            return ClaimedBatch();
        }

        spdlog::info("[WorkClaimCoordinator] Claimed {} rows ({} skipped), holding locks",
                     items.size(), skipped);
        return ClaimedBatch(std::move(conn), std::move(items), skipped);

    } catch (const std::exception& e) {
        spdlog::error("[WorkClaimCoordinator] Claim failed: {}", e.what());
        if (PQstatus(conn.get()) == CONNECTION_OK && PQtransactionStatus(conn.get()) != PQTRANS_IDLE) {
            try {
                execCommand(conn.get(), "ROLLBACK");
            } catch (const std::exception& rollback_error) {
                spdlog::warn("[WorkClaimCoordinator] Rollback after claim failure failed: {}",
                             rollback_error.what());
            }
        }
        throw;
    }
}

int64_t WorkClaimCoordinator::scalar_count(const std::string& sql, const std::vector<std::string>& params) {
    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(), sql, params);
    auto result = getTuplesResult(conn.get());
    if (PQntuples(result.get()) == 0 || PQgetisnull(result.get(), 0, 0)) {
        return 0;
    }
    return std::strtoll(PQgetvalue(result.get(), 0, 0), nullptr, 10);
}

int64_t WorkClaimCoordinator::pending_count(const std::string& country_filter) {
    std::string country = country_filter.empty() ? "" : normalize_country(country_filter);
    return scalar_count(
        "SELECT COUNT(*) FROM " + source_table_ + " r "
        "WHERE r.data->>'web_site' IS NOT NULL AND btrim(r.data->>'web_site') <> '' "
        "  AND NOT EXISTS (SELECT 1 FROM " + sink_table_ + " s WHERE s.business_key = r.data->>'link') "
        "  AND ($1 = '' OR upper(left(r.data->'complete_address'->>'country', 2)) = $1)",
        {country});
}

int64_t WorkClaimCoordinator::total_count() {
    return scalar_count(
        "SELECT COUNT(*) FROM " + source_table_ + " r "
        "WHERE r.data->>'web_site' IS NOT NULL AND btrim(r.data->>'web_site') <> ''",
        {});
}

int64_t WorkClaimCoordinator::completed_count() {
    return scalar_count(
        "SELECT COUNT(*) FROM " + source_table_ + " r "
        "JOIN " + sink_table_ + " s ON s.business_key = r.data->>'link'",
        {});
}

std::vector<std::pair<std::string, int64_t>> WorkClaimCoordinator::country_pending_counts() {
    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(),
        "SELECT COALESCE(upper(left(r.data->'complete_address'->>'country', 2)), 'XX') AS country, "
        "       COUNT(*) "
        "FROM " + source_table_ + " r "
        "WHERE r.data->>'web_site' IS NOT NULL AND btrim(r.data->>'web_site') <> '' "
        "  AND NOT EXISTS (SELECT 1 FROM " + sink_table_ + " s WHERE s.business_key = r.data->>'link') "
        "GROUP BY 1 ORDER BY 2 DESC",
        {});
    auto result = getTuplesResult(conn.get());

    std::vector<std::pair<std::string, int64_t>> counts;
    int num_rows = PQntuples(result.get());
    counts.reserve(num_rows);
    for (int i = 0; i < num_rows; ++i) {
        counts.emplace_back(PQgetvalue(result.get(), i, 0),
                            std::strtoll(PQgetvalue(result.get(), i, 1), nullptr, 10));
    }
    return counts;
}

} // namespace enricher
