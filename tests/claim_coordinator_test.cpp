/**
 * Work Claim Coordinator Test
 *
 * Runs against a scratch schema (requires PG_HOST):
 * 1. Claims skip rows without a URL and come back in id order
 * 2. Concurrent claims never hand out the same row
 * 3. Locks are released when the claim transaction ends
 * 4. Rows already in the sink are never claimed
 * 5. Unparseable rows are reported once and then excluded
 * 6. Country filter and lock namespaces
 * 7. Backlog counts
 * 8. Rows excluded by the caller are never claimed again
 */

#include "enricher/async_database.hpp"
#include "enricher/config.hpp"
#include "enricher/result_sink.hpp"
#include "enricher/schema_bootstrap.hpp"
#include "enricher/work_claim_coordinator.hpp"
#include <iostream>
#include <algorithm>
#include <set>
#include <stdexcept>
#include <thread>
#include <mutex>
#include <vector>
#include <spdlog/spdlog.h>

#ifndef ENRICHER_SCHEMA_DIR
#define ENRICHER_SCHEMA_DIR ""
#endif

using namespace enricher;

// Test utilities
#define TEST_ASSERT(condition, message) \
    if (!(condition)) { \
        std::cerr << "❌ TEST FAILED: " << message << std::endl; \
        return false; \
    } else { \
        std::cout << "✅ " << message << std::endl; \
    }

const std::string TEST_SCHEMA = "enricher_claim_test";
const std::string SOURCE_TABLE = TEST_SCHEMA + ".results";
const std::string SINK_TABLE = TEST_SCHEMA + ".contacts";

std::shared_ptr<AsyncDbPool> g_pool;

std::vector<int64_t> ids_of(const ClaimedBatch& batch) {
    std::vector<int64_t> ids;
    for (const auto& item : batch.items()) ids.push_back(item.id);
    return ids;
}

void run_sql(const std::string& sql) {
    auto conn = g_pool->acquire();
    execScript(conn.get(), sql);
}

// Recreates the backlog with rows 1..count, even ids in SG and odd ids in ID
void reset_tables(int count) {
    run_sql(
        "DROP TABLE IF EXISTS " + SOURCE_TABLE + ";"
        "CREATE TABLE " + SOURCE_TABLE + " (id BIGINT PRIMARY KEY, data JSONB NOT NULL);"
        "TRUNCATE " + SINK_TABLE + ";"
        "INSERT INTO " + SOURCE_TABLE + " (id, data) "
        "SELECT g, jsonb_build_object("
        "  'web_site', 'https://shop' || g || '.example',"
        "  'link', 'https://maps.example/place/' || g,"
        "  'title', 'Shop ' || g,"
        "  'complete_address', jsonb_build_object('country', CASE WHEN g % 2 = 0 THEN 'sg' ELSE 'id' END)) "
        "FROM generate_series(1, " + std::to_string(count) + ") g;");
}

bool setup() {
    if (!std::getenv("PG_HOST")) {
        std::cout << "⚠️  Skipping tests - PostgreSQL not configured (set PG_HOST env var)" << std::endl;
        return false;
    }
    DatabaseConfig config = DatabaseConfig::from_env();
    g_pool = std::make_shared<AsyncDbPool>(config.connection_string(), 8,
                                           60000, 10000, 30000, TEST_SCHEMA, 10000);
    run_sql("DROP SCHEMA IF EXISTS " + TEST_SCHEMA + " CASCADE");
    if (!initialize_schema(*g_pool, TEST_SCHEMA, locate_schema_dir(ENRICHER_SCHEMA_DIR))) {
        throw std::runtime_error("Failed to create test schema");
    }
    return true;
}

// Test 1: URL filter and ordering
bool test_claim_filters_and_orders() {
    std::cout << "\n=== Test 1: Claim Filters And Orders ===" << std::endl;
    reset_tables(0);
    run_sql(
        "INSERT INTO " + SOURCE_TABLE + " (id, data) VALUES "
        "(30, '{\"web_site\": \"https://c.example\", \"link\": \"L30\"}'),"
        "(10, '{\"web_site\": \"https://a.example\", \"link\": \"L10\"}'),"
        "(20, '{\"link\": \"L20\"}'),"
        "(25, '{\"web_site\": \"   \", \"link\": \"L25\"}')");

    WorkClaimCoordinator coordinator(g_pool, SOURCE_TABLE, SINK_TABLE);
    auto batch = coordinator.claim_batch(10);
    TEST_ASSERT(batch.size() == 2, "Rows without a URL are not claimed");
    TEST_ASSERT(ids_of(batch) == std::vector<int64_t>({10, 30}), "Rows come back in ascending id order");
    TEST_ASSERT(batch.items()[0].business_key == "L10", "Business key parsed from link");
    TEST_ASSERT(batch.holds_locks(), "Batch holds its claim transaction");
    batch.commit();
    TEST_ASSERT(!batch.holds_locks(), "Commit ends the claim transaction");

    TEST_ASSERT(coordinator.claim_batch(0).empty(), "Zero-sized claim returns nothing");
    return true;
}

// Test 2: concurrent claims are disjoint
bool test_concurrent_claims_disjoint() {
    std::cout << "\n=== Test 2: Concurrent Claims Disjoint ===" << std::endl;
    reset_tables(40);

    WorkClaimCoordinator coordinator(g_pool, SOURCE_TABLE, SINK_TABLE);

    auto first = coordinator.claim_batch(5);
    auto second = coordinator.claim_batch(5);
    TEST_ASSERT(ids_of(first) == std::vector<int64_t>({1, 2, 3, 4, 5}), "First claim takes the lowest ids");
    TEST_ASSERT(ids_of(second) == std::vector<int64_t>({6, 7, 8, 9, 10}), "Second claim skips locked rows");

    std::mutex ids_mutex;
    std::vector<int64_t> claimed;
    std::vector<ClaimedBatch> held(5);
    std::vector<std::thread> threads;
    for (int t = 0; t < 5; ++t) {
        threads.emplace_back([&, t]() {
            // Separate coordinators behave like separate processes
            WorkClaimCoordinator worker(g_pool, SOURCE_TABLE, SINK_TABLE);
            held[t] = worker.claim_batch(6);
            std::lock_guard<std::mutex> lock(ids_mutex);
            for (const auto& item : held[t].items()) claimed.push_back(item.id);
        });
    }
    for (auto& thread : threads) thread.join();

    std::set<int64_t> unique(claimed.begin(), claimed.end());
    TEST_ASSERT(claimed.size() == 30, "Concurrent claimers took every remaining row");
    TEST_ASSERT(unique.size() == claimed.size(), "No row was claimed twice");
    TEST_ASSERT(*unique.begin() == 11, "Rows held by earlier batches were skipped");

    for (auto& batch : held) batch.commit();
    first.commit();
    second.commit();
    return true;
}

// Test 3: lock release
bool test_locks_released() {
    std::cout << "\n=== Test 3: Locks Released ===" << std::endl;
    reset_tables(6);

    WorkClaimCoordinator coordinator(g_pool, SOURCE_TABLE, SINK_TABLE);
    auto batch = coordinator.claim_batch(3);
    TEST_ASSERT(ids_of(batch) == std::vector<int64_t>({1, 2, 3}), "Claimed rows 1-3");

    batch.rollback();
    auto again = coordinator.claim_batch(3);
    TEST_ASSERT(ids_of(again) == std::vector<int64_t>({1, 2, 3}), "Rollback released the locks");

    {
        ClaimedBatch moved = std::move(again);
        TEST_ASSERT(!again.holds_locks() && moved.holds_locks(), "Move transfers the claim");
    }
    auto after_scope = coordinator.claim_batch(3);
    TEST_ASSERT(ids_of(after_scope) == std::vector<int64_t>({1, 2, 3}), "Destroyed batch released the locks");
    after_scope.commit();

    TEST_ASSERT(g_pool->available() == g_pool->size(), "Every connection back in the pool");
    return true;
}

// Test 4: rows already written to the sink are excluded
bool test_sink_rows_excluded() {
    std::cout << "\n=== Test 4: Sink Rows Excluded ===" << std::endl;
    reset_tables(4);

    WorkClaimCoordinator coordinator(g_pool, SOURCE_TABLE, SINK_TABLE);
    ResultSink sink(g_pool, SINK_TABLE);

    auto batch = coordinator.claim_batch(2);
    TEST_ASSERT(ids_of(batch) == std::vector<int64_t>({1, 2}), "Claimed rows 1-2");

    std::vector<EnrichmentRecord> records;
    for (const auto& item : batch.items()) {
        EnrichmentRecord record;
        record.business_key = item.business_key;
        record.source_id = item.id;
        record.country = item.country;
        record.status = "no_contacts_found";
        records.push_back(record);
    }
    auto report = sink.upsert_batch(records);
    TEST_ASSERT(report.ok() && report.written == 2, "Results written before releasing the claim");
    batch.commit();

    auto next = coordinator.claim_batch(10);
    TEST_ASSERT(ids_of(next) == std::vector<int64_t>({3, 4}), "Written rows are not claimed again");
    next.commit();
    return true;
}

// Test 5: unparseable rows and drain detection
bool test_unparseable_rows() {
    std::cout << "\n=== Test 5: Unparseable Rows ===" << std::endl;
    reset_tables(0);
    run_sql(
        "INSERT INTO " + SOURCE_TABLE + " (id, data) VALUES "
        "(1, '{\"web_site\": \"https://no-link.example\"}'),"
        "(2, '{\"web_site\": \"https://ok.example\", \"link\": \"L2\"}')");

    WorkClaimCoordinator coordinator(g_pool, SOURCE_TABLE, SINK_TABLE);
    auto batch = coordinator.claim_batch(10);
    TEST_ASSERT(batch.size() == 1 && batch.skipped() == 1, "Row without a link is skipped");
    TEST_ASSERT(batch.items()[0].id == 2, "Valid row still claimed");
    batch.commit();

    run_sql("UPDATE " + SOURCE_TABLE + " SET data = data - 'link' WHERE id = 2");
    auto only_bad = coordinator.claim_batch(10);
    TEST_ASSERT(only_bad.empty() && only_bad.skipped() == 1, "Newly bad row reported as skipped");
    only_bad.commit();

    auto drained = coordinator.claim_batch(10);
    TEST_ASSERT(drained.empty() && drained.skipped() == 0, "Skipped rows are excluded afterwards");
    TEST_ASSERT(!drained.holds_locks(), "Empty claim holds nothing");
    TEST_ASSERT(coordinator.excluded_count() == 2, "Both skipped rows are remembered");
    return true;
}

// Test 6: country filter and lock namespaces
bool test_country_and_namespace() {
    std::cout << "\n=== Test 6: Country Filter And Namespaces ===" << std::endl;
    reset_tables(6);

    WorkClaimCoordinator coordinator(g_pool, SOURCE_TABLE, SINK_TABLE);
    auto sg = coordinator.claim_batch(10, "sg");
    TEST_ASSERT(ids_of(sg) == std::vector<int64_t>({2, 4, 6}), "Country filter keeps SG rows");
    TEST_ASSERT(sg.items()[0].country == "SG", "Country normalized on the item");
    sg.commit();

    WorkClaimCoordinator alpha(g_pool, SOURCE_TABLE, SINK_TABLE, "alpha");
    WorkClaimCoordinator alpha_peer(g_pool, SOURCE_TABLE, SINK_TABLE, "alpha");
    WorkClaimCoordinator beta(g_pool, SOURCE_TABLE, SINK_TABLE, "beta");

    auto a = alpha.claim_batch(2);
    auto a_peer = alpha_peer.claim_batch(2);
    auto b = beta.claim_batch(2);
    TEST_ASSERT(ids_of(a) == std::vector<int64_t>({1, 2}), "Namespace alpha claims rows 1-2");
    TEST_ASSERT(ids_of(a_peer) == std::vector<int64_t>({3, 4}), "Same namespace does not overlap");
    TEST_ASSERT(ids_of(b) == std::vector<int64_t>({1, 2}), "Different namespace uses separate locks");
    a.commit();
    a_peer.commit();
    b.commit();
    return true;
}

// Test 7: backlog counts
bool test_counts() {
    std::cout << "\n=== Test 7: Backlog Counts ===" << std::endl;
    reset_tables(10);
    run_sql("INSERT INTO " + SOURCE_TABLE + " (id, data) VALUES (99, '{\"link\": \"L99\"}')");

    WorkClaimCoordinator coordinator(g_pool, SOURCE_TABLE, SINK_TABLE);
    ResultSink sink(g_pool, SINK_TABLE);

    EnrichmentRecord record;
    record.business_key = "https://maps.example/place/1";
    record.country = "ID";
    record.status = "success";
    TEST_ASSERT(sink.upsert(record), "One result written");

    TEST_ASSERT(coordinator.total_count() == 10, "Total counts rows with a URL");
    TEST_ASSERT(coordinator.completed_count() == 1, "Completed counts rows in the sink");
    TEST_ASSERT(coordinator.pending_count() == 9, "Pending excludes completed rows");
    TEST_ASSERT(coordinator.pending_count("SG") == 5, "Pending by country");

    auto by_country = coordinator.country_pending_counts();
    TEST_ASSERT(by_country.size() == 2, "Two countries pending");
    TEST_ASSERT(by_country[0].first == "SG" && by_country[0].second == 5, "SG leads with 5 pending");
    TEST_ASSERT(by_country[1].first == "ID" && by_country[1].second == 4, "ID has 4 pending");
    return true;
}

// Test 8: rows excluded after their result was rejected
bool test_excluded_rows() {
    std::cout << "\n=== Test 8: Excluded Rows ===" << std::endl;
    reset_tables(5);

    WorkClaimCoordinator coordinator(g_pool, SOURCE_TABLE, SINK_TABLE);
    coordinator.exclude({1, 3});
    coordinator.exclude({3});
    TEST_ASSERT(coordinator.excluded_count() == 2, "Repeated exclusions count once");

    auto batch = coordinator.claim_batch(10);
    TEST_ASSERT(ids_of(batch) == std::vector<int64_t>({2, 4, 5}), "Excluded rows are not claimed");
    batch.rollback();

    WorkClaimCoordinator other(g_pool, SOURCE_TABLE, SINK_TABLE);
    auto all = other.claim_batch(10);
    TEST_ASSERT(all.size() == 5, "Exclusions are local to one coordinator");
    all.rollback();
    return true;
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);  // Reduce noise during tests

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Work Claim Coordinator Tests                         ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    try {
        if (setup()) {
            all_passed &= test_claim_filters_and_orders();
            all_passed &= test_concurrent_claims_disjoint();
            all_passed &= test_locks_released();
            all_passed &= test_sink_rows_excluded();
            all_passed &= test_unparseable_rows();
            all_passed &= test_country_and_namespace();
            all_passed &= test_counts();
            all_passed &= test_excluded_rows();
            run_sql("DROP SCHEMA IF EXISTS " + TEST_SCHEMA + " CASCADE");
        }
    } catch (const std::exception& e) {
        std::cerr << "❌ Exception: " << e.what() << std::endl;
        all_passed = false;
    }
    g_pool.reset();

    std::cout << "\n" << std::string(60, '=') << std::endl;
    if (all_passed) {
        std::cout << "✅ ALL TESTS PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << "❌ SOME TESTS FAILED" << std::endl;
        return 1;
    }
}
