/**
 * Enrichment Runner Test
 *
 * Drives the full claim -> fetch -> extract -> write loop against a
 * scratch schema (requires PG_HOST) with a scripted browser:
 * 1. A run drains the backlog and writes one row per item
 * 2. The row limit caps a run
 * 3. A stop request before the first claim processes nothing
 * 4. Country filter
 * 5. Batches holding only unparseable rows do not end the run
 * 6. Repeated claim failures end the run with an exception
 * 7. A row whose result can never be written does not stop the drain
 * 8. A single-connection pool is refused before anything is claimed
 */

#include "enricher/async_database.hpp"
#include "enricher/browser_pool.hpp"
#include "enricher/config.hpp"
#include "enricher/contact_extractor.hpp"
#include "enricher/enrichment_runner.hpp"
#include "enricher/result_sink.hpp"
#include "enricher/schema_bootstrap.hpp"
#include "enricher/work_claim_coordinator.hpp"
#include <iostream>
#include <atomic>
#include <cstdlib>
#include <stdexcept>
#include <string>
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

const std::string TEST_SCHEMA = "enricher_runner_test";
const std::string SOURCE_TABLE = TEST_SCHEMA + ".results";
const std::string SINK_TABLE = TEST_SCHEMA + ".contacts";

std::shared_ptr<AsyncDbPool> g_pool;

// Serves one contact address per page; hosts named "down" refuse connections
class ScriptedBrowser : public Browser {
public:
    int64_t pid() const override { return 1; }
    std::string context_id() const override { return "scripted"; }
    double memory_mb() const override { return 10.0; }
    int open_page_count() const override { return 1; }
    bool is_connected() const override { return true; }
    void clear_cookies() override {}
    void clear_permissions() override {}
    void close_extra_pages() override {}
    void navigate_blank() override {}
    void close() override {}

    PageResult fetch(const std::string& url, int) override {
        PageResult result;
        result.url = url;
        result.final_url = url;
        if (url.find("://down") != std::string::npos) {
            result.error = "Connection refused";
            return result;
        }
        result.status = "success";
        result.pages_scraped = 1;
        result.html = "<footer><a href=\"mailto:hello@shop.example\">hello@shop.example</a></footer>";
        return result;
    }
};

void run_sql(const std::string& sql) {
    auto conn = g_pool->acquire();
    execScript(conn.get(), sql);
}

int64_t query_count(const std::string& sql) {
    auto conn = g_pool->acquire();
    sendAndWait(conn.get(), sql.c_str());
    auto result = getTuplesResult(conn.get());
    return std::stoll(PQgetvalue(result.get(), 0, 0));
}

int64_t sink_rows(const std::string& where = "TRUE") {
    return query_count("SELECT COUNT(*) FROM " + SINK_TABLE + " WHERE " + where);
}

// Rows 1..count; even ids in SG, odd ids in ID, every fifth site is down
void reset_tables(int count) {
    run_sql(
        "DROP TABLE IF EXISTS " + SOURCE_TABLE + ";"
        "CREATE TABLE " + SOURCE_TABLE + " (id BIGINT PRIMARY KEY, data JSONB NOT NULL);"
        "TRUNCATE " + SINK_TABLE + ";"
        "INSERT INTO " + SOURCE_TABLE + " (id, data) "
        "SELECT g, jsonb_build_object("
        "  'web_site', CASE WHEN g % 5 = 0 THEN 'https://down' ELSE 'https://shop' END || g || '.example',"
        "  'link', 'https://maps.example/place/' || g,"
        "  'title', 'Shop ' || g,"
        "  'complete_address', jsonb_build_object('country', CASE WHEN g % 2 = 0 THEN 'sg' ELSE 'id' END)) "
        "FROM generate_series(1, " + std::to_string(count) + ") g;");
}

Config make_config(int batch_size) {
    Config config;
    config.server.server_id = "srv-runner-test";
    config.claim.batch_size = batch_size;
    config.claim.retry_delay_ms = 0;
    config.claim.max_consecutive_failures = 2;
    config.browser.min_instances = 1;
    config.browser.max_instances = 3;
    config.browser.health_check_interval_ms = 600000;
    return config;
}

// Wires one process worth of components and runs the loop once
RunSummary run_enricher(const Config& config,
                        const std::atomic<bool>& stop,
                        ServerStats* stats_out = nullptr,
                        const std::string& source_table = SOURCE_TABLE,
                        std::shared_ptr<AsyncDbPool> db_pool = nullptr) {
    if (!db_pool) db_pool = g_pool;

    auto system_pool = std::make_shared<astp::ThreadPool>(2);
    auto browser_pool = std::make_shared<BrowserPool>(
        config.browser,
        []() -> std::unique_ptr<Browser> { return std::make_unique<ScriptedBrowser>(); },
        system_pool);
    browser_pool->initialize();

    auto coordinator = std::make_shared<WorkClaimCoordinator>(db_pool, source_table, SINK_TABLE,
                                                              config.claim.lock_namespace);
    auto sink = std::make_shared<ResultSink>(db_pool, SINK_TABLE, RetryPolicy(), config.sink.max_batch_rows);

    EnricherContext ctx(config, db_pool, system_pool, coordinator, sink, nullptr,
                        browser_pool, std::make_shared<RegexContactExtractor>(), stop);
    EnrichmentRunner runner(ctx);

    RunSummary summary = runner.run();
    if (stats_out) {
        *stats_out = runner.stats();
    }
    browser_pool->close();
    return summary;
}

bool setup() {
    if (!std::getenv("PG_HOST")) {
        std::cout << "⚠️  Skipping tests - PostgreSQL not configured (set PG_HOST env var)" << std::endl;
        return false;
    }
    DatabaseConfig config = DatabaseConfig::from_env();
    g_pool = std::make_shared<AsyncDbPool>(config.connection_string(), 4,
                                           60000, 10000, 30000, TEST_SCHEMA, 10000);
    run_sql("DROP SCHEMA IF EXISTS " + TEST_SCHEMA + " CASCADE");
    if (!initialize_schema(*g_pool, TEST_SCHEMA, locate_schema_dir(ENRICHER_SCHEMA_DIR))) {
        throw std::runtime_error("Failed to create test schema");
    }
    return true;
}

// Test 1: drain
bool test_run_drains_backlog() {
    std::cout << "\n=== Test 1: Run Drains Backlog ===" << std::endl;
    reset_tables(7);
    std::atomic<bool> stop{false};
    Config config = make_config(3);

    ServerStats stats;
    RunSummary summary = run_enricher(config, stop, &stats);
    TEST_ASSERT(summary.drained, "Run ends because the backlog is drained");
    TEST_ASSERT(summary.batches == 3, "Seven rows in batches of three take three batches");
    TEST_ASSERT(summary.processed == 7, "Every row processed");
    TEST_ASSERT(summary.written == 7 && summary.write_failures == 0, "Every record written");
    TEST_ASSERT(sink_rows() == 7, "One sink row per source row");
    TEST_ASSERT(sink_rows("scrape_status = 'failed'") == 1, "Unreachable site recorded as failed");
    TEST_ASSERT(sink_rows("scrape_status = 'success' AND emails_count = 1") == 6, "Reachable sites yield one email");
    TEST_ASSERT(sink_rows("last_scrape_server = 'srv-runner-test'") == 7, "Server id stamped on every row");

    TEST_ASSERT(stats.processed == 7 && stats.success == 6 && stats.failed == 1, "Runner stats count outcomes");
    TEST_ASSERT(stats.emails_found == 6, "Runner stats count emails");

    summary = run_enricher(config, stop);
    TEST_ASSERT(summary.drained && summary.batches == 0, "Second run finds nothing left");
    return true;
}

// Test 2: row limit
bool test_row_limit() {
    std::cout << "\n=== Test 2: Row Limit ===" << std::endl;
    reset_tables(10);
    std::atomic<bool> stop{false};
    Config config = make_config(3);
    config.claim.row_limit = 4;

    RunSummary summary = run_enricher(config, stop);
    TEST_ASSERT(!summary.drained, "Limited run does not report a drain");
    TEST_ASSERT(summary.processed == 4, "Exactly the limit processed");
    TEST_ASSERT(summary.batches == 2, "Last batch shrinks to fit the limit");
    TEST_ASSERT(sink_rows() == 4, "Four sink rows");

    config.claim.row_limit = 0;
    summary = run_enricher(config, stop);
    TEST_ASSERT(summary.drained && summary.processed == 6, "Unlimited run picks up the rest");
    TEST_ASSERT(sink_rows() == 10, "All rows written once");
    return true;
}

// Test 3: stop before start
bool test_stop_requested() {
    std::cout << "\n=== Test 3: Stop Requested ===" << std::endl;
    reset_tables(5);
    std::atomic<bool> stop{true};

    RunSummary summary = run_enricher(make_config(3), stop);
    TEST_ASSERT(summary.batches == 0 && summary.processed == 0, "Nothing processed");
    TEST_ASSERT(!summary.drained, "Stopped run does not report a drain");
    TEST_ASSERT(sink_rows() == 0, "Sink untouched");
    return true;
}

// Test 4: country filter
bool test_country_filter() {
    std::cout << "\n=== Test 4: Country Filter ===" << std::endl;
    reset_tables(10);
    std::atomic<bool> stop{false};
    Config config = make_config(4);
    config.claim.country_filter = "sg";

    RunSummary summary = run_enricher(config, stop);
    TEST_ASSERT(summary.drained && summary.processed == 5, "Only the SG rows processed");
    TEST_ASSERT(sink_rows("country_code = 'SG'") == 5, "SG rows written");
    TEST_ASSERT(sink_rows("country_code <> 'SG'") == 0, "Other countries left alone");
    return true;
}

// Test 5: unparseable rows
bool test_skips_unparseable_rows() {
    std::cout << "\n=== Test 5: Unparseable Rows ===" << std::endl;
    reset_tables(3);
    run_sql("INSERT INTO " + SOURCE_TABLE + " (id, data) VALUES "
            "(4, '{\"web_site\": \"https://shop4.example\"}'),"
            "(6, '{\"web_site\": \"https://shop6.example\", \"link\": \"L6\"}')");
    std::atomic<bool> stop{false};

    RunSummary summary = run_enricher(make_config(3), stop);
    TEST_ASSERT(summary.drained, "Run drains despite the unparseable row");
    TEST_ASSERT(summary.processed == 4, "Parseable rows processed");
    TEST_ASSERT(sink_rows("business_key = 'L6'") == 1, "Row after the unparseable one written");
    TEST_ASSERT(sink_rows() == 4, "Unparseable row produces no sink row");
    return true;
}

// Test 6: claim failures
bool test_claim_failures_abort() {
    std::cout << "\n=== Test 6: Claim Failures ===" << std::endl;
    std::atomic<bool> stop{false};

    bool aborted = false;
    try {
        run_enricher(make_config(3), stop, nullptr, TEST_SCHEMA + ".missing_results");
    } catch (const std::runtime_error& e) {
        aborted = std::string(e.what()).find("consecutive claim failures") != std::string::npos;
    }
    TEST_ASSERT(aborted, "Run gives up after the configured number of claim failures");
    TEST_ASSERT(g_pool->available() == g_pool->size(), "Failed claims return their connections");
    return true;
}

// Test 7: permanently failing write
bool test_rejected_write_drains() {
    std::cout << "\n=== Test 7: Rejected Write Drains ===" << std::endl;
    reset_tables(4);
    // NUMERIC(3,2) cannot hold 123; every write of row 2 fails the same way
    run_sql("UPDATE " + SOURCE_TABLE + " SET data = data || '{\"review_rating\": 123}' WHERE id = 2");
    std::atomic<bool> stop{false};
    Config config = make_config(3);
    config.claim.row_limit = 50;   // bounds the run if the row kept coming back

    RunSummary summary = run_enricher(config, stop);
    TEST_ASSERT(summary.drained, "Run drains despite the unwritable row");
    TEST_ASSERT(summary.processed == 4, "Unwritable row is fetched only once");
    TEST_ASSERT(summary.batches == 2, "No batch is spent re-claiming it");
    TEST_ASSERT(summary.written == 3 && summary.write_failures == 1, "Other rows of its batch are written");
    TEST_ASSERT(summary.rejected == 1, "Failed row is excluded from later claims");
    TEST_ASSERT(sink_rows() == 3, "No sink row for the unwritable record");
    TEST_ASSERT(sink_rows("business_key = 'https://maps.example/place/2'") == 0, "Row 2 is the one missing");
    return true;
}

// Test 8: pool too small to write while a claim is held
bool test_single_connection_pool() {
    std::cout << "\n=== Test 8: Single Connection Pool ===" << std::endl;
    reset_tables(3);
    std::atomic<bool> stop{false};

    auto single = std::make_shared<AsyncDbPool>(DatabaseConfig::from_env().connection_string(), 1,
                                                60000, 10000, 30000, TEST_SCHEMA, 500);
    bool refused = false;
    try {
        run_enricher(make_config(3), stop, nullptr, SOURCE_TABLE, single);
    } catch (const std::invalid_argument&) {
        refused = true;
    }
    TEST_ASSERT(refused, "Runner refuses a pool that cannot hold a claim and write");
    TEST_ASSERT(sink_rows() == 0, "Nothing was claimed or written");
    TEST_ASSERT(single->available() == 1, "Connection returned to the pool");

    setenv("DB_POOL_SIZE", "1", 1);
    int configured = DatabaseConfig::from_env().pool_size;
    unsetenv("DB_POOL_SIZE");
    TEST_ASSERT(configured == 2, "DB_POOL_SIZE below 2 is raised to 2");

    RunSummary summary = run_enricher(make_config(3), stop);
    TEST_ASSERT(summary.drained && summary.written == 3, "Same backlog drains on a two-connection pool");
    return true;
}

// Main test runner
int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::off);  // Claim-failure tests log errors on purpose

    std::cout << "╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║     Enrichment Runner Tests                              ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝" << std::endl;

    bool all_passed = true;

    try {
        if (setup()) {
            all_passed &= test_run_drains_backlog();
            all_passed &= test_row_limit();
            all_passed &= test_stop_requested();
            all_passed &= test_country_filter();
            all_passed &= test_skips_unparseable_rows();
            all_passed &= test_claim_failures_abort();
            all_passed &= test_rejected_write_drains();
            all_passed &= test_single_connection_pool();
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
