#include "enricher/async_database.hpp"
#include "enricher/browser_pool.hpp"
#include "enricher/config.hpp"
#include "enricher/contact_extractor.hpp"
#include "enricher/curl_browser.hpp"
#include "enricher/enricher_context.hpp"
#include "enricher/enrichment_runner.hpp"
#include "enricher/result_sink.hpp"
#include "enricher/schema_bootstrap.hpp"
#include "enricher/server_registry.hpp"
#include "enricher/work_claim_coordinator.hpp"
#include "threadpool.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>

#ifndef ENRICHER_SCHEMA_DIR
#define ENRICHER_SCHEMA_DIR ""
#endif

namespace {

std::atomic<bool> g_stop_requested{false};
std::atomic<int> g_signal_count{0};

void signal_handler(int) {
    // Only async-signal-safe calls in here
    if (g_signal_count.fetch_add(1) == 0) {
        g_stop_requested.store(true);
        const char msg[] = "\nStop requested, finishing current batch (signal again to force quit)\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        return;
    }
    std::_Exit(1);
}

struct CliOptions {
    bool show_stats = false;
    bool init_schema = false;
};

void print_usage(const char* program_name) {
    std::cout << "Contact Enricher - distributed website contact scraper" << std::endl;
    std::cout << "\nUsage:" << std::endl;
    std::cout << "  " << program_name << " [options]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --batch-size N        Rows claimed per batch (default: 50)" << std::endl;
    std::cout << "  --limit N             Stop after N rows (default: 0 = until drained)" << std::endl;
    std::cout << "  --country CC          Only process rows of this country" << std::endl;
    std::cout << "  --server-id ID        Identity in the servers table (default: hostname)" << std::endl;
    std::cout << "  --workers N           Maximum concurrent browsers (default: 10)" << std::endl;
    std::cout << "  --stats               Print progress statistics and exit" << std::endl;
    std::cout << "  --init-schema         Create the schema and tables and exit" << std::endl;
    std::cout << "  --dev                 Debug logging" << std::endl;
    std::cout << "  --help                Show this help" << std::endl;
    std::cout << "\nDatabase and pool settings come from the environment (PG_HOST, PG_PORT, ...)." << std::endl;
    std::cout << "\nExamples:" << std::endl;
    std::cout << "  " << program_name << " --init-schema" << std::endl;
    std::cout << "  " << program_name << " --country ID --batch-size 100 --workers 6" << std::endl;
    std::cout << "  " << program_name << " --stats" << std::endl;
}

int parse_int_arg(const std::string& name, const char* value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        std::cerr << "Error: " << name << " expects a number, got '" << value << "'" << std::endl;
        std::exit(1);
    }
}

CliOptions parse_args(int argc, char** argv, enricher::Config& config) {
    CliOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--batch-size" && i + 1 < argc) {
            config.claim.batch_size = parse_int_arg(arg, argv[++i]);
        } else if (arg == "--limit" && i + 1 < argc) {
            config.claim.row_limit = parse_int_arg(arg, argv[++i]);
        } else if (arg == "--country" && i + 1 < argc) {
            config.claim.country_filter = argv[++i];
        } else if (arg == "--server-id" && i + 1 < argc) {
            config.server.server_id = argv[++i];
        } else if (arg == "--workers" && i + 1 < argc) {
            config.browser.max_instances = parse_int_arg(arg, argv[++i]);
            if (config.browser.min_instances > config.browser.max_instances) {
                config.browser.min_instances = config.browser.max_instances;
            }
        } else if (arg == "--stats") {
            options.show_stats = true;
        } else if (arg == "--init-schema") {
            options.init_schema = true;
        } else if (arg == "--dev") {
            config.server.dev_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    // Validation
    if (config.claim.batch_size < 1) {
        std::cerr << "Error: batch size must be >= 1" << std::endl;
        std::exit(1);
    }
    if (config.claim.row_limit < 0) {
        std::cerr << "Error: limit must be >= 0" << std::endl;
        std::exit(1);
    }
    if (config.browser.max_instances < 1) {
        std::cerr << "Error: workers must be >= 1" << std::endl;
        std::exit(1);
    }

    return options;
}

void print_stats(enricher::WorkClaimCoordinator& coordinator, enricher::ResultSink& sink,
                 const std::string& country_filter) {
    nlohmann::json out;
    out["backlog"] = {
        {"total", coordinator.total_count()},
        {"completed", coordinator.completed_count()},
        {"pending", coordinator.pending_count(country_filter)}
    };
    if (!country_filter.empty()) {
        out["backlog"]["country"] = enricher::normalize_country(country_filter);
    }

    nlohmann::json pending_by_country = nlohmann::json::object();
    for (const auto& entry : coordinator.country_pending_counts()) {
        pending_by_country[entry.first] = entry.second;
    }
    out["pending_by_country"] = pending_by_country;

    auto totals = sink.total_stats();
    out["contacts"] = {
        {"total", totals.total},
        {"with_email", totals.with_email},
        {"with_phone", totals.with_phone},
        {"with_whatsapp", totals.with_whatsapp},
        {"countries", totals.countries},
        {"successful", totals.successful},
        {"failed", totals.failed}
    };

    nlohmann::json countries = nlohmann::json::array();
    for (const auto& row : sink.country_stats()) {
        countries.push_back({
            {"country", row.country},
            {"total", row.total},
            {"with_email", row.with_email},
            {"with_phone", row.with_phone},
            {"with_whatsapp", row.with_whatsapp}
        });
    }
    out["contacts_by_country"] = countries;

    std::cout << out.dump(2) << std::endl;
}

int run(enricher::Config& config, const CliOptions& options) {
    using namespace enricher;

    const std::string schema = require_identifier(config.database.schema);
    const std::string source_table = require_identifier(config.database.source_table);
    const std::string sink_table = schema + ".contacts";
    const std::string servers_table = schema + ".servers";

    spdlog::info("Contact Enricher");
    spdlog::info("Configuration:");
    spdlog::info("  - Database: {}:{}/{}", config.database.host, config.database.port, config.database.database);
    spdlog::info("  - Source: {}, sink: {}", source_table, sink_table);
    spdlog::info("  - Server: {}", config.server.server_id);
    spdlog::info("  - Browsers: {}..{}", config.browser.min_instances, config.browser.max_instances);

    auto db_pool = std::make_shared<AsyncDbPool>(
        config.database.connection_string(),
        config.database.pool_size,
        config.database.statement_timeout,
        config.database.lock_timeout,
        config.database.idle_timeout,
        schema,
        config.database.connection_timeout);

    if (options.init_schema) {
        return initialize_schema(*db_pool, schema, locate_schema_dir(ENRICHER_SCHEMA_DIR)) ? 0 : 1;
    }

    auto coordinator = std::make_shared<WorkClaimCoordinator>(
        db_pool, source_table, sink_table, config.claim.lock_namespace);
    auto sink = std::make_shared<ResultSink>(
        db_pool, sink_table,
        RetryPolicy(config.database.max_retries, config.database.retry_base_delay_ms),
        config.sink.max_batch_rows);

    if (options.show_stats) {
        print_stats(*coordinator, *sink, config.claim.country_filter);
        return 0;
    }

    sink->verify_schema();

    // Pool maintenance and heartbeats each hold a thread while waiting
    auto system_thread_pool = std::make_shared<astp::ThreadPool>(4);

    CurlBrowser::global_init();
    auto browser_pool = std::make_shared<BrowserPool>(
        config.browser, CurlBrowser::factory(config.browser), system_thread_pool);
    browser_pool->initialize();

    ServerIdentity identity;
    identity.server_id = config.server.server_id;
    identity.server_name = config.server.server_name;
    identity.hostname = local_hostname();
    identity.region = config.server.server_region;
    identity.workers_count = config.browser.max_instances;
    identity.batch_size = config.claim.batch_size;

    auto registry = std::make_shared<ServerRegistry>(
        db_pool, system_thread_pool, servers_table, identity, config.server.heartbeat_interval_ms);
    try {
        registry->register_server();
    } catch (const DbError& e) {
        spdlog::warn("Server registry unavailable, continuing without heartbeats: {}", e.what());
        registry.reset();
    }

    EnricherContext ctx(
        config,
        db_pool,
        system_thread_pool,
        coordinator,
        sink,
        registry,
        browser_pool,
        std::make_shared<RegexContactExtractor>(),
        g_stop_requested
    );

    EnrichmentRunner runner(ctx);
    if (registry) {
        registry->start([&runner]() { return runner.stats(); });
    }

    int exit_code = 0;
    try {
        RunSummary summary = runner.run();
        spdlog::info("Run complete: {} processed, {} written, {} write failures{}",
                     summary.processed, summary.written, summary.write_failures,
                     summary.drained ? ", backlog drained" : "");
    } catch (const std::exception& e) {
        spdlog::error("Run aborted: {}", e.what());
        exit_code = 1;
    }

    // Shutdown
    if (registry) {
        registry->stop();
        try {
            registry->heartbeat(runner.stats());
            registry->deregister();
        } catch (const DbError& e) {
            spdlog::warn("Failed to deregister server: {}", e.what());
        }
    }

    auto pool_stats = browser_pool->stats();
    spdlog::info("Browser pool: created={} replaced={} retired={} success_rate={:.1f}%",
                 pool_stats.browsers_created, pool_stats.browsers_replaced,
                 pool_stats.browsers_retired, pool_stats.success_rate());
    browser_pool->close();
    CurlBrowser::global_cleanup();

    return exit_code;
}

} // namespace

int main(int argc, char* argv[]) {
    enricher::Config config = enricher::Config::load();
    CliOptions options = parse_args(argc, argv, config);

    // Set up logging
    spdlog::set_pattern(config.logging.log_pattern);
    spdlog::set_level(config.server.dev_mode ? spdlog::level::debug
                                             : spdlog::level::from_str(config.logging.log_level));

    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        return run(config, options);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
