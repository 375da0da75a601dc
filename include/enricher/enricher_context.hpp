#pragma once

#include <atomic>
#include <memory>

namespace enricher {

// Forward declarations
class AsyncDbPool;
class WorkClaimCoordinator;
class ResultSink;
class ServerRegistry;
class BrowserPool;
class ContactExtractor;
struct Config;

} // namespace enricher

namespace astp {
class ThreadPool;
}

namespace enricher {

/**
 * Context object containing every long-lived component of one process.
 * Built once in main and passed to the runner.
 */
struct EnricherContext {
    // Configuration reference
    const Config& config;

    // Shared database pool used by the coordinator, sink and registry
    std::shared_ptr<AsyncDbPool> db_pool;

    // Background services (pool maintenance, heartbeats)
    std::shared_ptr<astp::ThreadPool> system_thread_pool;

    std::shared_ptr<WorkClaimCoordinator> coordinator;
    std::shared_ptr<ResultSink> sink;

    // Optional; runs without a registry row when null
    std::shared_ptr<ServerRegistry> registry;

    std::shared_ptr<BrowserPool> browser_pool;
    std::shared_ptr<ContactExtractor> extractor;

    // Set by the signal handler; the runner finishes its batch and returns
    const std::atomic<bool>& stop_requested;

    EnricherContext(
        const Config& cfg,
        std::shared_ptr<AsyncDbPool> dbp,
        std::shared_ptr<astp::ThreadPool> stp,
        std::shared_ptr<WorkClaimCoordinator> wcc,
        std::shared_ptr<ResultSink> rs,
        std::shared_ptr<ServerRegistry> reg,
        std::shared_ptr<BrowserPool> bp,
        std::shared_ptr<ContactExtractor> ce,
        const std::atomic<bool>& stop
    ) : config(cfg),
        db_pool(std::move(dbp)),
        system_thread_pool(std::move(stp)),
        coordinator(std::move(wcc)),
        sink(std::move(rs)),
        registry(std::move(reg)),
        browser_pool(std::move(bp)),
        extractor(std::move(ce)),
        stop_requested(stop)
    {}
};

} // namespace enricher
