#pragma once

#include "enricher/async_database.hpp"
#include "enricher/periodic_task.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace enricher {

/**
 * Throughput counters for the current session
 */
struct ServerStats {
    std::string status = "online";       // online, paused, error, offline
    std::string current_task;
    uint64_t processed = 0;
    uint64_t success = 0;
    uint64_t failed = 0;
    uint64_t emails_found = 0;
    uint64_t phones_found = 0;
    uint64_t whatsapp_found = 0;
    double total_processing_seconds = 0.0;
};

struct ServerIdentity {
    std::string server_id;
    std::string server_name;
    std::string hostname;
    std::string region;
    int workers_count = 0;
    int batch_size = 0;
};

/**
 * ServerRegistry - reports this process to the servers table
 *
 * register_server() marks the row online and opens a new session,
 * heartbeat() folds counter deltas into the lifetime totals and refreshes
 * the session figures, deregister() marks the row offline. start() runs
 * heartbeats periodically from the system thread pool using a stats
 * provider supplied by the runner.
 */
class ServerRegistry {
public:
    using StatsProvider = std::function<ServerStats()>;

    ServerRegistry(std::shared_ptr<AsyncDbPool> db_pool,
                   std::shared_ptr<astp::ThreadPool> system_thread_pool,
                   std::string servers_table,
                   ServerIdentity identity,
                   int heartbeat_interval_ms);

    ~ServerRegistry();

    void register_server();
    void heartbeat(const ServerStats& stats);
    void deregister();

    void start(StatsProvider provider);
    void stop();

    const std::string& session_id() const { return session_id_; }
    const ServerIdentity& identity() const { return identity_; }

    static std::string generate_session_id();

private:
    std::shared_ptr<AsyncDbPool> db_pool_;
    std::string servers_table_;
    ServerIdentity identity_;
    std::string session_id_;
    std::chrono::steady_clock::time_point session_started_;

    StatsProvider provider_;
    PeriodicTask heartbeat_task_;

    // Totals already folded into the lifetime counters
    std::mutex reported_mutex_;
    ServerStats reported_;
};

} // namespace enricher
