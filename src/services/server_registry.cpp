#include "enricher/server_registry.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <random>

namespace enricher {

namespace {

std::string format_double(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    return buf;
}

} // namespace

ServerRegistry::ServerRegistry(std::shared_ptr<AsyncDbPool> db_pool,
                               std::shared_ptr<astp::ThreadPool> system_thread_pool,
                               std::string servers_table,
                               ServerIdentity identity,
                               int heartbeat_interval_ms)
    : db_pool_(std::move(db_pool)),
      servers_table_(require_identifier(servers_table)),
      identity_(std::move(identity)),
      session_id_(generate_session_id()),
      session_started_(std::chrono::steady_clock::now()),
      heartbeat_task_(std::move(system_thread_pool), "ServerRegistry", heartbeat_interval_ms,
                      [this]() {
                          if (provider_) heartbeat(provider_());
                      }) {
}

ServerRegistry::~ServerRegistry() {
    stop();
}

std::string ServerRegistry::generate_session_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
    return buf;
}

void ServerRegistry::register_server() {
    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(),
        "INSERT INTO " + servers_table_ + " "
        "(server_id, server_name, server_hostname, server_region, workers_count, batch_size, "
        " status, current_task, started_at, last_heartbeat, last_activity, "
        " session_id, session_started, session_processed, session_errors) "
        "VALUES ($1, NULLIF($2, ''), NULLIF($3, ''), NULLIF($4, ''), $5::integer, $6::integer, "
        " 'online', 'starting', NOW(), NOW(), NOW(), $7, NOW(), 0, 0) "
        "ON CONFLICT (server_id) DO UPDATE SET "
        " server_name = EXCLUDED.server_name, server_hostname = EXCLUDED.server_hostname, "
        " server_region = EXCLUDED.server_region, workers_count = EXCLUDED.workers_count, "
        " batch_size = EXCLUDED.batch_size, status = 'online', current_task = 'starting', "
        " started_at = NOW(), last_heartbeat = NOW(), last_activity = NOW(), "
        " session_id = EXCLUDED.session_id, session_started = NOW(), "
        " session_processed = 0, session_errors = 0",
        {identity_.server_id, identity_.server_name, identity_.hostname, identity_.region,
         std::to_string(identity_.workers_count), std::to_string(identity_.batch_size),
         session_id_});
    getCommandResult(conn.get());

    {
        std::lock_guard<std::mutex> lock(reported_mutex_);
        reported_ = ServerStats();
    }
    session_started_ = std::chrono::steady_clock::now();
    spdlog::info("[ServerRegistry] Registered server {} (session {})", identity_.server_id, session_id_);
}

void ServerRegistry::heartbeat(const ServerStats& stats) {
    // Serializes periodic and explicit heartbeats so deltas are counted once
    std::lock_guard<std::mutex> lock(reported_mutex_);

    ServerStats delta;
    delta.processed = stats.processed - reported_.processed;
    delta.success = stats.success - reported_.success;
    delta.failed = stats.failed - reported_.failed;
    delta.emails_found = stats.emails_found - reported_.emails_found;
    delta.phones_found = stats.phones_found - reported_.phones_found;
    delta.whatsapp_found = stats.whatsapp_found - reported_.whatsapp_found;

    double avg_time = stats.processed > 0 ? stats.total_processing_seconds / stats.processed : 0.0;
    double minutes = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - session_started_).count() / 60.0;
    double urls_per_minute = minutes > 0.0 ? stats.processed / minutes : 0.0;
    double success_rate = stats.processed > 0 ? 100.0 * stats.success / stats.processed : 0.0;

    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(),
        "UPDATE " + servers_table_ + " SET "
        " status = $2, current_task = NULLIF($3, ''), "
        " total_processed = total_processed + $4::bigint, "
        " total_success = total_success + $5::bigint, "
        " total_failed = total_failed + $6::bigint, "
        " total_emails_found = total_emails_found + $7::bigint, "
        " total_phones_found = total_phones_found + $8::bigint, "
        " total_whatsapp_found = total_whatsapp_found + $9::bigint, "
        " avg_time_per_url = $10::numeric, urls_per_minute = $11::numeric, success_rate = $12::numeric, "
        " session_processed = $13::integer, session_errors = $14::integer, "
        " last_heartbeat = NOW(), "
        " last_activity = CASE WHEN $4::bigint > 0 THEN NOW() ELSE last_activity END "
        "WHERE server_id = $1",
        {identity_.server_id, stats.status, stats.current_task,
         std::to_string(delta.processed), std::to_string(delta.success),
         std::to_string(delta.failed), std::to_string(delta.emails_found),
         std::to_string(delta.phones_found), std::to_string(delta.whatsapp_found),
         format_double(avg_time), format_double(urls_per_minute), format_double(success_rate),
         std::to_string(stats.processed), std::to_string(stats.failed)});
    getCommandResult(conn.get());

    reported_ = stats;
    spdlog::debug("[ServerRegistry] Heartbeat: processed={} success={} failed={}",
                  stats.processed, stats.success, stats.failed);
}

void ServerRegistry::deregister() {
    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(),
        "UPDATE " + servers_table_ + " SET status = 'offline', current_task = NULL, "
        "last_heartbeat = NOW() WHERE server_id = $1",
        {identity_.server_id});
    getCommandResult(conn.get());
    spdlog::info("[ServerRegistry] Deregistered server {}", identity_.server_id);
}

void ServerRegistry::start(StatsProvider provider) {
    provider_ = std::move(provider);
    heartbeat_task_.start();
}

void ServerRegistry::stop() {
    heartbeat_task_.stop();
}

} // namespace enricher
