#pragma once

#include "enricher/browser.hpp"
#include "enricher/config.hpp"
#include "enricher/periodic_task.hpp"
#include "threadpool.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace enricher {

class PoolTimeoutError : public std::runtime_error {
public:
    explicit PoolTimeoutError(const std::string& message) : std::runtime_error(message) {}
};

class PoolExhaustedError : public std::runtime_error {
public:
    explicit PoolExhaustedError(const std::string& message) : std::runtime_error(message) {}
};

struct BrowserMetrics {
    int64_t pid = 0;
    double memory_mb = 0.0;
    int open_pages = 0;
    int error_count = 0;
    uint64_t request_count = 0;
    std::chrono::steady_clock::time_point started_at;
    std::chrono::steady_clock::time_point last_used;
};

/**
 * BrowserHandle - a pooled browser plus its metrics and health history
 */
class BrowserHandle {
public:
    static constexpr size_t HEALTH_HISTORY_SIZE = 10;

    BrowserHandle(uint64_t id, std::unique_ptr<Browser> browser);

    uint64_t id() const { return id_; }
    Browser& browser() { return *browser_; }
    BrowserMetrics& metrics() { return metrics_; }
    const BrowserMetrics& metrics() const { return metrics_; }

    void record_health(bool healthy);

    // Fraction of healthy results over the last 5 checks; 1.0 with fewer than 3
    double health_trend() const;
    size_t health_checks() const { return history_.size(); }

private:
    uint64_t id_;
    std::unique_ptr<Browser> browser_;
    BrowserMetrics metrics_;
    std::deque<bool> history_;
};

struct BrowserPoolStats {
    uint64_t browsers_created = 0;
    uint64_t browsers_replaced = 0;
    uint64_t browsers_retired = 0;
    uint64_t creation_failures = 0;
    uint64_t total_requests = 0;
    uint64_t healthy_requests = 0;
    uint64_t failed_requests = 0;
    uint64_t pages_fetched = 0;
    uint64_t fetch_failures = 0;
    size_t total_browsers = 0;
    size_t available_browsers = 0;
    size_t busy_browsers = 0;
    double total_memory_mb = 0.0;

    double success_rate() const {
        return total_requests == 0 ? 100.0 : 100.0 * healthy_requests / total_requests;
    }
};

/**
 * BrowserPool - bounded, self-healing pool of browsers
 *
 * Keeps between min_instances and max_instances browsers. acquire() scales
 * up when nothing is idle, health-checks the instance it hands out and
 * swaps unhealthy ones for fresh instances (bounded by
 * max_replacement_attempts). Per-task state is reset before an instance is
 * handed out and again when it is released. release() retires one idle
 * instance when more than min_instances are idle. A maintenance task on the
 * system thread pool checks idle instances and refills the pool to
 * min_instances.
 *
 * scrape() is the non-throwing entry point used by the runner; scrape_async()
 * runs it on the pool's long-lived fetch executor.
 */
class BrowserPool {
public:
    using PooledBrowser = std::unique_ptr<BrowserHandle, std::function<void(BrowserHandle*)>>;

    BrowserPool(BrowserPoolConfig config,
                BrowserFactory factory,
                std::shared_ptr<astp::ThreadPool> system_thread_pool);

    ~BrowserPool();

    BrowserPool(const BrowserPool&) = delete;
    BrowserPool& operator=(const BrowserPool&) = delete;

    // Creates min_instances browsers and starts maintenance
    void initialize();

    /**
     * @throws PoolTimeoutError when nothing becomes available in time
     * @throws PoolExhaustedError when no healthy instance could be produced
     */
    PooledBrowser acquire();
    PooledBrowser acquire(std::chrono::milliseconds timeout);

    // Never throws
    PageResult scrape(const std::string& url);
    std::future<PageResult> scrape_async(const std::string& url);

    // One maintenance pass; also run periodically after initialize()
    void run_maintenance();

    bool check_health(BrowserHandle& handle);

    BrowserPoolStats stats() const;
    size_t size() const;
    size_t available() const;
    size_t busy() const;

    void close();

    const BrowserPoolConfig& config() const { return config_; }

private:
    void release(BrowserHandle* handle);

    // Waits for an idle instance or creates one; the result is marked busy
    BrowserHandle* reserve(std::chrono::steady_clock::time_point deadline);

    // Creation without the lock held; nullptr on failure
    std::unique_ptr<BrowserHandle> create_handle();

    // Removes a handle from the books; caller closes the result outside the lock
    std::unique_ptr<BrowserHandle> detach_locked(BrowserHandle* handle);

    void close_handle(std::unique_ptr<BrowserHandle> handle);

    bool reset_state(BrowserHandle& handle);

    BrowserPoolConfig config_;
    BrowserFactory factory_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<BrowserHandle>> all_;
    std::deque<BrowserHandle*> available_;
    std::unordered_set<BrowserHandle*> busy_;
    size_t pending_creations_ = 0;
    bool closed_ = false;
    uint64_t next_id_ = 1;
    BrowserPoolStats stats_;

    PeriodicTask maintenance_task_;
    astp::ThreadPool fetch_executor_;
};

} // namespace enricher
