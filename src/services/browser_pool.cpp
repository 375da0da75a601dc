#include "enricher/browser_pool.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace enricher {

namespace {

constexpr size_t TREND_WINDOW = 5;
constexpr size_t TREND_MIN_CHECKS = 3;
constexpr auto CREATION_RETRY_PAUSE = std::chrono::milliseconds(500);

double elapsed_seconds(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

// --- BrowserHandle ---

BrowserHandle::BrowserHandle(uint64_t id, std::unique_ptr<Browser> browser)
    : id_(id), browser_(std::move(browser)) {
    metrics_.pid = browser_->pid();
    metrics_.started_at = std::chrono::steady_clock::now();
    metrics_.last_used = metrics_.started_at;
}

void BrowserHandle::record_health(bool healthy) {
    history_.push_back(healthy);
    while (history_.size() > HEALTH_HISTORY_SIZE) {
        history_.pop_front();
    }
}

double BrowserHandle::health_trend() const {
    if (history_.size() < TREND_MIN_CHECKS) {
        return 1.0;
    }
    size_t window = std::min(TREND_WINDOW, history_.size());
    size_t healthy = std::count(history_.end() - window, history_.end(), true);
    return static_cast<double>(healthy) / window;
}

// --- BrowserPool ---

BrowserPool::BrowserPool(BrowserPoolConfig config,
                         BrowserFactory factory,
                         std::shared_ptr<astp::ThreadPool> system_thread_pool)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      maintenance_task_(std::move(system_thread_pool), "BrowserPool", config_.health_check_interval_ms,
                        [this]() { run_maintenance(); }),
      fetch_executor_(std::max(1, config_.max_instances)) {
    if (config_.max_instances < 1) {
        throw std::invalid_argument("BrowserPool max_instances must be at least 1");
    }
    if (config_.min_instances < 0 || config_.min_instances > config_.max_instances) {
        throw std::invalid_argument("BrowserPool min_instances must be within [0, max_instances]");
    }
}

BrowserPool::~BrowserPool() {
    close();
}

void BrowserPool::initialize() {
    spdlog::info("[BrowserPool] Initializing: min={}, max={}", config_.min_instances, config_.max_instances);

    for (int i = 0; i < config_.min_instances; ++i) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || all_.size() + pending_creations_ >= static_cast<size_t>(config_.min_instances)) break;
            pending_creations_++;
        }
        auto handle = create_handle();
        std::lock_guard<std::mutex> lock(mutex_);
        pending_creations_--;
        if (handle) {
            available_.push_back(handle.get());
            all_.push_back(std::move(handle));
        }
    }
    cv_.notify_all();

    spdlog::info("[BrowserPool] Initialized with {} browsers", size());
    maintenance_task_.start();
}

std::unique_ptr<BrowserHandle> BrowserPool::create_handle() {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
    }

    try {
        auto browser = factory_();
        if (!browser) {
            throw BrowserError("factory returned no browser");
        }
        auto handle = std::make_unique<BrowserHandle>(id, std::move(browser));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.browsers_created++;
        }
        spdlog::debug("[BrowserPool] Created browser #{} (pid {})", id, handle->metrics().pid);
        return handle;
    } catch (const std::exception& e) {
        spdlog::error("[BrowserPool] Failed to create browser: {}", e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.creation_failures++;
        return nullptr;
    }
}

std::unique_ptr<BrowserHandle> BrowserPool::detach_locked(BrowserHandle* handle) {
    busy_.erase(handle);
    auto avail_it = std::find(available_.begin(), available_.end(), handle);
    if (avail_it != available_.end()) {
        available_.erase(avail_it);
    }

    auto it = std::find_if(all_.begin(), all_.end(),
                           [handle](const std::unique_ptr<BrowserHandle>& h) { return h.get() == handle; });
    if (it == all_.end()) {
        return nullptr;
    }
    std::unique_ptr<BrowserHandle> owned = std::move(*it);
    all_.erase(it);
    stats_.browsers_retired++;
    return owned;
}

void BrowserPool::close_handle(std::unique_ptr<BrowserHandle> handle) {
    if (!handle) return;
    try {
        handle->browser().close();
        spdlog::debug("[BrowserPool] Closed browser #{} (pid {})", handle->id(), handle->metrics().pid);
    } catch (const std::exception& e) {
        spdlog::warn("[BrowserPool] Error closing browser #{}: {}", handle->id(), e.what());
    }
}

bool BrowserPool::check_health(BrowserHandle& handle) {
    auto& m = handle.metrics();
    bool connected = false;
    double memory_mb = m.memory_mb;
    int open_pages = m.open_pages;
    try {
        connected = handle.browser().is_connected();
        memory_mb = handle.browser().memory_mb();
        open_pages = handle.browser().open_page_count();
    } catch (const std::exception& e) {
        spdlog::warn("[BrowserPool] Could not sample browser #{}: {}", handle.id(), e.what());
        m.error_count++;
    }

    {
        // stats() reads memory_mb of every handle, including ones held here
        std::lock_guard<std::mutex> lock(mutex_);
        m.memory_mb = memory_mb;
        m.open_pages = open_pages;
    }

    double age_s = elapsed_seconds(m.started_at);
    bool healthy = connected &&
                   memory_mb < config_.memory_limit_mb &&
                   open_pages <= config_.max_pages &&
                   m.error_count < config_.max_errors &&
                   age_s < config_.max_lifetime_s;

    handle.record_health(healthy);
    if (!healthy) {
        spdlog::warn("[BrowserPool] Browser #{} unhealthy: connected={}, memory={:.1f}MB, pages={}, errors={}, age={:.0f}s",
                     handle.id(), connected, memory_mb, open_pages, m.error_count, age_s);
    }
    return healthy;
}

bool BrowserPool::reset_state(BrowserHandle& handle) {
    try {
        auto& browser = handle.browser();
        browser.clear_cookies();
        browser.clear_permissions();
        browser.close_extra_pages();
        browser.navigate_blank();
        handle.metrics().open_pages = browser.open_page_count();
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[BrowserPool] State reset failed for browser #{}: {}", handle.id(), e.what());
        handle.metrics().error_count++;
        return false;
    }
}

BrowserHandle* BrowserPool::reserve(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    const size_t max = static_cast<size_t>(config_.max_instances);

    while (true) {
        if (closed_) {
            throw BrowserError("Browser pool is closed");
        }

        if (!available_.empty()) {
            BrowserHandle* handle = available_.front();
            available_.pop_front();
            busy_.insert(handle);
            return handle;
        }

        // Nothing idle: scale up before waiting
        if (all_.size() + pending_creations_ < max) {
            pending_creations_++;
            lock.unlock();
            auto created = create_handle();
            lock.lock();
            pending_creations_--;

            if (created && !closed_) {
                BrowserHandle* handle = created.get();
                all_.push_back(std::move(created));
                busy_.insert(handle);
                spdlog::info("[BrowserPool] Scaled up: {} browsers", all_.size());
                return handle;
            }
            if (created) {
                lock.unlock();
                close_handle(std::move(created));
                throw BrowserError("Browser pool is closed");
            }

            // Creation failed; pause before trying again
            cv_.notify_all();
            auto pause_until = std::min(deadline, std::chrono::steady_clock::now() + CREATION_RETRY_PAUSE);
            cv_.wait_until(lock, pause_until, [this] { return closed_ || !available_.empty(); });
            if (std::chrono::steady_clock::now() >= deadline && available_.empty()) {
                stats_.failed_requests++;
                throw PoolTimeoutError("No browser available: creation failed and none was released in time");
            }
            continue;
        }

        bool ready = cv_.wait_until(lock, deadline, [this, max] {
            return closed_ || !available_.empty() || all_.size() + pending_creations_ < max;
        });
        if (!ready) {
            stats_.failed_requests++;
            throw PoolTimeoutError("No browser available after " +
                                   std::to_string(config_.acquire_timeout_ms) + "ms");
        }
    }
}

BrowserPool::PooledBrowser BrowserPool::acquire() {
    return acquire(std::chrono::milliseconds(config_.acquire_timeout_ms));
}

BrowserPool::PooledBrowser BrowserPool::acquire(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.total_requests++;
    }

    BrowserHandle* handle = reserve(deadline);

    for (int attempt = 0;; ++attempt) {
        if (check_health(*handle) && reset_state(*handle)) {
            break;
        }

        if (attempt >= config_.max_replacement_attempts) {
            std::unique_ptr<BrowserHandle> retired;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                retired = detach_locked(handle);
                stats_.failed_requests++;
            }
            close_handle(std::move(retired));
            cv_.notify_all();
            throw PoolExhaustedError("No healthy browser after " +
                                     std::to_string(config_.max_replacement_attempts) + " replacements");
        }

        // Retire the unhealthy instance and take over its slot for a fresh one
        std::unique_ptr<BrowserHandle> retired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            retired = detach_locked(handle);
            pending_creations_++;
        }
        uint64_t old_id = retired ? retired->id() : 0;
        close_handle(std::move(retired));

        auto fresh = create_handle();

        std::unique_lock<std::mutex> lock(mutex_);
        pending_creations_--;
        if (!fresh) {
            spdlog::error("[BrowserPool] Replacement for browser #{} failed, pool shrinks to {}",
                          old_id, all_.size());
            lock.unlock();
            cv_.notify_all();
            handle = reserve(deadline);
            continue;
        }
        if (closed_) {
            lock.unlock();
            close_handle(std::move(fresh));
            throw BrowserError("Browser pool is closed");
        }
        handle = fresh.get();
        all_.push_back(std::move(fresh));
        busy_.insert(handle);
        stats_.browsers_replaced++;
        spdlog::info("[BrowserPool] Replaced browser #{} with #{}", old_id, handle->id());
    }

    handle->metrics().last_used = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.healthy_requests++;
    }

    return PooledBrowser(handle, [this](BrowserHandle* returned) {
        this->release(returned);
    });
}

void BrowserPool::release(BrowserHandle* handle) {
    if (!handle) return;

    bool clean = reset_state(*handle);
    handle->metrics().last_used = std::chrono::steady_clock::now();

    std::vector<std::unique_ptr<BrowserHandle>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (busy_.erase(handle) == 0) {
            return;  // not ours, or already released
        }

        if (closed_ || !clean) {
            to_close.push_back(detach_locked(handle));
        } else {
            available_.push_back(handle);
        }

        // Scale down: keep at most min_instances idle
        const size_t min = static_cast<size_t>(config_.min_instances);
        if (available_.size() > min && all_.size() > min) {
            BrowserHandle* idle = available_.front();
            to_close.push_back(detach_locked(idle));
            spdlog::info("[BrowserPool] Scaled down: {} browsers", all_.size());
        }
    }
    cv_.notify_all();

    for (auto& h : to_close) {
        close_handle(std::move(h));
    }
}

void BrowserPool::run_maintenance() {
    std::vector<BrowserHandle*> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        idle.assign(available_.begin(), available_.end());
        available_.clear();
        for (auto* h : idle) busy_.insert(h);
    }

    size_t replaced = 0;
    for (auto* handle : idle) {
        if (check_health(*handle)) {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_.erase(handle);
            available_.push_back(handle);
            cv_.notify_one();
            continue;
        }

        std::unique_ptr<BrowserHandle> retired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            retired = detach_locked(handle);
            pending_creations_++;
        }
        close_handle(std::move(retired));

        auto fresh = create_handle();
        std::unique_ptr<BrowserHandle> orphan;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_creations_--;
            if (fresh && !closed_) {
                available_.push_back(fresh.get());
                all_.push_back(std::move(fresh));
                stats_.browsers_replaced++;
                replaced++;
            } else {
                orphan = std::move(fresh);
            }
        }
        close_handle(std::move(orphan));
        cv_.notify_all();
    }

    // Refill to the low-water mark
    size_t refilled = 0;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || all_.size() + pending_creations_ >= static_cast<size_t>(config_.min_instances)) break;
            pending_creations_++;
        }
        auto fresh = create_handle();
        std::unique_ptr<BrowserHandle> orphan;
        bool created = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_creations_--;
            if (fresh && !closed_) {
                available_.push_back(fresh.get());
                all_.push_back(std::move(fresh));
                created = true;
                refilled++;
            } else {
                orphan = std::move(fresh);
            }
        }
        close_handle(std::move(orphan));
        cv_.notify_all();
        if (!created) break;  // try again next cycle
    }

    if (replaced > 0 || refilled > 0) {
        spdlog::info("[BrowserPool] Maintenance: checked {}, replaced {}, refilled {} ({} browsers)",
                     idle.size(), replaced, refilled, size());
    } else {
        spdlog::debug("[BrowserPool] Maintenance: checked {} idle browsers", idle.size());
    }
}

PageResult BrowserPool::scrape(const std::string& url) {
    auto start = std::chrono::steady_clock::now();
    PageResult result;

    try {
        auto handle = acquire();
        try {
            result = handle->browser().fetch(url, config_.fetch_timeout_ms);
            handle->metrics().request_count++;
        } catch (const std::exception& e) {
            handle->metrics().error_count++;
            result = PageResult();
            result.error = e.what();
        }
    } catch (const std::exception& e) {
        result = PageResult();
        result.error = e.what();
    }

    result.url = url;
    result.load_time_seconds = elapsed_seconds(start);
    if (!result.ok() && result.error.empty()) {
        result.error = "fetch failed";
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.ok()) {
            stats_.pages_fetched++;
        } else {
            stats_.fetch_failures++;
        }
    }
    if (!result.ok()) {
        spdlog::debug("[BrowserPool] Fetch of {} failed: {}", url, result.error);
    }
    return result;
}

std::future<PageResult> BrowserPool::scrape_async(const std::string& url) {
    return fetch_executor_.future_from_push([this, url]() {
        return this->scrape(url);
    });
}

BrowserPoolStats BrowserPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BrowserPoolStats snapshot = stats_;
    snapshot.total_browsers = all_.size();
    snapshot.available_browsers = available_.size();
    snapshot.busy_browsers = busy_.size();
    snapshot.total_memory_mb = 0.0;
    for (const auto& h : all_) {
        snapshot.total_memory_mb += h->metrics().memory_mb;
    }
    return snapshot;
}

size_t BrowserPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return all_.size();
}

size_t BrowserPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_.size();
}

size_t BrowserPool::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_.size();
}

void BrowserPool::close() {
    maintenance_task_.stop();

    std::vector<std::unique_ptr<BrowserHandle>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;

        // Busy instances are closed when their holders release them
        std::vector<BrowserHandle*> idle(available_.begin(), available_.end());
        for (auto* h : idle) {
            to_close.push_back(detach_locked(h));
        }
        if (!busy_.empty()) {
            spdlog::warn("[BrowserPool] Closing with {} browsers still in use", busy_.size());
        }
    }
    cv_.notify_all();

    for (auto& h : to_close) {
        close_handle(std::move(h));
    }
    spdlog::info("[BrowserPool] Closed");
}

} // namespace enricher
