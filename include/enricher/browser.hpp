#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace enricher {

/**
 * Outcome of one page fetch. Failures are values, not exceptions, once a
 * result leaves the browser pool.
 */
struct PageResult {
    std::string url;
    std::string status = "failed";      // "success" or "failed"
    long http_status = 0;
    std::string html;
    std::string title;
    std::string final_url;
    std::string error;
    double load_time_seconds = 0.0;
    int pages_scraped = 0;

    bool ok() const { return status == "success"; }
    bool was_redirected() const { return !final_url.empty() && final_url != url; }
};

class BrowserError : public std::runtime_error {
public:
    explicit BrowserError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Browser - one heavyweight, stateful browsing process
 *
 * Implementations own a process (or process-like resource) and a single
 * browsing context inside it. Not thread-safe; the pool guarantees a
 * browser is driven by one caller at a time.
 */
class Browser {
public:
    virtual ~Browser() = default;

    // Process identity and bound browsing context
    virtual int64_t pid() const = 0;
    virtual std::string context_id() const = 0;

    // Live resource figures sampled by health checks
    virtual double memory_mb() const = 0;
    virtual int open_page_count() const = 0;
    virtual bool is_connected() const = 0;

    // Per-task state reset
    virtual void clear_cookies() = 0;
    virtual void clear_permissions() = 0;
    virtual void close_extra_pages() = 0;
    virtual void navigate_blank() = 0;

    /**
     * Loads @p url in the current page.
     * @throws BrowserError when the browser itself is unusable
     */
    virtual PageResult fetch(const std::string& url, int timeout_ms) = 0;

    virtual void close() = 0;
};

/**
 * Launches a new browser. Throws on failure; the pool turns that into a
 * logged, non-growing cycle.
 */
using BrowserFactory = std::function<std::unique_ptr<Browser>()>;

} // namespace enricher
