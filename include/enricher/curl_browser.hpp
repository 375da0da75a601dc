#pragma once

#include "enricher/browser.hpp"
#include "enricher/config.hpp"
#include <curl/curl.h>
#include <string>
#include <vector>

namespace enricher {

/**
 * CurlBrowser - HTTP browsing context backed by libcurl
 *
 * One instance owns a CURLSH share (cookie jar, DNS cache, connection
 * cache) that plays the role of the browsing context, and one easy handle
 * per open page. Page 0 always exists; fetches run in it.
 */
class CurlBrowser : public Browser {
public:
    explicit CurlBrowser(const BrowserPoolConfig& config);
    ~CurlBrowser() override;

    CurlBrowser(const CurlBrowser&) = delete;
    CurlBrowser& operator=(const CurlBrowser&) = delete;

    int64_t pid() const override { return pid_; }
    std::string context_id() const override { return context_id_; }

    double memory_mb() const override;
    int open_page_count() const override { return static_cast<int>(pages_.size()); }
    bool is_connected() const override { return share_ != nullptr; }

    void clear_cookies() override;
    void clear_permissions() override;
    void close_extra_pages() override;
    void navigate_blank() override;

    PageResult fetch(const std::string& url, int timeout_ms) override;

    // Opens an additional page bound to the same context
    void open_page();

    void close() override;

    // Process-wide libcurl setup; call once before creating browsers
    static void global_init();
    static void global_cleanup();

    static BrowserFactory factory(const BrowserPoolConfig& config);

    // Text of the first <title> element, whitespace-collapsed
    static std::string extract_title(const std::string& html);

private:
    CURL* new_page();
    void apply_defaults(CURL* page);

    std::string user_agent_;
    long max_body_bytes_;
    int64_t pid_;
    std::string context_id_;

    CURLSH* share_ = nullptr;
    std::vector<CURL*> pages_;
    std::string document_;
};

} // namespace enricher
