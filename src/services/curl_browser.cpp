#include "enricher/curl_browser.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <unistd.h>

namespace enricher {

namespace {

std::atomic<int64_t> g_next_context{1};

// Fixed per-page cost estimate on top of buffered document bytes
constexpr double PAGE_OVERHEAD_MB = 2.0;

struct WriteData {
    std::string* body;
    size_t limit;
};

// Truncates at the configured limit instead of failing the transfer
size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* data = static_cast<WriteData*>(userp);
    if (data->body->size() < data->limit) {
        size_t room = data->limit - data->body->size();
        data->body->append(static_cast<char*>(contents), std::min(room, total_size));
    }
    return total_size;
}

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

} // namespace

void CurlBrowser::global_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlBrowser::global_cleanup() {
    curl_global_cleanup();
}

BrowserFactory CurlBrowser::factory(const BrowserPoolConfig& config) {
    return [config]() -> std::unique_ptr<Browser> {
        return std::make_unique<CurlBrowser>(config);
    };
}

CurlBrowser::CurlBrowser(const BrowserPoolConfig& config)
    : user_agent_(config.user_agent),
      max_body_bytes_(config.max_body_bytes),
      pid_(static_cast<int64_t>(getpid())),
      context_id_("curl-ctx-" + std::to_string(g_next_context++)) {
    share_ = curl_share_init();
    if (!share_) {
        throw BrowserError("curl_share_init failed");
    }
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);

    try {
        pages_.push_back(new_page());
    } catch (...) {
        curl_share_cleanup(share_);
        share_ = nullptr;
        throw;
    }
    spdlog::debug("[CurlBrowser] Opened context {}", context_id_);
}

CurlBrowser::~CurlBrowser() {
    close();
}

CURL* CurlBrowser::new_page() {
    CURL* page = curl_easy_init();
    if (!page) {
        throw BrowserError("curl_easy_init failed");
    }
    apply_defaults(page);
    return page;
}

void CurlBrowser::apply_defaults(CURL* page) {
    curl_easy_setopt(page, CURLOPT_SHARE, share_);
    curl_easy_setopt(page, CURLOPT_COOKIEFILE, "");  // enable the in-memory cookie engine
    curl_easy_setopt(page, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(page, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(page, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(page, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(page, CURLOPT_NOSIGNAL, 1L);
}

double CurlBrowser::memory_mb() const {
    double bytes = static_cast<double>(document_.capacity());
    return bytes / (1024.0 * 1024.0) + PAGE_OVERHEAD_MB * pages_.size();
}

void CurlBrowser::clear_cookies() {
    if (!share_ || pages_.empty()) return;
    curl_easy_setopt(pages_.front(), CURLOPT_COOKIELIST, "ALL");
}

void CurlBrowser::clear_permissions() {
    // Drops credentials, referer and any per-page overrides left by the last task
    for (CURL* page : pages_) {
        curl_easy_reset(page);
        apply_defaults(page);
    }
}

void CurlBrowser::close_extra_pages() {
    while (pages_.size() > 1) {
        curl_easy_cleanup(pages_.back());
        pages_.pop_back();
    }
    if (pages_.empty() && share_) {
        pages_.push_back(new_page());
    }
}

void CurlBrowser::navigate_blank() {
    std::string().swap(document_);
}

void CurlBrowser::open_page() {
    if (!share_) {
        throw BrowserError("Browser " + context_id_ + " is closed");
    }
    pages_.push_back(new_page());
}

PageResult CurlBrowser::fetch(const std::string& url, int timeout_ms) {
    if (!share_ || pages_.empty()) {
        throw BrowserError("Browser " + context_id_ + " is closed");
    }

    CURL* page = pages_.front();
    PageResult result;
    result.url = url;

    document_.clear();
    WriteData write_data{&document_, static_cast<size_t>(max_body_bytes_)};
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(page, CURLOPT_URL, url.c_str());
    curl_easy_setopt(page, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(page, CURLOPT_WRITEDATA, &write_data);
    curl_easy_setopt(page, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(page, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(page, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(std::min(timeout_ms, 15000)));

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(page);
    result.load_time_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    // The buffer lives on this stack frame
    curl_easy_setopt(page, CURLOPT_ERRORBUFFER, nullptr);
    curl_easy_setopt(page, CURLOPT_WRITEDATA, nullptr);

    char* effective_url = nullptr;
    curl_easy_getinfo(page, CURLINFO_EFFECTIVE_URL, &effective_url);
    curl_easy_getinfo(page, CURLINFO_RESPONSE_CODE, &result.http_status);
    result.final_url = effective_url ? effective_url : url;

    if (res != CURLE_OK) {
        result.status = "failed";
        result.error = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        return result;
    }

    if (result.http_status >= 400) {
        result.status = "failed";
        result.error = "HTTP " + std::to_string(result.http_status);
        return result;
    }

    result.status = "success";
    result.html = document_;
    result.title = extract_title(document_);
    result.pages_scraped = 1;
    return result;
}

std::string CurlBrowser::extract_title(const std::string& html) {
    std::string lower = ToLower(html.substr(0, std::min<size_t>(html.size(), 64 * 1024)));
    size_t open = lower.find("<title");
    if (open == std::string::npos) return "";
    open = lower.find('>', open);
    if (open == std::string::npos) return "";
    size_t close = lower.find("</title", open);
    if (close == std::string::npos) return "";

    std::string title;
    bool space = false;
    for (size_t i = open + 1; i < close; ++i) {
        unsigned char c = static_cast<unsigned char>(html[i]);
        if (std::isspace(c)) {
            space = !title.empty();
        } else {
            if (space) title += ' ';
            title += static_cast<char>(c);
            space = false;
        }
    }
    return title;
}

void CurlBrowser::close() {
    for (CURL* page : pages_) {
        curl_easy_cleanup(page);
    }
    pages_.clear();
    if (share_) {
        curl_share_cleanup(share_);
        share_ = nullptr;
        spdlog::debug("[CurlBrowser] Closed context {}", context_id_);
    }
    std::string().swap(document_);
}

} // namespace enricher
