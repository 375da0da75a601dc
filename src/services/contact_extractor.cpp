#include "enricher/contact_extractor.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <unordered_set>

namespace enricher {

namespace {

const auto ICASE = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Asset names such as "logo@2x.png" look like addresses
bool is_asset_name(const std::string& email) {
    static const char* const extensions[] = {".png", ".jpg", ".jpeg", ".gif", ".webp", ".svg", ".css", ".js"};
    for (const char* ext : extensions) {
        if (ends_with(email, ext)) return true;
    }
    return false;
}

void push_unique(std::vector<std::string>& values, std::unordered_set<std::string>& seen, std::string value) {
    if (value.empty()) return;
    if (seen.insert(value).second) {
        values.push_back(std::move(value));
    }
}

// Window bounds around a needle; every pattern below is bounded to fit
constexpr size_t LOCAL_PART_MAX = 64;
constexpr size_t DOMAIN_MAX = 255;
constexpr size_t PREFIX_WINDOW = 40;
constexpr size_t SUFFIX_WINDOW = 240;

bool is_local_char(unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '_' || c == '%' || c == '+' || c == '-';
}

bool is_domain_char(unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '-';
}

// Sorted offsets of every needle occurrence in @p lower
std::vector<size_t> find_needles(const std::string& lower, std::initializer_list<const char*> needles) {
    std::vector<size_t> positions;
    for (const char* needle : needles) {
        for (size_t pos = lower.find(needle); pos != std::string::npos; pos = lower.find(needle, pos + 1)) {
            positions.push_back(pos);
        }
    }
    std::sort(positions.begin(), positions.end());
    return positions;
}

// Runs @p re over a short window around each needle, in page order, and
// hands every match that covers the needle to @p on_match. std::regex
// recurses per matched character, so it never sees the whole page.
template <typename Fn>
void scan_needles(const std::string& text, const std::string& lower,
                  std::initializer_list<const char*> needles,
                  size_t before, size_t after,
                  const std::regex& re, Fn&& on_match) {
    for (size_t pos : find_needles(lower, needles)) {
        size_t start = pos > before ? pos - before : 0;
        size_t length = std::min(text.size() - start, (pos - start) + after);
        std::string window = text.substr(start, length);
        size_t needle_offset = pos - start;

        for (std::sregex_iterator it(window.begin(), window.end(), re), end; it != end; ++it) {
            size_t match_start = static_cast<size_t>(it->position(0));
            size_t match_end = match_start + static_cast<size_t>(it->length(0));
            if (match_start <= needle_offset && needle_offset < match_end) {
                if (!on_match(*it)) return;
            }
        }
    }
}

std::string first_profile(const std::regex& re, const std::string& text, const std::string& lower,
                          const char* needle, std::initializer_list<const char*> excluded_paths) {
    std::string profile;
    scan_needles(text, lower, {needle}, PREFIX_WINDOW, SUFFIX_WINDOW, re, [&](const std::smatch& m) {
        std::string path = to_lower(m[1].str());
        std::string segment = path.substr(0, path.find('/'));
        for (const char* name : excluded_paths) {
            if (segment == name) {
                return true;
            }
        }

        std::string url = m.str(0);
        while (!url.empty() && (url.back() == '/' || url.back() == '.')) {
            url.pop_back();
        }
        profile = url;
        return false;
    });
    return profile;
}

} // namespace

RegexContactExtractor::RegexContactExtractor()
    : email_re_(R"(([A-Za-z0-9._%+\-]{1,64}@[A-Za-z0-9\-]{1,63}(?:\.[A-Za-z0-9\-]{1,63}){0,8}\.[A-Za-z]{2,24}))", ICASE),
      tel_re_(R"(href\s{0,4}=\s{0,4}["']tel:([^"'<>]{3,40})["'])", ICASE),
      whatsapp_re_(R"((?:wa\.me/|whatsapp\.com/send/?\?phone=)(?:%2B|\+)?([0-9]{7,15}))", ICASE),
      facebook_re_(R"(https?://(?:www\.|m\.|web\.)?facebook\.com/([A-Za-z0-9_.\-]{1,100}(?:/[A-Za-z0-9_.\-]{1,100})?))", ICASE),
      instagram_re_(R"(https?://(?:www\.)?instagram\.com/([A-Za-z0-9_.]{1,60}))", ICASE),
      linkedin_re_(R"(https?://(?:[a-z]{2,3}\.|www\.)?linkedin\.com/((?:company|in|school)/[A-Za-z0-9_\-%]{1,100}))", ICASE),
      tiktok_re_(R"(https?://(?:www\.)?tiktok\.com/(@[A-Za-z0-9_.]{1,60}))", ICASE),
      youtube_re_(R"(https?://(?:www\.)?youtube\.com/((?:channel/|c/|user/|@)[A-Za-z0-9_\-]{1,100}))", ICASE) {}

std::string RegexContactExtractor::normalize_phone(const std::string& raw) {
    std::string result;
    size_t digits = 0;
    for (unsigned char c : raw) {
        if (std::isdigit(c)) {
            result += static_cast<char>(c);
            ++digits;
        } else if (c == '+' && result.empty()) {
            result += '+';
        }
    }
    if (digits < 7 || digits > 15) return "";
    return result;
}

ExtractedContacts RegexContactExtractor::extract(const std::string& html, const std::string& page_url) const {
    ExtractedContacts contacts;
    const std::string lower = to_lower(html);

    // Each '@' is cut out with at most one address around it before matching
    std::unordered_set<std::string> seen_emails;
    for (size_t at = html.find('@'); at != std::string::npos; at = html.find('@', at + 1)) {
        size_t left = at;
        while (left > 0 && at - left < LOCAL_PART_MAX && is_local_char(html[left - 1])) --left;
        size_t right = at + 1;
        while (right < html.size() && right - at <= DOMAIN_MAX && is_domain_char(html[right])) ++right;

        std::string candidate = html.substr(left, right - left);
        std::smatch m;
        if (!std::regex_search(candidate, m, email_re_)) continue;

        std::string email = to_lower(m[1].str());
        while (!email.empty() && email.front() == '.') email.erase(email.begin());
        if (email.rfind("%20", 0) == 0) email.erase(0, 3);
        if (is_asset_name(email)) continue;
        push_unique(contacts.emails, seen_emails, std::move(email));
    }

    std::unordered_set<std::string> seen_phones;
    scan_needles(html, lower, {"tel:"}, 16, 48, tel_re_, [&](const std::smatch& m) {
        push_unique(contacts.phones, seen_phones, normalize_phone(m[1].str()));
        return true;
    });

    std::unordered_set<std::string> seen_whatsapp;
    scan_needles(html, lower, {"wa.me/", "whatsapp.com/send"}, 0, 64, whatsapp_re_, [&](const std::smatch& m) {
        push_unique(contacts.whatsapp, seen_whatsapp, "+" + m[1].str());
        return true;
    });

    // A business "website" is sometimes the social profile itself
    const std::string text = page_url + "\n" + html;
    const std::string text_lower = to_lower(page_url) + "\n" + lower;
    contacts.facebook = first_profile(facebook_re_, text, text_lower, "facebook.com/",
        {"sharer.php", "sharer", "share", "share.php", "plugins", "dialog", "tr", "login", "policy", "privacy", "help", "events"});
    contacts.instagram = first_profile(instagram_re_, text, text_lower, "instagram.com/", {"p", "explore", "reel", "accounts"});
    contacts.linkedin = first_profile(linkedin_re_, text, text_lower, "linkedin.com/", {});
    contacts.tiktok = first_profile(tiktok_re_, text, text_lower, "tiktok.com/", {});
    contacts.youtube = first_profile(youtube_re_, text, text_lower, "youtube.com/", {});

    return contacts;
}

} // namespace enricher
