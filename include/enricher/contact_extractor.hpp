#pragma once

#include <regex>
#include <string>
#include <vector>

namespace enricher {

struct ExtractedContacts {
    std::vector<std::string> emails;
    std::vector<std::string> phones;
    std::vector<std::string> whatsapp;
    std::string facebook;
    std::string instagram;
    std::string linkedin;
    std::string tiktok;
    std::string youtube;

    bool has_contacts() const {
        return !emails.empty() || !phones.empty() || !whatsapp.empty() ||
               !facebook.empty() || !instagram.empty() || !linkedin.empty() ||
               !tiktok.empty() || !youtube.empty();
    }
};

/**
 * ContactExtractor - turns a fetched page into contact data
 *
 * Implementations must be safe to call from several fetch threads at once.
 */
class ContactExtractor {
public:
    virtual ~ContactExtractor() = default;

    virtual ExtractedContacts extract(const std::string& html, const std::string& page_url) const = 0;
};

/**
 * RegexContactExtractor - pattern-based extraction
 *
 * Finds e-mail addresses in text and mailto: links, phone numbers in tel:
 * links, WhatsApp numbers in wa.me / api.whatsapp.com links and the first
 * profile link per social network. Results are de-duplicated in page order.
 */
class RegexContactExtractor : public ContactExtractor {
public:
    RegexContactExtractor();

    ExtractedContacts extract(const std::string& html, const std::string& page_url) const override;

    // Keeps a leading '+' and digits; empty when fewer than 7 digits remain
    static std::string normalize_phone(const std::string& raw);

private:
    std::regex email_re_;
    std::regex tel_re_;
    std::regex whatsapp_re_;
    std::regex facebook_re_;
    std::regex instagram_re_;
    std::regex linkedin_re_;
    std::regex tiktok_re_;
    std::regex youtube_re_;
};

} // namespace enricher
