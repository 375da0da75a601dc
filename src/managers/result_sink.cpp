#include "enricher/result_sink.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <iterator>
#include <set>
#include <unordered_map>

namespace enricher {

namespace {

// Largest row count that stays under libpq's 65535 bind parameter limit
constexpr size_t MAX_ROWS_PER_STATEMENT = 65535 / ResultSink::PARAMS_PER_ROW;

const char* const UPSERT_COLUMNS =
    "business_key, source_id, business_name, business_category, business_website, "
    "country_code, address, latitude, longitude, review_count, review_rating, "
    "emails, phones, whatsapp, facebook, instagram, linkedin, tiktok, youtube, "
    "validated_emails, validated_whatsapp, final_url, was_redirected, "
    "scrape_status, scrape_error, processing_time, pages_scraped, last_scrape_server, "
    "emails_count, phones_count, whatsapp_count";

// Row template; %N is replaced by the row's parameter offset + N
const char* const ROW_TEMPLATE =
    "(%1, NULLIF(%2, '')::bigint, NULLIF(%3, ''), NULLIF(%4, ''), NULLIF(%5, ''), "
    "%6, NULLIF(%7, ''), NULLIF(%8, '')::double precision, NULLIF(%9, '')::double precision, "
    "NULLIF(%10, '')::integer, NULLIF(%11, '')::numeric, "
    "%12::text[], %13::text[], %14::text[], "
    "NULLIF(%15, ''), NULLIF(%16, ''), NULLIF(%17, ''), NULLIF(%18, ''), NULLIF(%19, ''), "
    "NULLIF(%20, '')::jsonb, NULLIF(%21, '')::jsonb, NULLIF(%22, ''), %23::boolean, "
    "NULLIF(%24, ''), NULLIF(%25, ''), %26::numeric, %27::integer, NULLIF(%28, ''), "
    "cardinality(%12::text[]), cardinality(%13::text[]), cardinality(%14::text[]))";

const char* const CONFLICT_CLAUSE =
    " ON CONFLICT (business_key) DO UPDATE SET "
    // descriptive fields follow the backlog when it has a value
    "source_id = COALESCE(EXCLUDED.source_id, t.source_id), "
    "business_name = COALESCE(EXCLUDED.business_name, t.business_name), "
    "business_category = COALESCE(EXCLUDED.business_category, t.business_category), "
    "business_website = COALESCE(EXCLUDED.business_website, t.business_website), "
    "country_code = EXCLUDED.country_code, "
    "address = COALESCE(EXCLUDED.address, t.address), "
    "latitude = COALESCE(EXCLUDED.latitude, t.latitude), "
    "longitude = COALESCE(EXCLUDED.longitude, t.longitude), "
    "review_count = COALESCE(EXCLUDED.review_count, t.review_count), "
    "review_rating = COALESCE(EXCLUDED.review_rating, t.review_rating), "
    // appended
    "emails = COALESCE(t.emails, '{}') || COALESCE(EXCLUDED.emails, '{}'), "
    "whatsapp = COALESCE(t.whatsapp, '{}') || COALESCE(EXCLUDED.whatsapp, '{}'), "
    // first write wins
    "facebook = COALESCE(t.facebook, EXCLUDED.facebook), "
    "instagram = COALESCE(t.instagram, EXCLUDED.instagram), "
    "linkedin = COALESCE(t.linkedin, EXCLUDED.linkedin), "
    // newest scrape wins
    "phones = EXCLUDED.phones, "
    "tiktok = EXCLUDED.tiktok, "
    "youtube = EXCLUDED.youtube, "
    "validated_emails = EXCLUDED.validated_emails, "
    "validated_whatsapp = EXCLUDED.validated_whatsapp, "
    "final_url = EXCLUDED.final_url, "
    "was_redirected = EXCLUDED.was_redirected, "
    "scrape_status = EXCLUDED.scrape_status, "
    "scrape_error = EXCLUDED.scrape_error, "
    "processing_time = EXCLUDED.processing_time, "
    "pages_scraped = EXCLUDED.pages_scraped, "
    "last_scrape_server = EXCLUDED.last_scrape_server, "
    "emails_count = cardinality(COALESCE(t.emails, '{}') || COALESCE(EXCLUDED.emails, '{}')), "
    "phones_count = COALESCE(cardinality(EXCLUDED.phones), 0), "
    "whatsapp_count = cardinality(COALESCE(t.whatsapp, '{}') || COALESCE(EXCLUDED.whatsapp, '{}')), "
    "scrape_count = t.scrape_count + 1, "
    "updated_at = NOW()";

std::string format_number(double value) {
    return nlohmann::json(value).dump();
}

template <typename T>
std::string optional_param(const std::optional<T>& value) {
    return value ? format_number(static_cast<double>(*value)) : std::string();
}

std::string json_param(const nlohmann::json& value) {
    return value.is_null() ? std::string() : value.dump();
}

std::string render_row(int param_offset) {
    std::string row;
    const std::string tmpl = ROW_TEMPLATE;
    for (size_t i = 0; i < tmpl.size(); ++i) {
        if (tmpl[i] == '%') {
            size_t j = i + 1;
            int n = 0;
            while (j < tmpl.size() && tmpl[j] >= '0' && tmpl[j] <= '9') {
                n = n * 10 + (tmpl[j] - '0');
                ++j;
            }
            row += '$';
            row += std::to_string(param_offset + n);
            i = j - 1;
        } else {
            row += tmpl[i];
        }
    }
    return row;
}

} // namespace

ResultSink::ResultSink(std::shared_ptr<AsyncDbPool> db_pool,
                       std::string sink_table,
                       RetryPolicy retry_policy,
                       int max_batch_rows)
    : db_pool_(std::move(db_pool)),
      sink_table_(require_identifier(sink_table)),
      retry_policy_(std::move(retry_policy)),
      max_batch_rows_(std::min(static_cast<size_t>(std::max(1, max_batch_rows)), MAX_ROWS_PER_STATEMENT)) {
}

std::vector<std::string> ResultSink::record_params(const EnrichmentRecord& r) {
    std::vector<std::string> p;
    p.reserve(PARAMS_PER_ROW);
    p.push_back(r.business_key);
    p.push_back(r.source_id > 0 ? std::to_string(r.source_id) : std::string());
    p.push_back(r.business_name);
    p.push_back(r.business_category);
    p.push_back(r.business_website);
    p.push_back(normalize_country(r.country));
    p.push_back(r.address);
    p.push_back(optional_param(r.latitude));
    p.push_back(optional_param(r.longitude));
    p.push_back(r.review_count ? std::to_string(*r.review_count) : std::string());
    p.push_back(optional_param(r.review_rating));
    p.push_back(to_pg_text_array(r.emails));
    p.push_back(to_pg_text_array(r.phones));
    p.push_back(to_pg_text_array(r.whatsapp));
    p.push_back(r.facebook);
    p.push_back(r.instagram);
    p.push_back(r.linkedin);
    p.push_back(r.tiktok);
    p.push_back(r.youtube);
    p.push_back(json_param(r.validated_emails));
    p.push_back(json_param(r.validated_whatsapp));
    p.push_back(r.final_url);
    p.push_back(r.was_redirected ? "true" : "false");
    p.push_back(r.status);
    p.push_back(r.error);
    p.push_back(format_number(r.processing_time_seconds));
    p.push_back(std::to_string(r.pages_scraped));
    p.push_back(r.scrape_server);
    return p;
}

std::string ResultSink::build_upsert_sql(size_t rows) const {
    std::string sql = "INSERT INTO " + sink_table_ + " AS t (" + UPSERT_COLUMNS + ") VALUES ";
    for (size_t i = 0; i < rows; ++i) {
        if (i > 0) sql += ", ";
        sql += render_row(static_cast<int>(i) * PARAMS_PER_ROW);
    }
    sql += CONFLICT_CLAUSE;
    return sql;
}

std::vector<std::vector<const EnrichmentRecord*>> ResultSink::split_duplicate_keys(
    const std::vector<const EnrichmentRecord*>& records) {
    std::vector<std::vector<const EnrichmentRecord*>> waves;
    std::unordered_map<std::string, size_t> seen;
    for (const auto* record : records) {
        size_t wave = seen[record->business_key]++;
        if (wave >= waves.size()) {
            waves.resize(wave + 1);
        }
        waves[wave].push_back(record);
    }
    return waves;
}

void ResultSink::write_rows(PGconn* conn, const std::vector<const EnrichmentRecord*>& rows) {
    std::vector<std::string> params;
    params.reserve(rows.size() * PARAMS_PER_ROW);
    for (const auto* record : rows) {
        auto row_params = record_params(*record);
        params.insert(params.end(),
                      std::make_move_iterator(row_params.begin()),
                      std::make_move_iterator(row_params.end()));
    }
    sendQueryParamsAsync(conn, build_upsert_sql(rows.size()), params);
    getCommandResult(conn);
}

bool ResultSink::upsert(const EnrichmentRecord& record) {
    return write_one(record) == WriteOutcome::Written;
}

ResultSink::WriteOutcome ResultSink::write_one(const EnrichmentRecord& record) {
    if (record.business_key.empty()) {
        spdlog::error("[ResultSink] Refusing to write a record without a business key");
        return WriteOutcome::Rejected;
    }

    try {
        retry_policy_.run("upsert " + record.business_key, [&]() {
            auto conn = db_pool_->acquire();
            write_rows(conn.get(), {&record});
        });
        return WriteOutcome::Written;
    } catch (const DbError& e) {
        if (e.is_transient()) {
            spdlog::error("[ResultSink] Failed to write {} after retries: {}", record.business_key, e.what());
            return WriteOutcome::Transient;
        }
        if (e.is_integrity()) {
            spdlog::error("[ResultSink] Integrity violation for {} (SQLSTATE {}), not retrying: {}",
                          record.business_key, e.sqlstate(), e.what());
        } else {
            spdlog::error("[ResultSink] Failed to write {} ({}): {}",
                          record.business_key, to_string(e.error_class()), e.what());
        }
    } catch (const std::exception& e) {
        spdlog::error("[ResultSink] Failed to write {}: {}", record.business_key, e.what());
    }
    return WriteOutcome::Rejected;
}

void ResultSink::write_chunk(const std::vector<const EnrichmentRecord*>& chunk) {
    auto waves = split_duplicate_keys(chunk);

    retry_policy_.run("batch upsert of " + std::to_string(chunk.size()) + " rows", [&]() {
        auto conn = db_pool_->acquire();
        if (waves.size() == 1) {
            write_rows(conn.get(), waves.front());
            return;
        }

        // Repeated keys need one statement per wave; keep them atomic so a
        // replay never appends the same emails twice.
        execCommand(conn.get(), "BEGIN");
        try {
            for (const auto& wave : waves) {
                write_rows(conn.get(), wave);
            }
            execCommand(conn.get(), "COMMIT");
        } catch (const std::exception&) {
            if (PQstatus(conn.get()) == CONNECTION_OK) {
                try {
                    execCommand(conn.get(), "ROLLBACK");
                } catch (const std::exception& rollback_error) {
                    spdlog::warn("[ResultSink] Rollback failed: {}", rollback_error.what());
                }
            }
            throw;
        }
    });
}

WriteReport ResultSink::upsert_batch(const std::vector<EnrichmentRecord>& records) {
    WriteReport report;

    std::vector<const EnrichmentRecord*> valid;
    valid.reserve(records.size());
    for (const auto& record : records) {
        if (record.business_key.empty()) {
            spdlog::error("[ResultSink] Dropping record without a business key (source id {})",
                          record.source_id);
            report.failed_keys.push_back("");
            report.rejected_ids.push_back(record.source_id);
        } else {
            valid.push_back(&record);
        }
    }

    for (size_t start = 0; start < valid.size(); start += max_batch_rows_) {
        size_t end = std::min(start + max_batch_rows_, valid.size());
        std::vector<const EnrichmentRecord*> chunk(valid.begin() + start, valid.begin() + end);

        bool replay_rows = false;
        try {
            write_chunk(chunk);
            report.written += chunk.size();
            continue;
        } catch (const DbError& e) {
            if (e.is_transient()) {
                spdlog::error("[ResultSink] Batch of {} rows failed after retries: {}",
                              chunk.size(), e.what());
            } else {
                spdlog::warn("[ResultSink] Batch of {} rows failed ({}), replaying row by row: {}",
                             chunk.size(), to_string(e.error_class()), e.what());
                replay_rows = true;
            }
        } catch (const std::exception& e) {
            spdlog::warn("[ResultSink] Batch of {} rows failed, replaying row by row: {}",
                         chunk.size(), e.what());
            replay_rows = true;
        }

        for (const auto* record : chunk) {
            WriteOutcome outcome = replay_rows ? write_one(*record) : WriteOutcome::Transient;
            if (outcome == WriteOutcome::Written) {
                report.written++;
                continue;
            }
            report.failed_keys.push_back(record->business_key);
            if (outcome == WriteOutcome::Rejected) {
                report.rejected_ids.push_back(record->source_id);
            }
        }
    }

    if (!report.ok()) {
        spdlog::warn("[ResultSink] Wrote {}/{} records, {} failed",
                     report.written, records.size(), report.failed_keys.size());
    } else {
        spdlog::debug("[ResultSink] Wrote {} records", report.written);
    }
    return report;
}

void ResultSink::verify_schema() {
    static const char* const required[] = {
        "business_key", "source_id", "business_name", "business_category", "business_website",
        "country_code", "address", "latitude", "longitude", "review_count", "review_rating",
        "emails", "phones", "whatsapp", "facebook", "instagram", "linkedin", "tiktok", "youtube",
        "validated_emails", "validated_whatsapp", "final_url", "was_redirected",
        "scrape_status", "scrape_error", "processing_time", "pages_scraped", "last_scrape_server",
        "emails_count", "phones_count", "whatsapp_count", "scrape_count", "updated_at"
    };

    std::string schema;
    std::string table = sink_table_;
    auto dot = sink_table_.find('.');
    if (dot != std::string::npos) {
        schema = sink_table_.substr(0, dot);
        table = sink_table_.substr(dot + 1);
    }

    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(),
        "SELECT column_name FROM information_schema.columns "
        "WHERE table_schema = COALESCE(NULLIF($1, ''), current_schema()) AND table_name = $2",
        {schema, table});
    auto result = getTuplesResult(conn.get());

    std::set<std::string> present;
    for (int i = 0; i < PQntuples(result.get()); ++i) {
        present.insert(PQgetvalue(result.get(), i, 0));
    }
    if (present.empty()) {
        throw std::runtime_error("Sink table " + sink_table_ + " does not exist");
    }

    std::string missing;
    for (const char* column : required) {
        if (!present.count(column)) {
            if (!missing.empty()) missing += ", ";
            missing += column;
        }
    }
    if (!missing.empty()) {
        throw std::runtime_error("Sink table " + sink_table_ + " is missing columns: " + missing);
    }
    spdlog::info("[ResultSink] Schema verified for {}", sink_table_);
}

SinkStats ResultSink::total_stats() {
    auto conn = db_pool_->acquire();
    sendAndWait(conn.get(), (
        "SELECT COUNT(*), "
        "       COUNT(*) FILTER (WHERE emails_count > 0), "
        "       COUNT(*) FILTER (WHERE phones_count > 0), "
        "       COUNT(*) FILTER (WHERE whatsapp_count > 0), "
        "       COUNT(DISTINCT country_code), "
        "       COUNT(*) FILTER (WHERE scrape_status IN ('success', 'no_contacts_found')), "
        "       COUNT(*) FILTER (WHERE scrape_status = 'failed') "
        "FROM " + sink_table_).c_str());
    auto result = getTuplesResult(conn.get());

    SinkStats stats;
    if (PQntuples(result.get()) == 1) {
        auto col = [&](int c) { return std::strtoll(PQgetvalue(result.get(), 0, c), nullptr, 10); };
        stats.total = col(0);
        stats.with_email = col(1);
        stats.with_phone = col(2);
        stats.with_whatsapp = col(3);
        stats.countries = col(4);
        stats.successful = col(5);
        stats.failed = col(6);
    }
    return stats;
}

std::vector<CountryStats> ResultSink::country_stats(int limit) {
    auto conn = db_pool_->acquire();
    sendQueryParamsAsync(conn.get(),
        "SELECT country_code, COUNT(*), "
        "       COUNT(*) FILTER (WHERE emails_count > 0), "
        "       COUNT(*) FILTER (WHERE phones_count > 0), "
        "       COUNT(*) FILTER (WHERE whatsapp_count > 0) "
        "FROM " + sink_table_ + " "
        "GROUP BY country_code ORDER BY 2 DESC, 1 LIMIT $1",
        {std::to_string(limit)});
    auto result = getTuplesResult(conn.get());

    std::vector<CountryStats> stats;
    for (int i = 0; i < PQntuples(result.get()); ++i) {
        auto col = [&](int c) { return std::strtoll(PQgetvalue(result.get(), i, c), nullptr, 10); };
        CountryStats row;
        row.country = PQgetvalue(result.get(), i, 0);
        row.total = col(1);
        row.with_email = col(2);
        row.with_phone = col(3);
        row.with_whatsapp = col(4);
        stats.push_back(std::move(row));
    }
    return stats;
}

} // namespace enricher
