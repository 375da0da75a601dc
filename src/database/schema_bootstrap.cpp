#include "enricher/schema_bootstrap.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace enricher {

namespace {

std::string read_sql_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open SQL file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

std::string locate_schema_dir(const std::string& preferred) {
    if (!preferred.empty() && std::filesystem::exists(preferred + "/schema.sql")) {
        return preferred;
    }
    for (const auto& base : {".", "..", "../.."}) {
        std::string dir = std::string(base) + "/schema";
        if (std::filesystem::exists(dir + "/schema.sql")) {
            return dir;
        }
    }
    return "";
}

std::string render_schema_sql(const std::string& sql, const std::string& schema) {
    static const std::string placeholder = "${SCHEMA}";
    std::string result;
    result.reserve(sql.size());

    size_t pos = 0;
    while (true) {
        size_t next = sql.find(placeholder, pos);
        if (next == std::string::npos) {
            result.append(sql, pos, std::string::npos);
            break;
        }
        result.append(sql, pos, next - pos);
        result += schema;
        pos = next + placeholder.size();
    }
    return result;
}

bool initialize_schema(AsyncDbPool& db_pool, const std::string& schema, const std::string& schema_dir) {
    try {
        require_identifier(schema);

        std::string schema_file = schema_dir + "/schema.sql";
        if (schema_dir.empty() || !std::filesystem::exists(schema_file)) {
            spdlog::error("[Schema] Base schema file not found: {}", schema_file);
            return false;
        }

        spdlog::info("[Schema] Initializing schema {} from {}", schema, schema_file);
        std::string sql = render_schema_sql(read_sql_file(schema_file), schema);

        auto conn = db_pool.acquire();
        execScript(conn.get(), sql);

        spdlog::info("[Schema] Base schema applied successfully");
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Schema] Failed to initialize schema: {}", e.what());
        return false;
    }
}

} // namespace enricher
