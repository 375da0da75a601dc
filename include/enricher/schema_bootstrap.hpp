#pragma once

#include "enricher/async_database.hpp"
#include <string>

namespace enricher {

/**
 * @brief Finds the directory holding schema.sql.
 *
 * Checks @p preferred first (usually the install location baked in at
 * build time), then a few paths relative to the working directory.
 * Returns an empty string when none has the file.
 */
std::string locate_schema_dir(const std::string& preferred);

// Substitutes every ${SCHEMA} placeholder
std::string render_schema_sql(const std::string& sql, const std::string& schema);

/**
 * @brief Creates the enricher schema, the contacts table and the servers table.
 *
 * Idempotent. Logs and returns false on failure.
 */
bool initialize_schema(AsyncDbPool& db_pool, const std::string& schema, const std::string& schema_dir);

} // namespace enricher
