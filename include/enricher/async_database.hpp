#pragma once

#include <libpq-fe.h>
#include <memory>
#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <stdexcept>

namespace enricher {

// --- RAII Deleters for libpq ---

struct PGResultDeleter {
    void operator()(PGresult* res) const {
        if (res) PQclear(res);
    }
};
using PGResultPtr = std::unique_ptr<PGresult, PGResultDeleter>;

struct PGConnDeleter {
    void operator()(PGconn* conn) const {
        if (conn) PQfinish(conn);
    }
};
using PGConnPtr = std::unique_ptr<PGconn, PGConnDeleter>;

// --- Error taxonomy ---

enum class DbErrorClass {
    Transient,   // connection loss, timeouts, serialization failures, pool exhaustion
    Integrity,   // SQLSTATE class 23 (constraint violations)
    Other
};

const char* to_string(DbErrorClass cls);

/**
 * @brief Maps a SQLSTATE code to an error class.
 *
 * An empty SQLSTATE is treated as Transient when @p connection_lost is set
 * (libpq reports socket failures without a server-side code).
 */
DbErrorClass classify_sqlstate(const std::string& sqlstate, bool connection_lost);

/**
 * @brief Exception raised by the libpq helpers.
 *
 * Carries the server SQLSTATE (empty for client-side failures) and the
 * derived error class used by the retry policy.
 */
class DbError : public std::runtime_error {
public:
    DbError(const std::string& message, std::string sqlstate, DbErrorClass cls)
        : std::runtime_error(message), sqlstate_(std::move(sqlstate)), class_(cls) {}

    const std::string& sqlstate() const { return sqlstate_; }
    DbErrorClass error_class() const { return class_; }
    bool is_transient() const { return class_ == DbErrorClass::Transient; }
    bool is_integrity() const { return class_ == DbErrorClass::Integrity; }

private:
    std::string sqlstate_;
    DbErrorClass class_;
};

// --- Helper Functions ---

/**
 * @brief Waits for socket to be ready for reading or writing using select().
 *
 * @param conn Active PostgreSQL connection
 * @param for_reading True to wait for read, false to wait for write
 * @throws DbError (Transient) if socket is invalid or select() fails
 */
void waitForSocket(PGconn* conn, bool for_reading);

/**
 * @brief Asynchronously establishes a PostgreSQL connection.
 *
 * Uses PQconnectStart/PQconnectPoll for non-blocking connection establishment,
 * then applies timeouts and the search_path.
 *
 * @throws DbError if connection fails
 */
PGConnPtr asyncConnect(const char* conn_str,
                      int statement_timeout_ms = 60000,
                      int lock_timeout_ms = 10000,
                      int idle_in_transaction_timeout_ms = 30000,
                      const std::string& schema = "enricher");

/**
 * @brief Asynchronously resets a PostgreSQL connection and re-applies parameters.
 *
 * @return true if reset successful, false otherwise
 */
bool asyncReset(PGconn* conn,
               int statement_timeout_ms,
               int lock_timeout_ms,
               int idle_in_transaction_timeout_ms,
               const std::string& schema);

/**
 * @brief Sends a query asynchronously and waits for completion.
 *
 * @throws DbError if query send or processing fails
 */
void sendAndWait(PGconn* conn, const char* query);

/**
 * @brief Sends a parameterized query asynchronously and waits for completion.
 *
 * @param conn Non-blocking PostgreSQL connection
 * @param sql SQL query string with $1, $2, etc. placeholders
 * @param params Vector of parameter values (text format)
 * @throws DbError if query send or processing fails
 */
void sendQueryParamsAsync(PGconn* conn, const std::string& sql, const std::vector<std::string>& params);

/**
 * @brief Retrieves and validates a command result (COMMAND_OK).
 */
void getCommandResult(PGconn* conn);

/**
 * @brief Retrieves a command result for reading PQcmdTuples.
 */
PGResultPtr getCommandResultPtr(PGconn* conn);

/**
 * @brief Retrieves and validates a tuple result (TUPLES_OK).
 */
PGResultPtr getTuplesResult(PGconn* conn);

/**
 * @brief Runs a simple command (BEGIN, COMMIT, ...) and checks COMMAND_OK.
 */
void execCommand(PGconn* conn, const char* sql);

/**
 * @brief Runs a multi-statement script, consuming every result.
 * @throws DbError for the first statement that failed
 */
void execScript(PGconn* conn, const std::string& sql);

/**
 * @brief Encodes a list of strings as a PostgreSQL TEXT[] literal.
 *
 * Elements are always double-quoted, so commas, braces, quotes and
 * backslashes inside values survive the round trip.
 */
std::string to_pg_text_array(const std::vector<std::string>& values);

/**
 * @brief Decodes a TEXT[] literal as returned by the server in text format.
 */
std::vector<std::string> from_pg_text_array(const char* literal);

/**
 * @brief Validates a (optionally schema-qualified) SQL identifier.
 *
 * Only [A-Za-z0-9_] segments joined by a single dot are accepted, since
 * schema and table names are spliced into SQL text.
 *
 * @throws std::invalid_argument for anything else
 */
const std::string& require_identifier(const std::string& ident);

// --- Async Database Connection Pool ---

/**
 * @brief Thread-safe, asynchronous connection pool for libpq.
 *
 * Pre-allocates a fixed number of non-blocking PostgreSQL connections.
 * Connections are acquired with RAII wrappers that automatically return
 * them to the pool when destroyed.
 */
class AsyncDbPool {
public:
    /**
     * @brief Creates the pool and initializes all connections asynchronously.
     *
     * @throws std::invalid_argument if pool_size <= 0
     * @throws DbError if connection initialization fails
     */
    AsyncDbPool(std::string conn_str,
               int pool_size,
               int statement_timeout_ms = 60000,
               int lock_timeout_ms = 10000,
               int idle_in_transaction_timeout_ms = 30000,
               const std::string& schema = "enricher",
               int acquire_timeout_ms = 30000);

    ~AsyncDbPool();

    // Non-copyable, non-movable
    AsyncDbPool(const AsyncDbPool&) = delete;
    AsyncDbPool& operator=(const AsyncDbPool&) = delete;
    AsyncDbPool(AsyncDbPool&&) = delete;
    AsyncDbPool& operator=(AsyncDbPool&&) = delete;

    /**
     * @brief RAII wrapper for pooled connections.
     *
     * Automatically returns the connection to the pool when destroyed.
     */
    using PooledConnection = std::unique_ptr<PGconn, std::function<void(PGconn*)>>;

    /**
     * @brief Acquires a healthy connection from the pool.
     *
     * Waits up to the configured acquire timeout for a connection to be released.
     *
     * @throws DbError (Transient) on timeout or when no connection passes the health check
     */
    PooledConnection acquire();

    size_t size() const { return all_connections_.size(); }

    size_t available() const;

    const std::string& schema() const { return schema_; }

private:
    void release(PGconn* conn);

    bool ensureConnectionHealthy(PGconn* conn);

    std::string conn_str_;
    int statement_timeout_ms_;
    int lock_timeout_ms_;
    int idle_in_transaction_timeout_ms_;
    std::string schema_;
    int acquire_timeout_ms_;

    // Owns all connections; PQfinish runs when the pool is destroyed.
    std::vector<PGConnPtr> all_connections_;

    std::queue<PGconn*> idle_connections_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace enricher
