#include "enricher/async_database.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <chrono>

// For select() system call (POSIX)
#include <sys/select.h>

namespace enricher {

namespace {

bool connection_lost(PGconn* conn) {
    return conn == nullptr || PQstatus(conn) == CONNECTION_BAD;
}

[[noreturn]] void throwConnError(PGconn* conn, const std::string& context) {
    std::string msg = context;
    if (conn) {
        msg += ": ";
        msg += PQerrorMessage(conn);
    }
    throw DbError(msg, "", classify_sqlstate("", true));
}

[[noreturn]] void throwResultError(PGconn* conn, PGresult* res, const std::string& context) {
    const char* state = res ? PQresultErrorField(res, PG_DIAG_SQLSTATE) : nullptr;
    std::string sqlstate = state ? state : "";
    std::string msg = context + ": " + (res ? PQresultErrorMessage(res) : PQerrorMessage(conn));
    throw DbError(msg, sqlstate, classify_sqlstate(sqlstate, connection_lost(conn)));
}

void drainResults(PGconn* conn) {
    PGresult* drain;
    while ((drain = PQgetResult(conn)) != nullptr) {
        PQclear(drain);
    }
}

void waitUntilIdle(PGconn* conn) {
    while (true) {
        waitForSocket(conn, true);
        if (!PQconsumeInput(conn)) {
            throwConnError(conn, "PQconsumeInput failed");
        }
        if (PQisBusy(conn) == 0) {
            break;
        }
    }
}

// Applies non-blocking mode, encoding, timeouts and search_path to a fresh
// or freshly reset connection.
void applySessionSettings(PGconn* conn,
                          int statement_timeout_ms,
                          int lock_timeout_ms,
                          int idle_in_transaction_timeout_ms,
                          const std::string& schema) {
    if (PQsetnonblocking(conn, 1) != 0) {
        throwConnError(conn, "Failed to set non-blocking mode");
    }

    PQsetClientEncoding(conn, "UTF8");

    std::string set_params =
        "SET statement_timeout = " + std::to_string(statement_timeout_ms) + "; " +
        "SET lock_timeout = " + std::to_string(lock_timeout_ms) + "; " +
        "SET idle_in_transaction_session_timeout = " + std::to_string(idle_in_transaction_timeout_ms) + "; " +
        "SET search_path = " + require_identifier(schema) + ", public;";

    if (!PQsendQuery(conn, set_params.c_str())) {
        throwConnError(conn, "Failed to send connection parameters");
    }

    waitUntilIdle(conn);

    PGresult* result;
    while ((result = PQgetResult(conn)) != nullptr) {
        PGResultPtr guard(result);
        if (PQresultStatus(result) != PGRES_COMMAND_OK) {
            drainResults(conn);
            throwResultError(conn, result, "Failed to set connection parameters");
        }
    }
}

bool isIdentChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

} // namespace

// --- Error classification ---

const char* to_string(DbErrorClass cls) {
    switch (cls) {
        case DbErrorClass::Transient: return "transient";
        case DbErrorClass::Integrity: return "integrity";
        case DbErrorClass::Other: return "other";
    }
    return "other";
}

DbErrorClass classify_sqlstate(const std::string& sqlstate, bool connection_lost) {
    if (sqlstate.empty()) {
        return connection_lost ? DbErrorClass::Transient : DbErrorClass::Other;
    }
    if (sqlstate.compare(0, 2, "08") == 0) {
        return DbErrorClass::Transient;      // connection exception
    }
    if (sqlstate.compare(0, 2, "23") == 0) {
        return DbErrorClass::Integrity;      // integrity constraint violation
    }
    static const char* const transient_codes[] = {
        "40001",  // serialization_failure
        "40P01",  // deadlock_detected
        "53300",  // too_many_connections
        "55P03",  // lock_not_available (lock_timeout)
        "57014",  // query_canceled (statement_timeout)
        "57P01",  // admin_shutdown
        "57P02",  // crash_shutdown
        "57P03",  // cannot_connect_now
    };
    for (const char* code : transient_codes) {
        if (sqlstate == code) return DbErrorClass::Transient;
    }
    return DbErrorClass::Other;
}

// --- Helper: Socket Polling ---

void waitForSocket(PGconn* conn, bool for_reading) {
    int sock_fd = PQsocket(conn);
    if (sock_fd < 0) {
        throw DbError("PQsocket returned invalid file descriptor", "", DbErrorClass::Transient);
    }

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(sock_fd, &fds);

    int ret;
    if (for_reading) {
        ret = select(sock_fd + 1, &fds, nullptr, nullptr, nullptr);
    } else {
        ret = select(sock_fd + 1, nullptr, &fds, nullptr, nullptr);
    }

    if (ret < 0) {
        throw DbError("select() failed: " + std::string(strerror(errno)), "", DbErrorClass::Transient);
    }
}

// --- Helper: Asynchronous Connection ---

PGConnPtr asyncConnect(const char* conn_str,
                      int statement_timeout_ms,
                      int lock_timeout_ms,
                      int idle_in_transaction_timeout_ms,
                      const std::string& schema) {
    PGConnPtr conn(PQconnectStart(conn_str));
    if (!conn) {
        throw DbError("PQconnectStart failed to allocate connection", "", DbErrorClass::Transient);
    }

    if (PQstatus(conn.get()) == CONNECTION_BAD) {
        throwConnError(conn.get(), "PQconnectStart failed");
    }

    PostgresPollingStatusType poll_status;
    do {
        poll_status = PQconnectPoll(conn.get());
        switch (poll_status) {
            case PGRES_POLLING_READING:
                waitForSocket(conn.get(), true);
                break;
            case PGRES_POLLING_WRITING:
                waitForSocket(conn.get(), false);
                break;
            case PGRES_POLLING_FAILED:
                throwConnError(conn.get(), "Async connection failed");
            default:
                break;
        }
    } while (poll_status != PGRES_POLLING_OK);

    applySessionSettings(conn.get(), statement_timeout_ms, lock_timeout_ms,
                         idle_in_transaction_timeout_ms, schema);
    return conn;
}

// --- Helper: Asynchronous Connection Reset ---

bool asyncReset(PGconn* conn,
               int statement_timeout_ms,
               int lock_timeout_ms,
               int idle_in_transaction_timeout_ms,
               const std::string& schema) {
    if (!conn) {
        spdlog::error("[asyncReset] Cannot reset null connection");
        return false;
    }

    if (PQresetStart(conn) == 0) {
        spdlog::error("[asyncReset] PQresetStart failed");
        return false;
    }

    try {
        PostgresPollingStatusType poll_status;
        do {
            poll_status = PQresetPoll(conn);
            switch (poll_status) {
                case PGRES_POLLING_READING:
                    waitForSocket(conn, true);
                    break;
                case PGRES_POLLING_WRITING:
                    waitForSocket(conn, false);
                    break;
                case PGRES_POLLING_FAILED:
                    spdlog::error("[asyncReset] Reset failed: {}", PQerrorMessage(conn));
                    return false;
                default:
                    break;
            }
        } while (poll_status != PGRES_POLLING_OK);

        if (PQstatus(conn) != CONNECTION_OK) {
            spdlog::error("[asyncReset] Connection still invalid after reset: {}", PQerrorMessage(conn));
            return false;
        }

        applySessionSettings(conn, statement_timeout_ms, lock_timeout_ms,
                             idle_in_transaction_timeout_ms, schema);
    } catch (const std::exception& e) {
        spdlog::error("[asyncReset] {}", e.what());
        return false;
    }

    spdlog::info("[asyncReset] Connection reset and reconfigured successfully");
    return true;
}

// --- Helper: Send Query and Wait ---

void sendAndWait(PGconn* conn, const char* query) {
    if (!PQsendQuery(conn, query)) {
        throwConnError(conn, "PQsendQuery failed");
    }
    waitUntilIdle(conn);
}

// --- Helper: Get Command Result ---

void getCommandResult(PGconn* conn) {
    getCommandResultPtr(conn);
}

PGResultPtr getCommandResultPtr(PGconn* conn) {
    PGResultPtr res(PQgetResult(conn));
    if (!res) {
        throwConnError(conn, "Server returned no result");
    }
    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        drainResults(conn);
        throwResultError(conn, res.get(), "Query command failed");
    }

    PGResultPtr null_check(PQgetResult(conn));
    if (null_check) {
        drainResults(conn);
        throw DbError("Unexpected extra result after command", "", DbErrorClass::Other);
    }
    return res;
}

// --- Helper: Get Tuples Result ---

PGResultPtr getTuplesResult(PGconn* conn) {
    PGResultPtr res(PQgetResult(conn));
    if (!res) {
        throwConnError(conn, "Server returned no result for SELECT");
    }
    if (PQresultStatus(res.get()) != PGRES_TUPLES_OK) {
        drainResults(conn);
        throwResultError(conn, res.get(), "SELECT query failed");
    }

    PGResultPtr null_check(PQgetResult(conn));
    if (null_check) {
        drainResults(conn);
        throw DbError("Unexpected extra result after SELECT", "", DbErrorClass::Other);
    }
    return res;
}

void execCommand(PGconn* conn, const char* sql) {
    sendAndWait(conn, sql);
    getCommandResult(conn);
}

void execScript(PGconn* conn, const std::string& sql) {
    sendAndWait(conn, sql.c_str());

    PGResultPtr failed;
    while (true) {
        PGResultPtr res(PQgetResult(conn));
        if (!res) break;
        auto status = PQresultStatus(res.get());
        if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK && !failed) {
            failed = std::move(res);
        }
    }
    if (failed) {
        throwResultError(conn, failed.get(), "Script failed");
    }
}

// --- Helper: Send Parameterized Query Async ---

void sendQueryParamsAsync(PGconn* conn, const std::string& sql, const std::vector<std::string>& params) {
    std::vector<const char*> param_values;
    param_values.reserve(params.size());

    for (const auto& param : params) {
        param_values.push_back(param.c_str());
    }

    if (!PQsendQueryParams(conn, sql.c_str(), static_cast<int>(params.size()),
                          nullptr, param_values.data(), nullptr, nullptr, 0)) {
        throwConnError(conn, "PQsendQueryParams failed");
    }

    // Flush until the whole statement is on the wire; multi-row upserts can
    // exceed the socket send buffer.
    while (true) {
        int flush_result = PQflush(conn);
        if (flush_result == 0) {
            break;
        } else if (flush_result == -1) {
            throwConnError(conn, "PQflush failed");
        }
        waitForSocket(conn, false);
    }

    waitUntilIdle(conn);
}

// --- Array and identifier helpers ---

std::string to_pg_text_array(const std::vector<std::string>& values) {
    std::string out = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        out += '"';
        for (char c : values[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

std::vector<std::string> from_pg_text_array(const char* literal) {
    std::vector<std::string> out;
    if (!literal) return out;

    std::string s(literal);
    if (s.size() < 2 || s.front() != '{' || s.back() != '}') {
        return out;
    }

    size_t i = 1;
    const size_t end = s.size() - 1;
    while (i < end) {
        std::string element;
        bool quoted = false;
        if (s[i] == '"') {
            quoted = true;
            ++i;
            while (i < end && s[i] != '"') {
                if (s[i] == '\\' && i + 1 < end) ++i;
                element += s[i++];
            }
            ++i;  // closing quote
        } else {
            while (i < end && s[i] != ',') {
                element += s[i++];
            }
        }
        if (quoted || element != "NULL") {
            out.push_back(element);
        }
        if (i < end && s[i] == ',') ++i;
    }
    return out;
}

const std::string& require_identifier(const std::string& ident) {
    bool ok = !ident.empty();
    bool seen_dot = false;
    bool segment_empty = true;
    for (char c : ident) {
        if (c == '.') {
            if (seen_dot || segment_empty) { ok = false; break; }
            seen_dot = true;
            segment_empty = true;
        } else if (isIdentChar(c)) {
            segment_empty = false;
        } else {
            ok = false;
            break;
        }
    }
    if (!ok || segment_empty) {
        throw std::invalid_argument("Invalid SQL identifier: '" + ident + "'");
    }
    return ident;
}

// --- AsyncDbPool Implementation ---

AsyncDbPool::AsyncDbPool(std::string conn_str,
                       int pool_size,
                       int statement_timeout_ms,
                       int lock_timeout_ms,
                       int idle_in_transaction_timeout_ms,
                       const std::string& schema,
                       int acquire_timeout_ms)
    : conn_str_(std::move(conn_str)),
      statement_timeout_ms_(statement_timeout_ms),
      lock_timeout_ms_(lock_timeout_ms),
      idle_in_transaction_timeout_ms_(idle_in_transaction_timeout_ms),
      schema_(require_identifier(schema)),
      acquire_timeout_ms_(acquire_timeout_ms) {

    if (pool_size <= 0) {
        throw std::invalid_argument("Pool size must be greater than 0");
    }

    spdlog::info("[AsyncDbPool] Initializing {} async connections...", pool_size);

    all_connections_.reserve(pool_size);

    for (int i = 0; i < pool_size; ++i) {
        try {
            auto conn = asyncConnect(conn_str_.c_str(),
                                    statement_timeout_ms_,
                                    lock_timeout_ms_,
                                    idle_in_transaction_timeout_ms_,
                                    schema_);
            idle_connections_.push(conn.get());
            all_connections_.push_back(std::move(conn));

            spdlog::debug("[AsyncDbPool] Connection {}/{} initialized", i + 1, pool_size);
        } catch (const std::exception& e) {
            spdlog::error("[AsyncDbPool] Failed to create connection {}/{}: {}",
                         i + 1, pool_size, e.what());
            throw;
        }
    }

    spdlog::info("[AsyncDbPool] Initialization complete. {} connections ready.",
                all_connections_.size());
}

AsyncDbPool::~AsyncDbPool() {
    std::unique_lock<std::mutex> lock(mtx_);
    if (idle_connections_.size() != all_connections_.size()) {
        spdlog::warn("[AsyncDbPool] Waiting for {} connections to be returned...",
                    all_connections_.size() - idle_connections_.size());

        cv_.wait_for(lock, std::chrono::seconds(5), [this] {
            return idle_connections_.size() == all_connections_.size();
        });

        if (idle_connections_.size() != all_connections_.size()) {
            spdlog::error("[AsyncDbPool] {} connections still in use during shutdown!",
                        all_connections_.size() - idle_connections_.size());
        }
    }
    spdlog::info("[AsyncDbPool] Closed {} connections", all_connections_.size());
}

AsyncDbPool::PooledConnection AsyncDbPool::acquire() {
    // Trying each connection once is enough when the database is down
    const size_t max_attempts = all_connections_.size();
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(acquire_timeout_ms_);

    for (size_t attempt = 0; attempt < max_attempts; ++attempt) {
        std::unique_lock<std::mutex> lock(mtx_);

        if (!cv_.wait_until(lock, deadline, [this] { return !idle_connections_.empty(); })) {
            throw DbError("Timed out after " + std::to_string(acquire_timeout_ms_) +
                          "ms waiting for a database connection", "", DbErrorClass::Transient);
        }

        PGconn* conn = idle_connections_.front();
        idle_connections_.pop();
        lock.unlock();

        if (ensureConnectionHealthy(conn)) {
            return PooledConnection(conn, [this](PGconn* returned_conn) {
                this->release(returned_conn);
            });
        }

        spdlog::debug("[AsyncDbPool] Connection health check failed (attempt {}/{})",
                     attempt + 1, max_attempts);
        release(conn);
    }

    spdlog::error("[AsyncDbPool] No healthy connection after {} attempts, database may be unavailable",
                 max_attempts);
    throw DbError("Failed to acquire healthy database connection", "", DbErrorClass::Transient);
}

void AsyncDbPool::release(PGconn* conn) {
    if (!conn) return;

    // Pending results would surface as "another command is already in progress"
    // for the next borrower.
    drainResults(conn);

    // A connection returned mid-transaction (e.g. after an exception) must not
    // carry its locks to the next borrower.
    if (PQstatus(conn) == CONNECTION_OK &&
        PQtransactionStatus(conn) != PQTRANS_IDLE) {
        spdlog::warn("[AsyncDbPool] Connection released inside a transaction, rolling back");
        try {
            execCommand(conn, "ROLLBACK");
        } catch (const std::exception& e) {
            spdlog::warn("[AsyncDbPool] Rollback on release failed: {}", e.what());
        }
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::warn("[AsyncDbPool] Connection invalid on release, attempting async reset...");
        if (!asyncReset(conn, statement_timeout_ms_, lock_timeout_ms_,
                       idle_in_transaction_timeout_ms_, schema_)) {
            spdlog::error("[AsyncDbPool] Async connection reset failed, connection may be unusable");
        }
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        idle_connections_.push(conn);
    }
    cv_.notify_one();
}

size_t AsyncDbPool::available() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return idle_connections_.size();
}

bool AsyncDbPool::ensureConnectionHealthy(PGconn* conn) {
    auto reset = [this, conn]() {
        drainResults(conn);
        return asyncReset(conn, statement_timeout_ms_, lock_timeout_ms_,
                          idle_in_transaction_timeout_ms_, schema_);
    };

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::warn("[AsyncDbPool] Connection status not OK, attempting reset...");
        return reset();
    }

    if (!PQsendQuery(conn, "SELECT 1")) {
        spdlog::warn("[AsyncDbPool] Health check send failed, attempting reset...");
        return reset();
    }

    try {
        int sock_fd = PQsocket(conn);
        if (sock_fd < 0) {
            spdlog::warn("[AsyncDbPool] Invalid socket during health check, attempting reset...");
            return reset();
        }

        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(sock_fd, &fds);

        // Fail fast when the database is down
        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 100000;

        int ret = select(sock_fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret <= 0) {
            spdlog::warn("[AsyncDbPool] Health check {}, attempting reset...",
                        ret == 0 ? "timed out" : "select failed");
            return reset();
        }

        if (!PQconsumeInput(conn)) {
            spdlog::warn("[AsyncDbPool] Failed to consume health check input, attempting reset...");
            return reset();
        }

        while (PQisBusy(conn)) {
            waitForSocket(conn, true);
            if (!PQconsumeInput(conn)) {
                spdlog::warn("[AsyncDbPool] Failed to consume input, attempting reset...");
                return reset();
            }
        }

        PGResultPtr result(PQgetResult(conn));
        ExecStatusType res_status = result ? PQresultStatus(result.get()) : PGRES_FATAL_ERROR;
        drainResults(conn);

        if (res_status != PGRES_TUPLES_OK) {
            spdlog::warn("[AsyncDbPool] Health check query failed, attempting reset...");
            return reset();
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[AsyncDbPool] Health check exception: {}, attempting reset...", e.what());
        return reset();
    }
}

} // namespace enricher
