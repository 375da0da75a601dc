#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <unistd.h>

namespace enricher {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get double from environment
inline double get_env_double(const char* name, double default_value) {
    const char* value = std::getenv(name);
    return value ? std::atof(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

inline std::string local_hostname() {
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "enricher";
    }
    return std::string(buf);
}

struct DatabaseConfig {
    // Connection settings
    std::string user = "postgres";
    std::string host = "localhost";
    std::string database = "postgres";
    std::string password = "postgres";
    std::string port = "5432";
    std::string schema = "enricher";
    std::string source_table = "public.results";

    bool use_ssl = false;

    // Pool configuration. Every server process holds its own pool, so the
    // fleet-wide connection count is pool_size * processes.
    int pool_size = 5;
    int max_pool_size = 5;
    int min_pool_size = 2;               // a held claim transaction plus one for writes
    int idle_timeout = 30000;            // 30 seconds
    int connection_timeout = 10000;      // 10 seconds
    int statement_timeout = 60000;       // 60 seconds
    int lock_timeout = 10000;            // 10 seconds

    // Retry settings for sink writes
    int max_retries = 3;
    int retry_base_delay_ms = 1000;

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "postgres");
        config.port = get_env_string("PG_PORT", "5432");
        config.schema = get_env_string("ENRICHER_SCHEMA", "enricher");
        config.source_table = get_env_string("SOURCE_TABLE", "public.results");

        config.use_ssl = get_env_bool("PG_USE_SSL", false);

        config.pool_size = std::min(get_env_int("DB_POOL_SIZE", 5), config.max_pool_size);
        config.pool_size = std::max(config.pool_size, config.min_pool_size);
        config.idle_timeout = get_env_int("DB_IDLE_TIMEOUT", 30000);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 10000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 60000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 10000);

        config.max_retries = get_env_int("DB_MAX_RETRIES", 3);
        config.retry_base_delay_ms = get_env_int("DB_RETRY_BASE_DELAY_MS", 1000);
        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user + " password=" + password;

        conn_str += use_ssl ? " sslmode=require" : " sslmode=disable";

        // connect_timeout is the only timeout that goes in the connection string;
        // statement/lock/idle timeouts are applied with SET after connecting.
        conn_str += " connect_timeout=" + std::to_string(std::max(1, connection_timeout / 1000));
        conn_str += " application_name=contact-enricher";

        return conn_str;
    }
};

struct ClaimConfig {
    int batch_size = 50;
    int row_limit = 0;                   // 0 = until the backlog is drained
    std::string country_filter;          // empty = all countries
    std::string lock_namespace;          // empty = raw row id as the lock key
    int retry_delay_ms = 5000;
    int max_consecutive_failures = 10;

    static ClaimConfig from_env() {
        ClaimConfig config;
        config.batch_size = get_env_int("BATCH_SIZE", 50);
        config.row_limit = get_env_int("ROW_LIMIT", 0);
        config.country_filter = get_env_string("COUNTRY_FILTER", "");
        config.lock_namespace = get_env_string("LOCK_NAMESPACE", "");
        config.retry_delay_ms = get_env_int("CLAIM_RETRY_DELAY_MS", 5000);
        config.max_consecutive_failures = get_env_int("CLAIM_MAX_FAILURES", 10);
        return config;
    }
};

struct SinkConfig {
    int max_batch_rows = 200;

    static SinkConfig from_env() {
        SinkConfig config;
        config.max_batch_rows = get_env_int("SINK_MAX_BATCH_ROWS", 200);
        return config;
    }
};

struct BrowserPoolConfig {
    int min_instances = 2;
    int max_instances = 10;

    // Health thresholds
    double memory_limit_mb = 500.0;
    int max_pages = 10;
    int max_errors = 5;
    int max_lifetime_s = 3600;

    int health_check_interval_ms = 60000;
    int acquire_timeout_ms = 30000;
    int max_replacement_attempts = 3;

    // Fetch behaviour
    int fetch_timeout_ms = 30000;
    long max_body_bytes = 5 * 1024 * 1024;
    std::string user_agent =
        "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/124.0 Safari/537.36";

    static BrowserPoolConfig from_env() {
        BrowserPoolConfig config;
        config.min_instances = get_env_int("BROWSER_MIN_INSTANCES", 2);
        config.max_instances = get_env_int("BROWSER_MAX_INSTANCES", 10);
        config.memory_limit_mb = get_env_double("BROWSER_MEMORY_LIMIT_MB", 500.0);
        config.max_pages = get_env_int("BROWSER_MAX_PAGES", 10);
        config.max_errors = get_env_int("BROWSER_MAX_ERRORS", 5);
        config.max_lifetime_s = get_env_int("BROWSER_MAX_LIFETIME_S", 3600);
        config.health_check_interval_ms = get_env_int("BROWSER_HEALTH_CHECK_INTERVAL_MS", 60000);
        config.acquire_timeout_ms = get_env_int("BROWSER_ACQUIRE_TIMEOUT_MS", 30000);
        config.max_replacement_attempts = get_env_int("BROWSER_MAX_REPLACEMENTS", 3);
        config.fetch_timeout_ms = get_env_int("BROWSER_FETCH_TIMEOUT_MS", 30000);
        config.max_body_bytes = get_env_int("BROWSER_MAX_BODY_BYTES", 5 * 1024 * 1024);
        config.user_agent = get_env_string("BROWSER_USER_AGENT", config.user_agent);

        if (config.min_instances < 0) config.min_instances = 0;
        if (config.max_instances < 1) config.max_instances = 1;
        if (config.min_instances > config.max_instances) {
            config.min_instances = config.max_instances;
        }
        return config;
    }
};

struct ServerConfig {
    std::string server_id;
    std::string server_name;
    std::string server_region;
    int heartbeat_interval_ms = 30000;
    bool dev_mode = false;

    static ServerConfig from_env() {
        ServerConfig config;
        std::string hostname = local_hostname();
        config.server_id = get_env_string("SERVER_ID", hostname);
        config.server_name = get_env_string("SERVER_NAME", hostname);
        config.server_region = get_env_string("SERVER_REGION", "");
        config.heartbeat_interval_ms = get_env_int("HEARTBEAT_INTERVAL_MS", 30000);
        return config;
    }
};

struct LoggingConfig {
    std::string log_level = "info";
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.log_level = get_env_string("LOG_LEVEL", "info");
        config.log_pattern = get_env_string("LOG_PATTERN", config.log_pattern);
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    ClaimConfig claim;
    SinkConfig sink;
    BrowserPoolConfig browser;
    ServerConfig server;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.claim = ClaimConfig::from_env();
        config.sink = SinkConfig::from_env();
        config.browser = BrowserPoolConfig::from_env();
        config.server = ServerConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }
};

} // namespace enricher
