#pragma once

#include <string>
#include <cstdlib>
#include <cstring>

namespace duet {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0 || std::strcmp(value, "1") == 0;
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

struct DatabaseConfig {
    // Connection settings
    std::string user = "postgres";
    std::string host = "localhost";
    std::string database = "postgres";
    std::string password = "postgres";
    std::string port = "5432";
    std::string schema = "duet";

    bool use_ssl = false;

    // Pool configuration
    int pool_size = 8;
    int connection_timeout = 2000;       // 2 seconds
    int statement_timeout = 5000;        // 5 seconds - a fan-out step should never take longer
    int lock_timeout = 2000;             // 2 seconds
    int idle_in_transaction_timeout = 30000;

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "postgres");
        config.port = get_env_string("PG_PORT", "5432");
        config.schema = get_env_string("DB_SCHEMA", "duet");

        config.use_ssl = get_env_bool("PG_USE_SSL", false);

        config.pool_size = get_env_int("DB_POOL_SIZE", 8);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 2000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 5000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 2000);
        config.idle_in_transaction_timeout = get_env_int("DB_IDLE_IN_TRANSACTION_TIMEOUT", 30000);
        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user + " password=" + password;
        conn_str += use_ssl ? " sslmode=require" : " sslmode=disable";

        // connect_timeout is in seconds and must be at least 1
        int connect_seconds = connection_timeout / 1000;
        if (connect_seconds < 1) connect_seconds = 1;
        conn_str += " connect_timeout=" + std::to_string(connect_seconds);
        return conn_str;
    }
};

struct StoreConfig {
    // Pagination
    int default_page_size = 20;
    int max_page_size = 100;

    // Per-step retry with exponential backoff (applies to every fan-out step)
    int max_retries = 3;                 // Attempts after the first one
    int retry_base_ms = 20;
    double retry_multiplier = 2.0;
    int retry_max_ms = 500;

    static StoreConfig from_env() {
        StoreConfig config;
        config.default_page_size = get_env_int("DEFAULT_PAGE_SIZE", 20);
        config.max_page_size = get_env_int("MAX_PAGE_SIZE", 100);
        config.max_retries = get_env_int("STORE_MAX_RETRIES", 3);
        config.retry_base_ms = get_env_int("STORE_RETRY_BASE_MS", 20);
        config.retry_multiplier = get_env_double("STORE_RETRY_MULTIPLIER", 2.0);
        config.retry_max_ms = get_env_int("STORE_RETRY_MAX_MS", 500);
        return config;
    }
};

struct CursorConfig {
    // 32 bytes as 64 hex characters. Every replica serving the same clients
    // must share it, otherwise cursors only resume on the replica that minted them.
    std::string key_hex;

    static CursorConfig from_env() {
        CursorConfig config;
        config.key_hex = get_env_string("DUET_CURSOR_KEY", "");
        return config;
    }
};

struct RepairConfig {
    bool enabled = true;
    int interval_ms = 1000;
    int max_attempts = 20;
    std::string journal_dir;             // Empty = in-memory queue only

    static RepairConfig from_env() {
        RepairConfig config;
        config.enabled = get_env_bool("REPAIR_ENABLED", true);
        config.interval_ms = get_env_int("REPAIR_INTERVAL_MS", 1000);
        config.max_attempts = get_env_int("REPAIR_MAX_ATTEMPTS", 20);
        config.journal_dir = get_env_string("REPAIR_JOURNAL_DIR", "");
        return config;
    }
};

struct LoggingConfig {
    std::string log_level = "info";

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.log_level = get_env_string("LOG_LEVEL", "info");
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    StoreConfig store;
    CursorConfig cursor;
    RepairConfig repair;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.store = StoreConfig::from_env();
        config.cursor = CursorConfig::from_env();
        config.repair = RepairConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }
};

} // namespace duet
