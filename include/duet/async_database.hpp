#pragma once

#include <libpq-fe.h>
#include <memory>
#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>

namespace duet {

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

// Session parameters applied to every new or reset connection
struct SessionSettings {
    int statement_timeout_ms = 5000;
    int lock_timeout_ms = 2000;
    int idle_in_transaction_timeout_ms = 30000;
    std::string schema = "duet";
};

// --- Helper Functions ---

/**
 * @brief Waits for socket to be ready for reading or writing using select().
 *
 * @param conn Active PostgreSQL connection
 * @param for_reading True to wait for read, false to wait for write
 * @throws TransientStorageError if socket is invalid or select() fails
 */
void waitForSocket(PGconn* conn, bool for_reading);

/**
 * @brief Asynchronously establishes a PostgreSQL connection.
 *
 * Uses PQconnectStart/PQconnectPoll, switches the connection to non-blocking
 * mode and applies the session settings (timeouts, search_path).
 *
 * @throws TransientStorageError if the server cannot be reached
 */
PGConnPtr asyncConnect(const char* conn_str, const SessionSettings& settings);

/**
 * @brief Resets a broken connection in place and re-applies the session settings.
 *
 * @return true if the connection is usable again
 */
bool asyncReset(PGconn* conn, const SessionSettings& settings);

/**
 * @brief Sends a parameterized query and waits until its result is ready.
 *
 * @param conn Non-blocking PostgreSQL connection
 * @param sql SQL query string with $1, $2, etc. placeholders
 * @param params Parameter values in text format
 * @throws TransientStorageError if the connection fails while sending
 */
void sendQueryParamsAsync(PGconn* conn, const std::string& sql, const std::vector<std::string>& params);

/**
 * @brief Retrieves a COMMAND_OK result (affected rows available via PQcmdTuples).
 *
 * @throws TransientStorageError or StorageError depending on the SQLSTATE
 */
PGResultPtr getCommandResult(PGconn* conn);

/**
 * @brief Retrieves a TUPLES_OK result.
 *
 * @throws TransientStorageError or StorageError depending on the SQLSTATE
 */
PGResultPtr getTuplesResult(PGconn* conn);

/**
 * @brief Executes a multi-statement script (schema setup). Blocking.
 */
void execScript(PGconn* conn, const std::string& sql);

/**
 * @brief True for SQLSTATE classes worth retrying.
 *
 * 08 connection exception, 40 transaction rollback (serialization failure,
 * deadlock), 53 insufficient resources, 57 operator intervention (includes
 * statement timeout cancellation).
 */
bool isTransientSqlState(const char* sqlstate);

// --- Async Database Connection Pool ---

/**
 * @brief Thread-safe pool of non-blocking libpq connections.
 *
 * Connections are acquired through an RAII handle that returns them to the
 * pool when destroyed. Broken connections are reset on acquire and release.
 */
class AsyncDbPool {
public:
    /**
     * @throws std::invalid_argument if pool_size <= 0
     * @throws TransientStorageError if the first connection cannot be opened
     */
    AsyncDbPool(std::string conn_str, int pool_size, SessionSettings settings);

    ~AsyncDbPool();

    // Non-copyable, non-movable
    AsyncDbPool(const AsyncDbPool&) = delete;
    AsyncDbPool& operator=(const AsyncDbPool&) = delete;
    AsyncDbPool(AsyncDbPool&&) = delete;
    AsyncDbPool& operator=(AsyncDbPool&&) = delete;

    using PooledConnection = std::unique_ptr<PGconn, std::function<void(PGconn*)>>;

    /**
     * @brief Acquires a healthy connection, blocking until one is idle.
     *
     * @throws TransientStorageError when every connection fails its health check
     */
    PooledConnection acquire();

    size_t size() const { return all_connections_.size(); }
    size_t available() const;

    const SessionSettings& settings() const { return settings_; }

private:
    void release(PGconn* conn);
    bool ensureConnectionHealthy(PGconn* conn);

    std::string conn_str_;
    SessionSettings settings_;

    // Owns every connection; PQfinish runs when the pool is destroyed
    std::vector<PGConnPtr> all_connections_;
    std::queue<PGconn*> idle_connections_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace duet
