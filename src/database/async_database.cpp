#include "duet/async_database.hpp"
#include "duet/errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <chrono>

// For select() system call (POSIX)
#include <sys/select.h>

namespace duet {

namespace {

void drainResults(PGconn* conn) {
    PGresult* res;
    while ((res = PQgetResult(conn)) != nullptr) {
        PQclear(res);
    }
}

// Waits until the connection has consumed a full response
void awaitResponse(PGconn* conn) {
    while (true) {
        waitForSocket(conn, true);
        if (!PQconsumeInput(conn)) {
            throw TransientStorageError("PQconsumeInput failed: " + std::string(PQerrorMessage(conn)));
        }
        if (PQisBusy(conn) == 0) {
            break;
        }
    }
}

std::string sessionSql(const SessionSettings& settings) {
    return "SET statement_timeout = " + std::to_string(settings.statement_timeout_ms) + "; " +
           "SET lock_timeout = " + std::to_string(settings.lock_timeout_ms) + "; " +
           "SET idle_in_transaction_session_timeout = " +
           std::to_string(settings.idle_in_transaction_timeout_ms) + "; " +
           "SET search_path = " + settings.schema + ", public;";
}

// Applies timeouts and search_path on a freshly (re)connected session
void configureSession(PGconn* conn, const SessionSettings& settings) {
    if (PQsetnonblocking(conn, 1) != 0) {
        throw TransientStorageError("Failed to set non-blocking mode: " + std::string(PQerrorMessage(conn)));
    }
    PQsetClientEncoding(conn, "UTF8");

    std::string sql = sessionSql(settings);
    if (!PQsendQuery(conn, sql.c_str())) {
        throw TransientStorageError("Failed to send session parameters: " + std::string(PQerrorMessage(conn)));
    }
    awaitResponse(conn);

    PGresult* result;
    std::string error;
    while ((result = PQgetResult(conn)) != nullptr) {
        if (PQresultStatus(result) != PGRES_COMMAND_OK && error.empty()) {
            error = PQresultErrorMessage(result);
        }
        PQclear(result);
    }
    if (!error.empty()) {
        throw StorageError("Failed to set session parameters: " + error);
    }
}

[[noreturn]] void throwForResult(PGresult* result, const char* context) {
    const char* sqlstate = PQresultErrorField(result, PG_DIAG_SQLSTATE);
    std::string message = std::string(context) + ": " + PQresultErrorMessage(result);
    if (isTransientSqlState(sqlstate)) {
        throw TransientStorageError(message);
    }
    throw StorageError(message);
}

PGResultPtr getResult(PGconn* conn, ExecStatusType expected, const char* context) {
    PGResultPtr result(PQgetResult(conn));
    if (!result) {
        // A missing result means the connection dropped mid-query
        throw TransientStorageError(std::string(context) + ": server returned no result");
    }
    if (PQresultStatus(result.get()) != expected) {
        drainResults(conn);
        throwForResult(result.get(), context);
    }

    PGResultPtr extra(PQgetResult(conn));
    if (extra) {
        drainResults(conn);
        throw StorageError(std::string(context) + ": unexpected extra result");
    }
    return result;
}

} // anonymous namespace

bool isTransientSqlState(const char* sqlstate) {
    if (!sqlstate || std::strlen(sqlstate) < 2) {
        // No SQLSTATE at all: the failure happened on the client side of the wire
        return true;
    }
    return std::strncmp(sqlstate, "08", 2) == 0 ||
           std::strncmp(sqlstate, "40", 2) == 0 ||
           std::strncmp(sqlstate, "53", 2) == 0 ||
           std::strncmp(sqlstate, "57", 2) == 0;
}

// --- Helper: Socket Polling ---

void waitForSocket(PGconn* conn, bool for_reading) {
    int sock_fd = PQsocket(conn);
    if (sock_fd < 0) {
        throw TransientStorageError("PQsocket returned invalid file descriptor.");
    }

    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(sock_fd, &fds);

    int ret;
    do {
        if (for_reading) {
            ret = select(sock_fd + 1, &fds, nullptr, nullptr, nullptr);
        } else {
            ret = select(sock_fd + 1, nullptr, &fds, nullptr, nullptr);
        }
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
        throw TransientStorageError("select() failed: " + std::string(strerror(errno)));
    }
}

// --- Helper: Asynchronous Connection ---

PGConnPtr asyncConnect(const char* conn_str, const SessionSettings& settings) {
    PGConnPtr conn(PQconnectStart(conn_str));
    if (!conn) {
        throw StorageError("PQconnectStart failed to allocate connection.");
    }
    if (PQstatus(conn.get()) == CONNECTION_BAD) {
        throw TransientStorageError("PQconnectStart failed: " + std::string(PQerrorMessage(conn.get())));
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
                throw TransientStorageError("Async connection failed: " +
                                            std::string(PQerrorMessage(conn.get())));
            default:
                break;
        }
    } while (poll_status != PGRES_POLLING_OK);

    configureSession(conn.get(), settings);
    return conn;
}

// --- Helper: Asynchronous Connection Reset ---

bool asyncReset(PGconn* conn, const SessionSettings& settings) {
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
            if (poll_status == PGRES_POLLING_READING) {
                waitForSocket(conn, true);
            } else if (poll_status == PGRES_POLLING_WRITING) {
                waitForSocket(conn, false);
            } else if (poll_status == PGRES_POLLING_FAILED) {
                spdlog::error("[asyncReset] Reset failed: {}", PQerrorMessage(conn));
                return false;
            }
        } while (poll_status != PGRES_POLLING_OK);

        configureSession(conn, settings);
    } catch (const std::exception& e) {
        spdlog::error("[asyncReset] {}", e.what());
        return false;
    }

    spdlog::info("[asyncReset] Connection reset and reconfigured successfully");
    return true;
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
        throw TransientStorageError("PQsendQueryParams failed: " + std::string(PQerrorMessage(conn)));
    }

    // Flush until the whole query is on the wire
    while (true) {
        int flush_result = PQflush(conn);
        if (flush_result == 0) {
            break;
        } else if (flush_result == -1) {
            throw TransientStorageError("PQflush failed: " + std::string(PQerrorMessage(conn)));
        }
        waitForSocket(conn, false);
    }

    awaitResponse(conn);
}

PGResultPtr getCommandResult(PGconn* conn) {
    return getResult(conn, PGRES_COMMAND_OK, "Command failed");
}

PGResultPtr getTuplesResult(PGconn* conn) {
    return getResult(conn, PGRES_TUPLES_OK, "Query failed");
}

void execScript(PGconn* conn, const std::string& sql) {
    if (!PQsendQuery(conn, sql.c_str())) {
        throw TransientStorageError("PQsendQuery failed: " + std::string(PQerrorMessage(conn)));
    }
    awaitResponse(conn);

    PGresult* res;
    std::string error;
    const char* sqlstate = nullptr;
    while ((res = PQgetResult(conn)) != nullptr) {
        auto status = PQresultStatus(res);
        if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK && error.empty()) {
            error = PQresultErrorMessage(res);
            sqlstate = PQresultErrorField(res, PG_DIAG_SQLSTATE);
            if (isTransientSqlState(sqlstate)) {
                PQclear(res);
                drainResults(conn);
                throw TransientStorageError("Script failed: " + error);
            }
        }
        PQclear(res);
    }
    if (!error.empty()) {
        throw StorageError("Script failed: " + error);
    }
}

// --- AsyncDbPool Implementation ---

AsyncDbPool::AsyncDbPool(std::string conn_str, int pool_size, SessionSettings settings)
    : conn_str_(std::move(conn_str)),
      settings_(std::move(settings)) {

    if (pool_size <= 0) {
        throw std::invalid_argument("Pool size must be greater than 0");
    }

    spdlog::info("[AsyncDbPool] Initializing {} async connections (schema: {})...",
                 pool_size, settings_.schema);

    all_connections_.reserve(pool_size);
    for (int i = 0; i < pool_size; ++i) {
        try {
            auto conn = asyncConnect(conn_str_.c_str(), settings_);
            idle_connections_.push(conn.get());
            all_connections_.push_back(std::move(conn));
            spdlog::debug("[AsyncDbPool] Connection {}/{} initialized", i + 1, pool_size);
        } catch (const std::exception& e) {
            spdlog::error("[AsyncDbPool] Failed to create connection {}/{}: {}", i + 1, pool_size, e.what());
            if (all_connections_.empty()) {
                throw;
            }
            // Run degraded with what we have; broken slots are not retried here
            break;
        }
    }

    spdlog::info("[AsyncDbPool] Initialization complete. {}/{} connections ready.",
                 all_connections_.size(), pool_size);
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
    spdlog::info("[AsyncDbPool] Shutdown complete.");
}

AsyncDbPool::PooledConnection AsyncDbPool::acquire() {
    // One health check per connection is enough: when the database is down they all fail fast
    const size_t max_attempts = all_connections_.size();

    for (size_t attempt = 0; attempt < max_attempts; ++attempt) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return !idle_connections_.empty(); });

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

    spdlog::error("[AsyncDbPool] No healthy connection after {} attempts. Database may be unavailable.",
                  max_attempts);
    throw TransientStorageError("Failed to acquire healthy database connection");
}

void AsyncDbPool::release(PGconn* conn) {
    if (!conn) return;

    // A connection released after an exception may still hold unread results
    drainResults(conn);

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::warn("[AsyncDbPool] Connection invalid on release, attempting reset...");
        if (!asyncReset(conn, settings_)) {
            spdlog::error("[AsyncDbPool] Connection reset failed, will retry on next acquire");
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
    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::warn("[AsyncDbPool] Connection status not OK, attempting reset...");
        return asyncReset(conn, settings_);
    }

    // Consume anything the server pushed while idle; a dead socket shows up here
    if (!PQconsumeInput(conn)) {
        spdlog::warn("[AsyncDbPool] Idle connection lost: {}", PQerrorMessage(conn));
        return asyncReset(conn, settings_);
    }
    return true;
}

} // namespace duet
