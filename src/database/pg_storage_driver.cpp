#include "duet/pg_storage_driver.hpp"
#include "duet/errors.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <stdexcept>

namespace duet {

namespace {

const Table kAllTables[] = {
    Table::Messages, Table::ConversationsByUser, Table::Conversations, Table::DirectoryHeads
};

bool is_valid_identifier(const std::string& name) {
    if (name.empty() || name.size() > 63) return false;
    if (!(std::islower(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    for (char c : name) {
        if (!(std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)) || c == '_')) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> key_params(const RowKey& key) {
    return {key.partition, std::to_string(key.clustering.ts), key.clustering.id};
}

nlohmann::json parse_columns(const char* text) {
    auto columns = nlohmann::json::parse(text, nullptr, false);
    if (columns.is_discarded() || !columns.is_object()) {
        throw StorageError("Corrupt columns payload in storage row");
    }
    return columns;
}

std::optional<TimestampMs> parse_optional_ts(PGresult* result, int row, int col) {
    if (PQgetisnull(result, row, col)) {
        return std::nullopt;
    }
    return std::stoll(PQgetvalue(result, row, col));
}

} // anonymous namespace

PgStorageDriver::PgStorageDriver(std::shared_ptr<AsyncDbPool> pool)
    : pool_(std::move(pool)) {
    if (!pool_) {
        throw std::invalid_argument("Async database pool cannot be null");
    }
    schema_ = pool_->settings().schema;
    if (!is_valid_identifier(schema_)) {
        throw std::invalid_argument("Invalid schema name: " + schema_);
    }
}

std::string PgStorageDriver::qualified(Table table) const {
    return schema_ + "." + table_name(table);
}

void PgStorageDriver::initialize_schema() {
    spdlog::info("Initializing schema: {}", schema_);

    // ck_id uses the C collation so tie-breaks sort bytewise, like the ids themselves
    std::string sql = "CREATE SCHEMA IF NOT EXISTS " + schema_ + ";\n";
    for (Table table : kAllTables) {
        sql += "CREATE TABLE IF NOT EXISTS " + qualified(table) + " (\n"
               "    partition_key TEXT NOT NULL,\n"
               "    ck_ts BIGINT NOT NULL,\n"
               "    ck_id TEXT COLLATE \"C\" NOT NULL,\n"
               "    columns JSONB NOT NULL DEFAULT '{}'::jsonb,\n"
               "    PRIMARY KEY (partition_key, ck_ts, ck_id)\n"
               ");\n";
    }
    // Directory scans mix DESC timestamp with ASC conversation id
    sql += "CREATE INDEX IF NOT EXISTS conversations_by_user_recency_idx ON " +
           qualified(Table::ConversationsByUser) + " (partition_key, ck_ts DESC, ck_id ASC);\n";

    auto conn = pool_->acquire();
    execScript(conn.get(), sql);
    spdlog::info("Schema {} is ready ({} tables)", schema_, sizeof(kAllTables) / sizeof(kAllTables[0]));
}

void PgStorageDriver::put(Table table, const RowKey& key, const nlohmann::json& columns) {
    std::string sql =
        "INSERT INTO " + qualified(table) + " (partition_key, ck_ts, ck_id, columns) "
        "VALUES ($1, $2::bigint, $3, $4::jsonb) "
        "ON CONFLICT (partition_key, ck_ts, ck_id) DO UPDATE SET columns = EXCLUDED.columns";

    auto params = key_params(key);
    params.push_back(columns.dump());

    auto conn = pool_->acquire();
    sendQueryParamsAsync(conn.get(), sql, params);
    getCommandResult(conn.get());
}

Row PgStorageDriver::put_if_absent(Table table, const RowKey& key, const nlohmann::json& columns) {
    std::string insert_sql =
        "INSERT INTO " + qualified(table) + " (partition_key, ck_ts, ck_id, columns) "
        "VALUES ($1, $2::bigint, $3, $4::jsonb) "
        "ON CONFLICT (partition_key, ck_ts, ck_id) DO NOTHING RETURNING columns";

    auto params = key_params(key);
    params.push_back(columns.dump());

    auto conn = pool_->acquire();
    sendQueryParamsAsync(conn.get(), insert_sql, params);
    auto inserted = getTuplesResult(conn.get());
    if (PQntuples(inserted.get()) > 0) {
        return Row{key, parse_columns(PQgetvalue(inserted.get(), 0, 0))};
    }

    // Lost the race: read the winner in a fresh statement so its commit is visible
    std::string select_sql =
        "SELECT columns FROM " + qualified(table) +
        " WHERE partition_key = $1 AND ck_ts = $2::bigint AND ck_id = $3";
    sendQueryParamsAsync(conn.get(), select_sql, key_params(key));
    auto existing = getTuplesResult(conn.get());
    if (PQntuples(existing.get()) == 0) {
        // The winner was erased between the two statements
        throw TransientStorageError(std::string("Row vanished during insert-if-absent on ") + table_name(table));
    }
    return Row{key, parse_columns(PQgetvalue(existing.get(), 0, 0))};
}

void PgStorageDriver::read_guard(PGconn* conn, Table table, const RowKey& key, const Guard& guard, CasResult& cas) {
    std::string sql =
        "SELECT (columns->>$4)::bigint, COALESCE(columns->>$5, '') FROM " + qualified(table) +
        " WHERE partition_key = $1 AND ck_ts = $2::bigint AND ck_id = $3";
    auto params = key_params(key);
    params.push_back(guard.ts_column);
    params.push_back(guard.id_column);

    sendQueryParamsAsync(conn, sql, params);
    auto result = getTuplesResult(conn);
    cas.found = PQntuples(result.get()) > 0;
    if (!cas.found) {
        return;
    }
    cas.current = parse_optional_ts(result.get(), 0, 0);
    cas.current_id = PQgetvalue(result.get(), 0, 1);
}

CasResult PgStorageDriver::put_if_newer(Table table,
                                        const RowKey& key,
                                        const Guard& guard,
                                        const nlohmann::json& columns,
                                        bool upsert) {
    const std::string target = qualified(table);
    // An empty tie-break column reads as '' on both sides, so equal timestamps never pass
    const std::string guard_passes =
        "((t.columns->>$5) IS NULL OR (t.columns->>$5)::bigint < $6::bigint "
        "OR ((t.columns->>$5)::bigint = $6::bigint "
        "AND COALESCE(t.columns->>$7, '') COLLATE \"C\" < $8::text COLLATE \"C\"))";
    const std::string returning = "RETURNING (t.columns->>$5)::bigint, COALESCE(t.columns->>$7, '')";

    std::string sql;
    if (upsert) {
        sql = "INSERT INTO " + target + " AS t (partition_key, ck_ts, ck_id, columns) "
              "VALUES ($1, $2::bigint, $3, $4::jsonb) "
              "ON CONFLICT (partition_key, ck_ts, ck_id) DO UPDATE "
              "SET columns = t.columns || EXCLUDED.columns "
              "WHERE " + guard_passes + " " + returning;
    } else {
        sql = "UPDATE " + target + " AS t SET columns = t.columns || $4::jsonb "
              "WHERE t.partition_key = $1 AND t.ck_ts = $2::bigint AND t.ck_id = $3 AND " + guard_passes + " " +
              returning;
    }

    auto params = key_params(key);
    params.push_back(columns.dump());
    params.push_back(guard.ts_column);
    params.push_back(std::to_string(guard.ts));
    params.push_back(guard.id_column);
    params.push_back(guard.id_column.empty() ? std::string() : guard.id);

    auto conn = pool_->acquire();
    sendQueryParamsAsync(conn.get(), sql, params);
    auto result = getTuplesResult(conn.get());

    CasResult cas;
    if (PQntuples(result.get()) > 0) {
        cas.found = true;
        cas.applied = true;
        cas.current = parse_optional_ts(result.get(), 0, 0);
        cas.current_id = PQgetvalue(result.get(), 0, 1);
        return cas;
    }

    read_guard(conn.get(), table, key, guard, cas);
    return cas;
}

std::optional<Row> PgStorageDriver::get(Table table, const RowKey& key) {
    std::string sql =
        "SELECT columns FROM " + qualified(table) +
        " WHERE partition_key = $1 AND ck_ts = $2::bigint AND ck_id = $3";

    auto conn = pool_->acquire();
    sendQueryParamsAsync(conn.get(), sql, key_params(key));
    auto result = getTuplesResult(conn.get());
    if (PQntuples(result.get()) == 0) {
        return std::nullopt;
    }
    return Row{key, parse_columns(PQgetvalue(result.get(), 0, 0))};
}

void PgStorageDriver::erase(Table table, const RowKey& key) {
    std::string sql =
        "DELETE FROM " + qualified(table) +
        " WHERE partition_key = $1 AND ck_ts = $2::bigint AND ck_id = $3";

    auto conn = pool_->acquire();
    sendQueryParamsAsync(conn.get(), sql, key_params(key));
    getCommandResult(conn.get());
}

std::vector<Row> PgStorageDriver::scan(Table table,
                                       const std::string& partition,
                                       const ScanRange& range,
                                       int limit) {
    std::vector<Row> rows;
    if (limit <= 0) {
        return rows;
    }

    std::string sql = "SELECT ck_ts, ck_id, columns FROM " + qualified(table) + " WHERE partition_key = $1";
    std::vector<std::string> params{partition};

    if (range.before_ts) {
        params.push_back(std::to_string(*range.before_ts));
        sql += " AND ck_ts < $" + std::to_string(params.size()) + "::bigint";
    }
    if (range.after) {
        params.push_back(std::to_string(range.after->ts));
        std::string ts_param = "$" + std::to_string(params.size()) + "::bigint";
        params.push_back(range.after->id);
        std::string id_param = "$" + std::to_string(params.size());

        if (tiebreak_descending(table)) {
            sql += " AND (ck_ts, ck_id) < (" + ts_param + ", " + id_param + ")";
        } else {
            sql += " AND (ck_ts < " + ts_param + " OR (ck_ts = " + ts_param + " AND ck_id > " + id_param + "))";
        }
    }

    sql += tiebreak_descending(table) ? " ORDER BY ck_ts DESC, ck_id DESC" : " ORDER BY ck_ts DESC, ck_id ASC";
    params.push_back(std::to_string(limit));
    sql += " LIMIT $" + std::to_string(params.size()) + "::int";

    auto conn = pool_->acquire();
    sendQueryParamsAsync(conn.get(), sql, params);
    auto result = getTuplesResult(conn.get());

    int count = PQntuples(result.get());
    rows.reserve(count);
    for (int i = 0; i < count; ++i) {
        Row row;
        row.key.partition = partition;
        row.key.clustering.ts = std::stoll(PQgetvalue(result.get(), i, 0));
        row.key.clustering.id = PQgetvalue(result.get(), i, 1);
        row.columns = parse_columns(PQgetvalue(result.get(), i, 2));
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace duet
