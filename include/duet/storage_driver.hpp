#pragma once

#include "duet/conversation_types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace duet {

// Logical wide-column tables. Every table is partitioned by a string key and
// clustered by (timestamp, tie-break id), most recent first.
enum class Table {
    Messages,             // conversation_id | created_at DESC, message_id DESC
    ConversationsByUser,  // user_id | last_message_at DESC, conversation_id ASC
    Conversations,        // conversation_id | (single row)
    DirectoryHeads        // user_id | conversation_id (ts unused)
};

const char* table_name(Table table);

inline bool tiebreak_descending(Table table) {
    return table == Table::Messages;
}

struct ClusteringKey {
    TimestampMs ts = 0;
    std::string id;

    bool operator==(const ClusteringKey& other) const {
        return ts == other.ts && id == other.id;
    }
};

// True when `a` is returned before `b` by a scan of `table`
inline bool scan_order_before(Table table, const ClusteringKey& a, const ClusteringKey& b) {
    if (a.ts != b.ts) return a.ts > b.ts;
    return tiebreak_descending(table) ? a.id > b.id : a.id < b.id;
}

struct RowKey {
    std::string partition;
    ClusteringKey clustering;
};

struct Row {
    RowKey key;
    nlohmann::json columns = nlohmann::json::object();
};

struct ScanRange {
    std::optional<ClusteringKey> after;     // Resume strictly after this position
    std::optional<TimestampMs> before_ts;   // Only rows with ts strictly below
};

// Version guarded by put_if_newer: a timestamp column, tie-broken by a string
// column compared bytewise when the timestamps are equal
struct Guard {
    std::string ts_column;
    std::string id_column;                  // Empty: timestamp only
    TimestampMs ts = 0;
    std::string id;
};

struct CasResult {
    bool found = false;                     // Row existed (or was inserted by an upsert)
    bool applied = false;                   // Guard passed and columns were written
    std::optional<TimestampMs> current;     // Guard timestamp after the operation
    std::string current_id;                 // Guard tie-break after the operation ("" if none)
};

/**
 * @brief Storage driver contract for a partitioned wide-column store.
 *
 * Implementations guarantee atomicity per row and ordered range scans within
 * one partition. Nothing spans partitions. Retryable failures raise
 * TransientStorageError, everything else StorageError.
 */
class StorageDriver {
public:
    virtual ~StorageDriver() = default;

    /**
     * @brief Creates tables and indexes if missing. Idempotent.
     */
    virtual void initialize_schema() = 0;

    /**
     * @brief Unconditional upsert of one row. Columns replace the stored ones.
     */
    virtual void put(Table table, const RowKey& key, const nlohmann::json& columns) = 0;

    /**
     * @brief Atomic insert-if-absent.
     *
     * @return The row that is stored after the call: the new one if this caller
     *         won, the pre-existing one otherwise
     */
    virtual Row put_if_absent(Table table, const RowKey& key, const nlohmann::json& columns) = 0;

    /**
     * @brief Atomic compare-and-set on a (timestamp, tie-break) version.
     *
     * Merges `columns` into the stored row only if the stored timestamp column is
     * missing or strictly smaller than `guard.ts`, or equal with a stored tie-break
     * (missing counts as "") strictly smaller than `guard.id`. `columns` should
     * carry the new guard values.
     *
     * @param upsert Insert the row when it does not exist
     */
    virtual CasResult put_if_newer(Table table,
                                   const RowKey& key,
                                   const Guard& guard,
                                   const nlohmann::json& columns,
                                   bool upsert) = 0;

    virtual std::optional<Row> get(Table table, const RowKey& key) = 0;

    virtual void erase(Table table, const RowKey& key) = 0;

    /**
     * @brief Range scan of one partition in clustering order.
     */
    virtual std::vector<Row> scan(Table table,
                                  const std::string& partition,
                                  const ScanRange& range,
                                  int limit) = 0;
};

} // namespace duet
