#include "duet/memory_storage_driver.hpp"
#include <mutex>

namespace duet {

namespace {

std::optional<TimestampMs> guard_of(const nlohmann::json& columns, const std::string& guard_column) {
    auto it = columns.find(guard_column);
    if (it == columns.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<TimestampMs>();
}

std::string tiebreak_of(const nlohmann::json& columns, const std::string& id_column) {
    if (id_column.empty()) return std::string();
    auto it = columns.find(id_column);
    if (it == columns.end() || !it->is_string()) {
        return std::string();
    }
    return it->get<std::string>();
}

} // anonymous namespace

MemoryStorageDriver::Partition& MemoryStorageDriver::partition_for(Table table, const std::string& partition) {
    auto& data = tables_[table];
    auto it = data.find(partition);
    if (it == data.end()) {
        it = data.emplace(partition, Partition(ScanOrder{table})).first;
    }
    return it->second;
}

const MemoryStorageDriver::Partition* MemoryStorageDriver::find_partition(Table table,
                                                                          const std::string& partition) const {
    auto table_it = tables_.find(table);
    if (table_it == tables_.end()) return nullptr;
    auto it = table_it->second.find(partition);
    return it == table_it->second.end() ? nullptr : &it->second;
}

void MemoryStorageDriver::put(Table table, const RowKey& key, const nlohmann::json& columns) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    partition_for(table, key.partition)[key.clustering] = columns;
}

Row MemoryStorageDriver::put_if_absent(Table table, const RowKey& key, const nlohmann::json& columns) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& rows = partition_for(table, key.partition);
    auto result = rows.emplace(key.clustering, columns);
    return Row{key, result.first->second};
}

CasResult MemoryStorageDriver::put_if_newer(Table table,
                                            const RowKey& key,
                                            const Guard& guard,
                                            const nlohmann::json& columns,
                                            bool upsert) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& rows = partition_for(table, key.partition);
    CasResult cas;

    auto it = rows.find(key.clustering);
    if (it == rows.end()) {
        if (!upsert) {
            return cas;
        }
        it = rows.emplace(key.clustering, columns).first;
        cas.found = true;
        cas.applied = true;
        cas.current = guard_of(it->second, guard.ts_column);
        cas.current_id = tiebreak_of(it->second, guard.id_column);
        return cas;
    }

    cas.found = true;
    auto stored = guard_of(it->second, guard.ts_column);
    bool newer = !stored || *stored < guard.ts ||
                 (*stored == guard.ts && !guard.id_column.empty() &&
                  tiebreak_of(it->second, guard.id_column) < guard.id);
    if (newer) {
        it->second.update(columns);
        cas.applied = true;
    }
    cas.current = guard_of(it->second, guard.ts_column);
    cas.current_id = tiebreak_of(it->second, guard.id_column);
    return cas;
}

std::optional<Row> MemoryStorageDriver::get(Table table, const RowKey& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Partition* rows = find_partition(table, key.partition);
    if (!rows) return std::nullopt;
    auto it = rows->find(key.clustering);
    if (it == rows->end()) return std::nullopt;
    return Row{key, it->second};
}

void MemoryStorageDriver::erase(Table table, const RowKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto table_it = tables_.find(table);
    if (table_it == tables_.end()) return;
    auto it = table_it->second.find(key.partition);
    if (it == table_it->second.end()) return;
    it->second.erase(key.clustering);
}

std::vector<Row> MemoryStorageDriver::scan(Table table,
                                           const std::string& partition,
                                           const ScanRange& range,
                                           int limit) {
    std::vector<Row> result;
    if (limit <= 0) return result;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Partition* rows = find_partition(table, partition);
    if (!rows) return result;

    auto it = range.after ? rows->upper_bound(*range.after) : rows->begin();
    for (; it != rows->end() && static_cast<int>(result.size()) < limit; ++it) {
        if (range.before_ts && it->first.ts >= *range.before_ts) {
            continue;
        }
        result.push_back(Row{RowKey{partition, it->first}, it->second});
    }
    return result;
}

size_t MemoryStorageDriver::row_count(Table table, const std::string& partition) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Partition* rows = find_partition(table, partition);
    return rows ? rows->size() : 0;
}

} // namespace duet
