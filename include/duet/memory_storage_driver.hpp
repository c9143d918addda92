#pragma once

#include "duet/storage_driver.hpp"
#include <map>
#include <unordered_map>
#include <shared_mutex>

namespace duet {

/**
 * In-process StorageDriver with the same ordering and conditional-write
 * semantics as PgStorageDriver. Used by the test suite and `duet-cli --memory`.
 */
class MemoryStorageDriver : public StorageDriver {
public:
    MemoryStorageDriver() = default;

    void initialize_schema() override {}

    void put(Table table, const RowKey& key, const nlohmann::json& columns) override;
    Row put_if_absent(Table table, const RowKey& key, const nlohmann::json& columns) override;
    CasResult put_if_newer(Table table,
                           const RowKey& key,
                           const Guard& guard,
                           const nlohmann::json& columns,
                           bool upsert) override;
    std::optional<Row> get(Table table, const RowKey& key) override;
    void erase(Table table, const RowKey& key) override;
    std::vector<Row> scan(Table table,
                          const std::string& partition,
                          const ScanRange& range,
                          int limit) override;

    size_t row_count(Table table, const std::string& partition) const;

private:
    struct ScanOrder {
        Table table;
        bool operator()(const ClusteringKey& a, const ClusteringKey& b) const {
            return scan_order_before(table, a, b);
        }
    };
    using Partition = std::map<ClusteringKey, nlohmann::json, ScanOrder>;
    using TableData = std::unordered_map<std::string, Partition>;

    Partition& partition_for(Table table, const std::string& partition);
    const Partition* find_partition(Table table, const std::string& partition) const;

    mutable std::shared_mutex mutex_;
    std::map<Table, TableData> tables_;
};

} // namespace duet
