#pragma once

#include "duet/storage_driver.hpp"
#include "duet/async_database.hpp"
#include <memory>
#include <string>

namespace duet {

/**
 * @brief StorageDriver backed by PostgreSQL.
 *
 * Each logical table maps to a table `(partition_key, ck_ts, ck_id, columns jsonb)`
 * inside the configured schema. Row-level atomicity comes from single-statement
 * INSERT ... ON CONFLICT and guarded UPDATEs; no statement touches two partitions.
 */
class PgStorageDriver : public StorageDriver {
public:
    explicit PgStorageDriver(std::shared_ptr<AsyncDbPool> pool);

    void initialize_schema() override;

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

private:
    std::string qualified(Table table) const;
    void read_guard(PGconn* conn, Table table, const RowKey& key, const Guard& guard, CasResult& cas);

    std::shared_ptr<AsyncDbPool> pool_;
    std::string schema_;
};

} // namespace duet
