/**
 * PostgreSQL driver contract tests
 *
 * Needs a reachable server (PG_HOST, PG_PORT, PG_DB, PG_USER, PG_PASSWORD).
 * Every run works in its own schema, dropped at the end.
 */

#include "test_harness.hpp"
#include "duet/async_database.hpp"
#include "duet/config.hpp"
#include "duet/conversation_service.hpp"
#include "duet/errors.hpp"
#include "duet/pg_storage_driver.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <random>
#include <thread>

using namespace duet;

namespace {

Config g_config;
std::shared_ptr<AsyncDbPool> g_pool;
std::shared_ptr<PgStorageDriver> g_driver;

std::shared_ptr<AsyncDbPool> make_pool(const Config& config) {
    SessionSettings settings;
    settings.statement_timeout_ms = config.database.statement_timeout;
    settings.lock_timeout_ms = config.database.lock_timeout;
    settings.idle_in_transaction_timeout_ms = config.database.idle_in_transaction_timeout;
    settings.schema = config.database.schema;
    return std::make_shared<AsyncDbPool>(config.database.connection_string(), 4, settings);
}

void drop_schema() {
    try {
        auto conn = g_pool->acquire();
        execScript(conn.get(), "DROP SCHEMA IF EXISTS " + g_config.database.schema + " CASCADE");
    } catch (const std::exception& e) {
        std::cerr << "Failed to drop test schema: " << e.what() << std::endl;
    }
}

} // anonymous namespace

// ============================================================================
// Driver contract
// ============================================================================

TEST(test_schema_is_idempotent) {
    g_driver->initialize_schema();
    g_driver->initialize_schema();
    ASSERT(!g_driver->get(Table::Conversations, RowKey{"none", {0, ""}}), "Fresh schema is empty");
}

TEST(test_put_get_erase) {
    RowKey key{"conv-1", {100, "m1"}};
    g_driver->put(Table::Messages, key, {{"content", "first"}});
    g_driver->put(Table::Messages, key, {{"content", "second"}});

    auto row = g_driver->get(Table::Messages, key);
    ASSERT(row.has_value(), "Row stored");
    ASSERT_EQ(row->columns["content"].get<std::string>(), std::string("second"), "Put replaces the row");

    g_driver->erase(Table::Messages, key);
    ASSERT(!g_driver->get(Table::Messages, key), "Row erased");
    g_driver->erase(Table::Messages, key);
}

TEST(test_put_if_absent_returns_winner) {
    RowKey key{"conv-2", {0, ""}};
    auto first = g_driver->put_if_absent(Table::Conversations, key, {{"user1_id", 1}, {"user2_id", 2}});
    auto second = g_driver->put_if_absent(Table::Conversations, key, {{"user1_id", 7}, {"user2_id", 8}});
    ASSERT_EQ(first.columns["user1_id"].get<UserId>(), 1, "First writer stores its row");
    ASSERT_EQ(second.columns["user1_id"].get<UserId>(), 1, "Second writer sees the first row");
}

TEST(test_put_if_newer_guards_on_timestamp) {
    RowKey key{"conv-3", {0, ""}};
    auto missing = g_driver->put_if_newer(Table::Conversations, key, Guard{"last_message_at", "", 10, ""},
                                          {{"last_message_at", 10}}, false);
    ASSERT(!missing.found && !missing.applied, "No insert without upsert");

    g_driver->put_if_absent(Table::Conversations, key, {{"user1_id", 1}});
    auto applied = g_driver->put_if_newer(Table::Conversations, key, Guard{"last_message_at", "", 10, ""},
                                          {{"last_message_at", 10}, {"last_message_content", "a"}}, false);
    ASSERT(applied.applied, "Missing guard column accepts the write");

    auto stale = g_driver->put_if_newer(Table::Conversations, key, Guard{"last_message_at", "", 5, ""},
                                        {{"last_message_at", 5}, {"last_message_content", "old"}}, false);
    ASSERT(!stale.applied, "Older value rejected");
    ASSERT(stale.current && *stale.current == 10, "Current value reported");

    auto row = g_driver->get(Table::Conversations, key);
    ASSERT_EQ(row->columns["last_message_content"].get<std::string>(), std::string("a"), "Newer content kept");
    ASSERT_EQ(row->columns["user1_id"].get<UserId>(), 1, "Unrelated columns kept");

    auto upserted = g_driver->put_if_newer(Table::DirectoryHeads, RowKey{"9", {0, "conv-3"}},
                                           Guard{"last_message_at", "", 42, ""}, {{"last_message_at", 42}}, true);
    ASSERT(upserted.applied && upserted.current && *upserted.current == 42, "Upsert inserts the row");
}

TEST(test_put_if_newer_breaks_ties_on_id) {
    RowKey key{"9", {0, "conv-tie"}};
    auto at = [](const std::string& id) { return Guard{"last_message_at", "last_message_id", 70, id}; };
    auto columns = [](const std::string& id) {
        return nlohmann::json{{"last_message_at", 70}, {"last_message_id", id}};
    };

    auto first = g_driver->put_if_newer(Table::DirectoryHeads, key, at("0190-b"), columns("0190-b"), true);
    ASSERT(first.applied, "First version inserted");

    auto smaller = g_driver->put_if_newer(Table::DirectoryHeads, key, at("0190-A"), columns("0190-A"), true);
    ASSERT(!smaller.applied, "Bytewise smaller id loses the tie");
    ASSERT_EQ(smaller.current_id, std::string("0190-b"), "Current id reported");

    auto same = g_driver->put_if_newer(Table::DirectoryHeads, key, at("0190-b"), columns("0190-b"), true);
    ASSERT(!same.applied, "Same version is not newer");

    auto larger = g_driver->put_if_newer(Table::DirectoryHeads, key, at("0190-c"), columns("0190-c"), true);
    ASSERT(larger.applied && larger.current_id == "0190-c", "Larger id wins the tie");
}

TEST(test_pool_returns_connections) {
    const size_t size = g_pool->size();
    {
        auto conn = g_pool->acquire();
        ASSERT_EQ(g_pool->available(), size - 1, "Held connection leaves the idle set");
    }
    ASSERT_EQ(g_pool->available(), size, "Released connection returns to the pool");
}

TEST(test_scan_order_and_ranges) {
    const std::string p = "conv-4";
    g_driver->put(Table::Messages, RowKey{p, {10, "a"}}, {{"n", 1}});
    g_driver->put(Table::Messages, RowKey{p, {10, "b"}}, {{"n", 2}});
    g_driver->put(Table::Messages, RowKey{p, {20, "a"}}, {{"n", 3}});
    g_driver->put(Table::Messages, RowKey{p, {5, "z"}}, {{"n", 4}});
    g_driver->put(Table::Messages, RowKey{"other", {15, "x"}}, {{"n", 5}});

    auto rows = g_driver->scan(Table::Messages, p, ScanRange{}, 10);
    ASSERT_EQ(rows.size(), 4u, "Scan stays within the partition");
    ASSERT_EQ(rows[0].columns["n"].get<int>(), 3, "Newest first");
    ASSERT_EQ(rows[1].columns["n"].get<int>(), 2, "Descending tie-break for messages");

    ScanRange range;
    range.after = ClusteringKey{10, "b"};
    rows = g_driver->scan(Table::Messages, p, range, 1);
    ASSERT_EQ(rows.size(), 1u, "Limit respected");
    ASSERT_EQ(rows[0].key.clustering.id, std::string("a"), "Resume strictly after the position");

    ScanRange before;
    before.before_ts = 10;
    rows = g_driver->scan(Table::Messages, p, before, 10);
    ASSERT_EQ(rows.size(), 1u, "before_ts is strict");

    g_driver->put(Table::ConversationsByUser, RowKey{"u", {7, "b"}}, nlohmann::json::object());
    g_driver->put(Table::ConversationsByUser, RowKey{"u", {7, "a"}}, nlohmann::json::object());
    rows = g_driver->scan(Table::ConversationsByUser, "u", ScanRange{}, 10);
    ASSERT_EQ(rows[0].key.clustering.id, std::string("a"), "Ascending tie-break for directories");
}

TEST(test_concurrent_put_if_absent_single_winner) {
    RowKey key{"conv-race", {0, ""}};
    std::vector<std::thread> threads;
    std::vector<UserId> winners(4);
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&, i]() {
            try {
                auto row = g_driver->put_if_absent(Table::Conversations, key, {{"user1_id", i + 1}});
                winners[i] = row.columns["user1_id"].get<UserId>();
            } catch (const std::exception& e) {
                spdlog::error("put_if_absent failed: {}", e.what());
            }
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 1; i < 4; ++i) {
        ASSERT_EQ(winners[i], winners[0], "Every caller sees the same winner");
    }
    ASSERT_GT(winners[0], 0, "A winner was stored");
}

// ============================================================================
// End to end
// ============================================================================

TEST(test_send_and_read_back) {
    Config config = g_config;
    config.repair.enabled = false;
    ConversationService service(g_driver, config);

    auto first = service.send_message(5, 9, "hi", SendOptions{100, nullptr});
    auto reply = service.send_message(9, 5, "hey", SendOptions{105, nullptr});
    ASSERT(first.fanout_complete && reply.fanout_complete, "Fan-out completes inline");

    auto conversation = service.get_conversation(first.conversation_id);
    ASSERT_EQ(conversation.last_message_content.value_or(""), std::string("hey"), "Catalog shows the reply");

    auto history = service.list_messages(first.conversation_id, std::nullopt, 1);
    ASSERT_EQ(history.items[0].content, std::string("hey"), "Newest message first");
    history = service.list_messages(first.conversation_id, history.next_cursor, 1);
    ASSERT_EQ(history.items[0].content, std::string("hi"), "Cursor resumes the history");
    ASSERT(!history.next_cursor, "History exhausted");

    for (UserId user : {5, 9}) {
        auto page = service.list_conversations_for_user(user, std::nullopt, 10);
        ASSERT_EQ(page.items.size(), 1u, "One entry per participant");
        ASSERT_EQ(page.items[0].last_message_at, 105, "Directory at the reply");
    }
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    spdlog::set_level(spdlog::level::warn);

    g_config = Config::load();
    std::mt19937 rng(std::random_device{}());
    g_config.database.schema = "duet_test_" + std::to_string(rng() % 1000000);
    g_config.cursor.key_hex = std::string(64, 'a');

    std::cout << "============================================" << std::endl;
    std::cout << "PostgreSQL Driver Test Suite (schema " << g_config.database.schema << ")" << std::endl;
    std::cout << "============================================" << std::endl;

    try {
        g_pool = make_pool(g_config);
        g_driver = std::make_shared<PgStorageDriver>(g_pool);
        g_driver->initialize_schema();
    } catch (const std::exception& e) {
        std::cerr << "Cannot reach PostgreSQL: " << e.what() << std::endl;
        return 1;
    }

    RUN_TEST(test_schema_is_idempotent);
    RUN_TEST(test_put_get_erase);
    RUN_TEST(test_put_if_absent_returns_winner);
    RUN_TEST(test_put_if_newer_guards_on_timestamp);
    RUN_TEST(test_put_if_newer_breaks_ties_on_id);
    RUN_TEST(test_pool_returns_connections);
    RUN_TEST(test_scan_order_and_ranges);
    RUN_TEST(test_concurrent_put_if_absent_single_winner);
    RUN_TEST(test_send_and_read_back);

    drop_schema();
    return print_summary();
}
