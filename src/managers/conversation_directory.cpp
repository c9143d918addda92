#include "duet/conversation_directory.hpp"
#include "duet/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace duet {

namespace {

constexpr const char* HEAD_COLUMN = "last_message_at";
constexpr const char* HEAD_ID_COLUMN = "last_message_id";

Guard version(TimestampMs timestamp, const std::string& message_id) {
    return Guard{HEAD_COLUMN, HEAD_ID_COLUMN, timestamp, message_id};
}

bool newer_than(TimestampMs ts, const std::string& id, const Guard& other) {
    return ts > other.ts || (ts == other.ts && id > other.id);
}

std::string user_partition(UserId user_id) {
    return std::to_string(user_id);
}

RowKey head_key(const std::string& owner, const std::string& conversation_id) {
    return RowKey{owner, {0, conversation_id}};
}

ConversationListEntry entry_from_row(const Row& row, UserId user_id) {
    ConversationListEntry entry;
    try {
        entry.user_id = user_id;
        entry.conversation_id = row.key.clustering.id;
        entry.last_message_at = row.key.clustering.ts;
        entry.other_user_id = row.columns.at("other_user_id").get<UserId>();
        entry.last_message_content = row.columns.at("last_message_content").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("Corrupt directory entry " + row.key.partition + "/" +
                           row.key.clustering.id + ": " + e.what());
    }
    return entry;
}

} // anonymous namespace

ConversationDirectory::ConversationDirectory(std::shared_ptr<StorageDriver> driver,
                                             std::shared_ptr<CursorCodec> cursors,
                                             const StoreConfig& config)
    : driver_(std::move(driver)),
      cursors_(std::move(cursors)),
      config_(config) {
}

std::optional<Guard> ConversationDirectory::read_head(const std::string& owner, const std::string& conversation_id) {
    auto row = driver_->get(Table::DirectoryHeads, head_key(owner, conversation_id));
    if (!row) return std::nullopt;
    auto it = row->columns.find(HEAD_COLUMN);
    if (it == row->columns.end() || !it->is_number_integer()) return std::nullopt;
    return version(it->get<TimestampMs>(), row->columns.value(HEAD_ID_COLUMN, std::string()));
}

std::optional<TimestampMs> ConversationDirectory::head(UserId user_id, const std::string& conversation_id) {
    auto current = read_head(user_partition(user_id), conversation_id);
    if (!current) return std::nullopt;
    return current->ts;
}

CasResult ConversationDirectory::advance_head(const std::string& owner,
                                              const std::string& conversation_id,
                                              TimestampMs timestamp,
                                              const std::string& message_id) {
    nlohmann::json columns = {{HEAD_COLUMN, timestamp}, {HEAD_ID_COLUMN, message_id}};
    return driver_->put_if_newer(Table::DirectoryHeads, head_key(owner, conversation_id),
                                 version(timestamp, message_id), columns, true);
}

bool ConversationDirectory::upsert_entry(UserId owner_id,
                                         const std::string& conversation_id,
                                         UserId other_user_id,
                                         TimestampMs timestamp,
                                         const std::string& content,
                                         const std::string& message_id) {
    const std::string owner = user_partition(owner_id);

    auto previous = read_head(owner, conversation_id);
    if (previous && newer_than(previous->ts, previous->id, version(timestamp, message_id))) {
        spdlog::debug("[ConversationDirectory] stale entry ignored for user {} / {}: ({}, {}) < ({}, {})",
                      owner_id, conversation_id, timestamp, message_id, previous->ts, previous->id);
        return false;
    }

    // Entry first, head second: a reader never sees a head without its entry.
    // Same-millisecond messages share the entry row, the larger message id keeps it.
    RowKey entry_key{owner, {timestamp, conversation_id}};
    nlohmann::json columns = {
        {"other_user_id", other_user_id},
        {"last_message_content", content},
        {HEAD_COLUMN, timestamp},
        {HEAD_ID_COLUMN, message_id}
    };
    driver_->put_if_newer(Table::ConversationsByUser, entry_key, version(timestamp, message_id), columns, true);

    auto result = advance_head(owner, conversation_id, timestamp, message_id);

    if (!result.applied && result.current && *result.current > timestamp) {
        // Lost the race against a message from a later millisecond
        driver_->erase(Table::ConversationsByUser, entry_key);
        spdlog::debug("[ConversationDirectory] superseded entry removed for user {} / {} at {}",
                      owner_id, conversation_id, timestamp);
        return false;
    }

    if (result.applied && previous && previous->ts < timestamp) {
        driver_->erase(Table::ConversationsByUser, RowKey{owner, {previous->ts, conversation_id}});
    }
    return result.applied || (result.current == timestamp && result.current_id == message_id);
}

Page<ConversationListEntry> ConversationDirectory::list_conversations(UserId user_id,
                                                                      const std::optional<std::string>& cursor,
                                                                      int limit) {
    const int page_size = effective_limit(limit);
    const std::string partition = user_partition(user_id);

    ScanRange range;
    if (cursor) {
        range.after = cursors_->decode(*cursor, CursorKind::Conversations, partition);
    }

    Page<ConversationListEntry> page;
    std::optional<ClusteringKey> last_returned;
    bool has_more = false;
    size_t pruned = 0;
    const int batch = page_size + 1;

    // Stale entries are dropped, so keep scanning until the page is full
    while (!has_more) {
        auto rows = driver_->scan(Table::ConversationsByUser, partition, range, batch);
        for (const auto& row : rows) {
            range.after = row.key.clustering;
            const std::string& conversation_id = row.key.clustering.id;
            const TimestampMs ts = row.key.clustering.ts;

            auto current_head = read_head(partition, conversation_id);
            if (current_head && ts < current_head->ts) {
                driver_->erase(Table::ConversationsByUser, row.key);
                ++pruned;
                continue;
            }
            const std::string entry_id = row.columns.value(HEAD_ID_COLUMN, std::string());
            if (!current_head || newer_than(ts, entry_id, *current_head)) {
                // Upsert still in flight (or interrupted) before its head step: finish it
                auto result = advance_head(partition, conversation_id, ts, entry_id);
                if (result.current && *result.current > ts) {
                    driver_->erase(Table::ConversationsByUser, row.key);
                    ++pruned;
                    continue;
                }
            }

            if (static_cast<int>(page.items.size()) == page_size) {
                has_more = true;
                break;
            }
            page.items.push_back(entry_from_row(row, user_id));
            last_returned = row.key.clustering;
        }

        if (rows.size() < static_cast<size_t>(batch)) {
            break;
        }
    }

    if (has_more && last_returned) {
        page.next_cursor = cursors_->encode(CursorKind::Conversations, partition, *last_returned);
    }

    if (pruned > 0) {
        spdlog::debug("[ConversationDirectory] pruned {} stale entr{} for user {}",
                      pruned, pruned == 1 ? "y" : "ies", user_id);
    }
    return page;
}

int ConversationDirectory::effective_limit(int limit) const {
    if (limit <= 0) return config_.default_page_size;
    return std::min(limit, config_.max_page_size);
}

} // namespace duet
