#include "duet/message_store.hpp"
#include "duet/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace duet {

MessageStore::MessageStore(std::shared_ptr<StorageDriver> driver,
                           std::shared_ptr<CursorCodec> cursors,
                           std::shared_ptr<MessageIdGenerator> ids,
                           const StoreConfig& config)
    : driver_(std::move(driver)),
      cursors_(std::move(cursors)),
      ids_(std::move(ids)),
      config_(config) {
}

Message MessageStore::prepare(const std::string& conversation_id,
                              UserId sender_id,
                              UserId receiver_id,
                              const std::string& content,
                              std::optional<TimestampMs> client_timestamp) {
    auto stamp = ids_->next(client_timestamp);

    Message message;
    message.conversation_id = conversation_id;
    message.created_at = stamp.created_at;
    message.id = std::move(stamp.id);
    message.sender_id = sender_id;
    message.receiver_id = receiver_id;
    message.content = content;
    return message;
}

void MessageStore::append(const Message& message) {
    RowKey key{message.conversation_id, {message.created_at, message.id}};
    nlohmann::json columns = {
        {"sender_id", message.sender_id},
        {"receiver_id", message.receiver_id},
        {"content", message.content}
    };
    driver_->put(Table::Messages, key, columns);
}

void MessageStore::erase(const Message& message) {
    driver_->erase(Table::Messages, RowKey{message.conversation_id, {message.created_at, message.id}});
}

Message MessageStore::append(const std::string& conversation_id,
                             UserId sender_id,
                             UserId receiver_id,
                             const std::string& content,
                             std::optional<TimestampMs> client_timestamp) {
    Message message = prepare(conversation_id, sender_id, receiver_id, content, client_timestamp);
    append(message);
    return message;
}

Page<Message> MessageStore::list_messages(const std::string& conversation_id,
                                          const std::optional<std::string>& cursor,
                                          int limit,
                                          std::optional<TimestampMs> before_ts) {
    int page_size = effective_limit(limit);

    ScanRange range;
    range.before_ts = before_ts;
    if (cursor) {
        range.after = cursors_->decode(*cursor, CursorKind::Messages, conversation_id);
    }

    // One extra row tells whether another page exists
    auto rows = driver_->scan(Table::Messages, conversation_id, range, page_size + 1);

    Page<Message> page;
    bool has_more = rows.size() > static_cast<size_t>(page_size);
    if (has_more) {
        rows.resize(page_size);
    }

    page.items.reserve(rows.size());
    for (const auto& row : rows) {
        page.items.push_back(from_row(row));
    }

    if (has_more && !rows.empty()) {
        page.next_cursor = cursors_->encode(CursorKind::Messages, conversation_id, rows.back().key.clustering);
    }

    spdlog::debug("[MessageStore] {} -> {} message(s), more={}", conversation_id, page.items.size(), has_more);
    return page;
}

Message MessageStore::from_row(const Row& row) {
    Message message;
    try {
        message.conversation_id = row.key.partition;
        message.created_at = row.key.clustering.ts;
        message.id = row.key.clustering.id;
        message.sender_id = row.columns.at("sender_id").get<UserId>();
        message.receiver_id = row.columns.at("receiver_id").get<UserId>();
        message.content = row.columns.at("content").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("Corrupt message row " + row.key.clustering.id + ": " + e.what());
    }
    return message;
}

int MessageStore::effective_limit(int limit) const {
    if (limit <= 0) return config_.default_page_size;
    return std::min(limit, config_.max_page_size);
}

} // namespace duet
