#include "duet/conversation_catalog.hpp"
#include "duet/errors.hpp"
#include <spdlog/spdlog.h>

namespace duet {

ConversationCatalog::ConversationCatalog(std::shared_ptr<StorageDriver> driver)
    : driver_(std::move(driver)) {
}

RowKey ConversationCatalog::key_for(const std::string& conversation_id) {
    // Single-row partition
    return RowKey{conversation_id, {0, ""}};
}

Conversation ConversationCatalog::get(const std::string& conversation_id) {
    auto row = driver_->get(Table::Conversations, key_for(conversation_id));
    if (!row) {
        throw NotFound("Conversation not found: " + conversation_id);
    }
    return from_row(*row);
}

Conversation ConversationCatalog::create_if_absent(const std::string& conversation_id,
                                                   UserId low_user_id,
                                                   UserId high_user_id,
                                                   TimestampMs created_at) {
    nlohmann::json columns = {
        {"user1_id", low_user_id},
        {"user2_id", high_user_id},
        {"created_at", created_at}
    };
    auto winner = driver_->put_if_absent(Table::Conversations, key_for(conversation_id), columns);
    return from_row(winner);
}

bool ConversationCatalog::update_last_message(const std::string& conversation_id,
                                              TimestampMs timestamp,
                                              const std::string& content,
                                              const std::string& message_id) {
    nlohmann::json columns = {
        {"last_message_at", timestamp},
        {"last_message_id", message_id},
        {"last_message_content", content}
    };
    Guard guard{"last_message_at", "last_message_id", timestamp, message_id};
    auto result = driver_->put_if_newer(Table::Conversations, key_for(conversation_id), guard, columns, false);
    if (!result.found) {
        throw NotFound("Conversation not found: " + conversation_id);
    }
    if (!result.applied) {
        spdlog::debug("[ConversationCatalog] stale snapshot ignored for {}: ({}, {}) <= ({}, {})",
                      conversation_id, timestamp, message_id, result.current.value_or(0), result.current_id);
    }
    return result.applied;
}

Conversation ConversationCatalog::from_row(const Row& row) {
    Conversation conversation;
    try {
        conversation.id = row.key.partition;
        conversation.low_user_id = row.columns.at("user1_id").get<UserId>();
        conversation.high_user_id = row.columns.at("user2_id").get<UserId>();
        conversation.created_at = row.columns.at("created_at").get<TimestampMs>();
        if (row.columns.contains("last_message_at") && !row.columns["last_message_at"].is_null()) {
            conversation.last_message_at = row.columns["last_message_at"].get<TimestampMs>();
            conversation.last_message_content = row.columns.value("last_message_content", std::string());
        }
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("Corrupt conversation row " + row.key.partition + ": " + e.what());
    }
    return conversation;
}

} // namespace duet
