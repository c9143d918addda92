#pragma once

#include "duet/conversation_types.hpp"
#include "duet/storage_driver.hpp"
#include <memory>
#include <string>

namespace duet {

/**
 * @brief One row per conversation with a cached last-message snapshot.
 *
 * Source of truth for direct lookups. The snapshot only moves forward in time.
 */
class ConversationCatalog {
public:
    explicit ConversationCatalog(std::shared_ptr<StorageDriver> driver);

    /**
     * @throws NotFound
     */
    Conversation get(const std::string& conversation_id);

    /**
     * @brief Conditional insert. Racing creators all get the single winning row back.
     */
    Conversation create_if_absent(const std::string& conversation_id,
                                  UserId low_user_id,
                                  UserId high_user_id,
                                  TimestampMs created_at);

    /**
     * @brief Advances the snapshot if (`timestamp`, `message_id`) is strictly newer
     * than the stored pair. Equal timestamps are ordered by message id.
     *
     * @return false when the stored snapshot is already as new or newer
     * @throws NotFound if the conversation row does not exist
     */
    bool update_last_message(const std::string& conversation_id,
                             TimestampMs timestamp,
                             const std::string& content,
                             const std::string& message_id = std::string());

    static Conversation from_row(const Row& row);

private:
    static RowKey key_for(const std::string& conversation_id);

    std::shared_ptr<StorageDriver> driver_;
};

} // namespace duet
