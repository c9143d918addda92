#pragma once

#include "duet/config.hpp"
#include "duet/conversation_types.hpp"
#include "duet/pagination_cursor.hpp"
#include "duet/storage_driver.hpp"
#include <memory>
#include <optional>
#include <string>

namespace duet {

/**
 * @brief Per-user conversation list ordered by recency.
 *
 * Every send re-keys the owner's entry in `conversations_by_user` on the new
 * timestamp, which leaves the previous entry behind. A per-(user, conversation)
 * head row in `directory_heads` holds the newest timestamp applied so far:
 * entries older than their head are stale and get erased, either right away
 * by the upsert that superseded them or later by the read that finds them.
 */
class ConversationDirectory {
public:
    ConversationDirectory(std::shared_ptr<StorageDriver> driver,
                          std::shared_ptr<CursorCodec> cursors,
                          const StoreConfig& config);

    /**
     * @brief Writes the owner's entry for `timestamp` and advances the head.
     *
     * Versions are (timestamp, message_id): two messages in the same millisecond
     * share one entry row and the larger message id wins its content.
     * Idempotent: applying the same version again changes nothing.
     *
     * @return false if a newer version was already applied (this one is dropped)
     */
    bool upsert_entry(UserId owner_id,
                      const std::string& conversation_id,
                      UserId other_user_id,
                      TimestampMs timestamp,
                      const std::string& content,
                      const std::string& message_id = std::string());

    /**
     * @brief Most-recent-first page of the user's conversations, one entry per conversation.
     *
     * @throws InvalidCursor
     */
    Page<ConversationListEntry> list_conversations(UserId user_id,
                                                   const std::optional<std::string>& cursor,
                                                   int limit);

    // Newest timestamp applied to this user's entry for the conversation
    std::optional<TimestampMs> head(UserId user_id, const std::string& conversation_id);

private:
    std::optional<Guard> read_head(const std::string& owner, const std::string& conversation_id);
    CasResult advance_head(const std::string& owner,
                           const std::string& conversation_id,
                           TimestampMs timestamp,
                           const std::string& message_id);
    int effective_limit(int limit) const;

    std::shared_ptr<StorageDriver> driver_;
    std::shared_ptr<CursorCodec> cursors_;
    StoreConfig config_;
};

} // namespace duet
