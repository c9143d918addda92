#pragma once

#include "duet/config.hpp"
#include "duet/conversation_types.hpp"
#include "duet/message_id.hpp"
#include "duet/pagination_cursor.hpp"
#include "duet/storage_driver.hpp"
#include <memory>
#include <optional>
#include <string>

namespace duet {

/**
 * @brief Append-only per-conversation message log.
 *
 * Rows live in the `messages` table, partitioned by conversation id and
 * clustered by (created_at DESC, message_id DESC).
 */
class MessageStore {
public:
    MessageStore(std::shared_ptr<StorageDriver> driver,
                 std::shared_ptr<CursorCodec> cursors,
                 std::shared_ptr<MessageIdGenerator> ids,
                 const StoreConfig& config);

    /**
     * @brief Assigns id and timestamp without writing anything.
     */
    Message prepare(const std::string& conversation_id,
                    UserId sender_id,
                    UserId receiver_id,
                    const std::string& content,
                    std::optional<TimestampMs> client_timestamp = std::nullopt);

    // Writes exactly this row. Writing the same message twice is an overwrite of the same key.
    void append(const Message& message);

    // Removes the row of a message whose send failed. No-op if it was never written.
    void erase(const Message& message);

    // prepare + append
    Message append(const std::string& conversation_id,
                   UserId sender_id,
                   UserId receiver_id,
                   const std::string& content,
                   std::optional<TimestampMs> client_timestamp = std::nullopt);

    /**
     * @brief Most-recent-first page of a conversation.
     *
     * @param cursor Resume position from a previous page's next_cursor
     * @param limit <= 0 means the default page size, larger than the maximum is clamped
     * @param before_ts Only messages strictly older than this timestamp
     * @throws InvalidCursor
     */
    Page<Message> list_messages(const std::string& conversation_id,
                                const std::optional<std::string>& cursor,
                                int limit,
                                std::optional<TimestampMs> before_ts = std::nullopt);

    static Message from_row(const Row& row);

private:
    int effective_limit(int limit) const;

    std::shared_ptr<StorageDriver> driver_;
    std::shared_ptr<CursorCodec> cursors_;
    std::shared_ptr<MessageIdGenerator> ids_;
    StoreConfig config_;
};

} // namespace duet
