#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <atomic>
#include <memory>
#include <cstdint>

namespace duet {

// ============================================================================
// Shared Conversation Types
// Used by the stores, the write coordinator and the service facade
// ============================================================================

using UserId = int64_t;
using TimestampMs = int64_t;  // Milliseconds since the Unix epoch

struct ConversationRef {
    std::string id;
    UserId low_user_id = 0;
    UserId high_user_id = 0;
};

struct Message {
    std::string conversation_id;
    TimestampMs created_at = 0;
    std::string id;               // UUIDv7, sortable by creation time
    UserId sender_id = 0;
    UserId receiver_id = 0;
    std::string content;
};

struct Conversation {
    std::string id;
    UserId low_user_id = 0;       // user1_id
    UserId high_user_id = 0;      // user2_id
    TimestampMs created_at = 0;
    std::optional<TimestampMs> last_message_at;
    std::optional<std::string> last_message_content;
};

struct ConversationListEntry {
    UserId user_id = 0;
    std::string conversation_id;
    UserId other_user_id = 0;
    TimestampMs last_message_at = 0;
    std::string last_message_content;
};

template <typename T>
struct Page {
    std::vector<T> items;
    std::optional<std::string> next_cursor;  // Absent when the sequence is exhausted
};

// Shared between a caller and an in-flight send. Setting it stops retries;
// it never retracts a message that is already durable.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct SendOptions {
    std::optional<TimestampMs> client_timestamp;
    std::shared_ptr<CancellationToken> cancellation;
};

struct SendResult {
    Message message;
    std::string conversation_id;
    bool fanout_complete = false;  // False when steps 3-4 were handed to repair
};

// JSON conversion used by the CLI and the repair journal
void to_json(nlohmann::json& j, const Message& m);
void to_json(nlohmann::json& j, const Conversation& c);
void to_json(nlohmann::json& j, const ConversationListEntry& e);
void to_json(nlohmann::json& j, const SendResult& r);

} // namespace duet
