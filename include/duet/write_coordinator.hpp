#pragma once

#include "duet/conversation_catalog.hpp"
#include "duet/conversation_types.hpp"
#include "duet/fanout.hpp"
#include "duet/message_store.hpp"
#include "duet/repair_service.hpp"
#include "duet/retry.hpp"
#include <memory>
#include <string>

namespace duet {

/**
 * @brief Three-way fan-out of a send without a multi-partition transaction.
 *
 * 1. resolve the pair and create the catalog row if absent
 * 2. append the message (durability point)
 * 3. advance the catalog's last-message snapshot
 * 4. upsert both participants' directory entries
 *
 * Steps 1-2 decide whether the send happened. Steps 3-4 are idempotent and
 * monotonicity-guarded; whatever does not finish inline goes to the repair
 * service with the message's own timestamp and content.
 */
class WriteCoordinator {
public:
    WriteCoordinator(std::shared_ptr<ConversationCatalog> catalog,
                     std::shared_ptr<MessageStore> messages,
                     std::shared_ptr<FanoutApplier> fanout,
                     std::shared_ptr<RepairService> repair,
                     const RetryPolicy& policy);

    /**
     * @throws InvalidParticipants if sender and receiver are the same user
     * @throws SendFailed if the conversation row or the message could not be written
     * @throws SendCancelled if cancelled before the message became durable
     */
    SendResult send_message(UserId sender_id,
                            UserId receiver_id,
                            const std::string& content,
                            const SendOptions& options = SendOptions());

private:
    Conversation ensure_conversation(const ConversationRef& ref, TimestampMs created_at,
                                     const CancellationToken* cancel);
    void append_durably(const Message& message, const CancellationToken* cancel);
    void discard_message(const Message& message);

    std::shared_ptr<ConversationCatalog> catalog_;
    std::shared_ptr<MessageStore> messages_;
    std::shared_ptr<FanoutApplier> fanout_;
    std::shared_ptr<RepairService> repair_;  // May be null: unfinished fan-outs are then only logged
    RetryPolicy policy_;
};

} // namespace duet
