#include "duet/write_coordinator.hpp"
#include "duet/conversation_identity.hpp"
#include "duet/errors.hpp"
#include <spdlog/spdlog.h>

namespace duet {

namespace {

bool is_cancelled(const CancellationToken* cancel) {
    return cancel && cancel->is_cancelled();
}

} // anonymous namespace

WriteCoordinator::WriteCoordinator(std::shared_ptr<ConversationCatalog> catalog,
                                   std::shared_ptr<MessageStore> messages,
                                   std::shared_ptr<FanoutApplier> fanout,
                                   std::shared_ptr<RepairService> repair,
                                   const RetryPolicy& policy)
    : catalog_(std::move(catalog)),
      messages_(std::move(messages)),
      fanout_(std::move(fanout)),
      repair_(std::move(repair)),
      policy_(policy) {
}

SendResult WriteCoordinator::send_message(UserId sender_id,
                                          UserId receiver_id,
                                          const std::string& content,
                                          const SendOptions& options) {
    const CancellationToken* cancel = options.cancellation.get();

    auto ref = ConversationIdentity::resolve(sender_id, receiver_id);
    if (is_cancelled(cancel)) {
        throw SendCancelled("Send cancelled before it started");
    }

    // Id and timestamp are fixed once so every retry below writes the same row
    Message message = messages_->prepare(ref.id, sender_id, receiver_id, content, options.client_timestamp);

    // Step 1
    ensure_conversation(ref, message.created_at, cancel);
    if (is_cancelled(cancel)) {
        throw SendCancelled("Send cancelled before the message was stored");
    }

    // Step 2
    append_durably(message, cancel);

    // Steps 3-4
    SendResult result;
    result.conversation_id = ref.id;
    result.message = message;

    FanoutTask task = FanoutTask::for_message(message, ref);
    result.fanout_complete = fanout_->apply(task, cancel);

    if (!result.fanout_complete) {
        if (repair_) {
            spdlog::warn("[WriteCoordinator] fan-out incomplete for conversation {} (message {}), "
                         "handing {} to repair",
                         ref.id, message.id, describe_steps(task.pending));
            repair_->enqueue(std::move(task));
        } else {
            spdlog::warn("[WriteCoordinator] fan-out incomplete for conversation {} (message {}), "
                         "no repair service configured, views stay behind for: {}",
                         ref.id, message.id, describe_steps(task.pending));
        }
    }

    return result;
}

Conversation WriteCoordinator::ensure_conversation(const ConversationRef& ref, TimestampMs created_at,
                                                   const CancellationToken* cancel) {
    Conversation conversation;
    try {
        conversation = with_retry(policy_, "send.create_conversation", [&]() {
            return catalog_->create_if_absent(ref.id, ref.low_user_id, ref.high_user_id, created_at);
        }, cancel);
    } catch (const StorageError& e) {
        if (is_cancelled(cancel)) {
            throw SendCancelled("Send cancelled while creating the conversation");
        }
        throw SendFailed("Could not create conversation " + ref.id + ": " + e.what());
    }

    if (conversation.low_user_id != ref.low_user_id || conversation.high_user_id != ref.high_user_id) {
        spdlog::error("[WriteCoordinator] conversation id collision on {}: stored ({}, {}), wanted ({}, {})",
                      ref.id, conversation.low_user_id, conversation.high_user_id,
                      ref.low_user_id, ref.high_user_id);
        throw SendFailed("Conversation " + ref.id + " belongs to a different participant pair");
    }
    return conversation;
}

void WriteCoordinator::append_durably(const Message& message, const CancellationToken* cancel) {
    try {
        with_retry(policy_, "send.append", [&]() {
            messages_->append(message);
        }, cancel);
    } catch (const StorageError& e) {
        // A lost acknowledgement may have left the row behind
        discard_message(message);
        if (is_cancelled(cancel)) {
            throw SendCancelled("Send cancelled before the message was stored");
        }
        throw SendFailed("Could not store message in conversation " + message.conversation_id + ": " + e.what());
    }
}

void WriteCoordinator::discard_message(const Message& message) {
    try {
        with_retry(policy_, "send.discard", [&]() {
            messages_->erase(message);
        });
    } catch (const StorageError& e) {
        spdlog::error("[WriteCoordinator] failed send may still be visible in conversation {} (message {}): {}",
                      message.conversation_id, message.id, e.what());
    }
}

} // namespace duet
