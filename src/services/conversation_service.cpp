#include "duet/conversation_service.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace duet {

ConversationService::ConversationService(std::shared_ptr<StorageDriver> driver,
                                         const Config& config,
                                         MessageIdGenerator::Clock clock)
    : driver_(std::move(driver)), config_(config) {
    if (!driver_) {
        throw std::invalid_argument("Storage driver cannot be null");
    }

    auto policy = RetryPolicy::from_config(config_.store);

    cursors_ = std::make_shared<CursorCodec>(config_.cursor);
    ids_ = std::make_shared<MessageIdGenerator>(std::move(clock));
    messages_ = std::make_shared<MessageStore>(driver_, cursors_, ids_, config_.store);
    catalog_ = std::make_shared<ConversationCatalog>(driver_);
    directory_ = std::make_shared<ConversationDirectory>(driver_, cursors_, config_.store);
    fanout_ = std::make_shared<FanoutApplier>(catalog_, directory_, policy);
    repair_ = std::make_shared<RepairService>(fanout_, config_.repair);
    coordinator_ = std::make_unique<WriteCoordinator>(catalog_, messages_, fanout_, repair_, policy);

    spdlog::info("ConversationService ready: page_size={}/{}, retries={}, repair_pending={}",
                 config_.store.default_page_size, config_.store.max_page_size,
                 policy.max_retries, repair_->get_pending_count());
}

ConversationService::~ConversationService() {
    stop();
}

void ConversationService::initialize_schema() {
    driver_->initialize_schema();
}

void ConversationService::start() {
    repair_->start();
}

void ConversationService::stop() {
    repair_->stop();
}

SendResult ConversationService::send_message(UserId sender_id,
                                             UserId receiver_id,
                                             const std::string& content,
                                             const SendOptions& options) {
    return coordinator_->send_message(sender_id, receiver_id, content, options);
}

Conversation ConversationService::get_conversation(const std::string& conversation_id) {
    return catalog_->get(conversation_id);
}

Page<ConversationListEntry> ConversationService::list_conversations_for_user(
        UserId user_id, const std::optional<std::string>& cursor, int limit) {
    return directory_->list_conversations(user_id, cursor, limit);
}

Page<Message> ConversationService::list_messages(const std::string& conversation_id,
                                                 const std::optional<std::string>& cursor,
                                                 int limit,
                                                 std::optional<TimestampMs> before_ts) {
    return messages_->list_messages(conversation_id, cursor, limit, before_ts);
}

// --- JSON conversion ---

void to_json(nlohmann::json& j, const Message& m) {
    j = {
        {"conversation_id", m.conversation_id},
        {"message_id", m.id},
        {"created_at", m.created_at},
        {"sender_id", m.sender_id},
        {"receiver_id", m.receiver_id},
        {"content", m.content}
    };
}

void to_json(nlohmann::json& j, const Conversation& c) {
    j = {
        {"conversation_id", c.id},
        {"user1_id", c.low_user_id},
        {"user2_id", c.high_user_id},
        {"created_at", c.created_at},
        {"last_message_at", nullptr},
        {"last_message_content", nullptr}
    };
    if (c.last_message_at) j["last_message_at"] = *c.last_message_at;
    if (c.last_message_content) j["last_message_content"] = *c.last_message_content;
}

void to_json(nlohmann::json& j, const ConversationListEntry& e) {
    j = {
        {"user_id", e.user_id},
        {"conversation_id", e.conversation_id},
        {"other_user_id", e.other_user_id},
        {"last_message_at", e.last_message_at},
        {"last_message_content", e.last_message_content}
    };
}

void to_json(nlohmann::json& j, const SendResult& r) {
    j = {
        {"conversation_id", r.conversation_id},
        {"message", r.message},
        {"fanout_complete", r.fanout_complete}
    };
}

} // namespace duet
