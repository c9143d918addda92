#pragma once

#include "duet/config.hpp"
#include "duet/conversation_catalog.hpp"
#include "duet/conversation_directory.hpp"
#include "duet/conversation_types.hpp"
#include "duet/fanout.hpp"
#include "duet/message_id.hpp"
#include "duet/message_store.hpp"
#include "duet/pagination_cursor.hpp"
#include "duet/repair_service.hpp"
#include "duet/storage_driver.hpp"
#include "duet/write_coordinator.hpp"
#include <memory>
#include <optional>
#include <string>

namespace duet {

/**
 * @brief Request-handling surface of the messaging core.
 *
 * Owns the component graph over one StorageDriver. Sends go through the
 * WriteCoordinator; reads go straight to the store that owns the data.
 */
class ConversationService {
public:
    ConversationService(std::shared_ptr<StorageDriver> driver,
                         const Config& config,
                         MessageIdGenerator::Clock clock = system_clock_ms);
    ~ConversationService();

    ConversationService(const ConversationService&) = delete;
    ConversationService& operator=(const ConversationService&) = delete;

    void initialize_schema();

    // Background repair worker
    void start();
    void stop();

    SendResult send_message(UserId sender_id,
                            UserId receiver_id,
                            const std::string& content,
                            const SendOptions& options = SendOptions());

    Conversation get_conversation(const std::string& conversation_id);

    Page<ConversationListEntry> list_conversations_for_user(UserId user_id,
                                                            const std::optional<std::string>& cursor,
                                                            int limit);

    Page<Message> list_messages(const std::string& conversation_id,
                                const std::optional<std::string>& cursor,
                                int limit,
                                std::optional<TimestampMs> before_ts = std::nullopt);

    RepairService& repair() { return *repair_; }
    ConversationCatalog& catalog() { return *catalog_; }
    ConversationDirectory& directory() { return *directory_; }
    MessageStore& messages() { return *messages_; }

private:
    std::shared_ptr<StorageDriver> driver_;
    Config config_;

    std::shared_ptr<CursorCodec> cursors_;
    std::shared_ptr<MessageIdGenerator> ids_;
    std::shared_ptr<MessageStore> messages_;
    std::shared_ptr<ConversationCatalog> catalog_;
    std::shared_ptr<ConversationDirectory> directory_;
    std::shared_ptr<FanoutApplier> fanout_;
    std::shared_ptr<RepairService> repair_;
    std::unique_ptr<WriteCoordinator> coordinator_;
};

} // namespace duet
