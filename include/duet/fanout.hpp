#pragma once

#include "duet/conversation_catalog.hpp"
#include "duet/conversation_directory.hpp"
#include "duet/conversation_types.hpp"
#include "duet/retry.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace duet {

// View updates that follow a durable append (send steps 3 and 4)
enum FanoutStep : uint32_t {
    FANOUT_CATALOG = 1u << 0,          // Catalog last-message snapshot
    FANOUT_SENDER_ENTRY = 1u << 1,     // Sender's directory entry
    FANOUT_RECEIVER_ENTRY = 1u << 2,   // Receiver's directory entry
    FANOUT_ALL = FANOUT_CATALOG | FANOUT_SENDER_ENTRY | FANOUT_RECEIVER_ENTRY
};

/**
 * Everything needed to redo the view updates of one message without reading
 * it back: the timestamp and content are carried so a late replay cannot
 * overwrite a newer snapshot.
 */
struct FanoutTask {
    std::string conversation_id;
    UserId low_user_id = 0;
    UserId high_user_id = 0;
    UserId sender_id = 0;
    UserId receiver_id = 0;
    std::string message_id;
    TimestampMs timestamp = 0;
    std::string content;
    uint32_t pending = FANOUT_ALL;
    int attempts = 0;

    static FanoutTask for_message(const Message& message, const ConversationRef& ref);

    nlohmann::json to_json() const;
    static FanoutTask from_json(const nlohmann::json& j);
};

std::string describe_steps(uint32_t steps);

/**
 * Runs the pending steps of a task, each under its own retry budget.
 * Steps are idempotent and independent, so they can run in any order and any
 * number of times.
 */
class FanoutApplier {
public:
    FanoutApplier(std::shared_ptr<ConversationCatalog> catalog,
                  std::shared_ptr<ConversationDirectory> directory,
                  const RetryPolicy& policy);

    /**
     * Clears the bit of every step that completes. Stops early once `cancel`
     * is set; the remaining steps stay pending.
     *
     * @return true when no step is left pending
     */
    bool apply(FanoutTask& task, const CancellationToken* cancel = nullptr);

private:
    void run_step(FanoutTask& task, FanoutStep step, const CancellationToken* cancel);

    std::shared_ptr<ConversationCatalog> catalog_;
    std::shared_ptr<ConversationDirectory> directory_;
    RetryPolicy policy_;
};

} // namespace duet
