#include "duet/fanout.hpp"
#include "duet/errors.hpp"
#include <spdlog/spdlog.h>

namespace duet {

FanoutTask FanoutTask::for_message(const Message& message, const ConversationRef& ref) {
    FanoutTask task;
    task.conversation_id = ref.id;
    task.low_user_id = ref.low_user_id;
    task.high_user_id = ref.high_user_id;
    task.sender_id = message.sender_id;
    task.receiver_id = message.receiver_id;
    task.message_id = message.id;
    task.timestamp = message.created_at;
    task.content = message.content;
    return task;
}

nlohmann::json FanoutTask::to_json() const {
    return {
        {"conversation_id", conversation_id},
        {"low_user_id", low_user_id},
        {"high_user_id", high_user_id},
        {"sender_id", sender_id},
        {"receiver_id", receiver_id},
        {"message_id", message_id},
        {"timestamp", timestamp},
        {"content", content},
        {"pending", pending},
        {"attempts", attempts}
    };
}

FanoutTask FanoutTask::from_json(const nlohmann::json& j) {
    FanoutTask task;
    task.conversation_id = j.at("conversation_id").get<std::string>();
    task.low_user_id = j.at("low_user_id").get<UserId>();
    task.high_user_id = j.at("high_user_id").get<UserId>();
    task.sender_id = j.at("sender_id").get<UserId>();
    task.receiver_id = j.at("receiver_id").get<UserId>();
    task.message_id = j.value("message_id", std::string());
    task.timestamp = j.at("timestamp").get<TimestampMs>();
    task.content = j.at("content").get<std::string>();
    task.pending = j.value("pending", static_cast<uint32_t>(FANOUT_ALL)) & FANOUT_ALL;
    task.attempts = j.value("attempts", 0);
    return task;
}

std::string describe_steps(uint32_t steps) {
    std::string out;
    auto add = [&out](const char* name) {
        if (!out.empty()) out += ",";
        out += name;
    };
    if (steps & FANOUT_CATALOG) add("catalog");
    if (steps & FANOUT_SENDER_ENTRY) add("sender_entry");
    if (steps & FANOUT_RECEIVER_ENTRY) add("receiver_entry");
    return out.empty() ? "none" : out;
}

FanoutApplier::FanoutApplier(std::shared_ptr<ConversationCatalog> catalog,
                             std::shared_ptr<ConversationDirectory> directory,
                             const RetryPolicy& policy)
    : catalog_(std::move(catalog)),
      directory_(std::move(directory)),
      policy_(policy) {
}

bool FanoutApplier::apply(FanoutTask& task, const CancellationToken* cancel) {
    for (FanoutStep step : {FANOUT_CATALOG, FANOUT_SENDER_ENTRY, FANOUT_RECEIVER_ENTRY}) {
        if (!(task.pending & step)) continue;
        if (cancel && cancel->is_cancelled()) break;
        run_step(task, step, cancel);
    }
    return task.pending == 0;
}

void FanoutApplier::run_step(FanoutTask& task, FanoutStep step, const CancellationToken* cancel) {
    try {
        switch (step) {
            case FANOUT_CATALOG:
                with_retry(policy_, "fanout.catalog", [&]() {
                    return catalog_->update_last_message(task.conversation_id, task.timestamp,
                                                         task.content, task.message_id);
                }, cancel);
                break;
            case FANOUT_SENDER_ENTRY:
                with_retry(policy_, "fanout.sender_entry", [&]() {
                    return directory_->upsert_entry(task.sender_id, task.conversation_id,
                                                    task.receiver_id, task.timestamp, task.content,
                                                    task.message_id);
                }, cancel);
                break;
            case FANOUT_RECEIVER_ENTRY:
                with_retry(policy_, "fanout.receiver_entry", [&]() {
                    return directory_->upsert_entry(task.receiver_id, task.conversation_id,
                                                    task.sender_id, task.timestamp, task.content,
                                                    task.message_id);
                }, cancel);
                break;
            default:
                return;
        }
        task.pending &= ~static_cast<uint32_t>(step);
    } catch (const DuetError& e) {
        spdlog::warn("[Fanout] step {} failed for conversation {} (message {}): {}",
                     describe_steps(step), task.conversation_id, task.message_id, e.what());
    }
}

} // namespace duet
