#include "duet/repair_service.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <fstream>

namespace duet {

RepairService::RepairService(std::shared_ptr<FanoutApplier> applier, const RepairConfig& config)
    : applier_(std::move(applier)), config_(config) {
    if (!applier_) {
        throw std::invalid_argument("Fanout applier cannot be null");
    }

    if (config_.journal_dir.empty()) {
        spdlog::info("RepairService initializing: in-memory queue only (REPAIR_JOURNAL_DIR not set)");
        return;
    }

    spdlog::info("RepairService initializing: journal={}", config_.journal_dir);

    try {
        std::filesystem::create_directories(config_.journal_dir);
        std::filesystem::create_directories(config_.journal_dir + "/failed");
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to create repair journal directories: {} (error code: {})",
                      e.what(), e.code().value());
        throw;
    }

    replay_journal();
}

RepairService::~RepairService() {
    stop();
}

std::string RepairService::journal_path() const {
    return config_.journal_dir + "/fanout.jsonl";
}

std::string RepairService::failed_path() const {
    return config_.journal_dir + "/failed/fanout_failed.jsonl";
}

void RepairService::start() {
    if (!config_.enabled) {
        spdlog::info("RepairService disabled (REPAIR_ENABLED=false), {} task(s) left queued",
                     get_pending_count());
        return;
    }
    if (running_) {
        spdlog::warn("RepairService already running");
        return;
    }

    running_ = true;
    processor_ = std::thread([this]() { background_processor(); });

    spdlog::info("RepairService started: interval={}ms, max_attempts={}, pending={}",
                 config_.interval_ms, config_.max_attempts, get_pending_count());
}

void RepairService::stop() {
    {
        std::lock_guard<std::mutex> lock(processor_mutex_);
        if (!running_) return;
        running_ = false;
    }
    processor_cv_.notify_all();
    if (processor_.joinable()) {
        processor_.join();
    }
    spdlog::info("RepairService stopped ({} task(s) pending)", get_pending_count());
}

void RepairService::enqueue(FanoutTask task) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!config_.journal_dir.empty()) {
        append_to_journal(task);
    }
    spdlog::debug("[RepairService] queued {} for conversation {} (message {})",
                  describe_steps(task.pending), task.conversation_id, task.message_id);
    queue_.push_back(std::move(task));
}

size_t RepairService::drain_once() {
    std::lock_guard<std::mutex> drain_lock(drain_mutex_);

    std::deque<FanoutTask> batch;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        batch.swap(queue_);
    }
    if (batch.empty()) {
        return 0;
    }

    auto start = std::chrono::steady_clock::now();
    size_t completed = 0;
    size_t failed = 0;
    std::vector<FanoutTask> retained;

    for (auto& task : batch) {
        bool done = false;
        try {
            done = applier_->apply(task);
        } catch (const std::exception& e) {
            spdlog::error("[RepairService] unexpected error repairing conversation {}: {}",
                          task.conversation_id, e.what());
        }

        if (done) {
            ++completed;
            continue;
        }

        ++task.attempts;
        if (task.attempts >= config_.max_attempts) {
            spdlog::error("[RepairService] giving up on conversation {} (message {}) after {} attempts, "
                          "pending steps: {}",
                          task.conversation_id, task.message_id, task.attempts, describe_steps(task.pending));
            if (!config_.journal_dir.empty()) {
                move_to_failed(task);
            }
            ++failed;
            ++failed_count_;
            continue;
        }
        retained.push_back(std::move(task));
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        // Retried tasks go ahead of anything enqueued during the pass
        for (auto it = retained.rbegin(); it != retained.rend(); ++it) {
            queue_.push_front(std::move(*it));
        }
        if (!config_.journal_dir.empty()) {
            rewrite_journal();
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::info("[RepairService] pass completed in {}ms: repaired={}, retrying={}, failed={}",
                 elapsed, completed, retained.size(), failed);
    return completed;
}

size_t RepairService::get_pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

std::vector<FanoutTask> RepairService::pending_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return std::vector<FanoutTask>(queue_.begin(), queue_.end());
}

void RepairService::background_processor() {
    spdlog::debug("[RepairService] background processor running");

    while (running_) {
        {
            std::unique_lock<std::mutex> lock(processor_mutex_);
            processor_cv_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms),
                                   [this]() { return !running_.load(); });
        }
        if (!running_) break;
        if (get_pending_count() == 0) continue;

        try {
            drain_once();
        } catch (const std::exception& e) {
            spdlog::error("[RepairService] repair pass failed: {}", e.what());
        }
    }

    spdlog::debug("[RepairService] background processor exited");
}

// --- Journal ---

void RepairService::replay_journal() {
    std::ifstream in(journal_path());
    if (!in) {
        return;
    }

    size_t replayed = 0;
    size_t skipped = 0;
    std::string line;
    std::lock_guard<std::mutex> lock(queue_mutex_);

    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded()) {
            ++skipped;
            continue;
        }
        try {
            queue_.push_back(FanoutTask::from_json(j));
            ++replayed;
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("[RepairService] skipping malformed journal entry: {}", e.what());
            ++skipped;
        }
    }
    in.close();

    if (skipped > 0) {
        spdlog::warn("[RepairService] {} unreadable journal line(s) dropped (possibly a torn write)", skipped);
        rewrite_journal();
    }
    spdlog::info("RepairService recovered {} task(s) from {}", replayed, journal_path());
}

void RepairService::append_to_journal(const FanoutTask& task) {
    std::ofstream out(journal_path(), std::ios::app);
    out << task.to_json().dump() << '\n';
    out.flush();
    if (!out) {
        spdlog::error("[RepairService] failed to append to journal {}, task kept in memory only",
                      journal_path());
    }
}

void RepairService::rewrite_journal() {
    const std::string tmp_path = journal_path() + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        for (const auto& task : queue_) {
            out << task.to_json().dump() << '\n';
        }
        out.flush();
        if (!out) {
            spdlog::error("[RepairService] failed to write journal {}", tmp_path);
            return;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, journal_path(), ec);
    if (ec) {
        spdlog::error("[RepairService] failed to replace journal {}: {}", journal_path(), ec.message());
    }
}

void RepairService::move_to_failed(const FanoutTask& task) {
    std::ofstream out(failed_path(), std::ios::app);
    out << task.to_json().dump() << '\n';
    out.flush();
    if (!out) {
        spdlog::error("[RepairService] failed to record dead task in {}", failed_path());
    }
}

} // namespace duet
