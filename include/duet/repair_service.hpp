#pragma once

#include "duet/config.hpp"
#include "duet/fanout.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace duet {

/**
 * RepairService - Background reconciliation of unfinished fan-outs
 *
 * A send whose view updates could not complete inline hands them over here.
 * Tasks are kept in memory and, when a journal directory is configured,
 * appended to `fanout.jsonl` (one JSON object per line) so they survive a
 * restart. Tasks that keep failing for `max_attempts` passes are moved to
 * `failed/fanout_failed.jsonl`.
 *
 * Thread-safe: enqueue() may be called from any request thread while the
 * worker drains.
 */
class RepairService {
public:
    RepairService(std::shared_ptr<FanoutApplier> applier, const RepairConfig& config);
    ~RepairService();

    // Starts the worker thread (no-op when disabled in the config)
    void start();
    void stop();

    void enqueue(FanoutTask task);

    /**
     * Runs every queued task once, synchronously.
     *
     * @return Number of tasks that completed in this pass
     */
    size_t drain_once();

    size_t get_pending_count() const;
    size_t get_failed_count() const { return failed_count_.load(); }
    bool is_running() const { return running_.load(); }

    std::vector<FanoutTask> pending_tasks() const;

private:
    void background_processor();

    // Journal operations
    void replay_journal();
    void append_to_journal(const FanoutTask& task);
    void rewrite_journal();
    void move_to_failed(const FanoutTask& task);
    std::string journal_path() const;
    std::string failed_path() const;

    std::shared_ptr<FanoutApplier> applier_;
    RepairConfig config_;

    // Queue and journal file share one lock so the file mirrors the queue
    mutable std::mutex queue_mutex_;
    std::deque<FanoutTask> queue_;

    // One drain at a time (worker and manual passes)
    std::mutex drain_mutex_;

    std::thread processor_;
    std::mutex processor_mutex_;
    std::condition_variable processor_cv_;
    std::atomic<bool> running_{false};

    std::atomic<size_t> failed_count_{0};
};

} // namespace duet
