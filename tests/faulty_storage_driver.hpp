#pragma once

#include "duet/errors.hpp"
#include "duet/storage_driver.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

// Decorator that injects storage failures into selected operations.
// Used to drive the retry, SendFailed and repair paths deterministically.
class FaultyStorageDriver : public duet::StorageDriver {
public:
    enum class Op { Put, PutIfAbsent, PutIfNewer, Get, Erase, Scan };

    enum class Mode {
        FailBefore,   // Operation does not happen, caller sees TransientStorageError
        FailAfter,    // Operation happens, caller still sees TransientStorageError (lost ack)
        Permanent     // Operation does not happen, caller sees StorageError
    };

    explicit FaultyStorageDriver(std::shared_ptr<duet::StorageDriver> inner)
        : inner_(std::move(inner)) {}

    // times < 0 means until clear()
    void inject(duet::Table table, Op op, int times, Mode mode = Mode::FailBefore) {
        std::lock_guard<std::mutex> lock(mutex_);
        rules_.push_back(Rule{table, op, times, mode});
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        rules_.clear();
    }

    // Runs before every operation, outside the driver lock
    void on_call(std::function<void(duet::Table, Op)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        hook_ = std::move(hook);
    }

    int injected_failures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return injected_;
    }

    void initialize_schema() override { inner_->initialize_schema(); }

    void put(duet::Table table, const duet::RowKey& key, const nlohmann::json& columns) override {
        run(table, Op::Put, [&]() { inner_->put(table, key, columns); return 0; });
    }

    duet::Row put_if_absent(duet::Table table, const duet::RowKey& key, const nlohmann::json& columns) override {
        return run(table, Op::PutIfAbsent, [&]() { return inner_->put_if_absent(table, key, columns); });
    }

    duet::CasResult put_if_newer(duet::Table table,
                                 const duet::RowKey& key,
                                 const duet::Guard& guard,
                                 const nlohmann::json& columns,
                                 bool upsert) override {
        return run(table, Op::PutIfNewer, [&]() {
            return inner_->put_if_newer(table, key, guard, columns, upsert);
        });
    }

    std::optional<duet::Row> get(duet::Table table, const duet::RowKey& key) override {
        return run(table, Op::Get, [&]() { return inner_->get(table, key); });
    }

    void erase(duet::Table table, const duet::RowKey& key) override {
        run(table, Op::Erase, [&]() { inner_->erase(table, key); return 0; });
    }

    std::vector<duet::Row> scan(duet::Table table,
                                const std::string& partition,
                                const duet::ScanRange& range,
                                int limit) override {
        return run(table, Op::Scan, [&]() { return inner_->scan(table, partition, range, limit); });
    }

private:
    struct Rule {
        duet::Table table;
        Op op;
        int remaining;
        Mode mode;
    };

    template <typename Fn>
    auto run(duet::Table table, Op op, Fn&& fn) -> decltype(fn()) {
        std::function<void(duet::Table, Op)> hook;
        bool fail = false;
        Mode mode = Mode::FailBefore;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = hook_;
            for (auto& rule : rules_) {
                if (rule.table != table || rule.op != op || rule.remaining == 0) continue;
                if (rule.remaining > 0) --rule.remaining;
                fail = true;
                mode = rule.mode;
                ++injected_;
                break;
            }
        }

        if (hook) hook(table, op);

        if (!fail) return fn();

        const std::string what = std::string("injected failure on ") + duet::table_name(table);
        switch (mode) {
            case Mode::FailAfter:
                fn();
                throw duet::TransientStorageError(what + " (after write)");
            case Mode::Permanent:
                throw duet::StorageError(what);
            case Mode::FailBefore:
            default:
                throw duet::TransientStorageError(what);
        }
    }

    std::shared_ptr<duet::StorageDriver> inner_;
    mutable std::mutex mutex_;
    std::vector<Rule> rules_;
    std::function<void(duet::Table, Op)> hook_;
    int injected_ = 0;
};
