#pragma once
// Daemon: background reconciliation
//
// Walks every active scope on a fixed interval and reconciles it, and
// periodically runs the save hook (outbox persistence in arbiterd).

#include "config.hpp"
#include "scope.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace arbiter {

enum class DaemonEvent {
    Tick,           // Daemon started or stopped
    Reconciled,     // One scope reconciled
    Saved,          // Save hook ran
    Alert           // Something needs attention
};

using DaemonCallback = std::function<void(DaemonEvent, const std::string&)>;

class ReconcileDaemon {
public:
    explicit ReconcileDaemon(DaemonConfig config = {})
        : config_(config)
        , running_(false)
        , last_reconcile_(now())
        , last_save_(now())
    {}

    ~ReconcileDaemon() {
        stop();
    }

    ReconcileDaemon(const ReconcileDaemon&) = delete;
    ReconcileDaemon& operator=(const ReconcileDaemon&) = delete;

    // Required before start
    void attach(ScopeRegistry* registry) {
        registry_ = registry;
    }

    void on_event(DaemonCallback callback) {
        callback_ = std::move(callback);
    }

    void on_save(std::function<void()> save_fn) {
        save_fn_ = std::move(save_fn);
    }

    void start() {
        if (running_.exchange(true)) return;

        thread_ = std::thread([this]() {
            run_loop();
        });

        emit(DaemonEvent::Tick, "Daemon started");
    }

    void stop() {
        if (!running_.exchange(false)) return;

        if (thread_.joinable()) {
            thread_.join();
        }

        emit(DaemonEvent::Tick, "Daemon stopped");
    }

    bool is_running() const { return running_; }

    struct Stats {
        size_t ticks = 0;
        size_t reconcile_passes = 0;
        size_t scopes_reconciled = 0;
        size_t inconsistencies = 0;
        size_t auto_fixed = 0;
        size_t requires_human_review = 0;
        size_t saves = 0;
    };

    Stats stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        return stats_;
    }

    // One reconcile pass over all scopes, on the calling thread
    void run_reconcile() {
        if (!registry_) return;

        auto reports = registry_->reconcile_all(config_.auto_fix);

        // Callbacks may read stats(), so emit only after the lock is released
        std::vector<std::pair<DaemonEvent, std::string>> messages;
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.reconcile_passes++;
            for (const auto& r : reports) {
                stats_.scopes_reconciled++;
                stats_.inconsistencies += r.inconsistencies.size();
                stats_.auto_fixed += r.auto_fixed;
                stats_.requires_human_review += r.requires_human_review;

                messages.emplace_back(DaemonEvent::Reconciled,
                    r.scope_id + ": " + std::to_string(r.inconsistencies.size()) +
                    " found, " + std::to_string(r.auto_fixed) + " fixed");
                if (r.requires_human_review > 0) {
                    messages.emplace_back(DaemonEvent::Alert,
                        r.scope_id + ": " + std::to_string(r.requires_human_review) +
                        " bindings await review");
                }
            }
        }
        for (const auto& m : messages) emit(m.first, m.second);
    }

    void run_save() {
        if (!save_fn_) return;

        save_fn_();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.saves++;
        }

        emit(DaemonEvent::Saved, "State persisted");
    }

private:
    void run_loop() {
        while (running_) {
            Timestamp current = now();

            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.ticks++;
            }

            if (current - last_reconcile_ >= config_.reconcile_interval_ms) {
                run_reconcile();
                last_reconcile_ = current;
            }

            if (current - last_save_ >= config_.save_interval_ms) {
                run_save();
                last_save_ = current;
            }

            // Sleep in short steps so stop() returns promptly
            int64_t slept = 0;
            while (running_ && slept < config_.tick_interval_ms) {
                int64_t step = std::min<int64_t>(50, config_.tick_interval_ms - slept);
                std::this_thread::sleep_for(std::chrono::milliseconds(step));
                slept += step;
            }
        }
    }

    void emit(DaemonEvent event, const std::string& msg) {
        if (callback_) {
            callback_(event, msg);
        }
    }

    DaemonConfig config_;
    std::atomic<bool> running_;
    std::thread thread_;
    ScopeRegistry* registry_ = nullptr;
    DaemonCallback callback_;
    std::function<void()> save_fn_;

    Timestamp last_reconcile_;
    Timestamp last_save_;

    mutable std::mutex stats_mutex_;
    Stats stats_;
};

} // namespace arbiter
