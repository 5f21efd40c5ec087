#pragma once
// Notification Outbox: queued external delivery with retry
//
// An EventSink that never calls out from publish(). Events wait in a
// queue until flush() hands them to the transport. A failed delivery is
// retried with exponential backoff until max_attempts, and anything older
// than max_age is dropped unsent. The queue survives restarts via save/load.

#include "event_bus.hpp"
#include <algorithm>
#include <cstdio>
#include <deque>
#include <fstream>
#include <functional>
#include <mutex>
#include <unordered_set>

namespace arbiter {

struct OutboxConfig {
    uint32_t max_attempts = 3;
    int64_t base_delay_ms = 500;        // Doubles on every failed attempt
    int64_t max_age_ms = 3600000;       // 1 hour
};

// Returns true when the event reached its destination
using OutboxTransport = std::function<bool(const StatusEvent&)>;

struct FlushResult {
    size_t delivered = 0;
    size_t retried = 0;     // Failed, rescheduled
    size_t dropped = 0;     // Failed max_attempts times
    size_t expired = 0;     // Too old to send
};

class NotificationOutbox : public EventSink {
public:
    explicit NotificationOutbox(OutboxConfig config = {})
        : config_(config) {}

    void set_transport(OutboxTransport transport) {
        std::lock_guard<std::mutex> lock(mutex_);
        transport_ = std::move(transport);
    }

    // Queue only. Duplicate event ids are ignored.
    void publish(const StatusEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        enqueue_locked(event, 0, 0);
    }

    FlushResult flush(Timestamp current) {
        std::lock_guard<std::mutex> lock(mutex_);
        FlushResult result;

        std::deque<Pending> keep;
        for (auto& p : queue_) {
            if (current - p.event.timestamp > config_.max_age_ms) {
                result.expired++;
                ids_.erase(p.event.id);
                continue;
            }
            if (!transport_ || p.next_attempt_at > current) {
                keep.push_back(std::move(p));
                continue;
            }

            bool ok = false;
            try {
                ok = transport_(p.event);
            } catch (const std::exception& e) {
                std::cerr << "[NotificationOutbox] Transport failed: " << e.what() << "\n";
            }

            if (ok) {
                result.delivered++;
                ids_.erase(p.event.id);
                continue;
            }

            p.attempts++;
            if (p.attempts >= config_.max_attempts) {
                std::cerr << "[NotificationOutbox] Dropping " << to_string(p.event.type)
                          << " for " << p.event.binding_id.to_string()
                          << " after " << p.attempts << " attempts\n";
                result.dropped++;
                ids_.erase(p.event.id);
                continue;
            }

            p.next_attempt_at = current + backoff(p.attempts);
            result.retried++;
            keep.push_back(std::move(p));
        }
        queue_.swap(keep);

        stats_.delivered += result.delivered;
        stats_.dropped += result.dropped;
        stats_.expired += result.expired;
        return result;
    }

    // Delay before the next try after `attempts` failures
    int64_t backoff(uint32_t attempts) const {
        if (attempts == 0) return 0;
        // Capped so large attempt counts cannot overflow the shift
        uint32_t shift = std::min<uint32_t>(attempts - 1, 30);
        return config_.base_delay_ms * (int64_t(1) << shift);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    struct Stats {
        size_t delivered = 0;
        size_t dropped = 0;
        size_t expired = 0;
    };

    Stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Persistence
    // ═══════════════════════════════════════════════════════════════════════

    bool save(const std::string& path) const {
        json items = json::array();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& p : queue_) {
                items.push_back({
                    {"event", p.event.to_json()},
                    {"attempts", p.attempts},
                    {"next_attempt_at", p.next_attempt_at}
                });
            }
        }

        std::string tmp_path = path + ".tmp";
        {
            std::ofstream out(tmp_path);
            if (!out) return false;
            out << json{{"version", 1}, {"events", items}}.dump();
            if (!out) return false;
        }
        return std::rename(tmp_path.c_str(), path.c_str()) == 0;
    }

    // Merge a saved queue into this one. Missing file is not an error.
    // Returns the number of events added.
    size_t load(const std::string& path) {
        std::ifstream in(path);
        if (!in) return 0;

        json doc = json::parse(in, nullptr, false);
        if (doc.is_discarded() || !doc.contains("events") || !doc["events"].is_array()) {
            std::cerr << "[NotificationOutbox] Ignoring unreadable queue file " << path << "\n";
            return 0;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        size_t added = 0;
        for (const auto& item : doc["events"]) {
            if (!item.is_object()) continue;
            try {
                auto event = StatusEvent::from_json(item.value("event", json::object()));
                if (!event) continue;
                if (enqueue_locked(*event, item.value("attempts", 0u),
                                   item.value("next_attempt_at", Timestamp(0)))) {
                    added++;
                }
            } catch (const json::exception& e) {
                std::cerr << "[NotificationOutbox] Skipping bad entry in " << path
                          << ": " << e.what() << "\n";
            }
        }
        return added;
    }

private:
    struct Pending {
        StatusEvent event;
        uint32_t attempts = 0;
        Timestamp next_attempt_at = 0;
    };

    bool enqueue_locked(const StatusEvent& event, uint32_t attempts, Timestamp next_attempt_at) {
        if (!ids_.insert(event.id).second) return false;
        queue_.push_back(Pending{event, attempts, next_attempt_at});
        return true;
    }

    OutboxConfig config_;
    mutable std::mutex mutex_;
    OutboxTransport transport_;
    std::deque<Pending> queue_;
    std::unordered_set<Uuid, UuidHash> ids_;
    Stats stats_;
};

} // namespace arbiter
