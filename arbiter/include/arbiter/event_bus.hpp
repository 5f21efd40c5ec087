#pragma once
// Event Bus: how projections learn that existence changed
//
// Two delivery paths, both fed by one publish():
//   - Local listeners, called synchronously on the publishing thread
//   - Sinks, injected adapters that carry events out of the process
//
// Nothing is guaranteed beyond "called once, in order, per binding".
// A listener or sink that throws is logged and skipped.

#include "types.hpp"
#include <atomic>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

enum class EventType : uint8_t {
    StatusChanged = 0,  // Every applied transition
    Hidden = 1,
    Shown = 2,
    Deleted = 3,
    Pending = 4,
    Approved = 5,       // Arbitration outcomes
    Rejected = 6,
};

inline const char* to_string(EventType t) {
    switch (t) {
        case EventType::StatusChanged: return "status-changed";
        case EventType::Hidden: return "hidden";
        case EventType::Shown: return "shown";
        case EventType::Deleted: return "deleted";
        case EventType::Pending: return "pending";
        case EventType::Approved: return "approved";
        case EventType::Rejected: return "rejected";
    }
    return "unknown";
}

inline std::optional<EventType> parse_event_type(const std::string& s) {
    if (s == "status-changed") return EventType::StatusChanged;
    if (s == "hidden") return EventType::Hidden;
    if (s == "shown") return EventType::Shown;
    if (s == "deleted") return EventType::Deleted;
    if (s == "pending") return EventType::Pending;
    if (s == "approved") return EventType::Approved;
    if (s == "rejected") return EventType::Rejected;
    return std::nullopt;
}

struct StatusEvent {
    Uuid id;
    EventType type = EventType::StatusChanged;
    std::string scope_id;
    BindingId binding_id;
    std::string linked_element_id;
    BindingStatus status = BindingStatus::Visible;
    BindingStatus previous_status = BindingStatus::Visible;
    std::string actor_id;
    std::string reason;
    Timestamp timestamp = 0;

    json to_json() const {
        json j = {
            {"id", id.to_string()},
            {"type", to_string(type)},
            {"scope_id", scope_id},
            {"binding_id", binding_id.to_string()},
            {"linked_element_id", linked_element_id},
            {"status", to_string(status)},
            {"previous_status", to_string(previous_status)},
            {"actor_id", actor_id},
            {"timestamp", timestamp}
        };
        if (!reason.empty()) j["reason"] = reason;
        return j;
    }

    // nullopt if required fields are missing or malformed
    static std::optional<StatusEvent> from_json(const json& j) {
        if (!j.is_object()) return std::nullopt;

        auto type = parse_event_type(j.value("type", ""));
        auto status = parse_status(j.value("status", ""));
        auto previous = parse_status(j.value("previous_status", ""));
        if (!type || !status || !previous) return std::nullopt;

        StatusEvent e;
        e.id = Uuid::from_string(j.value("id", ""));
        e.binding_id = Uuid::from_string(j.value("binding_id", ""));
        if (!e.id.valid() || !e.binding_id.valid()) return std::nullopt;

        e.type = *type;
        e.scope_id = j.value("scope_id", "");
        e.linked_element_id = j.value("linked_element_id", "");
        e.status = *status;
        e.previous_status = *previous;
        e.actor_id = j.value("actor_id", "");
        e.reason = j.value("reason", "");
        e.timestamp = j.value("timestamp", Timestamp(0));
        return e;
    }
};

// External delivery adapter
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const StatusEvent& event) = 0;
};

using EventListener = std::function<void(const StatusEvent&)>;
using SubscriptionId = uint64_t;

class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // All events
    SubscriptionId subscribe(EventListener listener) {
        return add(std::nullopt, std::move(listener));
    }

    // Only events of one type
    SubscriptionId subscribe(EventType type, EventListener listener) {
        return add(type, std::move(listener));
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.erase(id) > 0;
    }

    void attach(std::shared_ptr<EventSink> sink) {
        if (!sink) return;
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
    }

    size_t listener_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    size_t sink_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sinks_.size();
    }

    // Deliver to listeners, then to sinks.
    // Handlers run without the bus lock held, so they may publish or subscribe.
    void publish(const StatusEvent& event) {
        std::vector<Registration> listeners;
        std::vector<std::shared_ptr<EventSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, reg] : listeners_) listeners.push_back(reg);
            sinks = sinks_;
        }

        for (const auto& reg : listeners) {
            if (reg.filter && *reg.filter != event.type) continue;
            try {
                reg.listener(event);
            } catch (const std::exception& e) {
                std::cerr << "[EventBus] Listener failed on " << to_string(event.type)
                          << ": " << e.what() << "\n";
            }
        }

        for (const auto& sink : sinks) {
            try {
                sink->publish(event);
            } catch (const std::exception& e) {
                std::cerr << "[EventBus] Sink failed on " << to_string(event.type)
                          << ": " << e.what() << "\n";
            }
        }

        published_++;
    }

    // The generic status-changed signal followed by the status-specific one
    void publish_transition(const std::string& scope_id,
                            const BindingId& binding_id,
                            const std::string& element_id,
                            BindingStatus status,
                            BindingStatus previous,
                            const std::string& actor_id,
                            const std::string& reason = "") {
        StatusEvent base;
        base.scope_id = scope_id;
        base.binding_id = binding_id;
        base.linked_element_id = element_id;
        base.status = status;
        base.previous_status = previous;
        base.actor_id = actor_id;
        base.reason = reason;
        base.timestamp = now();

        StatusEvent changed = base;
        changed.id = Uuid::generate();
        changed.type = EventType::StatusChanged;
        publish(changed);

        std::optional<EventType> specific;
        switch (status) {
            case BindingStatus::Hidden: specific = EventType::Hidden; break;
            case BindingStatus::Visible:
                if (previous != BindingStatus::Visible) specific = EventType::Shown;
                break;
            case BindingStatus::Deleted: specific = EventType::Deleted; break;
            case BindingStatus::Pending: specific = EventType::Pending; break;
        }
        if (specific) {
            StatusEvent e = base;
            e.id = Uuid::generate();
            e.type = *specific;
            publish(e);
        }
    }

    uint64_t published() const { return published_; }

private:
    struct Registration {
        std::optional<EventType> filter;
        EventListener listener;
    };

    SubscriptionId add(std::optional<EventType> filter, EventListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = next_id_++;
        listeners_[id] = Registration{filter, std::move(listener)};
        return id;
    }

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Registration> listeners_;
    std::vector<std::shared_ptr<EventSink>> sinks_;
    SubscriptionId next_id_ = 1;
    std::atomic<uint64_t> published_{0};
};

} // namespace arbiter
