#pragma once
// Arbitration: human decisions on demoted bindings
//
// approve -> visible, reject -> deleted. Either way the binding's most
// recent open inconsistency is closed with the decision, and an
// approved/rejected event follows the usual transition events.

#include "transition_engine.hpp"
#include <algorithm>

namespace arbiter {

struct ReviewStats {
    size_t open = 0;
    size_t approved = 0;
    size_t rejected = 0;
    size_t auto_fixed = 0;
    float approval_rate = 0.0f;   // approved / (approved + rejected)

    json to_json() const {
        return {
            {"open", open},
            {"approved", approved},
            {"rejected", rejected},
            {"auto_fixed", auto_fixed},
            {"approval_rate", approval_rate}
        };
    }
};

class Arbitration {
public:
    Arbitration(StatusStore& store, MemoryIndex& index, TransitionEngine& engine, EventBus& bus)
        : store_(store), index_(index), engine_(engine), bus_(bus) {}

    TransitionResult approve(const BindingId& id, const std::string& user_id) {
        return decide(id, user_id, true, "");
    }

    TransitionResult reject(const BindingId& id, const std::string& user_id,
                            const std::string& reason) {
        return decide(id, user_id, false, reason);
    }

    // Open findings, highest confidence first, then oldest first
    std::vector<Inconsistency> pending_review(size_t limit = 0) const {
        auto open = store_.scope_inconsistencies(engine_.scope_id(), true);
        std::sort(open.begin(), open.end(), [](const auto& a, const auto& b) {
            if (a.resolution_confidence != b.resolution_confidence) {
                return a.resolution_confidence > b.resolution_confidence;
            }
            return a.detected_at < b.detected_at;
        });
        if (limit > 0 && open.size() > limit) open.resize(limit);
        return open;
    }

    ReviewStats review_stats() const {
        ReviewStats stats;
        for (const auto& f : store_.scope_inconsistencies(engine_.scope_id(), false)) {
            if (!f.resolved()) {
                stats.open++;
            } else if (f.resolution_action == "approved") {
                stats.approved++;
            } else if (f.resolution_action == "rejected") {
                stats.rejected++;
            } else if (f.resolution_action == "auto_fixed") {
                stats.auto_fixed++;
            }
        }
        size_t decided = stats.approved + stats.rejected;
        stats.approval_rate = decided > 0 ? static_cast<float>(stats.approved) / decided : 0.0f;
        return stats;
    }

private:
    TransitionResult decide(const BindingId& id, const std::string& user_id, bool approve,
                            const std::string& reason) {
        if (user_id.empty()) {
            std::cerr << "[Arbitration] Refusing decision on " << id.to_string()
                      << " without an actor\n";
            TransitionResult refused;
            refused.outcome = TransitionOutcome::Forbidden;
            if (auto current = index_.status(id)) {
                refused.previous = *current;
                refused.current = *current;
            }
            return refused;
        }

        std::string audit_reason = approve ? "Human approved binding"
                                           : "Human rejected binding: " + reason;
        auto result = engine_.transition(
            id,
            approve ? BindingStatus::Visible : BindingStatus::Deleted,
            approve ? TransitionCause::ArbitrationApprove : TransitionCause::ArbitrationReject,
            user_id, ActorType::User, audit_reason);
        if (!result.ok()) return result;

        if (auto open = store_.latest_open_inconsistency(id)) {
            store_.resolve_inconsistency(open->id, now(), user_id,
                                         approve ? "approved" : "rejected",
                                         approve ? "Binding approved by human arbitration"
                                                 : reason);
        }

        StatusEvent event;
        event.id = Uuid::generate();
        event.type = approve ? EventType::Approved : EventType::Rejected;
        event.scope_id = engine_.scope_id();
        event.binding_id = id;
        if (auto entry = index_.get(id)) event.linked_element_id = entry->element_id;
        event.status = result.current;
        event.previous_status = result.previous;
        event.actor_id = user_id;
        event.reason = reason;
        event.timestamp = now();
        bus_.publish(event);

        return result;
    }

    StatusStore& store_;
    MemoryIndex& index_;
    TransitionEngine& engine_;
    EventBus& bus_;
};

} // namespace arbiter
