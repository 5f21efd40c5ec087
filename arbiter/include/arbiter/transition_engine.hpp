#pragma once
// Transition Engine: the only writer of binding status
//
// One applied transition is, in order:
//   1. compare-and-swap of status on the binding (status_version token)
//   2. one audit row
//   3. upsert of the derived cache row
//   4. index update
//   5. status-changed + status-specific event
//
// Same-status requests are successful no-ops: no row, no event.
// Store failures propagate as StoreError after whatever was written.

#include "event_bus.hpp"
#include "memory_index.hpp"
#include "status_store.hpp"
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace arbiter {

enum class TransitionOutcome : uint8_t {
    Applied = 0,
    Skipped = 1,          // Already in the requested status
    UnknownBinding = 2,   // Not indexed in this scope
    Conflict = 3,         // Another writer moved the binding first
    Forbidden = 4,        // Refused by the strict table or arbitration rules
    NotInitialized = 5,   // Scope not loaded yet
};

inline const char* to_string(TransitionOutcome o) {
    switch (o) {
        case TransitionOutcome::Applied: return "applied";
        case TransitionOutcome::Skipped: return "skipped";
        case TransitionOutcome::UnknownBinding: return "unknown_binding";
        case TransitionOutcome::Conflict: return "conflict";
        case TransitionOutcome::Forbidden: return "forbidden";
        case TransitionOutcome::NotInitialized: return "not_initialized";
    }
    return "unknown";
}

struct TransitionResult {
    TransitionOutcome outcome = TransitionOutcome::UnknownBinding;
    BindingStatus previous = BindingStatus::Visible;
    BindingStatus current = BindingStatus::Visible;
    int64_t log_id = 0;           // Audit row, when applied

    bool ok() const {
        return outcome == TransitionOutcome::Applied || outcome == TransitionOutcome::Skipped;
    }

    bool applied() const { return outcome == TransitionOutcome::Applied; }

    json to_json() const {
        return {
            {"outcome", to_string(outcome)},
            {"ok", ok()},
            {"previous_status", to_string(previous)},
            {"status", to_string(current)},
            {"log_id", log_id}
        };
    }
};

struct TransitionConfig {
    bool strict_transitions = false;
    bool verbose = false;
};

// Audit reason used when the caller gives none
inline const char* default_reason(TransitionCause cause) {
    switch (cause) {
        case TransitionCause::UserHide: return "User hid binding";
        case TransitionCause::UserShow: return "User showed binding";
        case TransitionCause::UserDelete: return "User deleted binding";
        case TransitionCause::UserRestore: return "User restored binding";
        case TransitionCause::SystemReconcile: return "Reconciliation";
        case TransitionCause::ArbitrationApprove: return "Human approved binding";
        case TransitionCause::ArbitrationReject: return "Human rejected binding";
    }
    return "";
}

class TransitionEngine {
public:
    TransitionEngine(std::string scope_id, StatusStore& store, MemoryIndex& index,
                     EventBus& bus, TransitionConfig config = {})
        : scope_id_(std::move(scope_id))
        , store_(store)
        , index_(index)
        , bus_(bus)
        , config_(config) {}

    TransitionEngine(const TransitionEngine&) = delete;
    TransitionEngine& operator=(const TransitionEngine&) = delete;

    const std::string& scope_id() const { return scope_id_; }
    const TransitionConfig& config() const { return config_; }

    // Strict table. Everything not named here is allowed.
    static bool allowed(BindingStatus from, BindingStatus to, TransitionCause cause) {
        if ((cause == TransitionCause::ArbitrationApprove ||
             cause == TransitionCause::ArbitrationReject) &&
            from != BindingStatus::Pending) {
            return false;
        }
        if (from == BindingStatus::Deleted) {
            if (to == BindingStatus::Visible) {
                return cause == TransitionCause::UserRestore ||
                       cause == TransitionCause::ArbitrationApprove;
            }
            if (to == BindingStatus::Pending) {
                return cause == TransitionCause::SystemReconcile;
            }
            return false;
        }
        return true;
    }

    TransitionResult transition(const BindingId& id, BindingStatus target,
                                TransitionCause cause,
                                const std::string& actor_id = "",
                                ActorType actor_type = ActorType::User,
                                const std::string& reason = "") {
        // Recursive: event listeners may transition again on this thread
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        TransitionResult result;

        if (!index_.ready()) {
            result.outcome = TransitionOutcome::NotInitialized;
            return result;
        }

        auto entry = index_.get(id);
        if (!entry) {
            std::cerr << "[TransitionEngine] Unknown binding " << id.to_string()
                      << " in scope " << scope_id_ << "\n";
            result.outcome = TransitionOutcome::UnknownBinding;
            return result;
        }

        result.previous = entry->status;
        result.current = entry->status;

        if (entry->status == target) {
            result.outcome = TransitionOutcome::Skipped;
            return result;
        }

        if (config_.strict_transitions && !allowed(entry->status, target, cause)) {
            std::cerr << "[TransitionEngine] Refused " << to_string(entry->status) << " -> "
                      << to_string(target) << " via " << to_string(cause)
                      << " for " << id.to_string() << "\n";
            result.outcome = TransitionOutcome::Forbidden;
            return result;
        }

        Timestamp at = now();
        if (!store_.update_status(id, target, at, actor_id, entry->status_version)) {
            return refresh_after_conflict(id, result);
        }
        uint64_t version = entry->status_version + 1;

        StatusLogEntry log;
        log.binding_id = id;
        log.status = target;
        log.previous_status = entry->status;
        log.cause = cause;
        log.reason = reason.empty() ? default_reason(cause) : reason;
        log.actor_id = actor_id;
        log.actor_type = actor_type;
        log.timestamp = at;
        log.metadata = {
            {"source", "transition-engine"},
            {"scope_id", scope_id_},
            {"status_version", version}
        };
        result.log_id = store_.append_log(log);

        store_.upsert_cache(ExistenceCacheEntry::derive(id, target, at));
        index_.set_status(id, target, version);

        if (config_.verbose) {
            std::cerr << "[TransitionEngine] " << id.to_string() << ": "
                      << to_string(entry->status) << " -> " << to_string(target)
                      << " (" << to_string(cause) << ")\n";
        }

        bus_.publish_transition(scope_id_, id, entry->element_id, target, entry->status,
                                actor_id, log.reason);

        result.outcome = TransitionOutcome::Applied;
        result.current = target;
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // User intents
    // ═══════════════════════════════════════════════════════════════════════

    TransitionResult hide(const BindingId& id, const std::string& actor_id = "") {
        return transition(id, BindingStatus::Hidden, TransitionCause::UserHide, actor_id);
    }

    TransitionResult show(const BindingId& id, const std::string& actor_id = "") {
        return transition(id, BindingStatus::Visible, TransitionCause::UserShow, actor_id);
    }

    TransitionResult soft_delete(const BindingId& id, const std::string& actor_id = "") {
        return transition(id, BindingStatus::Deleted, TransitionCause::UserDelete, actor_id);
    }

    TransitionResult restore(const BindingId& id, const std::string& actor_id = "") {
        return transition(id, BindingStatus::Visible, TransitionCause::UserRestore, actor_id);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Batches: sequential, per-item failures logged, returns success count
    // ═══════════════════════════════════════════════════════════════════════

    size_t hide_many(const std::vector<BindingId>& ids, const std::string& actor_id = "") {
        return run_batch(ids, "hide_many", [&](const BindingId& id) { return hide(id, actor_id); });
    }

    size_t show_many(const std::vector<BindingId>& ids, const std::string& actor_id = "") {
        return run_batch(ids, "show_many", [&](const BindingId& id) { return show(id, actor_id); });
    }

    size_t hide_by_element_ids(const std::vector<std::string>& element_ids,
                               const std::string& actor_id = "") {
        return run_batch(resolve_elements(element_ids), "hide_by_element_ids",
                         [&](const BindingId& id) { return hide(id, actor_id); });
    }

    size_t show_by_element_ids(const std::vector<std::string>& element_ids,
                               const std::string& actor_id = "") {
        return run_batch(resolve_elements(element_ids), "show_by_element_ids",
                         [&](const BindingId& id) { return show(id, actor_id); });
    }

private:
    TransitionResult refresh_after_conflict(const BindingId& id, TransitionResult result) {
        auto fresh = store_.get_binding(id);
        if (!fresh) {
            std::cerr << "[TransitionEngine] Binding " << id.to_string()
                      << " is indexed but missing from the store\n";
            result.outcome = TransitionOutcome::UnknownBinding;
            return result;
        }

        index_.set_status(id, fresh->status, fresh->status_version);
        std::cerr << "[TransitionEngine] Conflict on " << id.to_string()
                  << ": now " << to_string(fresh->status)
                  << " at version " << fresh->status_version << "\n";

        result.outcome = TransitionOutcome::Conflict;
        result.current = fresh->status;
        return result;
    }

    std::vector<BindingId> resolve_elements(const std::vector<std::string>& element_ids) const {
        std::vector<BindingId> ids;
        ids.reserve(element_ids.size());
        for (const auto& element_id : element_ids) {
            if (auto id = index_.by_element(element_id)) {
                ids.push_back(*id);
            } else {
                std::cerr << "[TransitionEngine] No binding for element " << element_id << "\n";
            }
        }
        return ids;
    }

    template <typename Fn>
    size_t run_batch(const std::vector<BindingId>& ids, const char* label, Fn&& fn) {
        size_t succeeded = 0;
        for (const auto& id : ids) {
            try {
                if (fn(id).ok()) succeeded++;
            } catch (const std::exception& e) {
                std::cerr << "[TransitionEngine] " << label << " failed for "
                          << id.to_string() << ": " << e.what() << "\n";
            }
        }
        return succeeded;
    }

    std::string scope_id_;
    StatusStore& store_;
    MemoryIndex& index_;
    EventBus& bus_;
    TransitionConfig config_;
    std::recursive_mutex mutex_;
};

} // namespace arbiter
