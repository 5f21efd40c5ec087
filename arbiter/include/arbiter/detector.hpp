#pragma once
// Inconsistency Detector: canonical status vs. what the projections show
//
// Read-only. Compares every binding of a scope against the existence
// signals reported by each projection and classifies the divergence.
// Findings are data; only infrastructure failures throw.
//
// Classification, first match wins:
//   orphaned         element and mark both absent          0.95  soft-delete
//   missing-element  element absent                        0.90  soft-delete
//   status-mismatch  visible, element flagged deleted      0.95  -> hidden
//   status-mismatch  hidden, element not deleted           0.85  -> visible
//   missing-mark     visible, element alive, mark absent   0.60  -> pending
//   ghost-binding    deleted, element and mark alive       0.70  -> visible
//
// Pending bindings are awaiting arbitration and are never classified.
// A deleted binding is never reported as missing. The two mark-side rows
// are dropped when the binding's last transition was a user or arbitration
// decision.

#include "status_store.hpp"
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbiter {

// What one projection says about one of its entities
struct EntitySignal {
    bool exists = true;
    bool deleted = false;

    bool alive() const { return exists && !deleted; }
};

// Read-only view of both projections.
// nullopt = this projection has no observations for the scope.
class ExistenceSource {
public:
    virtual ~ExistenceSource() = default;
    virtual std::optional<EntitySignal> element(const std::string& scope_id,
                                                const std::string& element_id) = 0;
    virtual std::optional<EntitySignal> mark(const std::string& scope_id,
                                             const std::string& block_id) = 0;
};

// In-memory signal table fed by projection reports
class SignalTable : public ExistenceSource {
public:
    // Replace the scope's whole element snapshot. Ids not listed are absent.
    void report_elements(const std::string& scope_id,
                         const std::unordered_map<std::string, EntitySignal>& elements) {
        std::unique_lock lock(mutex_);
        elements_[scope_id] = elements;
    }

    void report_marks(const std::string& scope_id,
                      const std::unordered_map<std::string, EntitySignal>& marks) {
        std::unique_lock lock(mutex_);
        marks_[scope_id] = marks;
    }

    // Update a single entity within the scope's snapshot
    void report_element(const std::string& scope_id, const std::string& element_id,
                        EntitySignal signal) {
        std::unique_lock lock(mutex_);
        elements_[scope_id][element_id] = signal;
    }

    void report_mark(const std::string& scope_id, const std::string& block_id,
                     EntitySignal signal) {
        std::unique_lock lock(mutex_);
        marks_[scope_id][block_id] = signal;
    }

    // Forget everything reported for a scope
    void forget(const std::string& scope_id) {
        std::unique_lock lock(mutex_);
        elements_.erase(scope_id);
        marks_.erase(scope_id);
    }

    std::optional<EntitySignal> element(const std::string& scope_id,
                                        const std::string& element_id) override {
        std::shared_lock lock(mutex_);
        return lookup(elements_, scope_id, element_id);
    }

    std::optional<EntitySignal> mark(const std::string& scope_id,
                                     const std::string& block_id) override {
        std::shared_lock lock(mutex_);
        return lookup(marks_, scope_id, block_id);
    }

private:
    using Snapshot = std::unordered_map<std::string, EntitySignal>;

    static std::optional<EntitySignal> lookup(
            const std::unordered_map<std::string, Snapshot>& table,
            const std::string& scope_id, const std::string& id) {
        auto scope = table.find(scope_id);
        if (scope == table.end()) return std::nullopt;
        auto it = scope->second.find(id);
        if (it == scope->second.end()) return EntitySignal{false, false};
        return it->second;
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Snapshot> elements_;
    std::unordered_map<std::string, Snapshot> marks_;
};

class InconsistencyDetector {
public:
    InconsistencyDetector(StatusStore& store, ExistenceSource& source)
        : store_(store), source_(source) {}

    std::vector<Inconsistency> detect(const std::string& scope_id) {
        std::vector<Inconsistency> findings;
        Timestamp at = now();

        for (const auto& b : store_.load_scope(scope_id)) {
            if (b.element_id.empty()) continue;
            if (b.status == BindingStatus::Pending) continue;

            auto element = source_.element(scope_id, b.element_id);
            std::optional<EntitySignal> mark;
            if (!b.block_id.empty()) {
                mark = source_.mark(scope_id, b.block_id);
            }

            auto finding = classify(b, element, mark, at);
            if (!finding) continue;
            if (mark_side(finding->type) && settled_by_decision(b.id)) continue;
            findings.push_back(std::move(*finding));
        }
        return findings;
    }

    // At most one finding per binding
    static std::optional<Inconsistency> classify(const Binding& b,
                                                 const std::optional<EntitySignal>& element,
                                                 const std::optional<EntitySignal>& mark,
                                                 Timestamp at) {
        if (b.status == BindingStatus::Pending) return std::nullopt;

        bool element_absent = element && !element->exists;
        bool mark_absent = mark && !mark->exists;
        bool element_alive = element && element->alive();
        bool tombstoned = b.status == BindingStatus::Deleted;

        auto make = [&](InconsistencyType type, float confidence,
                        BindingStatus target, const char* label) {
            Inconsistency f;
            f.id = Uuid::generate();
            f.binding_id = b.id;
            f.scope_id = b.scope_id;
            f.type = type;
            f.detected_at = at;
            f.binding_status = b.status;
            if (element) f.element_deleted = element->deleted;
            if (mark) f.mark_exists = mark->exists;
            f.suggested = SuggestedResolution{target, label};
            f.resolution_confidence = confidence;
            f.snapshot = {
                {"binding", b.to_json()},
                {"element", signal_json(element)},
                {"mark", signal_json(mark)}
            };
            return f;
        };

        if (!tombstoned && element_absent && mark_absent) {
            return make(InconsistencyType::Orphaned, 0.95f,
                        BindingStatus::Deleted, "soft-delete binding");
        }
        if (!tombstoned && element_absent) {
            return make(InconsistencyType::MissingElement, 0.90f,
                        BindingStatus::Deleted, "soft-delete binding");
        }
        if (b.status == BindingStatus::Visible && element && element->exists && element->deleted) {
            return make(InconsistencyType::StatusMismatch, 0.95f,
                        BindingStatus::Hidden, "set status=hidden");
        }
        if (b.status == BindingStatus::Hidden && element_alive) {
            return make(InconsistencyType::StatusMismatch, 0.85f,
                        BindingStatus::Visible, "set status=visible");
        }
        if (b.status == BindingStatus::Visible && element_alive && mark_absent) {
            return make(InconsistencyType::MissingMark, 0.60f,
                        BindingStatus::Pending, "demote to pending");
        }
        if (tombstoned && element_alive && mark && mark->alive()) {
            return make(InconsistencyType::GhostBinding, 0.70f,
                        BindingStatus::Visible, "restore binding");
        }
        return std::nullopt;
    }

private:
    static bool mark_side(InconsistencyType type) {
        return type == InconsistencyType::MissingMark ||
               type == InconsistencyType::GhostBinding;
    }

    // A user or arbitration decision outranks the mark projection: only
    // element-side evidence may reopen it.
    bool settled_by_decision(const BindingId& id) {
        auto log = store_.history(id);
        if (log.empty()) return false;
        switch (log.back().cause) {
            case TransitionCause::UserShow:
            case TransitionCause::UserDelete:
            case TransitionCause::UserRestore:
            case TransitionCause::ArbitrationApprove:
            case TransitionCause::ArbitrationReject:
                return true;
            default:
                return false;
        }
    }

    static json signal_json(const std::optional<EntitySignal>& s) {
        if (!s) return nullptr;
        return {{"exists", s->exists}, {"deleted", s->deleted}};
    }

    StatusStore& store_;
    ExistenceSource& source_;
};

} // namespace arbiter
