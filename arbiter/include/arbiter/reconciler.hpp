#pragma once
// Reconciler: turn findings into fixes or review items
//
// Every finding is persisted. High-confidence findings are applied through
// the transition engine when auto_fix is on; everything else is demoted to
// pending for a human to arbitrate. One bad finding never stops the run.

#include "detector.hpp"
#include "transition_engine.hpp"
#include <iostream>
#include <mutex>

namespace arbiter {

struct ReconcileConfig {
    float auto_fix_threshold = 0.90f;
};

struct ReconcileReport {
    std::string scope_id;
    size_t auto_fixed = 0;
    size_t requires_human_review = 0;
    std::vector<Inconsistency> inconsistencies;
    Timestamp started_at = 0;
    Timestamp finished_at = 0;

    json to_json() const {
        json items = json::array();
        for (const auto& f : inconsistencies) items.push_back(f.to_json());
        return {
            {"scope_id", scope_id},
            {"auto_fixed", auto_fixed},
            {"requires_human_review", requires_human_review},
            {"inconsistencies", items},
            {"started_at", started_at},
            {"finished_at", finished_at}
        };
    }
};

class Reconciler {
public:
    Reconciler(StatusStore& store, InconsistencyDetector& detector,
               TransitionEngine& engine, ReconcileConfig config = {})
        : store_(store), detector_(detector), engine_(engine), config_(config) {}

    // Detection and persistence failures propagate; per-finding fixes do not
    ReconcileReport reconcile(bool auto_fix) {
        std::lock_guard<std::mutex> lock(run_mutex_);

        ReconcileReport report;
        report.scope_id = engine_.scope_id();
        report.started_at = now();
        report.inconsistencies = detector_.detect(report.scope_id);

        for (auto& f : report.inconsistencies) {
            // A divergence still open from an earlier pass keeps its row
            auto open = store_.latest_open_inconsistency(f.binding_id);
            if (open && open->type == f.type) {
                f.id = open->id;
                f.detected_at = open->detected_at;
            } else {
                store_.insert_inconsistency(f);
            }

            if (auto_fix && f.resolution_confidence >= config_.auto_fix_threshold) {
                if (apply_fix(f)) {
                    report.auto_fixed++;
                } else {
                    report.requires_human_review++;
                }
            } else {
                demote(f);
                report.requires_human_review++;
            }
        }

        report.finished_at = now();
        if (!report.inconsistencies.empty()) {
            std::cerr << "[Reconciler] " << report.scope_id << ": "
                      << report.inconsistencies.size() << " inconsistencies, "
                      << report.auto_fixed << " auto-fixed, "
                      << report.requires_human_review << " for review\n";
        }
        return report;
    }

    float auto_fix_threshold() const { return config_.auto_fix_threshold; }

private:
    bool apply_fix(Inconsistency& f) {
        try {
            auto result = engine_.transition(f.binding_id, f.suggested.target,
                                             TransitionCause::SystemReconcile, "system",
                                             ActorType::System,
                                             std::string("Auto-fix: ") + to_string(f.type));
            if (!result.ok()) {
                std::cerr << "[Reconciler] Auto-fix of " << f.binding_id.to_string()
                          << " not applied: " << to_string(result.outcome) << "\n";
                return false;
            }
        } catch (const std::exception& e) {
            std::cerr << "[Reconciler] Auto-fix of " << f.binding_id.to_string()
                      << " failed: " << e.what() << "\n";
            return false;
        }

        Timestamp at = now();
        try {
            store_.resolve_inconsistency(f.id, at, "system", "auto_fixed", f.suggested.label);
            f.resolved_at = at;
            f.resolved_by = "system";
            f.resolution_action = "auto_fixed";
            f.resolution_notes = f.suggested.label;
        } catch (const std::exception& e) {
            std::cerr << "[Reconciler] Could not close " << f.id.to_string()
                      << ": " << e.what() << "\n";
        }
        return true;
    }

    void demote(const Inconsistency& f) {
        try {
            engine_.transition(f.binding_id, BindingStatus::Pending,
                               TransitionCause::SystemReconcile, "system", ActorType::System,
                               "Low confidence, requires human review");
        } catch (const std::exception& e) {
            std::cerr << "[Reconciler] Demotion of " << f.binding_id.to_string()
                      << " failed: " << e.what() << "\n";
        }
    }

    StatusStore& store_;
    InconsistencyDetector& detector_;
    TransitionEngine& engine_;
    ReconcileConfig config_;
    std::mutex run_mutex_;
};

} // namespace arbiter
