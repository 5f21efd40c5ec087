#pragma once
// Scope: the engine for one canvas/document pair
//
// Owns the scope's index and the components that work on it. Any number
// of scopes can be active at once through a ScopeRegistry; they share the
// store, the signal source and the event bus.

#include "arbitration.hpp"
#include "config.hpp"
#include "detector.hpp"
#include "memory_index.hpp"
#include "reconciler.hpp"
#include "transition_engine.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace arbiter {

// Request to link a new element/mark pair
struct NewBinding {
    std::string element_id;
    std::string block_id;
    std::string document_id;
    Provenance provenance = Provenance::User;
    float provenance_confidence = 1.0f;
    std::string actor_id;
    json metadata = json::object();
};

struct ScopeStatus {
    bool initialized = false;
    std::string scope_id;
    size_t cached_bindings = 0;
    size_t status_map_size = 0;
    size_t element_map_size = 0;
    size_t block_map_size = 0;
    std::array<size_t, BINDING_STATUS_COUNT> by_status{};

    json to_json() const {
        json counts = json::object();
        for (size_t i = 0; i < BINDING_STATUS_COUNT; ++i) {
            counts[to_string(static_cast<BindingStatus>(i))] = by_status[i];
        }
        return {
            {"initialized", initialized},
            {"scope_id", scope_id},
            {"cached_bindings", cached_bindings},
            {"status_map_size", status_map_size},
            {"element_map_size", element_map_size},
            {"block_map_size", block_map_size},
            {"by_status", counts}
        };
    }
};

class Scope {
public:
    Scope(std::string scope_id, StatusStore& store, ExistenceSource& source,
          EventBus& bus, const ArbiterConfig& config = {})
        : scope_id_(std::move(scope_id))
        , store_(store)
        , pending_below_(config.pending_below_confidence)
        , engine_(scope_id_, store, index_, bus, config.transition_config())
        , detector_(store, source)
        , reconciler_(store, detector_, engine_, config.reconcile_config())
        , arbitration_(store, index_, engine_, bus) {}

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    const std::string& id() const { return scope_id_; }

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    // Load (or reload) every binding of the scope. Returns the number indexed.
    size_t initialize() {
        size_t indexed = index_.rebuild(scope_id_, store_.load_scope(scope_id_));
        std::cerr << "[Scope] " << scope_id_ << ": indexed " << indexed << " bindings\n";
        return indexed;
    }

    bool initialized() const { return index_.ready(); }

    // Index an already persisted binding and write its cache row
    bool register_binding(const Binding& b) {
        if (!index_.insert(b)) {
            std::cerr << "[Scope] " << scope_id_ << ": not registering "
                      << b.id.to_string() << "\n";
            return false;
        }
        store_.upsert_cache(ExistenceCacheEntry::derive(b.id, b.status, now()));
        return true;
    }

    // Persist and register in one step
    std::optional<Binding> create_binding(const NewBinding& req) {
        if (!initialized() || req.element_id.empty()) return std::nullopt;

        Binding b;
        b.id = Uuid::generate();
        b.scope_id = scope_id_;
        b.document_id = req.document_id;
        b.element_id = req.element_id;
        b.block_id = req.block_id;
        b.status = initial_status(req.provenance_confidence, pending_below_);
        b.created_at = now();
        b.status_updated_at = b.created_at;
        b.status_updated_by = req.actor_id;
        b.provenance = req.provenance;
        b.provenance_confidence = req.provenance_confidence;
        b.metadata = req.metadata;

        store_.insert_binding(b);
        if (!register_binding(b)) return std::nullopt;
        return b;
    }

    // Recompute every cache row of the scope from canonical status
    size_t rebuild_cache() {
        store_.discard_cache(scope_id_);
        size_t rebuilt = 0;
        Timestamp at = now();
        for (const auto& b : store_.load_scope(scope_id_)) {
            if (b.element_id.empty()) continue;
            store_.upsert_cache(ExistenceCacheEntry::derive(b.id, b.status, at));
            rebuilt++;
        }
        return rebuilt;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Mutations
    // ═══════════════════════════════════════════════════════════════════════

    TransitionResult hide(const BindingId& id, const std::string& actor = "") {
        return engine_.hide(id, actor);
    }
    TransitionResult show(const BindingId& id, const std::string& actor = "") {
        return engine_.show(id, actor);
    }
    TransitionResult soft_delete(const BindingId& id, const std::string& actor = "") {
        return engine_.soft_delete(id, actor);
    }
    TransitionResult restore(const BindingId& id, const std::string& actor = "") {
        return engine_.restore(id, actor);
    }

    size_t hide_many(const std::vector<BindingId>& ids, const std::string& actor = "") {
        return engine_.hide_many(ids, actor);
    }
    size_t show_many(const std::vector<BindingId>& ids, const std::string& actor = "") {
        return engine_.show_many(ids, actor);
    }
    size_t hide_by_element_ids(const std::vector<std::string>& element_ids,
                               const std::string& actor = "") {
        return engine_.hide_by_element_ids(element_ids, actor);
    }
    size_t show_by_element_ids(const std::vector<std::string>& element_ids,
                               const std::string& actor = "") {
        return engine_.show_by_element_ids(element_ids, actor);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════

    std::optional<BindingStatus> get_status(const BindingId& id) const {
        return index_.status(id);
    }

    std::vector<BindingId> get_bindings_by_status(BindingStatus status) const {
        return index_.by_status(status);
    }

    std::optional<BindingId> get_binding_by_element_id(const std::string& element_id) const {
        return index_.by_element(element_id);
    }

    std::vector<BindingId> get_bindings_by_block_id(const std::string& block_id) const {
        return index_.by_block(block_id);
    }

    ScopeStatus engine_status() const {
        auto stats = index_.stats();
        ScopeStatus s;
        s.initialized = index_.ready();
        s.scope_id = scope_id_;
        s.cached_bindings = stats.bindings;
        s.status_map_size = stats.bindings;
        s.element_map_size = stats.elements;
        s.block_map_size = stats.blocks;
        s.by_status = stats.by_status;
        return s;
    }

    std::vector<StatusLogEntry> history(const BindingId& id) const {
        return store_.history(id);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Reconciliation and arbitration
    // ═══════════════════════════════════════════════════════════════════════

    ReconcileReport reconcile(bool auto_fix) {
        return reconciler_.reconcile(auto_fix);
    }

    TransitionResult approve(const BindingId& id, const std::string& user_id) {
        return arbitration_.approve(id, user_id);
    }

    TransitionResult reject(const BindingId& id, const std::string& user_id,
                            const std::string& reason) {
        return arbitration_.reject(id, user_id, reason);
    }

    std::vector<Inconsistency> pending_review(size_t limit = 0) const {
        return arbitration_.pending_review(limit);
    }

    ReviewStats review_stats() const {
        return arbitration_.review_stats();
    }

    TransitionEngine& engine() { return engine_; }

private:
    std::string scope_id_;
    StatusStore& store_;
    float pending_below_;
    MemoryIndex index_;
    TransitionEngine engine_;
    InconsistencyDetector detector_;
    Reconciler reconciler_;
    Arbitration arbitration_;
};

// Active scopes by id
class ScopeRegistry {
public:
    ScopeRegistry(StatusStore& store, ExistenceSource& source, EventBus& bus,
                  ArbiterConfig config = {})
        : store_(store), source_(source), bus_(bus), config_(std::move(config)) {}

    ScopeRegistry(const ScopeRegistry&) = delete;
    ScopeRegistry& operator=(const ScopeRegistry&) = delete;

    // Create and load the scope, or reload it if already active.
    // Store failures propagate and leave the registry unchanged.
    std::shared_ptr<Scope> activate(const std::string& scope_id) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = scopes_.find(scope_id);
        if (it != scopes_.end()) {
            it->second->initialize();
            return it->second;
        }

        auto scope = std::make_shared<Scope>(scope_id, store_, source_, bus_, config_);
        scope->initialize();
        scopes_[scope_id] = scope;
        return scope;
    }

    std::shared_ptr<Scope> find(const std::string& scope_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = scopes_.find(scope_id);
        return it != scopes_.end() ? it->second : nullptr;
    }

    bool deactivate(const std::string& scope_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return scopes_.erase(scope_id) > 0;
    }

    std::vector<std::string> active_scopes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(scopes_.size());
        for (const auto& [id, scope] : scopes_) ids.push_back(id);
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return scopes_.size();
    }

    // nullopt if the scope is not active
    std::optional<ReconcileReport> reconcile(const std::string& scope_id, bool auto_fix) {
        auto scope = find(scope_id);
        if (!scope) return std::nullopt;
        return scope->reconcile(auto_fix);
    }

    // Every active scope; a failing scope is logged and skipped
    std::vector<ReconcileReport> reconcile_all(bool auto_fix) {
        std::vector<ReconcileReport> reports;
        for (const auto& id : active_scopes()) {
            auto scope = find(id);
            if (!scope) continue;
            try {
                reports.push_back(scope->reconcile(auto_fix));
            } catch (const std::exception& e) {
                std::cerr << "[ScopeRegistry] Reconcile of " << id << " failed: "
                          << e.what() << "\n";
            }
        }
        return reports;
    }

    const ArbiterConfig& config() const { return config_; }
    StatusStore& store() { return store_; }

private:
    StatusStore& store_;
    ExistenceSource& source_;
    EventBus& bus_;
    ArbiterConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Scope>> scopes_;
};

} // namespace arbiter
