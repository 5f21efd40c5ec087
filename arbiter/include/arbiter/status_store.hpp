#pragma once
// Status Store: durable home of bindings and their history
//
// Holds four kinds of record:
// - Bindings (the canonical status, with a version token)
// - Status log (append-only audit trail)
// - Existence cache (derived, rebuildable)
// - Inconsistencies (reconciliation findings and their resolution)
//
// Every write touches one binding. There is no lock spanning several
// writes; status updates are compare-and-swap on status_version instead.

#include "types.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace arbiter {

// Infrastructure failure while talking to the store
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class StatusStore {
public:
    virtual ~StatusStore() = default;

    // Bindings
    virtual std::vector<Binding> load_scope(const std::string& scope_id) = 0;
    virtual std::optional<Binding> get_binding(const BindingId& id) = 0;
    virtual void insert_binding(const Binding& binding) = 0;

    // Write status if the stored version still equals expected_version.
    // Returns false when another writer moved the binding first.
    virtual bool update_status(const BindingId& id, BindingStatus status,
                               Timestamp at, const std::string& actor_id,
                               uint64_t expected_version) = 0;

    // Audit log
    virtual int64_t append_log(const StatusLogEntry& entry) = 0;
    virtual std::vector<StatusLogEntry> history(const BindingId& id) = 0;

    // Existence cache
    virtual void upsert_cache(const ExistenceCacheEntry& entry) = 0;
    virtual std::optional<ExistenceCacheEntry> get_cache(const BindingId& id) = 0;
    virtual size_t discard_cache(const std::string& scope_id) = 0;

    // Inconsistencies
    virtual void insert_inconsistency(const Inconsistency& finding) = 0;
    virtual bool resolve_inconsistency(const Uuid& id, Timestamp at,
                                       const std::string& resolved_by,
                                       const std::string& action,
                                       const std::string& notes) = 0;
    virtual std::optional<Inconsistency> latest_open_inconsistency(const BindingId& id) = 0;
    virtual std::vector<Inconsistency> inconsistencies(const BindingId& id) = 0;
    virtual std::vector<Inconsistency> scope_inconsistencies(const std::string& scope_id,
                                                             bool open_only) = 0;
};

} // namespace arbiter
