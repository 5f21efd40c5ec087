#pragma once
// SQLite Status Store
//
// One database file holds every scope. Schema is versioned through
// PRAGMA user_version and upgraded by sequential migrations on open().
// A single connection is shared; calls are serialized by a mutex.

#include "status_store.hpp"
#include <mutex>
#include <string>

struct sqlite3;

namespace arbiter {

namespace schema {
constexpr int CURRENT_VERSION = 2;
}

class SqliteStatusStore : public StatusStore {
public:
    // ":memory:" gives a private in-memory database
    explicit SqliteStatusStore(std::string path);
    ~SqliteStatusStore() override;

    SqliteStatusStore(const SqliteStatusStore&) = delete;
    SqliteStatusStore& operator=(const SqliteStatusStore&) = delete;

    // Open and migrate. Returns false (and logs) on failure.
    bool open();
    void close();
    bool is_open() const { return db_ != nullptr; }
    int schema_version();
    const std::string& path() const { return path_; }

    std::vector<Binding> load_scope(const std::string& scope_id) override;
    std::optional<Binding> get_binding(const BindingId& id) override;
    void insert_binding(const Binding& binding) override;
    bool update_status(const BindingId& id, BindingStatus status, Timestamp at,
                       const std::string& actor_id, uint64_t expected_version) override;

    int64_t append_log(const StatusLogEntry& entry) override;
    std::vector<StatusLogEntry> history(const BindingId& id) override;

    void upsert_cache(const ExistenceCacheEntry& entry) override;
    std::optional<ExistenceCacheEntry> get_cache(const BindingId& id) override;
    size_t discard_cache(const std::string& scope_id) override;

    void insert_inconsistency(const Inconsistency& finding) override;
    bool resolve_inconsistency(const Uuid& id, Timestamp at, const std::string& resolved_by,
                               const std::string& action, const std::string& notes) override;
    std::optional<Inconsistency> latest_open_inconsistency(const BindingId& id) override;
    std::vector<Inconsistency> inconsistencies(const BindingId& id) override;
    std::vector<Inconsistency> scope_inconsistencies(const std::string& scope_id,
                                                     bool open_only) override;

private:
    bool migrate();
    void exec(const char* sql);
    void require_open() const;

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace arbiter
