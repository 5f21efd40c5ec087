#include <arbiter/sqlite_store.hpp>
#include <sqlite3.h>
#include <iostream>
#include <utility>

namespace arbiter {

namespace {

// Sequential migrations: entry i upgrades user_version i to i+1
const char* const MIGRATIONS[] = {
    // v0 -> v1: core tables
    "CREATE TABLE IF NOT EXISTS bindings ("
    "  id TEXT PRIMARY KEY,"
    "  scope_id TEXT NOT NULL,"
    "  document_id TEXT NOT NULL DEFAULT '',"
    "  element_id TEXT NOT NULL DEFAULT '',"
    "  block_id TEXT NOT NULL DEFAULT '',"
    "  current_status TEXT NOT NULL DEFAULT 'visible',"
    "  status_updated_at INTEGER NOT NULL DEFAULT 0,"
    "  status_updated_by TEXT NOT NULL DEFAULT '',"
    "  provenance TEXT NOT NULL DEFAULT 'user',"
    "  provenance_confidence REAL NOT NULL DEFAULT 1.0,"
    "  created_at INTEGER NOT NULL DEFAULT 0,"
    "  metadata TEXT NOT NULL DEFAULT '{}'"
    ");"
    "CREATE TABLE IF NOT EXISTS status_log ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  binding_id TEXT NOT NULL REFERENCES bindings(id),"
    "  status TEXT NOT NULL,"
    "  previous_status TEXT NOT NULL,"
    "  transition_type TEXT NOT NULL,"
    "  transition_reason TEXT NOT NULL DEFAULT '',"
    "  actor_id TEXT NOT NULL DEFAULT '',"
    "  actor_type TEXT NOT NULL DEFAULT 'user',"
    "  created_at INTEGER NOT NULL,"
    "  metadata TEXT NOT NULL DEFAULT '{}'"
    ");"
    "CREATE TABLE IF NOT EXISTS existence_cache ("
    "  binding_id TEXT PRIMARY KEY REFERENCES bindings(id),"
    "  status TEXT NOT NULL,"
    "  element_exists INTEGER NOT NULL DEFAULT 1,"
    "  element_deleted INTEGER NOT NULL DEFAULT 0,"
    "  mark_exists INTEGER NOT NULL DEFAULT 1,"
    "  last_verified_at INTEGER NOT NULL,"
    "  cache_version INTEGER NOT NULL DEFAULT 1,"
    "  is_stale INTEGER NOT NULL DEFAULT 0"
    ");"
    "CREATE TABLE IF NOT EXISTS inconsistencies ("
    "  id TEXT PRIMARY KEY,"
    "  binding_id TEXT NOT NULL,"
    "  scope_id TEXT NOT NULL,"
    "  type TEXT NOT NULL,"
    "  detected_at INTEGER NOT NULL,"
    "  detected_by TEXT NOT NULL,"
    "  binding_status TEXT NOT NULL,"
    "  element_deleted INTEGER,"
    "  mark_exists INTEGER,"
    "  suggested_status TEXT NOT NULL,"
    "  suggested_resolution TEXT NOT NULL,"
    "  resolution_confidence REAL NOT NULL,"
    "  resolved_at INTEGER,"
    "  resolved_by TEXT,"
    "  resolution_action TEXT,"
    "  resolution_notes TEXT,"
    "  snapshot TEXT NOT NULL DEFAULT '{}'"
    ");",

    // v1 -> v2: optimistic version token and lookup indexes
    "ALTER TABLE bindings ADD COLUMN status_version INTEGER NOT NULL DEFAULT 0;"
    "CREATE INDEX IF NOT EXISTS bindings_by_scope_idx ON bindings(scope_id);"
    "CREATE INDEX IF NOT EXISTS status_log_by_binding_idx ON status_log(binding_id, created_at);"
    "CREATE INDEX IF NOT EXISTS inconsistencies_by_binding_idx ON inconsistencies(binding_id);"
    "CREATE INDEX IF NOT EXISTS inconsistencies_by_scope_idx ON inconsistencies(scope_id, resolved_at);",
};

static_assert(sizeof(MIGRATIONS) / sizeof(MIGRATIONS[0]) == schema::CURRENT_VERSION,
              "one migration per schema version");

const char* const BINDING_COLUMNS =
    "id, scope_id, document_id, element_id, block_id, current_status, status_updated_at, "
    "status_updated_by, provenance, provenance_confidence, status_version, created_at, metadata";

const char* const INCONSISTENCY_COLUMNS =
    "id, binding_id, scope_id, type, detected_at, detected_by, binding_status, element_deleted, "
    "mark_exists, suggested_status, suggested_resolution, resolution_confidence, resolved_at, "
    "resolved_by, resolution_action, resolution_notes, snapshot";

// RAII prepared statement
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind_text(int i, const std::string& value) {
        check(sqlite3_bind_text(stmt_, i, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind_int(int i, int64_t value) {
        check(sqlite3_bind_int64(stmt_, i, value));
        return *this;
    }

    Statement& bind_real(int i, double value) {
        check(sqlite3_bind_double(stmt_, i, value));
        return *this;
    }

    Statement& bind_null(int i) {
        check(sqlite3_bind_null(stmt_, i));
        return *this;
    }

    // true = row available, false = done
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    std::string text(int col) const {
        const unsigned char* p = sqlite3_column_text(stmt_, col);
        return p ? std::string(reinterpret_cast<const char*>(p)) : std::string();
    }

    int64_t integer(int col) const { return sqlite3_column_int64(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

json parse_json_column(const std::string& text) {
    json j = json::parse(text, nullptr, false);
    return j.is_discarded() ? json::object() : j;
}

Binding read_binding(const Statement& st) {
    Binding b;
    b.id = Uuid::from_string(st.text(0));
    b.scope_id = st.text(1);
    b.document_id = st.text(2);
    b.element_id = st.text(3);
    b.block_id = st.text(4);
    b.status = parse_status(st.text(5)).value_or(BindingStatus::Pending);
    b.status_updated_at = st.integer(6);
    b.status_updated_by = st.text(7);
    b.provenance = parse_provenance(st.text(8)).value_or(Provenance::System);
    b.provenance_confidence = static_cast<float>(st.real(9));
    b.status_version = static_cast<uint64_t>(st.integer(10));
    b.created_at = st.integer(11);
    b.metadata = parse_json_column(st.text(12));
    return b;
}

Inconsistency read_inconsistency(const Statement& st) {
    Inconsistency f;
    f.id = Uuid::from_string(st.text(0));
    f.binding_id = Uuid::from_string(st.text(1));
    f.scope_id = st.text(2);
    f.type = parse_inconsistency_type(st.text(3)).value_or(InconsistencyType::StatusMismatch);
    f.detected_at = st.integer(4);
    f.detected_by = st.text(5);
    f.binding_status = parse_status(st.text(6)).value_or(BindingStatus::Pending);
    if (!st.is_null(7)) f.element_deleted = st.integer(7) != 0;
    if (!st.is_null(8)) f.mark_exists = st.integer(8) != 0;
    f.suggested.target = parse_status(st.text(9)).value_or(BindingStatus::Pending);
    f.suggested.label = st.text(10);
    f.resolution_confidence = static_cast<float>(st.real(11));
    f.resolved_at = st.is_null(12) ? 0 : st.integer(12);
    f.resolved_by = st.text(13);
    f.resolution_action = st.text(14);
    f.resolution_notes = st.text(15);
    f.snapshot = parse_json_column(st.text(16));
    return f;
}

} // namespace

SqliteStatusStore::SqliteStatusStore(std::string path)
    : path_(std::move(path)) {}

SqliteStatusStore::~SqliteStatusStore() {
    close();
}

bool SqliteStatusStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) return true;

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::cerr << "[SqliteStatusStore] Cannot open " << path_ << ": "
                  << (db_ ? sqlite3_errmsg(db_) : "out of memory") << "\n";
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, 5000);

    try {
        exec("PRAGMA foreign_keys = ON;");
        if (path_ != ":memory:") {
            exec("PRAGMA journal_mode = WAL;");
        }
    } catch (const StoreError& e) {
        std::cerr << "[SqliteStatusStore] " << e.what() << "\n";
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    if (!migrate()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

void SqliteStatusStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

int SqliteStatusStore::schema_version() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();
    Statement st(db_, "PRAGMA user_version;");
    return st.step() ? static_cast<int>(st.integer(0)) : 0;
}

void SqliteStatusStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError(message);
    }
}

void SqliteStatusStore::require_open() const {
    if (!db_) throw StoreError("status store is not open: " + path_);
}

bool SqliteStatusStore::migrate() {
    int version = 0;
    try {
        Statement st(db_, "PRAGMA user_version;");
        if (st.step()) version = static_cast<int>(st.integer(0));
    } catch (const StoreError& e) {
        std::cerr << "[SqliteStatusStore] Cannot read schema version: " << e.what() << "\n";
        return false;
    }

    if (version > schema::CURRENT_VERSION) {
        std::cerr << "[SqliteStatusStore] Database schema v" << version
                  << " is newer than supported v" << schema::CURRENT_VERSION << "\n";
        return false;
    }

    for (int v = version; v < schema::CURRENT_VERSION; ++v) {
        try {
            exec("BEGIN;");
            exec(MIGRATIONS[v]);
            std::string bump = "PRAGMA user_version = " + std::to_string(v + 1) + ";";
            exec(bump.c_str());
            exec("COMMIT;");
        } catch (const StoreError& e) {
            std::cerr << "[SqliteStatusStore] Migration v" << v << " -> v" << (v + 1)
                      << " failed: " << e.what() << "\n";
            char* err = nullptr;
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err);
            sqlite3_free(err);
            return false;
        }
        std::cerr << "[SqliteStatusStore] Migrated schema to v" << (v + 1) << "\n";
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Bindings
// ═══════════════════════════════════════════════════════════════════════════

std::vector<Binding> SqliteStatusStore::load_scope(const std::string& scope_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_, std::string("SELECT ") + BINDING_COLUMNS +
                      " FROM bindings WHERE scope_id = ? ORDER BY created_at, id;");
    st.bind_text(1, scope_id);

    std::vector<Binding> result;
    while (st.step()) {
        result.push_back(read_binding(st));
    }
    return result;
}

std::optional<Binding> SqliteStatusStore::get_binding(const BindingId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_, std::string("SELECT ") + BINDING_COLUMNS + " FROM bindings WHERE id = ?;");
    st.bind_text(1, id.to_string());
    if (!st.step()) return std::nullopt;
    return read_binding(st);
}

void SqliteStatusStore::insert_binding(const Binding& b) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "INSERT INTO bindings (id, scope_id, document_id, element_id, block_id, current_status, "
        "status_updated_at, status_updated_by, provenance, provenance_confidence, status_version, "
        "created_at, metadata) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    st.bind_text(1, b.id.to_string())
      .bind_text(2, b.scope_id)
      .bind_text(3, b.document_id)
      .bind_text(4, b.element_id)
      .bind_text(5, b.block_id)
      .bind_text(6, to_string(b.status))
      .bind_int(7, b.status_updated_at)
      .bind_text(8, b.status_updated_by)
      .bind_text(9, to_string(b.provenance))
      .bind_real(10, b.provenance_confidence)
      .bind_int(11, static_cast<int64_t>(b.status_version))
      .bind_int(12, b.created_at)
      .bind_text(13, b.metadata.dump());
    st.step();
}

bool SqliteStatusStore::update_status(const BindingId& id, BindingStatus status, Timestamp at,
                                      const std::string& actor_id, uint64_t expected_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "UPDATE bindings SET current_status = ?, status_updated_at = ?, status_updated_by = ?, "
        "status_version = status_version + 1 WHERE id = ? AND status_version = ?;");
    st.bind_text(1, to_string(status))
      .bind_int(2, at)
      .bind_text(3, actor_id)
      .bind_text(4, id.to_string())
      .bind_int(5, static_cast<int64_t>(expected_version));
    st.step();
    return sqlite3_changes(db_) == 1;
}

// ═══════════════════════════════════════════════════════════════════════════
// Audit log
// ═══════════════════════════════════════════════════════════════════════════

int64_t SqliteStatusStore::append_log(const StatusLogEntry& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "INSERT INTO status_log (binding_id, status, previous_status, transition_type, "
        "transition_reason, actor_id, actor_type, created_at, metadata) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);");
    st.bind_text(1, e.binding_id.to_string())
      .bind_text(2, to_string(e.status))
      .bind_text(3, to_string(e.previous_status))
      .bind_text(4, to_string(e.cause))
      .bind_text(5, e.reason)
      .bind_text(6, e.actor_id)
      .bind_text(7, to_string(e.actor_type))
      .bind_int(8, e.timestamp)
      .bind_text(9, e.metadata.dump());
    st.step();
    return sqlite3_last_insert_rowid(db_);
}

std::vector<StatusLogEntry> SqliteStatusStore::history(const BindingId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "SELECT id, binding_id, status, previous_status, transition_type, transition_reason, "
        "actor_id, actor_type, created_at, metadata FROM status_log "
        "WHERE binding_id = ? ORDER BY created_at, id;");
    st.bind_text(1, id.to_string());

    std::vector<StatusLogEntry> result;
    while (st.step()) {
        StatusLogEntry e;
        e.id = st.integer(0);
        e.binding_id = Uuid::from_string(st.text(1));
        e.status = parse_status(st.text(2)).value_or(BindingStatus::Pending);
        e.previous_status = parse_status(st.text(3)).value_or(BindingStatus::Pending);
        e.cause = parse_cause(st.text(4)).value_or(TransitionCause::SystemReconcile);
        e.reason = st.text(5);
        e.actor_id = st.text(6);
        e.actor_type = parse_actor_type(st.text(7)).value_or(ActorType::System);
        e.timestamp = st.integer(8);
        e.metadata = parse_json_column(st.text(9));
        result.push_back(std::move(e));
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════
// Existence cache
// ═══════════════════════════════════════════════════════════════════════════

void SqliteStatusStore::upsert_cache(const ExistenceCacheEntry& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "INSERT INTO existence_cache (binding_id, status, element_exists, element_deleted, "
        "mark_exists, last_verified_at, cache_version, is_stale) VALUES (?, ?, ?, ?, ?, ?, 1, 0) "
        "ON CONFLICT(binding_id) DO UPDATE SET status = excluded.status, "
        "element_exists = excluded.element_exists, element_deleted = excluded.element_deleted, "
        "mark_exists = excluded.mark_exists, last_verified_at = excluded.last_verified_at, "
        "cache_version = existence_cache.cache_version + 1, is_stale = 0;");
    st.bind_text(1, e.binding_id.to_string())
      .bind_text(2, to_string(e.status))
      .bind_int(3, e.element_exists ? 1 : 0)
      .bind_int(4, e.element_deleted ? 1 : 0)
      .bind_int(5, e.mark_exists ? 1 : 0)
      .bind_int(6, e.last_verified_at);
    st.step();
}

std::optional<ExistenceCacheEntry> SqliteStatusStore::get_cache(const BindingId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "SELECT binding_id, status, element_exists, element_deleted, mark_exists, "
        "last_verified_at, cache_version, is_stale FROM existence_cache WHERE binding_id = ?;");
    st.bind_text(1, id.to_string());
    if (!st.step()) return std::nullopt;

    ExistenceCacheEntry e;
    e.binding_id = Uuid::from_string(st.text(0));
    e.status = parse_status(st.text(1)).value_or(BindingStatus::Pending);
    e.element_exists = st.integer(2) != 0;
    e.element_deleted = st.integer(3) != 0;
    e.mark_exists = st.integer(4) != 0;
    e.last_verified_at = st.integer(5);
    e.cache_version = static_cast<uint32_t>(st.integer(6));
    e.is_stale = st.integer(7) != 0;
    return e;
}

size_t SqliteStatusStore::discard_cache(const std::string& scope_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "DELETE FROM existence_cache WHERE binding_id IN "
        "(SELECT id FROM bindings WHERE scope_id = ?);");
    st.bind_text(1, scope_id);
    st.step();
    return static_cast<size_t>(sqlite3_changes(db_));
}

// ═══════════════════════════════════════════════════════════════════════════
// Inconsistencies
// ═══════════════════════════════════════════════════════════════════════════

void SqliteStatusStore::insert_inconsistency(const Inconsistency& f) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_, std::string("INSERT INTO inconsistencies (") + INCONSISTENCY_COLUMNS +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    st.bind_text(1, f.id.to_string())
      .bind_text(2, f.binding_id.to_string())
      .bind_text(3, f.scope_id)
      .bind_text(4, to_string(f.type))
      .bind_int(5, f.detected_at)
      .bind_text(6, f.detected_by)
      .bind_text(7, to_string(f.binding_status));
    if (f.element_deleted) st.bind_int(8, *f.element_deleted ? 1 : 0); else st.bind_null(8);
    if (f.mark_exists) st.bind_int(9, *f.mark_exists ? 1 : 0); else st.bind_null(9);
    st.bind_text(10, to_string(f.suggested.target))
      .bind_text(11, f.suggested.label)
      .bind_real(12, f.resolution_confidence);
    if (f.resolved()) {
        st.bind_int(13, f.resolved_at)
          .bind_text(14, f.resolved_by)
          .bind_text(15, f.resolution_action)
          .bind_text(16, f.resolution_notes);
    } else {
        st.bind_null(13).bind_null(14).bind_null(15).bind_null(16);
    }
    st.bind_text(17, f.snapshot.dump());
    st.step();
}

bool SqliteStatusStore::resolve_inconsistency(const Uuid& id, Timestamp at,
                                              const std::string& resolved_by,
                                              const std::string& action,
                                              const std::string& notes) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_,
        "UPDATE inconsistencies SET resolved_at = ?, resolved_by = ?, resolution_action = ?, "
        "resolution_notes = ? WHERE id = ? AND resolved_at IS NULL;");
    st.bind_int(1, at)
      .bind_text(2, resolved_by)
      .bind_text(3, action)
      .bind_text(4, notes)
      .bind_text(5, id.to_string());
    st.step();
    return sqlite3_changes(db_) == 1;
}

std::optional<Inconsistency> SqliteStatusStore::latest_open_inconsistency(const BindingId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_, std::string("SELECT ") + INCONSISTENCY_COLUMNS +
                      " FROM inconsistencies WHERE binding_id = ? AND resolved_at IS NULL"
                      " ORDER BY detected_at DESC, rowid DESC LIMIT 1;");
    st.bind_text(1, id.to_string());
    if (!st.step()) return std::nullopt;
    return read_inconsistency(st);
}

std::vector<Inconsistency> SqliteStatusStore::inconsistencies(const BindingId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    Statement st(db_, std::string("SELECT ") + INCONSISTENCY_COLUMNS +
                      " FROM inconsistencies WHERE binding_id = ? ORDER BY detected_at, rowid;");
    st.bind_text(1, id.to_string());

    std::vector<Inconsistency> result;
    while (st.step()) {
        result.push_back(read_inconsistency(st));
    }
    return result;
}

std::vector<Inconsistency> SqliteStatusStore::scope_inconsistencies(const std::string& scope_id,
                                                                    bool open_only) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_open();

    std::string sql = std::string("SELECT ") + INCONSISTENCY_COLUMNS +
                      " FROM inconsistencies WHERE scope_id = ?";
    if (open_only) sql += " AND resolved_at IS NULL";
    sql += " ORDER BY detected_at, rowid;";

    Statement st(db_, sql);
    st.bind_text(1, scope_id);

    std::vector<Inconsistency> result;
    while (st.step()) {
        result.push_back(read_inconsistency(st));
    }
    return result;
}

} // namespace arbiter
