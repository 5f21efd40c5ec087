#pragma once
// Core types: the records of existence
//
// A binding links one element (canvas side) to one mark (document side).
// Its status is the only truth about whether the link exists.
// Projections follow it; they never own it.

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace arbiter {

using json = nlohmann::json;

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// UUID - simple 128-bit identifier
struct Uuid {
    uint64_t high = 0;
    uint64_t low = 0;

    static Uuid generate() {
        static thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<uint64_t> dis;
        Uuid id{dis(gen), dis(gen)};
        // Version 4, variant 1
        id.high = (id.high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        id.low = (id.low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
        return id;
    }

    bool operator==(const Uuid& other) const {
        return high == other.high && low == other.low;
    }

    bool operator!=(const Uuid& other) const {
        return !(*this == other);
    }

    bool operator<(const Uuid& other) const {
        return high < other.high || (high == other.high && low < other.low);
    }

    std::string to_string() const {
        char buf[37];
        snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                 (uint32_t)(high >> 32),
                 (uint16_t)(high >> 16),
                 (uint16_t)high,
                 (uint16_t)(low >> 48),
                 (unsigned long long)(low & 0xFFFFFFFFFFFFULL));
        return buf;
    }

    static Uuid from_string(const std::string& s) {
        Uuid id;
        if (s.length() < 36) return id;

        // Parse UUID: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
        uint32_t a;
        uint16_t b, c, d;
        unsigned long long e;

        if (sscanf(s.c_str(), "%8x-%4hx-%4hx-%4hx-%12llx", &a, &b, &c, &d, &e) == 5) {
            id.high = ((uint64_t)a << 32) | ((uint64_t)b << 16) | c;
            id.low = ((uint64_t)d << 48) | (uint64_t)e;
        }
        return id;
    }

    bool valid() const { return high != 0 || low != 0; }
};

// Hash function for Uuid (for use in unordered containers)
struct UuidHash {
    size_t operator()(const Uuid& id) const {
        return std::hash<uint64_t>{}(id.high) ^ (std::hash<uint64_t>{}(id.low) << 1);
    }
};

using BindingId = Uuid;
using BindingIdHash = UuidHash;

// ═══════════════════════════════════════════════════════════════════════════
// Enumerations
// ═══════════════════════════════════════════════════════════════════════════

enum class BindingStatus : uint8_t {
    Visible = 0,
    Hidden = 1,
    Deleted = 2,     // Tombstone, never a row removal
    Pending = 3,     // Awaiting human arbitration
};

constexpr size_t BINDING_STATUS_COUNT = 4;

enum class ActorType : uint8_t {
    User = 0,
    System = 1,
    Ai = 2,
};

// Why a transition happened. Recorded for audit.
enum class TransitionCause : uint8_t {
    UserHide = 0,
    UserShow = 1,
    UserDelete = 2,
    UserRestore = 3,
    SystemReconcile = 4,
    ArbitrationApprove = 5,
    ArbitrationReject = 6,
};

enum class Provenance : uint8_t {
    User = 0,
    Ai = 1,
    System = 2,
};

enum class InconsistencyType : uint8_t {
    Orphaned = 0,        // Neither projection has the linked entity
    MissingElement = 1,  // Canvas element gone
    MissingMark = 2,     // Document mark gone
    StatusMismatch = 3,  // Status disagrees with the element's deleted flag
    GhostBinding = 4,    // Tombstoned binding still rendered by both projections
};

inline const char* to_string(BindingStatus s) {
    switch (s) {
        case BindingStatus::Visible: return "visible";
        case BindingStatus::Hidden: return "hidden";
        case BindingStatus::Deleted: return "deleted";
        case BindingStatus::Pending: return "pending";
    }
    return "unknown";
}

inline const char* to_string(ActorType t) {
    switch (t) {
        case ActorType::User: return "user";
        case ActorType::System: return "system";
        case ActorType::Ai: return "ai";
    }
    return "unknown";
}

inline const char* to_string(TransitionCause c) {
    switch (c) {
        case TransitionCause::UserHide: return "user_hide";
        case TransitionCause::UserShow: return "user_show";
        case TransitionCause::UserDelete: return "user_delete";
        case TransitionCause::UserRestore: return "user_restore";
        case TransitionCause::SystemReconcile: return "system_reconcile";
        case TransitionCause::ArbitrationApprove: return "arbitration_approve";
        case TransitionCause::ArbitrationReject: return "arbitration_reject";
    }
    return "unknown";
}

inline const char* to_string(Provenance p) {
    switch (p) {
        case Provenance::User: return "user";
        case Provenance::Ai: return "ai";
        case Provenance::System: return "system";
    }
    return "unknown";
}

inline const char* to_string(InconsistencyType t) {
    switch (t) {
        case InconsistencyType::Orphaned: return "orphaned";
        case InconsistencyType::MissingElement: return "missing-element";
        case InconsistencyType::MissingMark: return "missing-mark";
        case InconsistencyType::StatusMismatch: return "status-mismatch";
        case InconsistencyType::GhostBinding: return "ghost-binding";
    }
    return "unknown";
}

inline std::optional<BindingStatus> parse_status(const std::string& s) {
    if (s == "visible") return BindingStatus::Visible;
    if (s == "hidden") return BindingStatus::Hidden;
    if (s == "deleted") return BindingStatus::Deleted;
    if (s == "pending") return BindingStatus::Pending;
    return std::nullopt;
}

inline std::optional<ActorType> parse_actor_type(const std::string& s) {
    if (s == "user") return ActorType::User;
    if (s == "system") return ActorType::System;
    if (s == "ai") return ActorType::Ai;
    return std::nullopt;
}

inline std::optional<TransitionCause> parse_cause(const std::string& s) {
    if (s == "user_hide") return TransitionCause::UserHide;
    if (s == "user_show") return TransitionCause::UserShow;
    if (s == "user_delete") return TransitionCause::UserDelete;
    if (s == "user_restore") return TransitionCause::UserRestore;
    if (s == "system_reconcile") return TransitionCause::SystemReconcile;
    if (s == "arbitration_approve") return TransitionCause::ArbitrationApprove;
    if (s == "arbitration_reject") return TransitionCause::ArbitrationReject;
    return std::nullopt;
}

inline std::optional<Provenance> parse_provenance(const std::string& s) {
    if (s == "user") return Provenance::User;
    if (s == "ai") return Provenance::Ai;
    if (s == "system") return Provenance::System;
    return std::nullopt;
}

inline std::optional<InconsistencyType> parse_inconsistency_type(const std::string& s) {
    if (s == "orphaned") return InconsistencyType::Orphaned;
    if (s == "missing-element") return InconsistencyType::MissingElement;
    if (s == "missing-mark") return InconsistencyType::MissingMark;
    if (s == "status-mismatch") return InconsistencyType::StatusMismatch;
    if (s == "ghost-binding") return InconsistencyType::GhostBinding;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════
// Records
// ═══════════════════════════════════════════════════════════════════════════

// Canonical link between a canvas element and a document mark
struct Binding {
    BindingId id;
    std::string scope_id;           // Container (canvas/document pair)
    std::string document_id;
    std::string element_id;         // Projection A entity
    std::string block_id;           // Projection B entity (empty = no mark side)
    BindingStatus status = BindingStatus::Visible;
    Timestamp status_updated_at = 0;
    std::string status_updated_by;
    Provenance provenance = Provenance::User;
    float provenance_confidence = 1.0f;
    uint64_t status_version = 0;    // Bumped by every status write
    Timestamp created_at = 0;
    json metadata = json::object();

    json to_json() const {
        return {
            {"id", id.to_string()},
            {"scope_id", scope_id},
            {"document_id", document_id},
            {"element_id", element_id},
            {"block_id", block_id},
            {"status", to_string(status)},
            {"status_updated_at", status_updated_at},
            {"status_updated_by", status_updated_by},
            {"provenance", to_string(provenance)},
            {"provenance_confidence", provenance_confidence},
            {"status_version", status_version},
            {"created_at", created_at}
        };
    }
};

// Entry status for a freshly linked binding
inline BindingStatus initial_status(float provenance_confidence, float pending_below) {
    return provenance_confidence < pending_below ? BindingStatus::Pending
                                                 : BindingStatus::Visible;
}

// Immutable audit row. One per applied transition.
struct StatusLogEntry {
    int64_t id = 0;
    BindingId binding_id;
    BindingStatus status = BindingStatus::Visible;
    BindingStatus previous_status = BindingStatus::Visible;
    TransitionCause cause = TransitionCause::UserHide;
    std::string reason;
    std::string actor_id;
    ActorType actor_type = ActorType::User;
    Timestamp timestamp = 0;
    json metadata = json::object();

    json to_json() const {
        return {
            {"id", id},
            {"binding_id", binding_id.to_string()},
            {"status", to_string(status)},
            {"previous_status", to_string(previous_status)},
            {"cause", to_string(cause)},
            {"reason", reason},
            {"actor_id", actor_id},
            {"actor_type", to_string(actor_type)},
            {"timestamp", timestamp},
            {"metadata", metadata}
        };
    }
};

// Derived per-binding snapshot. Never authoritative.
struct ExistenceCacheEntry {
    BindingId binding_id;
    BindingStatus status = BindingStatus::Visible;
    bool element_exists = true;
    bool element_deleted = false;
    bool mark_exists = true;
    Timestamp last_verified_at = 0;
    uint32_t cache_version = 1;     // Maintained by the store on upsert
    bool is_stale = false;

    // What the projections should be showing for a given status
    static ExistenceCacheEntry derive(const BindingId& id, BindingStatus status, Timestamp at) {
        ExistenceCacheEntry e;
        e.binding_id = id;
        e.status = status;
        e.element_exists = status != BindingStatus::Deleted;
        e.element_deleted = status == BindingStatus::Hidden || status == BindingStatus::Deleted;
        e.mark_exists = status == BindingStatus::Visible;
        e.last_verified_at = at;
        return e;
    }
};

// What the reconciler proposes: a target status and a readable label
struct SuggestedResolution {
    BindingStatus target = BindingStatus::Pending;
    std::string label;
};

// A detected divergence between canonical status and projection reality
struct Inconsistency {
    Uuid id;
    BindingId binding_id;
    std::string scope_id;
    InconsistencyType type = InconsistencyType::StatusMismatch;
    Timestamp detected_at = 0;
    std::string detected_by = "reconciliation";
    BindingStatus binding_status = BindingStatus::Visible;
    std::optional<bool> element_deleted;   // nullopt = element not observed
    std::optional<bool> mark_exists;       // nullopt = mark side not observed
    SuggestedResolution suggested;
    float resolution_confidence = 0.0f;

    // Resolution (empty until resolved)
    Timestamp resolved_at = 0;
    std::string resolved_by;
    std::string resolution_action;
    std::string resolution_notes;

    json snapshot = json::object();

    bool resolved() const { return resolved_at != 0; }

    json to_json() const {
        json j = {
            {"id", id.to_string()},
            {"binding_id", binding_id.to_string()},
            {"scope_id", scope_id},
            {"type", to_string(type)},
            {"detected_at", detected_at},
            {"detected_by", detected_by},
            {"binding_status", to_string(binding_status)},
            {"element_deleted", element_deleted ? json(*element_deleted) : json()},
            {"mark_exists", mark_exists ? json(*mark_exists) : json()},
            {"suggested_status", to_string(suggested.target)},
            {"suggested_resolution", suggested.label},
            {"resolution_confidence", resolution_confidence},
            {"snapshot", snapshot}
        };
        if (resolved()) {
            j["resolved_at"] = resolved_at;
            j["resolved_by"] = resolved_by;
            j["resolution_action"] = resolution_action;
            j["resolution_notes"] = resolution_notes;
        }
        return j;
    }
};

} // namespace arbiter
