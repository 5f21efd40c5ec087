#pragma once
// Memory Index: per-scope lookup tables over bindings
//
// Layout (same shape as an inverted tag index):
//   - Forward map: binding id -> entry (status, element, block, slot)
//   - Element map: element id -> binding id
//   - Block postings: block id -> RoaringBitmap of slots
//   - Status postings: status -> RoaringBitmap of slots
//   - Slot table: slot -> binding id
//
// Slots are dense and never reused while the index lives, so a posting
// list turns into binding ids with one array lookup per member.

#include "types.hpp"
#include <roaring/roaring.h>
#include <array>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbiter {

struct IndexEntry {
    BindingId id;
    std::string element_id;
    std::string block_id;
    std::string document_id;
    BindingStatus status = BindingStatus::Visible;
    uint64_t status_version = 0;
    uint32_t slot = 0;
};

struct IndexStats {
    size_t bindings = 0;
    size_t elements = 0;
    size_t blocks = 0;
    std::array<size_t, BINDING_STATUS_COUNT> by_status{};
};

class MemoryIndex {
public:
    MemoryIndex() {
        for (auto& bitmap : by_status_) bitmap = roaring_bitmap_create();
    }

    ~MemoryIndex() {
        clear_postings();
        for (auto* bitmap : by_status_) roaring_bitmap_free(bitmap);
    }

    MemoryIndex(const MemoryIndex&) = delete;
    MemoryIndex& operator=(const MemoryIndex&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    // Replace all contents with the given bindings of one scope.
    // Bindings without an element id are skipped. Returns the number indexed.
    size_t rebuild(const std::string& scope_id, const std::vector<Binding>& bindings) {
        std::unique_lock lock(mutex_);

        clear_postings();
        for (auto* bitmap : by_status_) roaring_bitmap_clear(bitmap);
        entries_.clear();
        by_element_.clear();
        slots_.clear();
        scope_id_ = scope_id;

        size_t indexed = 0;
        for (const auto& b : bindings) {
            if (b.element_id.empty()) continue;
            add_locked(b);
            ++indexed;
        }
        ready_ = true;
        return indexed;
    }

    bool ready() const {
        std::shared_lock lock(mutex_);
        return ready_;
    }

    std::string scope_id() const {
        std::shared_lock lock(mutex_);
        return scope_id_;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Mutation
    // ═══════════════════════════════════════════════════════════════════════

    // Add a binding without a rescan. Refused before rebuild(), for another
    // scope, or without an element id. Re-inserting an id replaces it.
    bool insert(const Binding& b) {
        std::unique_lock lock(mutex_);
        if (!ready_ || b.scope_id != scope_id_ || b.element_id.empty()) return false;

        auto it = entries_.find(b.id);
        if (it != entries_.end()) {
            uint32_t slot = it->second.slot;
            unlink_locked(it->second);
            IndexEntry entry = make_entry(b, slot);
            link_locked(entry);
            it->second = std::move(entry);
        } else {
            add_locked(b);
        }
        return true;
    }

    // Move a binding between status postings
    bool set_status(const BindingId& id, BindingStatus status, uint64_t status_version) {
        std::unique_lock lock(mutex_);

        auto it = entries_.find(id);
        if (it == entries_.end()) return false;

        auto& entry = it->second;
        roaring_bitmap_remove(by_status_[index_of(entry.status)], entry.slot);
        roaring_bitmap_add(by_status_[index_of(status)], entry.slot);
        entry.status = status;
        entry.status_version = status_version;
        return true;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════

    std::optional<IndexEntry> get(const BindingId& id) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<BindingStatus> status(const BindingId& id) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return std::nullopt;
        return it->second.status;
    }

    std::optional<BindingId> by_element(const std::string& element_id) const {
        std::shared_lock lock(mutex_);
        auto it = by_element_.find(element_id);
        if (it == by_element_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<BindingId> by_block(const std::string& block_id) const {
        std::shared_lock lock(mutex_);
        auto it = by_block_.find(block_id);
        if (it == by_block_.end()) return {};
        return resolve_locked(it->second);
    }

    // O(k) in the number of matches
    std::vector<BindingId> by_status(BindingStatus status) const {
        std::shared_lock lock(mutex_);
        return resolve_locked(by_status_[index_of(status)]);
    }

    IndexStats stats() const {
        std::shared_lock lock(mutex_);
        IndexStats s;
        s.bindings = entries_.size();
        s.elements = by_element_.size();
        for (const auto& [block, bitmap] : by_block_) {
            if (!roaring_bitmap_is_empty(bitmap)) ++s.blocks;
        }
        for (size_t i = 0; i < BINDING_STATUS_COUNT; ++i) {
            s.by_status[i] = roaring_bitmap_get_cardinality(by_status_[i]);
        }
        return s;
    }

private:
    static size_t index_of(BindingStatus status) {
        return static_cast<size_t>(status);
    }

    static IndexEntry make_entry(const Binding& b, uint32_t slot) {
        IndexEntry entry;
        entry.id = b.id;
        entry.element_id = b.element_id;
        entry.block_id = b.block_id;
        entry.document_id = b.document_id;
        entry.status = b.status;
        entry.status_version = b.status_version;
        entry.slot = slot;
        return entry;
    }

    void add_locked(const Binding& b) {
        auto slot = static_cast<uint32_t>(slots_.size());
        slots_.push_back(b.id);
        IndexEntry entry = make_entry(b, slot);
        link_locked(entry);
        entries_[b.id] = std::move(entry);
    }

    void link_locked(const IndexEntry& entry) {
        by_element_[entry.element_id] = entry.id;
        if (!entry.block_id.empty()) {
            auto& bitmap = by_block_[entry.block_id];
            if (!bitmap) bitmap = roaring_bitmap_create();
            roaring_bitmap_add(bitmap, entry.slot);
        }
        roaring_bitmap_add(by_status_[index_of(entry.status)], entry.slot);
    }

    void unlink_locked(const IndexEntry& entry) {
        auto el = by_element_.find(entry.element_id);
        if (el != by_element_.end() && el->second == entry.id) {
            by_element_.erase(el);
        }
        if (!entry.block_id.empty()) {
            auto bl = by_block_.find(entry.block_id);
            if (bl != by_block_.end()) roaring_bitmap_remove(bl->second, entry.slot);
        }
        roaring_bitmap_remove(by_status_[index_of(entry.status)], entry.slot);
    }

    std::vector<BindingId> resolve_locked(const roaring_bitmap_t* bitmap) const {
        uint64_t card = roaring_bitmap_get_cardinality(bitmap);
        std::vector<uint32_t> slots(card);
        roaring_bitmap_to_uint32_array(bitmap, slots.data());

        std::vector<BindingId> result;
        result.reserve(slots.size());
        for (uint32_t slot : slots) {
            if (slot < slots_.size()) result.push_back(slots_[slot]);
        }
        return result;
    }

    void clear_postings() {
        for (auto& [block, bitmap] : by_block_) {
            roaring_bitmap_free(bitmap);
        }
        by_block_.clear();
    }

    mutable std::shared_mutex mutex_;
    std::string scope_id_;
    bool ready_ = false;

    std::unordered_map<BindingId, IndexEntry, BindingIdHash> entries_;
    std::unordered_map<std::string, BindingId> by_element_;
    std::unordered_map<std::string, roaring_bitmap_t*> by_block_;
    std::array<roaring_bitmap_t*, BINDING_STATUS_COUNT> by_status_{};
    std::vector<BindingId> slots_;
};

} // namespace arbiter
