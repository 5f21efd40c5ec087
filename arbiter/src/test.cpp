#include <arbiter/arbiter.hpp>
#include <arbiter/socket_server.hpp>
#include <arbiter/rpc/handler.hpp>
#include <iostream>
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <memory>

using namespace arbiter;

// Store, signals and bus shared by every scope of one test
struct Fixture {
    SqliteStatusStore store{":memory:"};
    SignalTable signals;
    EventBus bus;
    std::unique_ptr<ScopeRegistry> registry;

    explicit Fixture(ArbiterConfig config = {}) {
        bool opened = store.open();
        assert(opened);
        (void)opened;
        registry = std::make_unique<ScopeRegistry>(store, signals, bus, config);
    }
};

NewBinding new_binding(const std::string& element_id, const std::string& block_id,
                       float confidence = 1.0f) {
    NewBinding req;
    req.element_id = element_id;
    req.block_id = block_id;
    req.document_id = "doc-1";
    req.provenance_confidence = confidence;
    req.actor_id = "u1";
    return req;
}

bool near(float a, float b) {
    return std::fabs(a - b) < 1e-4f;
}

// Fails update_status for one binding; everything else goes to the real store
class FlakyStore : public StatusStore {
public:
    FlakyStore(StatusStore& inner) : inner_(inner) {}

    BindingId fail_id;

    std::vector<Binding> load_scope(const std::string& scope_id) override {
        return inner_.load_scope(scope_id);
    }
    std::optional<Binding> get_binding(const BindingId& id) override {
        return inner_.get_binding(id);
    }
    void insert_binding(const Binding& binding) override {
        inner_.insert_binding(binding);
    }
    bool update_status(const BindingId& id, BindingStatus status, Timestamp at,
                       const std::string& actor_id, uint64_t expected_version) override {
        if (id == fail_id) throw StoreError("disk I/O error");
        return inner_.update_status(id, status, at, actor_id, expected_version);
    }
    int64_t append_log(const StatusLogEntry& entry) override {
        return inner_.append_log(entry);
    }
    std::vector<StatusLogEntry> history(const BindingId& id) override {
        return inner_.history(id);
    }
    void upsert_cache(const ExistenceCacheEntry& entry) override {
        inner_.upsert_cache(entry);
    }
    std::optional<ExistenceCacheEntry> get_cache(const BindingId& id) override {
        return inner_.get_cache(id);
    }
    size_t discard_cache(const std::string& scope_id) override {
        return inner_.discard_cache(scope_id);
    }
    void insert_inconsistency(const Inconsistency& finding) override {
        inner_.insert_inconsistency(finding);
    }
    bool resolve_inconsistency(const Uuid& id, Timestamp at, const std::string& resolved_by,
                               const std::string& action, const std::string& notes) override {
        return inner_.resolve_inconsistency(id, at, resolved_by, action, notes);
    }
    std::optional<Inconsistency> latest_open_inconsistency(const BindingId& id) override {
        return inner_.latest_open_inconsistency(id);
    }
    std::vector<Inconsistency> inconsistencies(const BindingId& id) override {
        return inner_.inconsistencies(id);
    }
    std::vector<Inconsistency> scope_inconsistencies(const std::string& scope_id,
                                                     bool open_only) override {
        return inner_.scope_inconsistencies(scope_id, open_only);
    }

private:
    StatusStore& inner_;
};

void test_types() {
    std::cout << "Testing types..." << std::endl;

    assert(parse_status("hidden") == BindingStatus::Hidden);
    assert(parse_status("pending") == BindingStatus::Pending);
    assert(!parse_status("gone"));
    assert(parse_cause("arbitration_reject") == TransitionCause::ArbitrationReject);
    assert(std::string(to_string(TransitionCause::SystemReconcile)) == "system_reconcile");
    assert(std::string(to_string(InconsistencyType::GhostBinding)) == "ghost-binding");
    assert(parse_inconsistency_type("missing-mark") == InconsistencyType::MissingMark);

    Uuid id = Uuid::generate();
    assert(id.valid());
    assert(Uuid::from_string(id.to_string()) == id);
    assert(!Uuid::from_string("not-a-uuid").valid());

    assert(initial_status(0.3f, 0.5f) == BindingStatus::Pending);
    assert(initial_status(0.5f, 0.5f) == BindingStatus::Visible);

    auto hidden = ExistenceCacheEntry::derive(id, BindingStatus::Hidden, 1);
    assert(hidden.element_exists && hidden.element_deleted && !hidden.mark_exists);
    auto deleted = ExistenceCacheEntry::derive(id, BindingStatus::Deleted, 1);
    assert(!deleted.element_exists && !deleted.mark_exists);

    std::cout << "  PASS" << std::endl;
}

void test_memory_index() {
    std::cout << "Testing MemoryIndex..." << std::endl;

    auto make = [](const std::string& element, const std::string& block) {
        Binding b;
        b.id = Uuid::generate();
        b.scope_id = "s1";
        b.element_id = element;
        b.block_id = block;
        return b;
    };

    MemoryIndex index;
    Binding early = make("E0", "B0");
    assert(!index.insert(early));

    Binding b1 = make("E1", "B1");
    Binding b2 = make("E2", "B1");
    Binding unlinked = make("", "B2");
    assert(index.rebuild("s1", {b1, b2, unlinked}) == 2);
    assert(index.ready());

    assert(index.by_element("E1") == b1.id);
    assert(!index.by_element("E9"));
    assert(index.by_block("B1").size() == 2);
    assert(index.by_status(BindingStatus::Visible).size() == 2);

    assert(index.set_status(b1.id, BindingStatus::Hidden, 1));
    assert(index.status(b1.id) == BindingStatus::Hidden);
    assert(index.by_status(BindingStatus::Visible).size() == 1);
    assert(index.get(b1.id)->status_version == 1);

    Binding other = make("E3", "B3");
    other.scope_id = "s2";
    assert(!index.insert(other));

    auto stats = index.stats();
    assert(stats.bindings == 2);
    assert(stats.elements == 2);
    assert(stats.blocks == 1);
    assert(stats.by_status[static_cast<size_t>(BindingStatus::Hidden)] == 1);

    std::cout << "  PASS" << std::endl;
}

void test_event_bus() {
    std::cout << "Testing EventBus..." << std::endl;

    EventBus bus;
    int changed = 0, shown = 0, all = 0;
    bus.subscribe(EventType::StatusChanged, [&](const StatusEvent&) { changed++; });
    bus.subscribe(EventType::Shown, [&](const StatusEvent&) { shown++; });
    auto sub = bus.subscribe([&](const StatusEvent&) { all++; });
    bus.subscribe([](const StatusEvent&) { throw std::runtime_error("listener broke"); });

    BindingId id = Uuid::generate();
    bus.publish_transition("s1", id, "E1", BindingStatus::Hidden, BindingStatus::Visible, "u1");
    assert(changed == 1 && all == 2 && shown == 0);

    bus.publish_transition("s1", id, "E1", BindingStatus::Visible, BindingStatus::Pending, "u1");
    assert(changed == 2 && shown == 1 && all == 4);

    assert(bus.listener_count() == 4);
    assert(bus.unsubscribe(sub));
    assert(!bus.unsubscribe(sub));
    assert(bus.listener_count() == 3);
    assert(bus.sink_count() == 0);
    assert(bus.published() == 4);

    StatusEvent e;
    e.id = Uuid::generate();
    e.type = EventType::Rejected;
    e.binding_id = id;
    e.status = BindingStatus::Deleted;
    e.previous_status = BindingStatus::Pending;
    e.reason = "spam";
    auto parsed = StatusEvent::from_json(e.to_json());
    assert(parsed && parsed->type == EventType::Rejected && parsed->reason == "spam");
    assert(!StatusEvent::from_json(json{{"type", "exploded"}}));

    std::cout << "  PASS" << std::endl;
}

void test_store_schema() {
    std::cout << "Testing SqliteStatusStore schema..." << std::endl;

    SqliteStatusStore closed(":memory:");
    bool threw = false;
    try {
        closed.load_scope("s1");
    } catch (const StoreError&) {
        threw = true;
    }
    assert(threw);

    SqliteStatusStore store(":memory:");
    assert(store.open());
    assert(store.schema_version() == schema::CURRENT_VERSION);

    Binding b;
    b.id = Uuid::generate();
    b.scope_id = "s1";
    b.element_id = "E1";
    b.metadata = {{"color", "yellow"}};
    store.insert_binding(b);

    auto loaded = store.get_binding(b.id);
    assert(loaded && loaded->element_id == "E1");
    assert(loaded->metadata["color"] == "yellow");
    assert(loaded->status_version == 0);

    // Version token must match
    assert(!store.update_status(b.id, BindingStatus::Hidden, now(), "u1", 7));
    assert(store.update_status(b.id, BindingStatus::Hidden, now(), "u1", 0));
    assert(store.get_binding(b.id)->status_version == 1);

    store.upsert_cache(ExistenceCacheEntry::derive(b.id, BindingStatus::Hidden, now()));
    store.upsert_cache(ExistenceCacheEntry::derive(b.id, BindingStatus::Hidden, now()));
    assert(store.get_cache(b.id)->cache_version == 2);
    assert(store.discard_cache("s1") == 1);
    assert(!store.get_cache(b.id));

    store.close();
    assert(!store.is_open());

    std::cout << "  PASS" << std::endl;
}

void test_hide_is_idempotent() {
    std::cout << "Testing hide idempotency..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1"));
    assert(b && b->status == BindingStatus::Visible);

    int changed = 0;
    f.bus.subscribe(EventType::StatusChanged, [&](const StatusEvent&) { changed++; });

    auto first = scope->hide(b->id, "u1");
    auto second = scope->hide(b->id, "u1");
    assert(first.outcome == TransitionOutcome::Applied);
    assert(second.outcome == TransitionOutcome::Skipped);
    assert(second.ok());

    assert(scope->history(b->id).size() == 1);
    assert(changed == 1);

    auto cache = f.store.get_cache(b->id);
    assert(cache && cache->status == BindingStatus::Hidden);
    assert(cache->element_deleted && !cache->mark_exists);

    std::cout << "  PASS" << std::endl;
}

void test_round_trip() {
    std::cout << "Testing hide/show/delete/restore..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1"));
    assert(b);

    assert(scope->hide(b->id, "u1").applied());
    assert(scope->show(b->id, "u1").applied());
    assert(scope->soft_delete(b->id, "u1").applied());
    assert(scope->restore(b->id, "u1").applied());

    auto log = scope->history(b->id);
    assert(log.size() == 4);
    assert(log[0].cause == TransitionCause::UserHide);
    assert(log[0].reason == "User hid binding");
    assert(log[0].previous_status == BindingStatus::Visible);
    assert(log[2].status == BindingStatus::Deleted);
    assert(log[3].cause == TransitionCause::UserRestore);
    assert(log[3].metadata["source"] == "transition-engine");

    auto stored = f.store.get_binding(b->id);
    assert(stored->status == BindingStatus::Visible);
    assert(stored->status_version == 4);
    assert(scope->get_status(b->id) == BindingStatus::Visible);

    std::cout << "  PASS" << std::endl;
}

void test_unknown_and_uninitialized() {
    std::cout << "Testing unknown bindings and uninitialized scopes..." << std::endl;

    Fixture f;
    Scope cold("cold", f.store, f.signals, f.bus);
    assert(!cold.initialized());
    assert(cold.hide(Uuid::generate()).outcome == TransitionOutcome::NotInitialized);
    assert(!cold.create_binding(new_binding("E1", "B1")));

    auto scope = f.registry->activate("s1");
    assert(scope->hide(Uuid::generate()).outcome == TransitionOutcome::UnknownBinding);
    assert(!scope->create_binding(new_binding("", "B1")));

    std::cout << "  PASS" << std::endl;
}

void test_partial_batch() {
    std::cout << "Testing partial batch..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1"));
    assert(b);

    assert(scope->hide_many({b->id, Uuid::generate()}, "u1") == 1);
    assert(scope->get_status(b->id) == BindingStatus::Hidden);

    // Already hidden counts as success
    assert(scope->hide_many({b->id}, "u1") == 1);
    assert(scope->show_many({b->id}, "u1") == 1);

    std::cout << "  PASS" << std::endl;
}

void test_hide_by_element() {
    std::cout << "Testing hide by element id..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1"));
    auto other = scope->create_binding(new_binding("E2", "B1"));
    assert(b && other);

    assert(scope->hide_by_element_ids({"E1"}, "u1") == 1);
    assert(scope->get_status(b->id) == BindingStatus::Hidden);
    assert(scope->get_status(other->id) == BindingStatus::Visible);

    auto log = scope->history(b->id);
    assert(log.size() == 1);
    assert(log[0].cause == TransitionCause::UserHide);
    assert(log[0].actor_id == "u1");

    assert(scope->hide_by_element_ids({"missing"}, "u1") == 0);
    assert(scope->show_by_element_ids({"E1", "E2"}, "u1") == 2);

    assert(scope->get_binding_by_element_id("E2") == other->id);
    assert(scope->get_bindings_by_block_id("B1").size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_classification() {
    std::cout << "Testing classification..." << std::endl;

    Binding b;
    b.id = Uuid::generate();
    b.scope_id = "s1";
    b.element_id = "E1";
    b.block_id = "B1";

    EntitySignal absent{false, false};
    EntitySignal alive{true, false};
    EntitySignal deleted{true, true};

    auto f = InconsistencyDetector::classify(b, absent, absent, 1);
    assert(f && f->type == InconsistencyType::Orphaned && near(f->resolution_confidence, 0.95f));
    assert(f->suggested.target == BindingStatus::Deleted);

    f = InconsistencyDetector::classify(b, absent, alive, 1);
    assert(f && f->type == InconsistencyType::MissingElement && near(f->resolution_confidence, 0.90f));

    f = InconsistencyDetector::classify(b, alive, absent, 1);
    assert(f && f->type == InconsistencyType::MissingMark && near(f->resolution_confidence, 0.60f));
    assert(f->suggested.target == BindingStatus::Pending);

    assert(!InconsistencyDetector::classify(b, alive, alive, 1));
    assert(!InconsistencyDetector::classify(b, std::nullopt, std::nullopt, 1));

    b.status = BindingStatus::Deleted;
    assert(!InconsistencyDetector::classify(b, absent, absent, 1));
    f = InconsistencyDetector::classify(b, alive, alive, 1);
    assert(f && f->type == InconsistencyType::GhostBinding && near(f->resolution_confidence, 0.70f));
    assert(f->suggested.label == "restore binding");

    b.status = BindingStatus::Pending;
    assert(!InconsistencyDetector::classify(b, absent, absent, 1));

    std::cout << "  PASS" << std::endl;
}

void test_detect_status_mismatch() {
    std::cout << "Testing detection of a deleted element..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1"));
    assert(b);

    f.signals.report_elements("s1", {{"E1", EntitySignal{true, true}}});

    InconsistencyDetector detector(f.store, f.signals);
    auto findings = detector.detect("s1");
    assert(findings.size() == 1);
    assert(findings[0].type == InconsistencyType::StatusMismatch);
    assert(near(findings[0].resolution_confidence, 0.95f));
    assert(findings[0].suggested.label == "set status=hidden");
    assert(findings[0].element_deleted == true);
    assert(!findings[0].mark_exists);
    assert(findings[0].detected_by == "reconciliation");

    // Detection never writes
    assert(scope->get_status(b->id) == BindingStatus::Visible);
    assert(f.store.scope_inconsistencies("s1", false).empty());

    // Without a report the element side is not consulted at all
    f.signals.forget("s1");
    assert(!f.signals.element("s1", "E1"));
    assert(detector.detect("s1").empty());

    std::cout << "  PASS" << std::endl;
}

void test_auto_fix() {
    std::cout << "Testing auto-fix..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1"));
    assert(b);
    f.signals.report_elements("s1", {{"E1", EntitySignal{true, true}}});

    auto report = scope->reconcile(true);
    assert(report.inconsistencies.size() == 1);
    assert(report.auto_fixed == 1);
    assert(report.requires_human_review == 0);
    assert(scope->get_status(b->id) == BindingStatus::Hidden);

    auto log = scope->history(b->id);
    assert(log.back().cause == TransitionCause::SystemReconcile);
    assert(log.back().actor_type == ActorType::System);
    assert(log.back().reason == "Auto-fix: status-mismatch");

    auto stored = f.store.inconsistencies(b->id);
    assert(stored.size() == 1);
    assert(stored[0].resolved());
    assert(stored[0].resolution_action == "auto_fixed");
    assert(stored[0].resolved_by == "system");

    // Converged: nothing left to find
    auto again = scope->reconcile(true);
    assert(again.inconsistencies.empty());
    assert(scope->review_stats().auto_fixed == 1);

    std::cout << "  PASS" << std::endl;
}

void test_low_confidence_demotion() {
    std::cout << "Testing low-confidence demotion..." << std::endl;

    for (bool auto_fix : {true, false}) {
        Fixture f;
        auto scope = f.registry->activate("s1");
        auto b = scope->create_binding(new_binding("E1", "B1"));
        assert(b);
        assert(scope->hide(b->id, "u1").applied());

        f.signals.report_elements("s1", {{"E1", EntitySignal{true, false}}});
        f.signals.report_marks("s1", {{"B1", EntitySignal{true, false}}});

        auto report = scope->reconcile(auto_fix);
        assert(report.inconsistencies.size() == 1);
        assert(near(report.inconsistencies[0].resolution_confidence, 0.85f));
        assert(report.auto_fixed == 0);
        assert(report.requires_human_review == 1);
        assert(scope->get_status(b->id) == BindingStatus::Pending);
        assert(scope->history(b->id).back().reason == "Low confidence, requires human review");

        auto queue = scope->pending_review();
        assert(queue.size() == 1);
        assert(queue[0].binding_id == b->id);

        // Pending bindings are left for arbitration
        assert(scope->reconcile(auto_fix).inconsistencies.empty());
    }

    std::cout << "  PASS" << std::endl;
}

void test_review_queue_order() {
    std::cout << "Testing review queue order..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto ghost = scope->create_binding(new_binding("E1", "B1"));
    auto unmarked = scope->create_binding(new_binding("E2", "B2"));
    assert(ghost && unmarked);

    // E1 vanishes and the pass tombstones its binding
    f.signals.report_elements("s1", {{"E2", EntitySignal{true, false}}});
    f.signals.report_marks("s1", {{"B1", EntitySignal{true, false}},
                                  {"B2", EntitySignal{true, false}}});
    assert(scope->reconcile(true).auto_fixed == 1);
    assert(scope->get_status(ghost->id) == BindingStatus::Deleted);

    // E1 comes back while B2 disappears
    f.signals.report_element("s1", "E1", EntitySignal{true, false});
    f.signals.report_marks("s1", {{"B1", EntitySignal{true, false}}});

    auto report = scope->reconcile(false);
    assert(report.requires_human_review == 2);

    auto queue = scope->pending_review();
    assert(queue.size() == 2);
    assert(queue[0].type == InconsistencyType::GhostBinding);
    assert(queue[1].type == InconsistencyType::MissingMark);
    assert(scope->pending_review(1).size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_reject() {
    std::cout << "Testing reject..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1"));
    assert(b);
    assert(scope->hide(b->id, "u1").applied());
    f.signals.report_elements("s1", {{"E1", EntitySignal{true, false}}});
    scope->reconcile(true);
    assert(scope->get_status(b->id) == BindingStatus::Pending);

    int rejected = 0;
    f.bus.subscribe(EventType::Rejected, [&](const StatusEvent& e) {
        assert(e.reason == "spam");
        assert(e.actor_id == "u2");
        rejected++;
    });

    // Refused without an actor
    auto refused = scope->reject(b->id, "", "spam");
    assert(refused.outcome == TransitionOutcome::Forbidden);
    assert(scope->get_status(b->id) == BindingStatus::Pending);

    auto result = scope->reject(b->id, "u2", "spam");
    assert(result.applied());
    assert(scope->get_status(b->id) == BindingStatus::Deleted);
    assert(rejected == 1);

    auto log = scope->history(b->id);
    assert(log.back().cause == TransitionCause::ArbitrationReject);
    assert(log.back().reason == "Human rejected binding: spam");

    auto stored = f.store.inconsistencies(b->id);
    assert(stored.size() == 1);
    assert(stored[0].resolution_action == "rejected");
    assert(stored[0].resolution_notes == "spam");
    assert(stored[0].resolved_by == "u2");
    assert(scope->pending_review().empty());

    auto stats = scope->review_stats();
    assert(stats.rejected == 1 && stats.open == 0);
    assert(near(stats.approval_rate, 0.0f));

    std::cout << "  PASS" << std::endl;
}

void test_approve() {
    std::cout << "Testing approve..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1", 0.3f));
    assert(b && b->status == BindingStatus::Pending);
    assert(scope->get_bindings_by_status(BindingStatus::Pending).size() == 1);

    int approved = 0;
    f.bus.subscribe(EventType::Approved, [&](const StatusEvent&) { approved++; });

    auto result = scope->approve(b->id, "u2");
    assert(result.applied());
    assert(result.previous == BindingStatus::Pending);
    assert(scope->get_status(b->id) == BindingStatus::Visible);
    assert(approved == 1);
    assert(scope->history(b->id).back().reason == "Human approved binding");

    std::cout << "  PASS" << std::endl;
}

void test_decisions_hold() {
    std::cout << "Testing that decisions survive later passes..." << std::endl;

    // Rejected while element and mark are both alive
    {
        Fixture f;
        auto scope = f.registry->activate("s1");
        auto b = scope->create_binding(new_binding("E1", "B1"));
        assert(b);
        assert(scope->hide(b->id, "u1").applied());
        f.signals.report_elements("s1", {{"E1", EntitySignal{true, false}}});
        f.signals.report_marks("s1", {{"B1", EntitySignal{true, false}}});

        scope->reconcile(false);
        assert(scope->get_status(b->id) == BindingStatus::Pending);
        assert(scope->reject(b->id, "u2", "spam").applied());

        for (int pass = 0; pass < 2; ++pass) {
            assert(scope->reconcile(true).inconsistencies.empty());
            assert(scope->get_status(b->id) == BindingStatus::Deleted);
        }
        assert(scope->pending_review().empty());
        assert(f.store.inconsistencies(b->id).size() == 1);
    }

    // Approved although the mark is still missing
    {
        Fixture f;
        auto scope = f.registry->activate("s1");
        auto b = scope->create_binding(new_binding("E2", "B2"));
        assert(b);
        f.signals.report_elements("s1", {{"E2", EntitySignal{true, false}}});
        f.signals.report_marks("s1", {});

        auto first = scope->reconcile(true);
        assert(first.inconsistencies.size() == 1);
        assert(first.inconsistencies[0].type == InconsistencyType::MissingMark);
        assert(scope->approve(b->id, "u2").applied());

        assert(scope->reconcile(true).inconsistencies.empty());
        assert(scope->get_status(b->id) == BindingStatus::Visible);
        assert(f.store.scope_inconsistencies("s1", true).empty());

        // The element side can still overrule it
        f.signals.report_element("s1", "E2", EntitySignal{true, true});
        auto next = scope->reconcile(true);
        assert(next.inconsistencies.size() == 1 && next.auto_fixed == 1);
        assert(scope->get_status(b->id) == BindingStatus::Hidden);
    }

    // User removal of a live link
    {
        Fixture f;
        auto scope = f.registry->activate("s1");
        auto b = scope->create_binding(new_binding("E3", "B3"));
        assert(b);
        f.signals.report_elements("s1", {{"E3", EntitySignal{true, false}}});
        f.signals.report_marks("s1", {{"B3", EntitySignal{true, false}}});
        assert(scope->soft_delete(b->id, "u1").applied());

        assert(scope->reconcile(true).inconsistencies.empty());
        assert(scope->get_status(b->id) == BindingStatus::Deleted);
    }

    std::cout << "  PASS" << std::endl;
}

void test_stuck_divergence() {
    std::cout << "Testing repeated passes over an unfixable binding..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");

    // Written by another process after activation: the index never saw it
    Binding stray;
    stray.id = Uuid::generate();
    stray.scope_id = "s1";
    stray.document_id = "doc-1";
    stray.element_id = "E9";
    stray.block_id = "B9";
    stray.created_at = now();
    stray.status_updated_at = stray.created_at;
    f.store.insert_binding(stray);
    f.signals.report_elements("s1", {{"E9", EntitySignal{true, true}}});

    Uuid first_id;
    for (int pass = 0; pass < 3; ++pass) {
        auto report = scope->reconcile(true);
        assert(report.inconsistencies.size() == 1);
        assert(report.auto_fixed == 0);
        assert(report.requires_human_review == 1);
        if (pass == 0) first_id = report.inconsistencies[0].id;
        assert(report.inconsistencies[0].id == first_id);
    }

    assert(f.store.inconsistencies(stray.id).size() == 1);
    assert(f.store.scope_inconsistencies("s1", true).size() == 1);
    assert(scope->pending_review().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_writers() {
    std::cout << "Testing version conflict between writers..." << std::endl;

    std::system("rm -f /tmp/arbiter_conflict_test.db*");
    const std::string path = "/tmp/arbiter_conflict_test.db";

    SqliteStatusStore store_a(path);
    SqliteStatusStore store_b(path);
    assert(store_a.open());
    assert(store_b.open());

    SignalTable signals;
    EventBus bus;
    ScopeRegistry registry_a(store_a, signals, bus);
    ScopeRegistry registry_b(store_b, signals, bus);

    auto a = registry_a.activate("s1");
    auto b = a->create_binding(new_binding("E1", "B1"));
    assert(b);
    auto other = registry_b.activate("s1");
    assert(other->get_status(b->id) == BindingStatus::Visible);

    assert(a->hide(b->id, "u1").applied());

    // The second writer still holds version 0
    auto late = other->soft_delete(b->id, "u2");
    assert(late.outcome == TransitionOutcome::Conflict);
    assert(late.current == BindingStatus::Hidden);
    assert(other->get_status(b->id) == BindingStatus::Hidden);
    assert(a->history(b->id).size() == 1);

    // Retrying against the refreshed version succeeds
    assert(other->soft_delete(b->id, "u2").applied());
    assert(store_a.get_binding(b->id)->status == BindingStatus::Deleted);

    store_a.close();
    store_b.close();
    std::system("rm -f /tmp/arbiter_conflict_test.db*");

    std::cout << "  PASS" << std::endl;
}

void test_strict_transitions() {
    std::cout << "Testing strict transitions..." << std::endl;

    assert(!TransitionEngine::allowed(BindingStatus::Deleted, BindingStatus::Hidden,
                                      TransitionCause::UserHide));
    assert(TransitionEngine::allowed(BindingStatus::Deleted, BindingStatus::Visible,
                                     TransitionCause::UserRestore));
    assert(!TransitionEngine::allowed(BindingStatus::Visible, BindingStatus::Deleted,
                                      TransitionCause::ArbitrationReject));

    ArbiterConfig config;
    config.strict_transitions = true;
    Fixture f(config);
    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1"));
    assert(b);

    assert(scope->soft_delete(b->id, "u1").applied());
    assert(scope->hide(b->id, "u1").outcome == TransitionOutcome::Forbidden);
    assert(scope->get_status(b->id) == BindingStatus::Deleted);
    assert(scope->restore(b->id, "u1").applied());

    // Arbitration only applies to pending bindings
    assert(scope->reject(b->id, "u1", "no").outcome == TransitionOutcome::Forbidden);

    std::cout << "  PASS" << std::endl;
}

void test_failed_writes() {
    std::cout << "Testing failed writes..." << std::endl;

    SqliteStatusStore real(":memory:");
    assert(real.open());
    FlakyStore store(real);
    SignalTable signals;
    EventBus bus;
    ScopeRegistry registry(store, signals, bus);

    auto scope = registry.activate("s1");
    auto broken = scope->create_binding(new_binding("E1", "B1"));
    auto healthy = scope->create_binding(new_binding("E2", "B2"));
    assert(broken && healthy);
    store.fail_id = broken->id;

    // One failure does not stop the batch
    assert(scope->hide_many({broken->id, healthy->id}, "u1") == 1);
    assert(scope->get_status(broken->id) == BindingStatus::Visible);
    assert(scope->get_status(healthy->id) == BindingStatus::Hidden);
    assert(scope->show_many({healthy->id}, "u1") == 1);

    bool threw = false;
    try {
        scope->hide(broken->id, "u1");
    } catch (const StoreError&) {
        threw = true;
    }
    assert(threw);

    signals.report_elements("s1", {{"E1", EntitySignal{true, true}},
                                   {"E2", EntitySignal{true, true}}});
    auto report = scope->reconcile(true);
    assert(report.inconsistencies.size() == 2);
    assert(report.auto_fixed == 1);
    assert(report.requires_human_review == 1);
    assert(scope->get_status(healthy->id) == BindingStatus::Hidden);
    assert(scope->get_status(broken->id) == BindingStatus::Visible);
    assert(scope->pending_review().size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_rebuild_cache() {
    std::cout << "Testing cache rebuild..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto b1 = scope->create_binding(new_binding("E1", "B1"));
    auto b2 = scope->create_binding(new_binding("E2", "B2"));
    assert(b1 && b2);
    assert(scope->soft_delete(b2->id, "u1").applied());

    assert(f.store.discard_cache("s1") == 2);
    assert(scope->rebuild_cache() == 2);

    assert(f.store.get_cache(b1->id)->status == BindingStatus::Visible);
    auto deleted = f.store.get_cache(b2->id);
    assert(deleted && deleted->status == BindingStatus::Deleted);
    assert(!deleted->element_exists);

    // Reload from the store sees the same state
    assert(f.registry->activate("s1")->engine_status().by_status[
        static_cast<size_t>(BindingStatus::Deleted)] == 1);

    std::cout << "  PASS" << std::endl;
}

void test_registry() {
    std::cout << "Testing ScopeRegistry..." << std::endl;

    Fixture f;
    auto s1 = f.registry->activate("s1");
    auto s2 = f.registry->activate("s2");
    auto b1 = s1->create_binding(new_binding("E1", "B1"));
    auto b2 = s2->create_binding(new_binding("E1", "B1"));
    assert(b1 && b2);

    assert(s1->get_binding_by_element_id("E1") == b1->id);
    assert(s2->get_binding_by_element_id("E1") == b2->id);
    assert(s1->hide(b2->id).outcome == TransitionOutcome::UnknownBinding);

    assert(s1->hide(b1->id, "u1").applied());
    assert(s2->get_status(b2->id) == BindingStatus::Visible);

    auto scopes = f.registry->active_scopes();
    assert(scopes.size() == 2 && scopes[0] == "s1" && scopes[1] == "s2");
    assert(f.registry->find("s1") == s1);
    assert(!f.registry->reconcile("nope", true));

    // Signals for s1 do not leak into s2
    f.signals.report_elements("s1", {});
    auto reports = f.registry->reconcile_all(true);
    assert(reports.size() == 2);
    assert(reports[0].inconsistencies.size() == 1);
    assert(reports[1].inconsistencies.empty());

    assert(f.registry->deactivate("s2"));
    assert(!f.registry->find("s2"));
    assert(f.registry->size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_outbox() {
    std::cout << "Testing NotificationOutbox..." << std::endl;

    OutboxConfig config;
    config.max_attempts = 3;
    config.base_delay_ms = 100;
    config.max_age_ms = 10000;

    Timestamp t0 = 1000000;
    auto event = [&](EventType type) {
        StatusEvent e;
        e.id = Uuid::generate();
        e.type = type;
        e.binding_id = Uuid::generate();
        e.timestamp = t0;
        return e;
    };

    NotificationOutbox outbox(config);
    assert(outbox.backoff(1) == 100);
    assert(outbox.backoff(3) == 400);
    assert(outbox.backoff(100) == config.base_delay_ms * (int64_t(1) << 30));

    auto e = event(EventType::Hidden);
    outbox.publish(e);
    outbox.publish(e);
    assert(outbox.size() == 1);

    // Queued until a transport exists
    assert(outbox.flush(t0).retried == 0);
    assert(outbox.size() == 1);

    int calls = 0;
    outbox.set_transport([&](const StatusEvent&) { calls++; return false; });
    assert(outbox.flush(t0).retried == 1);
    assert(outbox.flush(t0 + 50).retried == 0);
    assert(outbox.flush(t0 + 100).retried == 1);
    assert(outbox.flush(t0 + 299).retried == 0);
    auto last = outbox.flush(t0 + 300);
    assert(last.dropped == 1);
    assert(calls == 3);
    assert(outbox.size() == 0);

    outbox.publish(event(EventType::Shown));
    assert(outbox.flush(t0 + config.max_age_ms + 1).expired == 1);

    std::vector<EventType> sent;
    outbox.set_transport([&](const StatusEvent& ev) { sent.push_back(ev.type); return true; });
    outbox.publish(event(EventType::Deleted));
    assert(outbox.flush(t0).delivered == 1);
    assert(sent.size() == 1 && sent[0] == EventType::Deleted);

    auto stats = outbox.stats();
    assert(stats.delivered == 1 && stats.dropped == 1 && stats.expired == 1);

    std::cout << "  PASS" << std::endl;
}

void test_outbox_persistence() {
    std::cout << "Testing NotificationOutbox persistence..." << std::endl;

    const std::string path = "/tmp/arbiter_outbox_test.json";
    std::system("rm -f /tmp/arbiter_outbox_test.json*");

    NotificationOutbox outbox;
    for (int i = 0; i < 2; ++i) {
        StatusEvent e;
        e.id = Uuid::generate();
        e.type = EventType::Pending;
        e.binding_id = Uuid::generate();
        e.status = BindingStatus::Pending;
        e.timestamp = now();
        outbox.publish(e);
    }
    assert(outbox.save(path));

    NotificationOutbox restored;
    assert(restored.load(path) == 2);
    assert(restored.load(path) == 0);
    assert(restored.size() == 2);
    assert(restored.load("/tmp/arbiter_outbox_missing.json") == 0);

    // Bad entries are skipped, good ones still load
    auto queued = [](BindingStatus status) {
        StatusEvent e;
        e.id = Uuid::generate();
        e.type = EventType::StatusChanged;
        e.binding_id = Uuid::generate();
        e.status = status;
        e.timestamp = now();
        return e.to_json();
    };
    json doc = {
        {"version", 1},
        {"events", json::array({
            5,
            json{{"event", 3}},
            json{{"event", queued(BindingStatus::Hidden)}, {"attempts", "x"}},
            json{{"event", queued(BindingStatus::Visible)}, {"attempts", 1}}
        })}
    };
    {
        std::ofstream out(path);
        out << doc.dump();
    }
    NotificationOutbox damaged;
    assert(damaged.load(path) == 1);
    assert(damaged.size() == 1);

    std::system("rm -f /tmp/arbiter_outbox_test.json*");

    std::cout << "  PASS" << std::endl;
}

void test_bus_feeds_outbox() {
    std::cout << "Testing EventBus to outbox..." << std::endl;

    Fixture f;
    auto outbox = std::make_shared<NotificationOutbox>();
    f.bus.attach(outbox);
    f.bus.attach(nullptr);
    assert(f.bus.sink_count() == 1);

    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1"));
    assert(b);
    assert(scope->hide(b->id, "u1").applied());
    assert(outbox->size() == 2);

    std::vector<std::string> types;
    outbox->set_transport([&](const StatusEvent& e) {
        types.push_back(to_string(e.type));
        assert(e.linked_element_id == "E1");
        return true;
    });
    assert(outbox->flush(now()).delivered == 2);
    assert(types[0] == "status-changed" && types[1] == "hidden");

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing ArbiterConfig..." << std::endl;

    auto config = ArbiterConfig::from_json({
        {"db_path", "/var/lib/arbiter/a.db"},
        {"scopes", {"s1", "s2"}},
        {"auto_fix_threshold", 0.8},
        {"outbox", {{"max_attempts", 5}}},
        {"daemon", {{"auto_fix", false}}}
    });
    assert(config.db_path == "/var/lib/arbiter/a.db");
    assert(config.scopes.size() == 2);
    assert(near(config.reconcile_config().auto_fix_threshold, 0.8f));
    assert(config.outbox.max_attempts == 5);
    assert(config.outbox.base_delay_ms == 500);
    assert(!config.daemon.auto_fix);
    assert(config.daemon.reconcile_interval_ms == 300000);
    assert(config.socket_path.empty());

    assert(!ArbiterConfig::load("/tmp/arbiter_no_such_config.json"));

    std::cout << "  PASS" << std::endl;
}

void test_daemon() {
    std::cout << "Testing ReconcileDaemon..." << std::endl;

    Fixture f;
    auto scope = f.registry->activate("s1");
    auto b = scope->create_binding(new_binding("E1", "B1"));
    assert(b);
    f.signals.report_elements("s1", {{"E1", EntitySignal{true, true}}});

    DaemonConfig config;
    config.tick_interval_ms = 10;
    ReconcileDaemon daemon(config);
    daemon.attach(f.registry.get());

    int saves = 0, alerts = 0;
    size_t passes_seen = 0;
    daemon.on_save([&]() { saves++; });
    daemon.on_event([&](DaemonEvent event, const std::string&) {
        if (event == DaemonEvent::Alert) alerts++;
        if (event == DaemonEvent::Reconciled) passes_seen = daemon.stats().reconcile_passes;
    });

    daemon.run_reconcile();
    daemon.run_save();
    auto stats = daemon.stats();
    assert(stats.reconcile_passes == 1);
    assert(stats.scopes_reconciled == 1);
    assert(stats.auto_fixed == 1);
    assert(stats.saves == 1 && saves == 1);
    assert(alerts == 0);
    assert(passes_seen == 1);
    assert(scope->get_status(b->id) == BindingStatus::Hidden);

    daemon.start();
    assert(daemon.is_running());
    daemon.stop();
    assert(!daemon.is_running());

    std::cout << "  PASS" << std::endl;
}

json call(rpc::Handler& handler, const std::string& method, const json& params, int id = 1) {
    json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    return json::parse(handler.handle(request.dump()));
}

json call_tool(rpc::Handler& handler, const std::string& name, const json& arguments) {
    return call(handler, "tools/call", {{"name", name}, {"arguments", arguments}});
}

void test_rpc_handler() {
    std::cout << "Testing RPC handler..." << std::endl;

    Fixture f;
    rpc::Handler handler(f.registry.get(), &f.signals,
                         rpc::HandlerContext{"/tmp/arbiter-test.sock", ":memory:"});

    auto init = call(handler, "initialize", json::object());
    assert(init["result"]["serverInfo"]["name"] == "arbiterd");
    assert(init["result"]["protocol"]["major"] == ARBITER_PROTOCOL_VERSION_MAJOR);

    auto too_new = call(handler, "initialize",
                        {{"protocol_major", ARBITER_PROTOCOL_VERSION_MAJOR + 1}});
    assert(too_new["error"]["code"] == rpc::error::INVALID_REQUEST);

    auto list = call(handler, "tools/list", json::object());
    bool has_reconcile = false;
    for (const auto& tool : list["result"]["tools"]) {
        if (tool["name"] == "reconcile") has_reconcile = true;
    }
    assert(has_reconcile);
    assert(list["result"]["tools"].size() == handler.tools().size());

    auto inactive = call_tool(handler, "hide", {{"scope_id", "s1"}, {"binding_id", "x"}});
    assert(inactive["result"]["isError"] == true);

    call_tool(handler, "activate_scope", {{"scope_id", "s1"}});
    auto created = call_tool(handler, "create_binding",
                             {{"scope_id", "s1"}, {"element_id", "E1"}, {"block_id", "B1"}});
    assert(created["result"]["isError"] == false);
    std::string id = created["result"]["structured"]["id"];

    auto hidden = call_tool(handler, "hide", {{"scope_id", "s1"}, {"binding_id", id},
                                              {"actor_id", "u1"}});
    assert(hidden["result"]["structured"]["outcome"] == "applied");

    auto status = call_tool(handler, "get_status", {{"scope_id", "s1"}, {"binding_id", id}});
    assert(status["result"]["content"][0]["text"] == "hidden");

    call_tool(handler, "report_elements",
              {{"scope_id", "s1"},
               {"elements", json::array({json{{"id", "E1"}, {"exists", true}}})}});
    auto report = call_tool(handler, "reconcile", {{"scope_id", "s1"}, {"auto_fix", true}});
    assert(report["result"]["structured"]["requires_human_review"] == 1);

    auto queue = call_tool(handler, "review_queue", {{"scope_id", "s1"}});
    assert(queue["result"]["structured"]["items"].size() == 1);

    auto rejected = call_tool(handler, "reject", {{"scope_id", "s1"}, {"binding_id", id},
                                                  {"user_id", "u2"}, {"reason", "spam"}});
    assert(rejected["result"]["structured"]["status"] == "deleted");

    auto history = call_tool(handler, "history", {{"scope_id", "s1"}, {"binding_id", id}});
    assert(history["result"]["structured"]["entries"].size() == 3);

    auto unknown = call_tool(handler, "frobnicate", json::object());
    assert(unknown["error"]["code"] == rpc::error::TOOL_NOT_FOUND);

    auto bad_method = call(handler, "nope", json::object());
    assert(bad_method["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    auto parse = json::parse(handler.handle("{not json"));
    assert(parse["error"]["code"] == rpc::error::PARSE_ERROR);

    // No socket behind this handler
    auto sub = call(handler, "notifications/subscribe", json::object());
    assert(sub["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    int hooked_fd = -1;
    handler.on_subscribe([&](int fd, bool on) { hooked_fd = on ? fd : -1; return true; });
    json request = {{"jsonrpc", "2.0"}, {"id", 9}, {"method", "notifications/subscribe"},
                    {"params", json::object()}};
    auto subscribed = json::parse(handler.handle(request.dump(), 7));
    assert(subscribed["result"]["subscribed"] == true);
    assert(hooked_fd == 7);

    assert(!handler.shutdown_requested());
    call(handler, "shutdown", json::object());
    assert(handler.shutdown_requested());

    std::cout << "  PASS" << std::endl;
}

void test_socket_path() {
    std::cout << "Testing socket path derivation..." << std::endl;

    auto a = socket_path_for_db("/data/a.db");
    assert(a == socket_path_for_db("/data/a.db"));
    assert(a != socket_path_for_db("/data/b.db"));
    assert(a.rfind("/tmp/arbiter-", 0) == 0);
    assert(version::protocol_compatible(ARBITER_PROTOCOL_VERSION_MAJOR, 0));
    assert(!version::protocol_compatible(ARBITER_PROTOCOL_VERSION_MAJOR + 1, 0));

    std::cout << "  PASS" << std::endl;
}

void test_socket_server() {
    std::cout << "Testing SocketServer..." << std::endl;

    const std::string path = "/tmp/arbiter_socket_test.sock";
    SocketServer server(path);
    assert(server.start());

    int client = socket(AF_UNIX, SOCK_STREAM, 0);
    assert(client >= 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::copy(path.begin(), path.end(), addr.sun_path);
    assert(connect(client, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    const std::string lines = "hello\r\nsecond\n";
    assert(write(client, lines.data(), lines.size()) == static_cast<ssize_t>(lines.size()));

    std::vector<ClientRequest> requests;
    for (int i = 0; i < 50 && requests.size() < 2; ++i) {
        for (auto& req : server.poll(20)) requests.push_back(std::move(req));
    }
    assert(requests.size() == 2);
    assert(requests[0].data == "hello");
    assert(requests[1].data == "second");
    assert(server.connection_count() == 1);

    int fd = requests[0].client_fd;
    assert(server.subscribe(fd));
    assert(server.subscriber_count() == 1);
    assert(server.broadcast("note") == 1);
    server.respond(fd, "world");
    for (int i = 0; i < 50 && server.pending_writes() > 0; ++i) server.poll(20);
    assert(server.pending_writes() == 0);

    std::string received;
    char buf[64];
    while (std::count(received.begin(), received.end(), '\n') < 2) {
        ssize_t got = read(client, buf, sizeof(buf));
        assert(got > 0);
        received.append(buf, static_cast<size_t>(got));
    }
    assert(received == "note\nworld\n");

    close(client);
    for (int i = 0; i < 50 && server.connection_count() > 0; ++i) server.poll(20);
    assert(server.connection_count() == 0);
    assert(!server.unsubscribe(fd));

    server.stop();
    assert(!server.running());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Arbiter Tests ===" << std::endl;
    std::cout << "Version " << ARBITER_VERSION << std::endl;
    std::cout << std::endl;

    test_types();
    test_memory_index();
    test_event_bus();
    test_store_schema();

    std::cout << std::endl;
    std::cout << "=== Transitions ===" << std::endl;
    test_hide_is_idempotent();
    test_round_trip();
    test_unknown_and_uninitialized();
    test_partial_batch();
    test_hide_by_element();
    test_concurrent_writers();
    test_strict_transitions();
    test_failed_writes();
    test_rebuild_cache();

    std::cout << std::endl;
    std::cout << "=== Reconciliation and Arbitration ===" << std::endl;
    test_classification();
    test_detect_status_mismatch();
    test_auto_fix();
    test_low_confidence_demotion();
    test_review_queue_order();
    test_reject();
    test_approve();
    test_decisions_hold();
    test_stuck_divergence();
    test_registry();

    std::cout << std::endl;
    std::cout << "=== Daemon ===" << std::endl;
    test_outbox();
    test_outbox_persistence();
    test_bus_feeds_outbox();
    test_config();
    test_daemon();
    test_rpc_handler();
    test_socket_path();
    test_socket_server();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
