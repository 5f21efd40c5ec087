#pragma once
// Arbiter: existence arbitration between two projections
//
// - Types: bindings, audit rows, cache rows, findings
// - StatusStore: durable canonical status (SQLite)
// - MemoryIndex: per-scope lookups (roaring postings)
// - TransitionEngine: the only status writer
// - EventBus / NotificationOutbox: change propagation
// - InconsistencyDetector / Reconciler: drift detection and repair
// - Arbitration: human decisions
// - Scope / ScopeRegistry: one engine per scope

#include "version.hpp"
#include "types.hpp"
#include "status_store.hpp"
#include "sqlite_store.hpp"
#include "memory_index.hpp"
#include "event_bus.hpp"
#include "outbox.hpp"
#include "transition_engine.hpp"
#include "detector.hpp"
#include "reconciler.hpp"
#include "arbitration.hpp"
#include "config.hpp"
#include "scope.hpp"
#include "daemon.hpp"
