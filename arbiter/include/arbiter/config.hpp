#pragma once
// Configuration for the engine and the daemon
//
// Defaults live in the structs. A JSON file may override any subset;
// command-line flags in arbiterd override the file.

#include "outbox.hpp"
#include "reconciler.hpp"
#include "transition_engine.hpp"
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {

// Background maintenance schedule
struct DaemonConfig {
    int64_t tick_interval_ms = 1000;          // Loop granularity
    int64_t reconcile_interval_ms = 300000;   // 5 minutes between reconcile passes
    int64_t save_interval_ms = 60000;         // 1 minute between outbox saves
    bool auto_fix = true;                     // Passed to every scheduled reconcile
};

struct ArbiterConfig {
    std::string db_path = "arbiter.db";
    std::string socket_path;                  // Empty = derived from db_path
    std::string outbox_path;                  // Empty = do not persist
    std::string log_path;                     // Empty = stderr
    std::vector<std::string> scopes;          // Activated at startup

    float auto_fix_threshold = 0.90f;
    float pending_below_confidence = 0.5f;    // New bindings under this start pending
    bool strict_transitions = false;
    bool verbose = false;

    OutboxConfig outbox;
    DaemonConfig daemon;

    TransitionConfig transition_config() const {
        TransitionConfig c;
        c.strict_transitions = strict_transitions;
        c.verbose = verbose;
        return c;
    }

    ReconcileConfig reconcile_config() const {
        ReconcileConfig c;
        c.auto_fix_threshold = auto_fix_threshold;
        return c;
    }

    // Missing keys keep their defaults
    static ArbiterConfig from_json(const json& j) {
        ArbiterConfig c;
        c.db_path = j.value("db_path", c.db_path);
        c.socket_path = j.value("socket_path", c.socket_path);
        c.outbox_path = j.value("outbox_path", c.outbox_path);
        c.log_path = j.value("log_path", c.log_path);
        c.scopes = j.value("scopes", c.scopes);
        c.auto_fix_threshold = j.value("auto_fix_threshold", c.auto_fix_threshold);
        c.pending_below_confidence = j.value("pending_below_confidence", c.pending_below_confidence);
        c.strict_transitions = j.value("strict_transitions", c.strict_transitions);
        c.verbose = j.value("verbose", c.verbose);

        if (j.contains("outbox") && j["outbox"].is_object()) {
            const auto& o = j["outbox"];
            c.outbox.max_attempts = o.value("max_attempts", c.outbox.max_attempts);
            c.outbox.base_delay_ms = o.value("base_delay_ms", c.outbox.base_delay_ms);
            c.outbox.max_age_ms = o.value("max_age_ms", c.outbox.max_age_ms);
        }

        if (j.contains("daemon") && j["daemon"].is_object()) {
            const auto& d = j["daemon"];
            c.daemon.tick_interval_ms = d.value("tick_interval_ms", c.daemon.tick_interval_ms);
            c.daemon.reconcile_interval_ms = d.value("reconcile_interval_ms", c.daemon.reconcile_interval_ms);
            c.daemon.save_interval_ms = d.value("save_interval_ms", c.daemon.save_interval_ms);
            c.daemon.auto_fix = d.value("auto_fix", c.daemon.auto_fix);
        }
        return c;
    }

    // nullopt if the file is missing or not a JSON object
    static std::optional<ArbiterConfig> load(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            std::cerr << "[config] Cannot read " << path << "\n";
            return std::nullopt;
        }
        json j = json::parse(in, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "[config] " << path << " is not a JSON object\n";
            return std::nullopt;
        }
        try {
            return from_json(j);
        } catch (const json::exception& e) {
            std::cerr << "[config] " << path << ": " << e.what() << "\n";
            return std::nullopt;
        }
    }
};

} // namespace arbiter
