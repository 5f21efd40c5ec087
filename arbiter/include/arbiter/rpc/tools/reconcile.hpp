#pragma once
// RPC Reconcile Tools: existence reports, reconciliation, arbitration
//
// Projections push what they currently hold with report_elements and
// report_marks. reconcile compares that against canonical status;
// review_queue, approve and reject close the loop for a human.

#include "../types.hpp"
#include <iomanip>
#include <sstream>

namespace arbiter::rpc::tools::reconcile {

using json = nlohmann::json;

inline json entity_list_schema() {
    return {
        {"type", "array"},
        {"items", {
            {"type", "object"},
            {"properties", {
                {"id", {{"type", "string"}}},
                {"exists", {{"type", "boolean"}, {"default", true}}},
                {"deleted", {{"type", "boolean"}, {"default", false}}}
            }},
            {"required", {"id"}}
        }}
    };
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "report_elements",
        "Report the canvas elements of a scope. With replace (default) the list is the "
        "full snapshot and unlisted elements count as absent.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"elements", entity_list_schema()},
                {"replace", {{"type", "boolean"}, {"default", true}}}
            }},
            {"required", {"scope_id", "elements"}}
        }
    });

    tools.push_back({
        "report_marks",
        "Report the document marks of a scope, keyed by block id.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"marks", entity_list_schema()},
                {"replace", {{"type", "boolean"}, {"default", true}}}
            }},
            {"required", {"scope_id", "marks"}}
        }
    });

    tools.push_back({
        "reconcile",
        "Detect divergence between canonical status and the reported projections. "
        "With auto_fix, high-confidence findings are applied; the rest go to review.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"auto_fix", {{"type", "boolean"}, {"default", true}}}
            }},
            {"required", {"scope_id"}}
        }
    });

    tools.push_back({
        "review_queue",
        "Open inconsistencies awaiting a decision, most confident first.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"limit", {{"type", "integer"}, {"minimum", 0}, {"default", 20}}}
            }},
            {"required", {"scope_id"}}
        }
    });

    tools.push_back({
        "review_stats",
        "Counts of open, approved, rejected and auto-fixed findings.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()}
            }},
            {"required", {"scope_id"}}
        }
    });

    tools.push_back({
        "approve",
        "Keep a binding under review: status becomes visible.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"binding_id", binding_property()},
                {"user_id", {{"type", "string"}, {"description", "Reviewer"}}}
            }},
            {"required", {"scope_id", "binding_id", "user_id"}}
        }
    });

    tools.push_back({
        "reject",
        "Discard a binding under review: status becomes deleted.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"binding_id", binding_property()},
                {"user_id", {{"type", "string"}, {"description", "Reviewer"}}},
                {"reason", {{"type", "string"}}}
            }},
            {"required", {"scope_id", "binding_id", "user_id"}}
        }
    });

    tools.push_back({
        "rebuild_cache",
        "Recompute every existence cache row of a scope from canonical status.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()}
            }},
            {"required", {"scope_id"}}
        }
    });
}

// ═══════════════════════════════════════════════════════════════════════════
// Implementations
// ═══════════════════════════════════════════════════════════════════════════

inline std::unordered_map<std::string, EntitySignal> parse_entities(const json& list) {
    std::unordered_map<std::string, EntitySignal> out;
    if (!list.is_array()) return out;
    for (const auto& item : list) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) continue;
        EntitySignal s;
        s.exists = item.value("exists", true);
        s.deleted = item.value("deleted", false);
        out[item["id"].get<std::string>()] = s;
    }
    return out;
}

inline ToolResult report(SignalTable* signals, const json& params, bool elements) {
    std::string scope_id = params.value("scope_id", "");
    if (scope_id.empty()) return ToolResult::error("scope_id required");

    const char* key = elements ? "elements" : "marks";
    if (!params.contains(key) || !params[key].is_array()) {
        return ToolResult::error(std::string(key) + " must be an array");
    }

    auto entities = parse_entities(params[key]);
    if (params.value("replace", true)) {
        if (elements) signals->report_elements(scope_id, entities);
        else signals->report_marks(scope_id, entities);
    } else {
        for (const auto& [id, signal] : entities) {
            if (elements) signals->report_element(scope_id, id, signal);
            else signals->report_mark(scope_id, id, signal);
        }
    }

    return ToolResult::ok("Recorded " + std::to_string(entities.size()) + " " + key +
                          " for " + scope_id,
                          {{"scope_id", scope_id}, {"count", entities.size()}});
}

inline ToolResult reconcile(ScopeRegistry* registry, const json& params) {
    std::string scope_id = params.value("scope_id", "");
    auto report = registry->reconcile(scope_id, params.value("auto_fix", true));
    if (!report) return ToolResult::error("Scope not active: " + scope_id);

    std::ostringstream ss;
    ss << "=== Reconcile " << scope_id << " ===\n";
    ss << "Inconsistencies: " << report->inconsistencies.size() << "\n";
    ss << "Auto-fixed: " << report->auto_fixed << "\n";
    ss << "Requires review: " << report->requires_human_review << "\n";
    for (const auto& f : report->inconsistencies) {
        ss << "  [" << f.binding_id.to_string().substr(0, 8) << "] " << to_string(f.type)
           << " -> " << f.suggested.label
           << (f.resolved() ? " (fixed)" : "") << "\n";
    }
    return ToolResult::ok(ss.str(), report->to_json());
}

inline ToolResult review_queue(ScopeRegistry* registry, const json& params) {
    std::string scope_id = params.value("scope_id", "");
    auto scope = registry->find(scope_id);
    if (!scope) return ToolResult::error("Scope not active: " + scope_id);

    size_t limit = params.value("limit", size_t(20));
    auto items = scope->pending_review(limit);

    std::ostringstream ss;
    ss << "=== Review Queue (" << items.size() << ") ===\n";
    json items_json = json::array();
    for (const auto& f : items) {
        ss << "[" << f.binding_id.to_string().substr(0, 8) << "] " << to_string(f.type)
           << " " << static_cast<int>(f.resolution_confidence * 100) << "% -> "
           << f.suggested.label << "\n";
        items_json.push_back(f.to_json());
    }
    return ToolResult::ok(ss.str(), {{"items", items_json}});
}

inline ToolResult review_stats(ScopeRegistry* registry, const json& params) {
    std::string scope_id = params.value("scope_id", "");
    auto scope = registry->find(scope_id);
    if (!scope) return ToolResult::error("Scope not active: " + scope_id);

    auto stats = scope->review_stats();

    std::ostringstream ss;
    ss << "=== Review Stats ===\n";
    ss << "Open: " << stats.open << "\n";
    ss << "Approved: " << stats.approved << "\n";
    ss << "Rejected: " << stats.rejected << "\n";
    ss << "Auto-fixed: " << stats.auto_fixed << "\n";
    ss << "Approval rate: " << std::fixed << std::setprecision(1)
       << stats.approval_rate * 100 << "%\n";
    return ToolResult::ok(ss.str(), stats.to_json());
}

inline ToolResult decide(ScopeRegistry* registry, const json& params, bool approve) {
    std::string scope_id = params.value("scope_id", "");
    auto scope = registry->find(scope_id);
    if (!scope) return ToolResult::error("Scope not active: " + scope_id);

    auto id = binding_id_param(params);
    if (!id) return ToolResult::error("Invalid binding_id");

    std::string user_id = params.value("user_id", "");
    auto result = approve ? scope->approve(*id, user_id)
                          : scope->reject(*id, user_id, params.value("reason", ""));

    json data = result.to_json();
    data["binding_id"] = id->to_string();
    std::string verb = approve ? "approve" : "reject";
    if (!result.ok()) {
        return {true, verb + " " + id->to_string() + ": " + to_string(result.outcome), data};
    }
    return ToolResult::ok(verb + " " + id->to_string() + ": " + to_string(result.current), data);
}

inline ToolResult rebuild_cache(ScopeRegistry* registry, const json& params) {
    std::string scope_id = params.value("scope_id", "");
    auto scope = registry->find(scope_id);
    if (!scope) return ToolResult::error("Scope not active: " + scope_id);

    size_t rebuilt = scope->rebuild_cache();
    return ToolResult::ok("Rebuilt " + std::to_string(rebuilt) + " cache rows",
                          {{"scope_id", scope_id}, {"rebuilt", rebuilt}});
}

inline void register_handlers(ScopeRegistry* registry, SignalTable* signals,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["report_elements"] = [signals](const json& p) { return report(signals, p, true); };
    handlers["report_marks"] = [signals](const json& p) { return report(signals, p, false); };
    handlers["reconcile"] = [registry](const json& p) { return reconcile(registry, p); };
    handlers["review_queue"] = [registry](const json& p) { return review_queue(registry, p); };
    handlers["review_stats"] = [registry](const json& p) { return review_stats(registry, p); };
    handlers["approve"] = [registry](const json& p) { return decide(registry, p, true); };
    handlers["reject"] = [registry](const json& p) { return decide(registry, p, false); };
    handlers["rebuild_cache"] = [registry](const json& p) { return rebuild_cache(registry, p); };
}

} // namespace arbiter::rpc::tools::reconcile
