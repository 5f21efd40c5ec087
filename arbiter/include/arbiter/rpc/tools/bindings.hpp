#pragma once
// RPC Binding Tools: scope activation, binding lifecycle and lookups
//
// Every tool except activate_scope and engine_status needs an active
// scope_id. Transition refusals (unknown binding, conflict, forbidden)
// come back as error results carrying the outcome.

#include "../types.hpp"
#include <sstream>

namespace arbiter::rpc::tools::bindings {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "activate_scope",
        "Load a scope's bindings into memory (or reload them). Required before any "
        "other call on that scope.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()}
            }},
            {"required", {"scope_id"}}
        }
    });

    tools.push_back({
        "create_binding",
        "Link a canvas element to a document mark. Starts visible, or pending when "
        "the provenance confidence is low.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"element_id", {{"type", "string"}, {"description", "Canvas element id"}}},
                {"block_id", {{"type", "string"}, {"description", "Document block id (optional)"}}},
                {"document_id", {{"type", "string"}}},
                {"provenance", {{"type", "string"}, {"enum", {"user", "ai", "system"}}, {"default", "user"}}},
                {"confidence", {{"type", "number"}, {"minimum", 0}, {"maximum", 1}, {"default", 1.0}}},
                {"actor_id", actor_property()},
                {"metadata", {{"type", "object"}}}
            }},
            {"required", {"scope_id", "element_id"}}
        }
    });

    for (const char* name : {"hide", "show", "soft_delete", "restore"}) {
        tools.push_back({
            name,
            std::string("Transition one binding (") + name + "). Same-status requests are no-ops.",
            {
                {"type", "object"},
                {"properties", {
                    {"scope_id", scope_property()},
                    {"binding_id", binding_property()},
                    {"actor_id", actor_property()}
                }},
                {"required", {"scope_id", "binding_id"}}
            }
        });
    }

    for (const char* name : {"hide_many", "show_many"}) {
        tools.push_back({
            name,
            "Transition several bindings. Failures are skipped; returns the success count.",
            {
                {"type", "object"},
                {"properties", {
                    {"scope_id", scope_property()},
                    {"binding_ids", {{"type", "array"}, {"items", binding_property()}}},
                    {"actor_id", actor_property()}
                }},
                {"required", {"scope_id", "binding_ids"}}
            }
        });
    }

    for (const char* name : {"hide_by_elements", "show_by_elements"}) {
        tools.push_back({
            name,
            "Transition the bindings of the given canvas elements. Returns the success count.",
            {
                {"type", "object"},
                {"properties", {
                    {"scope_id", scope_property()},
                    {"element_ids", {{"type", "array"}, {"items", {{"type", "string"}}}}},
                    {"actor_id", actor_property()}
                }},
                {"required", {"scope_id", "element_ids"}}
            }
        });
    }

    tools.push_back({
        "get_status",
        "Canonical status of one binding.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"binding_id", binding_property()}
            }},
            {"required", {"scope_id", "binding_id"}}
        }
    });

    tools.push_back({
        "bindings_by_status",
        "All bindings of a scope in one status.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"status", {{"type", "string"}, {"enum", {"visible", "hidden", "deleted", "pending"}}}}
            }},
            {"required", {"scope_id", "status"}}
        }
    });

    tools.push_back({
        "binding_by_element",
        "Binding linked to a canvas element.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"element_id", {{"type", "string"}}}
            }},
            {"required", {"scope_id", "element_id"}}
        }
    });

    tools.push_back({
        "bindings_by_block",
        "Bindings with a mark in a document block.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"block_id", {{"type", "string"}}}
            }},
            {"required", {"scope_id", "block_id"}}
        }
    });

    tools.push_back({
        "engine_status",
        "Index sizes and status counts. Without scope_id, reports every active scope.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()}
            }},
            {"required", json::array()}
        }
    });

    tools.push_back({
        "history",
        "Audit log of one binding, oldest first.",
        {
            {"type", "object"},
            {"properties", {
                {"scope_id", scope_property()},
                {"binding_id", binding_property()}
            }},
            {"required", {"scope_id", "binding_id"}}
        }
    });
}

// ═══════════════════════════════════════════════════════════════════════════
// Implementations
// ═══════════════════════════════════════════════════════════════════════════

inline ToolResult scope_not_active(const json& params) {
    return ToolResult::error("Scope not active: " + params.value("scope_id", std::string()));
}

inline ToolResult transition_result(const std::string& verb, const BindingId& id,
                                    const TransitionResult& r) {
    json data = r.to_json();
    data["binding_id"] = id.to_string();

    std::ostringstream ss;
    ss << verb << " " << id.to_string() << ": ";
    if (!r.ok()) {
        ss << to_string(r.outcome);
        return {true, ss.str(), data};
    }
    ss << to_string(r.previous) << " -> " << to_string(r.current);
    if (r.outcome == TransitionOutcome::Skipped) ss << " (unchanged)";
    return ToolResult::ok(ss.str(), data);
}

inline ToolResult activate_scope(ScopeRegistry* registry, const json& params) {
    std::string scope_id = params.value("scope_id", "");
    if (scope_id.empty()) return ToolResult::error("scope_id required");

    auto scope = registry->activate(scope_id);
    auto status = scope->engine_status();
    return ToolResult::ok("Activated " + scope_id + ": " +
                          std::to_string(status.status_map_size) + " bindings",
                          status.to_json());
}

inline ToolResult create_binding(ScopeRegistry* registry, const json& params) {
    auto scope = registry->find(params.value("scope_id", ""));
    if (!scope) return scope_not_active(params);

    NewBinding req;
    req.element_id = params.value("element_id", "");
    req.block_id = params.value("block_id", "");
    req.document_id = params.value("document_id", "");
    req.actor_id = params.value("actor_id", "");
    req.provenance_confidence = std::clamp(params.value("confidence", 1.0f), 0.0f, 1.0f);
    if (params.contains("metadata") && params["metadata"].is_object()) {
        req.metadata = params["metadata"];
    }

    auto provenance = parse_provenance(params.value("provenance", "user"));
    if (!provenance) return ToolResult::error("Invalid provenance");
    req.provenance = *provenance;

    if (req.element_id.empty()) return ToolResult::error("element_id required");

    auto binding = scope->create_binding(req);
    if (!binding) return ToolResult::error("Binding not created for element " + req.element_id);

    return ToolResult::ok("Created " + binding->id.to_string() + " (" +
                          to_string(binding->status) + ")", binding->to_json());
}

using TransitionFn = std::function<TransitionResult(Scope&, const BindingId&, const std::string&)>;

inline ToolResult single(ScopeRegistry* registry, const json& params,
                         const std::string& verb, const TransitionFn& fn) {
    auto scope = registry->find(params.value("scope_id", ""));
    if (!scope) return scope_not_active(params);

    auto id = binding_id_param(params);
    if (!id) return ToolResult::error("Invalid binding_id");

    return transition_result(verb, *id, fn(*scope, *id, params.value("actor_id", "")));
}

inline ToolResult many(ScopeRegistry* registry, const json& params, bool hide) {
    auto scope = registry->find(params.value("scope_id", ""));
    if (!scope) return scope_not_active(params);

    auto ids = binding_id_list_param(params, "binding_ids");
    std::string actor = params.value("actor_id", "");
    size_t succeeded = hide ? scope->hide_many(ids, actor) : scope->show_many(ids, actor);

    return ToolResult::ok(std::to_string(succeeded) + "/" + std::to_string(ids.size()) +
                          (hide ? " hidden" : " shown"),
                          {{"requested", ids.size()}, {"succeeded", succeeded}});
}

inline ToolResult by_elements(ScopeRegistry* registry, const json& params, bool hide) {
    auto scope = registry->find(params.value("scope_id", ""));
    if (!scope) return scope_not_active(params);

    auto elements = string_list_param(params, "element_ids");
    std::string actor = params.value("actor_id", "");
    size_t succeeded = hide ? scope->hide_by_element_ids(elements, actor)
                            : scope->show_by_element_ids(elements, actor);

    return ToolResult::ok(std::to_string(succeeded) + "/" + std::to_string(elements.size()) +
                          (hide ? " hidden" : " shown"),
                          {{"requested", elements.size()}, {"succeeded", succeeded}});
}

inline ToolResult get_status(ScopeRegistry* registry, const json& params) {
    auto scope = registry->find(params.value("scope_id", ""));
    if (!scope) return scope_not_active(params);

    auto id = binding_id_param(params);
    if (!id) return ToolResult::error("Invalid binding_id");

    auto status = scope->get_status(*id);
    if (!status) return ToolResult::error("Unknown binding: " + id->to_string());

    return ToolResult::ok(to_string(*status),
                          {{"binding_id", id->to_string()}, {"status", to_string(*status)}});
}

inline ToolResult bindings_by_status(ScopeRegistry* registry, const json& params) {
    auto scope = registry->find(params.value("scope_id", ""));
    if (!scope) return scope_not_active(params);

    auto status = parse_status(params.value("status", ""));
    if (!status) return ToolResult::error("Invalid status");

    auto ids = scope->get_bindings_by_status(*status);
    return ToolResult::ok(std::to_string(ids.size()) + " " + to_string(*status),
                          {{"status", to_string(*status)}, {"binding_ids", id_array(ids)}});
}

inline ToolResult binding_by_element(ScopeRegistry* registry, const json& params) {
    auto scope = registry->find(params.value("scope_id", ""));
    if (!scope) return scope_not_active(params);

    std::string element_id = params.value("element_id", "");
    auto id = scope->get_binding_by_element_id(element_id);
    if (!id) return ToolResult::error("No binding for element " + element_id);

    return ToolResult::ok(id->to_string(),
                          {{"element_id", element_id}, {"binding_id", id->to_string()}});
}

inline ToolResult bindings_by_block(ScopeRegistry* registry, const json& params) {
    auto scope = registry->find(params.value("scope_id", ""));
    if (!scope) return scope_not_active(params);

    std::string block_id = params.value("block_id", "");
    auto ids = scope->get_bindings_by_block_id(block_id);
    return ToolResult::ok(std::to_string(ids.size()) + " bindings in block " + block_id,
                          {{"block_id", block_id}, {"binding_ids", id_array(ids)}});
}

inline ToolResult engine_status(ScopeRegistry* registry, const json& params) {
    std::string scope_id = params.value("scope_id", "");
    if (!scope_id.empty()) {
        auto scope = registry->find(scope_id);
        if (!scope) return scope_not_active(params);
        auto status = scope->engine_status();
        return ToolResult::ok(scope_id + ": " + std::to_string(status.status_map_size) +
                              " bindings", status.to_json());
    }

    json scopes = json::array();
    std::ostringstream ss;
    ss << "=== Active scopes ===\n";
    for (const auto& id : registry->active_scopes()) {
        auto scope = registry->find(id);
        if (!scope) continue;
        auto status = scope->engine_status();
        ss << id << ": " << status.status_map_size << " bindings\n";
        scopes.push_back(status.to_json());
    }
    return ToolResult::ok(ss.str(), {{"scopes", scopes}});
}

inline ToolResult history(ScopeRegistry* registry, const json& params) {
    auto scope = registry->find(params.value("scope_id", ""));
    if (!scope) return scope_not_active(params);

    auto id = binding_id_param(params);
    if (!id) return ToolResult::error("Invalid binding_id");

    json entries = json::array();
    std::ostringstream ss;
    for (const auto& e : scope->history(*id)) {
        ss << e.timestamp << " " << to_string(e.previous_status) << " -> "
           << to_string(e.status) << " (" << to_string(e.cause) << ")\n";
        entries.push_back(e.to_json());
    }
    return ToolResult::ok(ss.str(), {{"binding_id", id->to_string()}, {"entries", entries}});
}

inline void register_handlers(ScopeRegistry* registry,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["activate_scope"] = [registry](const json& p) { return activate_scope(registry, p); };
    handlers["create_binding"] = [registry](const json& p) { return create_binding(registry, p); };

    handlers["hide"] = [registry](const json& p) {
        return single(registry, p, "hide", [](Scope& s, const BindingId& id, const std::string& a) {
            return s.hide(id, a);
        });
    };
    handlers["show"] = [registry](const json& p) {
        return single(registry, p, "show", [](Scope& s, const BindingId& id, const std::string& a) {
            return s.show(id, a);
        });
    };
    handlers["soft_delete"] = [registry](const json& p) {
        return single(registry, p, "soft_delete", [](Scope& s, const BindingId& id, const std::string& a) {
            return s.soft_delete(id, a);
        });
    };
    handlers["restore"] = [registry](const json& p) {
        return single(registry, p, "restore", [](Scope& s, const BindingId& id, const std::string& a) {
            return s.restore(id, a);
        });
    };

    handlers["hide_many"] = [registry](const json& p) { return many(registry, p, true); };
    handlers["show_many"] = [registry](const json& p) { return many(registry, p, false); };
    handlers["hide_by_elements"] = [registry](const json& p) { return by_elements(registry, p, true); };
    handlers["show_by_elements"] = [registry](const json& p) { return by_elements(registry, p, false); };

    handlers["get_status"] = [registry](const json& p) { return get_status(registry, p); };
    handlers["bindings_by_status"] = [registry](const json& p) { return bindings_by_status(registry, p); };
    handlers["binding_by_element"] = [registry](const json& p) { return binding_by_element(registry, p); };
    handlers["bindings_by_block"] = [registry](const json& p) { return bindings_by_block(registry, p); };
    handlers["engine_status"] = [registry](const json& p) { return engine_status(registry, p); };
    handlers["history"] = [registry](const json& p) { return history(registry, p); };
}

} // namespace arbiter::rpc::tools::bindings
