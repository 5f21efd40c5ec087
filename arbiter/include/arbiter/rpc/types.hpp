#pragma once
// RPC Types: tool schema, tool result, and parameter helpers

#include "../scope.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace arbiter::rpc {

using json = nlohmann::json;

// Entry in tools/list
struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable text
    json structured;          // Optional machine-readable data

    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data};
    }

    static ToolResult error(const std::string& message) {
        return {true, message, json()};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

// nullopt if absent or not a well-formed UUID
inline std::optional<BindingId> binding_id_param(const json& params, const char* key = "binding_id") {
    if (!params.contains(key) || !params[key].is_string()) return std::nullopt;
    BindingId id = Uuid::from_string(params[key].get<std::string>());
    if (!id.valid()) return std::nullopt;
    return id;
}

// Array of strings; non-string members are ignored
inline std::vector<std::string> string_list_param(const json& params, const char* key) {
    std::vector<std::string> out;
    if (!params.contains(key) || !params[key].is_array()) return out;
    for (const auto& v : params[key]) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

inline std::vector<BindingId> binding_id_list_param(const json& params, const char* key) {
    std::vector<BindingId> out;
    for (const auto& s : string_list_param(params, key)) {
        out.push_back(Uuid::from_string(s));
    }
    return out;
}

inline json id_array(const std::vector<BindingId>& ids) {
    json arr = json::array();
    for (const auto& id : ids) arr.push_back(id.to_string());
    return arr;
}

// Shared schema fragments
inline json scope_property() {
    return {{"type", "string"}, {"description", "Scope id (must be active)"}};
}

inline json binding_property() {
    return {{"type", "string"}, {"description", "Binding UUID"}};
}

inline json actor_property() {
    return {{"type", "string"}, {"description", "Who is acting (recorded in the audit log)"}};
}

} // namespace arbiter::rpc
