#pragma once
// RPC Handler: JSON-RPC dispatch for arbiterd
//
// Methods: initialize, tools/list, tools/call, notifications/subscribe,
// notifications/unsubscribe, shutdown. Tool failures are isError results;
// protocol failures are JSON-RPC errors.

#include "protocol.hpp"
#include "types.hpp"
#include "tools/bindings.hpp"
#include "tools/reconcile.hpp"
#include "../version.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

namespace arbiter::rpc {

using json = nlohmann::json;

struct HandlerContext {
    std::string socket_path;
    std::string db_path;
};

// Called with the client fd and true to subscribe, false to unsubscribe
using SubscribeHook = std::function<bool(int, bool)>;

class Handler {
public:
    Handler(ScopeRegistry* registry, SignalTable* signals, HandlerContext context = {})
        : registry_(registry),
          signals_(signals),
          context_(std::move(context)),
          start_time_(std::chrono::steady_clock::now()) {
        register_all_tools();
    }

    // One request line in, one response line out.
    // client_fd identifies the connection for subscriptions (-1 = none).
    std::string handle(const std::string& request_str, int client_fd = -1) {
        try {
            auto request = json::parse(request_str);
            auto response = handle_request(request, client_fd);
            try {
                return response.dump();
            } catch (const json::type_error&) {
                return response.dump(-1, ' ', false, json::error_handler_t::replace);
            }
        } catch (const json::parse_error& e) {
            return make_error(json(), error::PARSE_ERROR,
                              std::string("JSON parse error: ") + e.what()).dump();
        } catch (const std::exception& e) {
            return make_error(json(), error::INTERNAL_ERROR,
                              std::string("Internal error: ") + e.what()).dump();
        }
    }

    void on_subscribe(SubscribeHook hook) { subscribe_hook_ = std::move(hook); }

    const std::vector<ToolSchema>& tools() const { return tools_; }
    bool shutdown_requested() const { return shutdown_requested_; }

private:
    ScopeRegistry* registry_;
    SignalTable* signals_;
    HandlerContext context_;
    std::chrono::steady_clock::time_point start_time_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
    SubscribeHook subscribe_hook_;
    std::atomic<bool> shutdown_requested_{false};

    void register_all_tools() {
        // Scope and binding lifecycle
        tools::bindings::register_schemas(tools_);
        tools::bindings::register_handlers(registry_, handlers_);

        // Signals, reconciliation, arbitration
        tools::reconcile::register_schemas(tools_);
        tools::reconcile::register_handlers(registry_, signals_, handlers_);
    }

    // ═══════════════════════════════════════════════════════════════════
    // JSON-RPC dispatch
    // ═══════════════════════════════════════════════════════════════════

    json handle_request(const json& request, int client_fd) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);

        if (info.method == "initialize") {
            return handle_initialize(info.params, info.id);
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        } else if (info.method == "notifications/subscribe") {
            return handle_subscribe(info.id, client_fd, true);
        } else if (info.method == "notifications/unsubscribe") {
            return handle_subscribe(info.id, client_fd, false);
        } else if (info.method == "shutdown") {
            shutdown_requested_ = true;
            return make_result(info.id, {{"status", "ok"}});
        }
        return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
    }

    json handle_initialize(const json& params, const json& id) {
        int major = params.value("protocol_major", ARBITER_PROTOCOL_VERSION_MAJOR);
        int minor = params.value("protocol_minor", ARBITER_PROTOCOL_VERSION_MINOR);
        if (!version::protocol_compatible(major, minor)) {
            return make_error(id, error::INVALID_REQUEST,
                              "Incompatible protocol " + std::to_string(major) + "." +
                              std::to_string(minor));
        }

        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time_).count();

        return make_result(id, {
            {"serverInfo", {
                {"name", "arbiterd"},
                {"version", ARBITER_VERSION}
            }},
            {"protocol", {
                {"major", ARBITER_PROTOCOL_VERSION_MAJOR},
                {"minor", ARBITER_PROTOCOL_VERSION_MINOR}
            }},
            {"capabilities", {
                {"tools", {{"listChanged", false}}},
                {"notifications", {{"subscribe", static_cast<bool>(subscribe_hook_)}}}
            }},
            {"db_path", context_.db_path},
            {"socket_path", context_.socket_path},
            {"active_scopes", registry_->active_scopes()},
            {"uptime_seconds", uptime}
        });
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());
        if (!arguments.is_object()) {
            return make_error(id, error::INVALID_PARAMS, "arguments must be an object");
        }

        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        try {
            ToolResult result = it->second(arguments);
            return make_result(id, make_tool_response(result.content, result.is_error,
                                                      result.structured));
        } catch (const std::exception& e) {
            return make_error(id, error::TOOL_EXECUTION_ERROR,
                              std::string("Tool execution failed: ") + e.what());
        }
    }

    json handle_subscribe(const json& id, int client_fd, bool subscribe) {
        if (!subscribe_hook_ || client_fd < 0) {
            return make_error(id, error::METHOD_NOT_FOUND,
                              "Notifications not available on this transport");
        }
        bool changed = subscribe_hook_(client_fd, subscribe);
        return make_result(id, {{"subscribed", subscribe}, {"changed", changed}});
    }
};

} // namespace arbiter::rpc
