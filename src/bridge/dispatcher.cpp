/// @file dispatcher.cpp
/// @brief Command dispatcher and transaction built-ins

#include <strata/bridge/dispatcher.hpp>
#include <strata/bridge/response.hpp>
#include <strata/ops/params.hpp>
#include <strata/core/log.hpp>

#include <algorithm>
#include <set>

namespace strata_bridge {

namespace {

const nlohmann::json& empty_object() {
    static const nlohmann::json object = nlohmann::json::object();
    return object;
}

strata_ops::Operation operation_from(const nlohmann::json& item) {
    if (!item.is_object()) {
        return {};
    }
    std::string method = item.contains("method") && item["method"].is_string()
        ? item["method"].get<std::string>()
        : std::string{};
    nlohmann::json params = item.contains("params") && item["params"].is_object()
        ? item["params"]
        : nlohmann::json::object();
    return strata_ops::Operation(std::move(method), std::move(params));
}

} // anonymous namespace

CommandDispatcher::CommandDispatcher(const strata_ops::OperationRegistry& registry,
                                     strata_model::ResourceHandle& resource,
                                     BridgeConfig config)
    : m_registry(&registry)
    , m_resource(&resource)
    , m_config(std::move(config))
    , m_policy(strata_model::make_failure_policy(m_config.continue_on_warning))
    , m_session(resource, m_policy)
    , m_batch(registry, resource)
    , m_guarded(registry, resource, m_policy)
{
    register_builtins();
}

// =============================================================================
// Built-in Table
// =============================================================================

void CommandDispatcher::register_builtins() {
    auto add = [this](std::string name, std::vector<std::string> aliases,
                      std::string description, BuiltinHandler handler) {
        strata_ops::OperationInfo info;
        info.name = std::move(name);
        info.aliases = std::move(aliases);
        info.category = "Transaction";
        info.description = std::move(description);
        m_builtins.push_back(Builtin{std::move(info), handler});
    };

    add("startTransactionGroup", {},
        "Start a transaction group to combine multiple operations into one undoable action",
        &CommandDispatcher::start_group);
    add("commitTransactionGroup", {},
        "Commit the active transaction group, finalizing all operations",
        &CommandDispatcher::commit_group);
    add("rollbackTransactionGroup", {},
        "Rollback the active transaction group, undoing all operations since it started",
        &CommandDispatcher::rollback_group);
    add("addCheckpoint", {},
        "Add a named checkpoint to track progress within a transaction group",
        &CommandDispatcher::add_checkpoint);
    add("getTransactionStatus", {},
        "Get the current status of transaction groups and checkpoints",
        &CommandDispatcher::transaction_status);
    add("getUndoHistory", {},
        "Get finished groups, checkpoints and the undo stack",
        &CommandDispatcher::undo_history);
    add("executeWithUndo", {},
        "Execute a method with explicit undo point creation",
        &CommandDispatcher::execute_with_undo);
    add("batchExecute", {"executeBatch"},
        "Execute multiple methods as a single undoable operation",
        &CommandDispatcher::batch_execute);
    add("safeExecute", {},
        "Execute a method with automatic rollback if it fails",
        &CommandDispatcher::safe_execute);
    add("verifyAndRollback", {},
        "Execute a method, then run verification; rollback if verification fails",
        &CommandDispatcher::verify_and_rollback);
    add("listMethods", {"getMethods"},
        "List available methods, optionally by category",
        &CommandDispatcher::list_methods);
}

const CommandDispatcher::Builtin* CommandDispatcher::find_builtin(const std::string& method) const {
    auto key = strata_ops::normalize_name(method);
    for (const auto& builtin : m_builtins) {
        if (strata_ops::normalize_name(builtin.info.name) == key) {
            return &builtin;
        }
        for (const auto& alias : builtin.info.aliases) {
            if (strata_ops::normalize_name(alias) == key) {
                return &builtin;
            }
        }
    }
    return nullptr;
}

std::vector<strata_ops::OperationInfo> CommandDispatcher::builtin_methods() const {
    std::vector<strata_ops::OperationInfo> out;
    out.reserve(m_builtins.size());
    for (const auto& builtin : m_builtins) {
        out.push_back(builtin.info);
    }
    return out;
}

// =============================================================================
// Entry Points
// =============================================================================

nlohmann::json CommandDispatcher::handle(const nlohmann::json& request) {
    nlohmann::json response;

    if (!request.is_object()) {
        response = ResponseBuilder::error("Request must be a JSON object").build();
    } else if (!request.contains("method") || !request["method"].is_string()
               || request["method"].get<std::string>().empty()) {
        response = ResponseBuilder::error("Request requires a 'method' string").build();
    } else {
        const auto& params = request.contains("params") ? request["params"] : empty_object();
        if (!params.is_null() && !params.is_object()) {
            response = ResponseBuilder::error("'params' must be an object").build();
        } else {
            response = execute(request["method"].get<std::string>(),
                               params.is_null() ? empty_object() : params);
        }
    }

    if (request.is_object() && request.contains("id")) {
        response["id"] = request["id"];
    }
    return response;
}

std::string CommandDispatcher::handle_line(const std::string& line) {
    auto request = nlohmann::json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        strata_core::bridge_logger()->warn("Rejected malformed request line");
        return ResponseBuilder::error("Invalid JSON request").build().dump();
    }
    return handle(request).dump();
}

nlohmann::json CommandDispatcher::execute(const std::string& method, const nlohmann::json& params) {
    strata_core::bridge_logger()->debug("-> {}", method);

    try {
        if (const auto* builtin = find_builtin(method)) {
            return (this->*(builtin->handler))(params);
        }
        return run_standalone(method, params);
    } catch (const std::exception& e) {
        strata_core::bridge_logger()->error("Command '{}' failed: {}", method, e.what());
        return ResponseBuilder::error(method + " failed: " + e.what(), strata_ops::ErrorKind::Exception).build();
    }
}

nlohmann::json CommandDispatcher::run_standalone(const std::string& method, const nlohmann::json& params) {
    strata_ops::ExecutionContext ctx(*m_resource, false, m_policy);
    auto result = m_registry->invoke(ctx, strata_ops::Operation(method, params));
    return ResponseBuilder::from_result(result).build();
}

// =============================================================================
// Transaction Groups
// =============================================================================

nlohmann::json CommandDispatcher::start_group(const nlohmann::json& params) {
    strata_ops::ParamReader reader(params);
    auto name = reader.optional<std::string>("name", "");
    if (!reader.ok()) {
        return ResponseBuilder::from_result(reader.failure()).build();
    }

    auto started = m_session.start(name);
    if (!started) {
        return ResponseBuilder::from_error(started.error()).build();
    }

    return ResponseBuilder::ok()
        .with("groupName", *started)
        .message("Transaction group '" + *started + "' started. All operations will be combined into one undo.")
        .build();
}

nlohmann::json CommandDispatcher::commit_group(const nlohmann::json&) {
    auto committed = m_session.commit();
    if (!committed) {
        auto response = ResponseBuilder::from_error(committed.error());
        if (const auto* group = committed.error().get_context("group")) {
            response.with("groupName", *group).with("rolledBack", true);
        }
        return response.build();
    }

    return ResponseBuilder::ok()
        .with("groupName", committed->name)
        .with("checkpoints", strata_tx::checkpoint_texts(committed->checkpoints))
        .message("Transaction group '" + committed->name + "' committed. Can be undone as single action.")
        .build();
}

nlohmann::json CommandDispatcher::rollback_group(const nlohmann::json&) {
    auto rolled_back = m_session.rollback();
    if (!rolled_back) {
        return ResponseBuilder::from_error(rolled_back.error()).build();
    }

    return ResponseBuilder::ok()
        .with("groupName", rolled_back->name)
        .with("rolledBackCheckpoints", strata_tx::checkpoint_texts(rolled_back->checkpoints))
        .message("Transaction group '" + rolled_back->name + "' rolled back. All operations undone.")
        .build();
}

nlohmann::json CommandDispatcher::add_checkpoint(const nlohmann::json& params) {
    strata_ops::ParamReader reader(params);
    auto label = reader.optional<std::string>("name", "");
    if (!reader.ok()) {
        return ResponseBuilder::from_result(reader.failure()).build();
    }

    auto added = m_session.checkpoint(label);
    if (!added) {
        return ResponseBuilder::from_error(added.error()).build();
    }

    auto status = m_session.status();
    return ResponseBuilder::ok()
        .with("checkpoint", added->label)
        .with("checkpointCount", status.checkpoint_count)
        .with("activeGroup", status.name)
        .message("Checkpoint '" + added->label + "' added")
        .build();
}

nlohmann::json CommandDispatcher::transaction_status(const nlohmann::json&) {
    return status_response(m_session.status());
}

nlohmann::json CommandDispatcher::undo_history(const nlohmann::json&) {
    auto status = m_session.status();

    nlohmann::json groups = nlohmann::json::array();
    for (const auto& record : m_session.history()) {
        groups.push_back({
            {"name", record.name},
            {"state", strata_tx::group_state_name(record.state)},
            {"checkpointCount", record.checkpoint_count},
            {"finishedAt", strata_tx::format_time_of_day(record.finished_at)},
        });
    }

    return ResponseBuilder::ok()
        .with("checkpointsInSession", strata_tx::checkpoint_texts(status.checkpoints))
        .with("activeTransactionGroup", status.has_active ? nlohmann::json(status.name) : nlohmann::json(nullptr))
        .with("groups", std::move(groups))
        .with("undoStack", m_resource->undo_stack())
        .build();
}

// =============================================================================
// Guarded Execution
// =============================================================================

nlohmann::json CommandDispatcher::execute_with_undo(const nlohmann::json& params) {
    strata_ops::ParamReader reader(params);
    auto method = reader.required<std::string>("method");
    auto method_params = reader.optional<nlohmann::json>("params", nlohmann::json::object());
    auto undo_name = reader.optional<std::string>("undoName", method);
    if (!reader.ok()) {
        return ResponseBuilder::from_result(reader.failure()).build();
    }

    if (!m_registry->contains(method)) {
        return ResponseBuilder::error("Method '" + method + "' not found", strata_ops::ErrorKind::NotFound).build();
    }

    if (m_session.has_active()) {
        auto added = m_session.checkpoint("Execute: " + undo_name);
        if (!added) {
            return ResponseBuilder::from_error(added.error()).build();
        }
    }

    auto outcome = m_guarded.safe_execute(strata_ops::Operation(method, method_params), undo_name);

    auto response = outcome.success() ? ResponseBuilder::ok()
        : ResponseBuilder::error(outcome.result.error_message, outcome.result.error_kind);
    return response
        .with("executedMethod", method)
        .with("undoName", undo_name)
        .with("result", outcome.result.to_json())
        .with("wasRolledBack", outcome.was_rolled_back)
        .message(outcome.success()
            ? "Executed '" + method + "' with undo point"
            : outcome.message)
        .build();
}

nlohmann::json CommandDispatcher::batch_execute(const nlohmann::json& params) {
    strata_ops::ParamReader reader(params);
    auto items = reader.optional<std::vector<nlohmann::json>>("operations", {});
    auto batch_name = reader.optional<std::string>("batchName",
        reader.optional<std::string>("transactionName", m_config.default_batch_name));

    strata_tx::BatchPolicy policy;
    policy.stop_on_error = reader.optional<bool>("stopOnError",
        reader.optional<bool>("rollbackOnError", m_config.stop_on_error));
    policy.continue_on_warning = reader.optional<bool>("continueOnWarning", m_config.continue_on_warning);
    policy.allow_partial_success = reader.optional<bool>("allowPartialSuccess", m_config.allow_partial_success);

    if (!reader.ok()) {
        return ResponseBuilder::from_result(reader.failure()).build();
    }

    std::vector<strata_ops::Operation> operations;
    operations.reserve(items.size());
    for (const auto& item : items) {
        operations.push_back(operation_from(item));
    }

    return batch_response(m_batch.run(batch_name, operations, policy));
}

nlohmann::json CommandDispatcher::safe_execute(const nlohmann::json& params) {
    strata_ops::ParamReader reader(params);
    auto method = reader.optional<std::string>("method", "");
    auto method_params = reader.optional<nlohmann::json>("params", nlohmann::json::object());
    auto operation_name = reader.optional<std::string>("operationName", method);
    if (!reader.ok()) {
        return ResponseBuilder::from_result(reader.failure()).build();
    }

    auto outcome = m_guarded.safe_execute(strata_ops::Operation(method, method_params), operation_name);
    return safe_execute_response(method, outcome);
}

nlohmann::json CommandDispatcher::verify_and_rollback(const nlohmann::json& params) {
    strata_ops::ParamReader reader(params);
    auto method = reader.optional<std::string>("method", "");
    auto method_params = reader.optional<nlohmann::json>("params", nlohmann::json::object());
    auto verify_method = reader.optional<std::string>("verifyMethod", "");
    auto verify_params = reader.optional<nlohmann::json>("verifyParams", nlohmann::json::object());
    auto operation_name = reader.optional<std::string>("operationName", method);
    if (!reader.ok()) {
        return ResponseBuilder::from_result(reader.failure()).build();
    }

    auto outcome = m_guarded.verify_and_rollback(
        strata_ops::Operation(method, method_params),
        strata_ops::Operation(verify_method, verify_params),
        operation_name);
    return verify_response(outcome);
}

// =============================================================================
// Discovery
// =============================================================================

nlohmann::json CommandDispatcher::list_methods(const nlohmann::json& params) {
    strata_ops::ParamReader reader(params);
    auto category = reader.optional<std::string>("category", "");
    if (!reader.ok()) {
        return ResponseBuilder::from_result(reader.failure()).build();
    }
    auto wanted = strata_ops::normalize_name(category);

    std::vector<strata_ops::OperationInfo> infos;
    std::set<std::string> categories;

    for (const auto& builtin : m_builtins) {
        categories.insert(builtin.info.category);
        if (wanted.empty() || strata_ops::normalize_name(builtin.info.category) == wanted) {
            infos.push_back(builtin.info);
        }
    }
    for (auto& info : m_registry->list()) {
        // Built-ins resolve first, so a registry operation with the same name is unreachable
        if (find_builtin(info.name)) {
            continue;
        }
        categories.insert(info.category);
        if (wanted.empty() || strata_ops::normalize_name(info.category) == wanted) {
            infos.push_back(std::move(info));
        }
    }

    std::sort(infos.begin(), infos.end(), [](const auto& a, const auto& b) {
        return strata_ops::normalize_name(a.name) < strata_ops::normalize_name(b.name);
    });

    nlohmann::json methods = nlohmann::json::array();
    for (const auto& info : infos) {
        methods.push_back(operation_info_json(info));
    }

    return ResponseBuilder::ok()
        .with("count", infos.size())
        .with("methods", std::move(methods))
        .with("categories", std::vector<std::string>(categories.begin(), categories.end()))
        .build();
}

} // namespace strata_bridge
