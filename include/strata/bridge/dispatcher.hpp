#pragma once

/// @file dispatcher.hpp
/// @brief Inbound {method, params} command dispatcher
///
/// The dispatcher resolves transaction built-ins first and falls through to
/// the operation registry for everything else. It owns the group session of
/// the resource it serves. Requests never throw out of handle(); a malformed
/// request yields {success: false, error}.

#include "fwd.hpp"
#include "config.hpp"
#include <strata/ops/registry.hpp>
#include <strata/model/resource.hpp>
#include <strata/model/failure.hpp>
#include <strata/tx/batch.hpp>
#include <strata/tx/group.hpp>
#include <strata/tx/guarded.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace strata_bridge {

// =============================================================================
// CommandDispatcher
// =============================================================================

class CommandDispatcher {
public:
    CommandDispatcher(const strata_ops::OperationRegistry& registry,
                      strata_model::ResourceHandle& resource,
                      BridgeConfig config = {});

    // Non-copyable
    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    /// Handle a request object; "id" is echoed back
    [[nodiscard]] nlohmann::json handle(const nlohmann::json& request);

    /// Handle one JSON line and serialize the response
    [[nodiscard]] std::string handle_line(const std::string& line);

    /// Run a method by name
    [[nodiscard]] nlohmann::json execute(const std::string& method, const nlohmann::json& params);

    /// Built-in transaction commands
    [[nodiscard]] std::vector<strata_ops::OperationInfo> builtin_methods() const;

    [[nodiscard]] strata_tx::GroupSession& session() noexcept { return m_session; }
    [[nodiscard]] const BridgeConfig& config() const noexcept { return m_config; }

private:
    using BuiltinHandler = nlohmann::json (CommandDispatcher::*)(const nlohmann::json&);

    struct Builtin {
        strata_ops::OperationInfo info;
        BuiltinHandler handler;
    };

    void register_builtins();
    [[nodiscard]] const Builtin* find_builtin(const std::string& method) const;

    // Built-ins
    nlohmann::json start_group(const nlohmann::json& params);
    nlohmann::json commit_group(const nlohmann::json& params);
    nlohmann::json rollback_group(const nlohmann::json& params);
    nlohmann::json add_checkpoint(const nlohmann::json& params);
    nlohmann::json transaction_status(const nlohmann::json& params);
    nlohmann::json undo_history(const nlohmann::json& params);
    nlohmann::json execute_with_undo(const nlohmann::json& params);
    nlohmann::json batch_execute(const nlohmann::json& params);
    nlohmann::json safe_execute(const nlohmann::json& params);
    nlohmann::json verify_and_rollback(const nlohmann::json& params);
    nlohmann::json list_methods(const nlohmann::json& params);

    /// Registry operation outside any executor-owned scope
    nlohmann::json run_standalone(const std::string& method, const nlohmann::json& params);

    const strata_ops::OperationRegistry* m_registry;
    strata_model::ResourceHandle* m_resource;
    BridgeConfig m_config;
    std::shared_ptr<strata_model::FailurePolicy> m_policy;

    strata_tx::GroupSession m_session;
    strata_tx::BatchExecutor m_batch;
    strata_tx::GuardedExecutor m_guarded;

    std::vector<Builtin> m_builtins;
};

} // namespace strata_bridge
