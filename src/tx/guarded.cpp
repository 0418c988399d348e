/// @file guarded.cpp
/// @brief Safe-execute and verify-and-rollback wrappers

#include <strata/tx/guarded.hpp>
#include <strata/model/scope.hpp>
#include <strata/core/log.hpp>

namespace strata_tx {

namespace {

/// Roll the scope back if it is still open; false if the resource refused
bool revert(strata_model::Scope& scope) {
    if (!scope.is_open()) {
        return true;
    }
    auto result = scope.rollback();
    if (!result) {
        strata_core::tx_logger()->error("Rollback of '{}' failed: {}",
            scope.name(), result.error().message());
        return false;
    }
    return true;
}

} // anonymous namespace

GuardedExecutor::GuardedExecutor(const strata_ops::OperationRegistry& registry,
                                 strata_model::ResourceHandle& resource,
                                 std::shared_ptr<strata_model::FailurePolicy> policy)
    : m_registry(&registry)
    , m_resource(&resource)
    , m_policy(policy ? std::move(policy) : strata_model::make_failure_policy(true)) {}

// =============================================================================
// safe_execute
// =============================================================================

SafeExecuteResult GuardedExecutor::safe_execute(const strata_ops::Operation& operation,
                                                const std::string& display_name) const
{
    SafeExecuteResult out;
    const std::string name = display_name.empty() ? operation.name : display_name;

    if (operation.name.empty()) {
        out.result = strata_ops::OperationResult::failed(strata_ops::ErrorKind::Validation,
            "method name required");
        out.message = out.result.error_message;
        return out;
    }

    auto scope = strata_model::Scope::open(*m_resource, name, strata_model::ScopeKind::Group, m_policy);
    if (!scope) {
        out.result = strata_ops::OperationResult::from_error(scope.error());
        out.message = "Cannot start '" + name + "': " + scope.error().message();
        return out;
    }

    strata_ops::ExecutionContext ctx(*m_resource, false, m_policy);
    out.result = m_registry->invoke(ctx, operation);

    if (out.result.success) {
        auto committed = scope->commit();
        if (committed) {
            out.message = "'" + name + "' completed successfully";
            return out;
        }
        revert(*scope);
        out.result = strata_ops::OperationResult::from_error(committed.error());
        out.was_rolled_back = true;
        out.message = "'" + name + "' could not be committed and was rolled back";
        strata_core::tx_logger()->warn("{}: {}", out.message, committed.error().message());
        return out;
    }

    out.was_rolled_back = revert(*scope);
    out.message = out.result.error_kind == strata_ops::ErrorKind::Exception
        ? "'" + name + "' threw exception and was rolled back"
        : "'" + name + "' failed and was rolled back";
    strata_core::tx_logger()->warn("{}: {}", out.message, out.result.error_message);
    return out;
}

// =============================================================================
// verify_and_rollback
// =============================================================================

VerifyResult GuardedExecutor::verify_and_rollback(const strata_ops::Operation& main,
                                                  const strata_ops::Operation& verify,
                                                  const std::string& display_name) const
{
    VerifyResult out;
    const std::string name = display_name.empty() ? main.name : display_name;

    if (main.name.empty() || verify.name.empty()) {
        out.main_result = strata_ops::OperationResult::failed(strata_ops::ErrorKind::Validation,
            "Both method and verifyMethod are required");
        out.message = out.main_result.error_message;
        return out;
    }

    auto scope = strata_model::Scope::open(*m_resource, name, strata_model::ScopeKind::Group, m_policy);
    if (!scope) {
        out.main_result = strata_ops::OperationResult::from_error(scope.error());
        out.message = "Cannot start '" + name + "': " + scope.error().message();
        return out;
    }

    strata_ops::ExecutionContext ctx(*m_resource, false, m_policy);

    out.main_result = m_registry->invoke(ctx, main);
    if (!out.main_result.success) {
        out.phase = VerifyPhase::Execution;
        out.was_rolled_back = revert(*scope);
        out.message = "Main operation failed, rolled back";
        strata_core::tx_logger()->warn("'{}': {}", name, out.main_result.error_message);
        return out;
    }

    out.verify_result = m_registry->invoke(ctx, verify);
    if (!out.verify_result->success) {
        out.phase = VerifyPhase::Verification;
        out.was_rolled_back = revert(*scope);
        out.message = "Verification failed, changes rolled back";
        strata_core::tx_logger()->warn("'{}' verification failed: {}",
            name, out.verify_result->error_message);
        return out;
    }

    out.phase = VerifyPhase::Complete;
    auto committed = scope->commit();
    if (!committed) {
        revert(*scope);
        out.was_rolled_back = true;
        out.message = "Commit refused, changes rolled back: " + committed.error().message();
        strata_core::tx_logger()->warn("'{}': {}", name, out.message);
        return out;
    }

    out.success = true;
    out.message = "Operation and verification both succeeded";
    return out;
}

} // namespace strata_tx
