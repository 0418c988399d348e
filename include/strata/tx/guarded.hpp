#pragma once

/// @file guarded.hpp
/// @brief Single operations wrapped in a group that is rolled back on failure

#include "fwd.hpp"
#include <strata/ops/operation.hpp>
#include <strata/ops/registry.hpp>
#include <strata/model/resource.hpp>
#include <strata/model/failure.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace strata_tx {

// =============================================================================
// Results
// =============================================================================

/// Outcome of safe_execute
struct SafeExecuteResult {
    strata_ops::OperationResult result;
    bool was_rolled_back = false;
    std::string message;

    [[nodiscard]] bool success() const noexcept { return result.success && !was_rolled_back; }
};

/// Phase at which verify_and_rollback stopped
enum class VerifyPhase : std::uint8_t {
    Execution = 0,
    Verification,
    Complete
};

[[nodiscard]] inline const char* verify_phase_name(VerifyPhase phase) noexcept {
    switch (phase) {
        case VerifyPhase::Execution: return "execution";
        case VerifyPhase::Verification: return "verification";
        case VerifyPhase::Complete: return "complete";
        default: return "unknown";
    }
}

/// Outcome of verify_and_rollback
struct VerifyResult {
    VerifyPhase phase = VerifyPhase::Execution;
    strata_ops::OperationResult main_result;
    std::optional<strata_ops::OperationResult> verify_result;
    bool was_rolled_back = false;
    bool success = false;
    std::string message;
};

// =============================================================================
// GuardedExecutor
// =============================================================================

/// Runs standalone operations inside a private group scope.
///
/// Handlers are invoked unmanaged and open their own transactions inside the
/// group; the group is assimilated on success and rolled back otherwise.
class GuardedExecutor {
public:
    GuardedExecutor(const strata_ops::OperationRegistry& registry,
                    strata_model::ResourceHandle& resource,
                    std::shared_ptr<strata_model::FailurePolicy> policy = nullptr);

    /// Commit on success, roll back on failure or exception
    [[nodiscard]] SafeExecuteResult safe_execute(const strata_ops::Operation& operation,
                                                 const std::string& display_name = {}) const;

    /// Commit only if the verification operation succeeds afterwards
    [[nodiscard]] VerifyResult verify_and_rollback(const strata_ops::Operation& main,
                                                   const strata_ops::Operation& verify,
                                                   const std::string& display_name = {}) const;

private:
    const strata_ops::OperationRegistry* m_registry;
    strata_model::ResourceHandle* m_resource;
    std::shared_ptr<strata_model::FailurePolicy> m_policy;
};

} // namespace strata_tx
