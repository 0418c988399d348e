#pragma once

/// @file batch.hpp
/// @brief Ordered execution of operations inside one transaction

#include "fwd.hpp"
#include <strata/ops/operation.hpp>
#include <strata/ops/registry.hpp>
#include <strata/model/resource.hpp>
#include <strata/model/fwd.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace strata_tx {

/// Default scope name of a batch
inline constexpr const char* k_default_batch_name = "Batch Operation";

// =============================================================================
// BatchPolicy
// =============================================================================

/// How a batch reacts to failures
struct BatchPolicy {
    bool stop_on_error = true;          // Roll back and stop at the first failure
    bool continue_on_warning = true;    // Suppress model warnings at commit
    bool allow_partial_success = false; // Committed batch with failures still succeeds
};

// =============================================================================
// BatchResult
// =============================================================================

/// Result of one operation inside a batch
struct BatchEntry {
    std::size_t index = 0;
    std::string name;
    strata_ops::OperationResult result;
};

/// Result of a whole batch
struct BatchResult {
    std::string batch_name;
    std::vector<BatchEntry> entries;
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    bool rolled_back = false;
    bool committed = false;
    bool partial_allowed = false;
    std::string message;
    std::vector<strata_model::ElementId> created_ids;
    strata_ops::ErrorKind error_kind = strata_ops::ErrorKind::None;

    /// Committed with no failures, or with failures when partial success is allowed
    [[nodiscard]] bool success() const noexcept {
        return committed && (failed == 0 || partial_allowed);
    }
};

// =============================================================================
// BatchExecutor
// =============================================================================

/// Runs operations strictly in order inside one private transaction.
///
/// Handlers see a managed context and do not open transactions of their own.
/// Each operation runs in a nested step transaction: a failed step is rolled
/// back on its own, including faults and refused step commits. With
/// stop_on_error the first failure rolls everything back; otherwise the
/// successful operations are committed together at the end.
class BatchExecutor {
public:
    BatchExecutor(const strata_ops::OperationRegistry& registry,
                  strata_model::ResourceHandle& resource)
        : m_registry(&registry), m_resource(&resource) {}

    [[nodiscard]] BatchResult run(const std::string& batch_name,
                                  const std::vector<strata_ops::Operation>& operations,
                                  const BatchPolicy& policy = {}) const;

private:
    /// Invoke one operation inside its own step transaction
    [[nodiscard]] strata_ops::OperationResult run_step(
        strata_ops::ExecutionContext& ctx,
        const strata_ops::Operation& op,
        const std::string& batch_name,
        const std::shared_ptr<strata_model::FailurePolicy>& failure_policy) const;

    const strata_ops::OperationRegistry* m_registry;
    strata_model::ResourceHandle* m_resource;
};

/// Element ids a successful operation reports (elementId, createdIds)
[[nodiscard]] std::vector<strata_model::ElementId> collect_created_ids(const nlohmann::json& payload);

} // namespace strata_tx
