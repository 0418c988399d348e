/// @file batch.cpp
/// @brief Batch executor implementation

#include <strata/tx/batch.hpp>
#include <strata/model/scope.hpp>
#include <strata/model/failure.hpp>
#include <strata/core/log.hpp>

namespace strata_tx {

namespace {

void append_id(std::vector<strata_model::ElementId>& out, const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        out.push_back(value.get<strata_model::ElementId>());
    } else if (value.is_number_integer() && value.get<std::int64_t>() > 0) {
        out.push_back(static_cast<strata_model::ElementId>(value.get<std::int64_t>()));
    }
}

/// Roll back a step scope that is still open
void revert_step(strata_model::Scope& step, const std::string& batch_name) {
    if (!step.is_open()) {
        return;
    }
    auto reverted = step.rollback();
    if (!reverted) {
        strata_core::tx_logger()->error("Batch '{}': rollback of step '{}' failed: {}",
            batch_name, step.name(), reverted.error().message());
    }
}

BatchResult fail_batch(BatchResult result, strata_ops::ErrorKind kind, std::string message) {
    result.error_kind = kind;
    result.message = std::move(message);
    return result;
}

} // anonymous namespace

strata_ops::OperationResult BatchExecutor::run_step(
    strata_ops::ExecutionContext& ctx,
    const strata_ops::Operation& op,
    const std::string& batch_name,
    const std::shared_ptr<strata_model::FailurePolicy>& failure_policy) const
{
    auto step = strata_model::Scope::open(*m_resource, op.name,
        strata_model::ScopeKind::Transaction, failure_policy);
    if (!step) {
        return strata_ops::OperationResult::from_error(step.error());
    }

    auto outcome = m_registry->invoke(ctx, op);
    if (!outcome.success) {
        revert_step(*step, batch_name);
        return outcome;
    }

    auto kept = step->commit();
    if (!kept) {
        revert_step(*step, batch_name);
        return strata_ops::OperationResult::from_error(kept.error());
    }
    return outcome;
}

std::vector<strata_model::ElementId> collect_created_ids(const nlohmann::json& payload) {
    std::vector<strata_model::ElementId> ids;
    if (!payload.is_object()) {
        return ids;
    }

    if (auto it = payload.find("elementId"); it != payload.end()) {
        append_id(ids, *it);
    }
    if (auto it = payload.find("createdIds"); it != payload.end() && it->is_array()) {
        for (const auto& id : *it) {
            append_id(ids, id);
        }
    }
    return ids;
}

BatchResult BatchExecutor::run(const std::string& batch_name,
                               const std::vector<strata_ops::Operation>& operations,
                               const BatchPolicy& policy) const
{
    BatchResult result;
    result.batch_name = batch_name.empty() ? k_default_batch_name : batch_name;
    result.total = operations.size();
    result.partial_allowed = policy.allow_partial_success;

    if (operations.empty()) {
        return fail_batch(std::move(result), strata_ops::ErrorKind::Validation,
            "No operations provided. 'operations' array is required.");
    }

    strata_core::LogScope trace("batch " + result.batch_name);

    auto failure_policy = strata_model::make_failure_policy(policy.continue_on_warning);
    auto scope = strata_model::Scope::open(*m_resource, result.batch_name,
        strata_model::ScopeKind::Transaction, failure_policy);
    if (!scope) {
        strata_core::tx_logger()->warn("Batch '{}' not started: {}",
            result.batch_name, scope.error().message());
        return fail_batch(std::move(result), strata_ops::ErrorKind::Resource,
            "Cannot start batch '" + result.batch_name + "': " + scope.error().message());
    }

    strata_core::tx_logger()->info("Batch '{}': {} operations (stopOnError={}, continueOnWarning={})",
        result.batch_name, operations.size(), policy.stop_on_error, policy.continue_on_warning);

    strata_ops::ExecutionContext ctx(*m_resource, true, failure_policy);

    for (std::size_t i = 0; i < operations.size(); ++i) {
        const auto& op = operations[i];

        BatchEntry entry;
        entry.index = i;
        entry.name = op.name.empty() ? "(empty)" : op.name;
        if (op.name.empty()) {
            entry.result = strata_ops::OperationResult::failed(strata_ops::ErrorKind::Validation,
                "Method name required");
        } else {
            entry.result = run_step(ctx, op, result.batch_name, failure_policy);
        }

        if (entry.result.success) {
            ++result.succeeded;
            auto ids = collect_created_ids(entry.result.payload);
            result.created_ids.insert(result.created_ids.end(), ids.begin(), ids.end());
            result.entries.push_back(std::move(entry));
            continue;
        }

        ++result.failed;
        strata_core::tx_logger()->warn("Batch '{}': operation {} ({}) failed: {}",
            result.batch_name, i, entry.name, entry.result.error_message);

        std::string message = "Operation " + std::to_string(i) + " (" + entry.name + ") failed: "
            + entry.result.error_message + ". Transaction rolled back.";
        auto kind = entry.result.error_kind;
        result.entries.push_back(std::move(entry));

        if (policy.stop_on_error) {
            auto reverted = scope->rollback();
            if (!reverted) {
                strata_core::tx_logger()->error("Batch '{}' rollback failed: {}",
                    result.batch_name, reverted.error().message());
            }
            result.rolled_back = true;
            result.created_ids.clear();
            return fail_batch(std::move(result), kind, std::move(message));
        }
    }

    auto committed = scope->commit();
    if (!committed) {
        if (scope->is_open()) {
            auto reverted = scope->rollback();
            if (!reverted) {
                strata_core::tx_logger()->error("Batch '{}' rollback failed: {}",
                    result.batch_name, reverted.error().message());
            }
        }
        result.rolled_back = true;
        result.created_ids.clear();
        return fail_batch(std::move(result), strata_ops::ErrorKind::Resource,
            "Batch '" + result.batch_name + "' could not be committed: " + committed.error().message()
            + ". Transaction rolled back.");
    }

    result.committed = true;
    if (result.failed == 0) {
        result.message = "Batch '" + result.batch_name + "' completed successfully";
    } else {
        result.message = "Batch had " + std::to_string(result.failed) + " failures";
        // First failure decides the kind
        for (const auto& entry : result.entries) {
            if (!entry.result.success) {
                result.error_kind = entry.result.error_kind;
                break;
            }
        }
    }

    strata_core::log_structured(spdlog::level::info, "strata_tx", "Batch committed", {
        {"batch", result.batch_name},
        {"succeeded", std::to_string(result.succeeded)},
        {"failed", std::to_string(result.failed)},
        {"created", std::to_string(result.created_ids.size())},
    });
    return result;
}

} // namespace strata_tx
