#pragma once

/// @file test_support.hpp
/// @brief Shared fixtures: a fault-injecting resource and sample operations

#include <strata/model/memory_model.hpp>
#include <strata/ops/registry.hpp>
#include <strata/ops/params.hpp>

#include <stdexcept>
#include <string>

namespace strata_test {

// =============================================================================
// FaultyResource
// =============================================================================

/// MemoryModel that can be told to refuse commits, rollbacks or policies
class FaultyResource final : public strata_model::ResourceHandle {
public:
    strata_model::MemoryModel model{"Faulty"};

    bool fail_commit = false;     // Non-refusal commit error, scope stays open
    bool fail_rollback = false;
    bool fail_attach = false;
    int commit_calls = 0;
    int rollback_calls = 0;

    [[nodiscard]] std::string title() const override { return model.title(); }

    [[nodiscard]] strata_core::Result<strata_model::ScopeToken> begin_scope(
        const std::string& name, strata_model::ScopeKind kind) override
    {
        return model.begin_scope(name, kind);
    }

    [[nodiscard]] strata_core::Result<void> commit(strata_model::ScopeToken token) override {
        ++commit_calls;
        if (fail_commit) {
            return strata_core::Err(strata_core::Error(strata_core::ErrorCode::IOError, "disk full"));
        }
        return model.commit(token);
    }

    [[nodiscard]] strata_core::Result<void> rollback(strata_model::ScopeToken token) override {
        ++rollback_calls;
        if (fail_rollback) {
            return strata_core::Err(strata_core::Error(strata_core::ErrorCode::ResourceFailure, "rollback refused"));
        }
        return model.rollback(token);
    }

    [[nodiscard]] strata_core::Result<void> attach_failure_policy(
        strata_model::ScopeToken token, std::shared_ptr<strata_model::FailurePolicy> policy) override
    {
        if (fail_attach) {
            return strata_core::Err(strata_core::Error(strata_core::ErrorCode::NotSupported, "no policies"));
        }
        return model.attach_failure_policy(token, std::move(policy));
    }

    [[nodiscard]] std::size_t open_scope_count() const override { return model.open_scope_count(); }
    [[nodiscard]] std::vector<std::string> undo_stack() const override { return model.undo_stack(); }
};

// =============================================================================
// Sample Operations
// =============================================================================

/// Creates one "Sample" element named after the operation
inline strata_ops::OperationHandler create_sample(const std::string& name) {
    return [name](strata_ops::ExecutionContext& ctx, const strata_ops::Params&) {
        auto* model = ctx.resource_as<strata_model::MemoryModel>();
        if (!model) {
            return strata_ops::OperationResult::failed(strata_ops::ErrorKind::Resource, "no model");
        }
        auto scope = ctx.ensure_scope(name);
        if (!scope) {
            return strata_ops::OperationResult::from_error(scope.error());
        }
        auto id = model->create_element("Sample", name);
        if (!id) {
            return strata_ops::OperationResult::from_error(id.error());
        }
        auto committed = scope->commit();
        if (!committed) {
            return strata_ops::OperationResult::from_error(committed.error());
        }
        return strata_ops::OperationResult::ok({{"elementId", *id}});
    };
}

/// Registers opA and opC (create a sample element), opB (fails with NotFound),
/// boom (throws) and warn (creates a sample element and raises a warning)
inline void register_sample_operations(strata_ops::OperationRegistry& registry) {
    registry.register_operation({"opA", {}, "Sample", "creates a sample element"}, create_sample("opA"));
    registry.register_operation({"opC", {}, "Sample", "creates a sample element"}, create_sample("opC"));

    registry.register_operation({"opB", {}, "Sample", "always fails"},
        [](strata_ops::ExecutionContext&, const strata_ops::Params&) {
            return strata_ops::OperationResult::failed(strata_ops::ErrorKind::NotFound, "X not found");
        });

    registry.register_operation({"boom", {}, "Sample", "throws"},
        [](strata_ops::ExecutionContext& ctx, const strata_ops::Params&) -> strata_ops::OperationResult {
            auto* model = ctx.resource_as<strata_model::MemoryModel>();
            auto scope = ctx.ensure_scope("boom");
            if (model && scope) {
                auto id = model->create_element("Sample", "boom");
                (void)id;
                auto committed = scope->commit();
                (void)committed;
            }
            throw std::runtime_error("kaboom");
        });

    registry.register_operation({"warn", {}, "Sample", "creates a sample element and raises a warning"},
        [](strata_ops::ExecutionContext& ctx, const strata_ops::Params&) {
            auto* model = ctx.resource_as<strata_model::MemoryModel>();
            if (!model) {
                return strata_ops::OperationResult::failed(strata_ops::ErrorKind::Resource, "no model");
            }
            auto scope = ctx.ensure_scope("warn");
            if (!scope) {
                return strata_ops::OperationResult::from_error(scope.error());
            }
            auto id = model->create_element("Sample", "warn");
            auto posted = model->post_failure(strata_model::FailureMessage::warning("overlap"));
            if (!id || !posted) {
                return strata_ops::OperationResult::failed(strata_ops::ErrorKind::Resource, "sample creation failed");
            }
            auto committed = scope->commit();
            if (!committed) {
                return strata_ops::OperationResult::from_error(committed.error());
            }
            return strata_ops::OperationResult::ok({{"elementId", *id}});
        });
}

} // namespace strata_test
