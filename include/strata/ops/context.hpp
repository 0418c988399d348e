#pragma once

/// @file context.hpp
/// @brief What an operation handler sees of the world

#include "fwd.hpp"
#include <strata/core/error.hpp>
#include <strata/model/resource.hpp>
#include <strata/model/scope.hpp>
#include <strata/model/failure.hpp>

#include <memory>
#include <string>

namespace strata_ops {

// =============================================================================
// ExecutionContext
// =============================================================================

/// Borrowed resource plus the scope arrangement a handler runs under.
///
/// When the batch executor already holds a transaction for the whole batch the
/// context is managed and ensure_scope() hands back an inactive guard. A
/// handler invoked standalone gets a real transaction that carries the
/// context's failure policy.
class ExecutionContext {
public:
    ExecutionContext(strata_model::ResourceHandle& resource,
                     bool managed_scope,
                     std::shared_ptr<strata_model::FailurePolicy> policy = nullptr);

    [[nodiscard]] strata_model::ResourceHandle& resource() const noexcept { return *m_resource; }

    /// Downcast the resource to a concrete model (nullptr on mismatch)
    template<typename T>
    [[nodiscard]] T* resource_as() const noexcept {
        return dynamic_cast<T*>(m_resource);
    }

    [[nodiscard]] bool in_managed_scope() const noexcept { return m_managed_scope; }

    [[nodiscard]] const std::shared_ptr<strata_model::FailurePolicy>& policy() const noexcept {
        return m_policy;
    }

    /// Scope for a handler's mutations
    [[nodiscard]] strata_core::Result<strata_model::Scope> ensure_scope(const std::string& name) const;

private:
    strata_model::ResourceHandle* m_resource;
    bool m_managed_scope;
    std::shared_ptr<strata_model::FailurePolicy> m_policy;
};

} // namespace strata_ops
