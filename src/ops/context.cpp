/// @file context.cpp
/// @brief ExecutionContext implementation

#include <strata/ops/context.hpp>

namespace strata_ops {

ExecutionContext::ExecutionContext(strata_model::ResourceHandle& resource,
                                   bool managed_scope,
                                   std::shared_ptr<strata_model::FailurePolicy> policy)
    : m_resource(&resource)
    , m_managed_scope(managed_scope)
    , m_policy(policy ? std::move(policy) : strata_model::make_failure_policy(true)) {}

strata_core::Result<strata_model::Scope> ExecutionContext::ensure_scope(const std::string& name) const {
    if (m_managed_scope) {
        return strata_core::Ok(strata_model::Scope::inactive(name));
    }
    return strata_model::Scope::open(*m_resource, name, strata_model::ScopeKind::Transaction, m_policy);
}

} // namespace strata_ops
