/// @file scope.cpp
/// @brief RAII scope guard implementation

#include <strata/model/scope.hpp>
#include <strata/core/log.hpp>

namespace strata_model {

bool is_commit_refused(const strata_core::Error& error) {
    const auto* scope_error = error.as<strata_core::ScopeError>();
    return scope_error && scope_error->kind == strata_core::ScopeError::Kind::CommitRefused;
}

strata_core::Result<Scope> Scope::open(
    ResourceHandle& resource,
    const std::string& name,
    ScopeKind kind,
    std::shared_ptr<FailurePolicy> policy)
{
    auto token = resource.begin_scope(name, kind);
    if (!token) {
        return strata_core::Err<Scope>(token.error());
    }

    Scope scope(&resource, *token, name, kind);

    if (policy) {
        auto attached = resource.attach_failure_policy(*token, std::move(policy));
        if (!attached) {
            // Revert here so the attach error is the one returned
            auto reverted = scope.rollback();
            if (!reverted) {
                strata_core::tx_logger()->error("Cannot revert scope '{}': {}",
                                                name, reverted.error().message());
            }
            return strata_core::Err<Scope>(attached.error());
        }
    }

    strata_core::tx_logger()->debug("Opened {} '{}'", scope_kind_name(kind), name);
    return strata_core::Ok(std::move(scope));
}

Scope Scope::inactive(const std::string& name) {
    return Scope(nullptr, ScopeToken{}, name, ScopeKind::Transaction);
}

Scope::Scope(ResourceHandle* resource, ScopeToken token, std::string name, ScopeKind kind)
    : m_resource(resource)
    , m_token(token)
    , m_name(std::move(name))
    , m_kind(kind)
    , m_open(resource != nullptr) {}

Scope::Scope(Scope&& other) noexcept
    : m_resource(other.m_resource)
    , m_token(other.m_token)
    , m_name(std::move(other.m_name))
    , m_kind(other.m_kind)
    , m_open(other.m_open)
{
    other.m_open = false;
}

Scope::~Scope() {
    if (!m_open) {
        return;
    }

    strata_core::tx_logger()->warn("{} '{}' left open, rolling back",
                                   scope_kind_name(m_kind), m_name);
    auto result = m_resource->rollback(m_token);
    if (!result) {
        strata_core::tx_logger()->error("Rollback of '{}' failed: {}",
                                        m_name, result.error().message());
    }
    m_open = false;
}

strata_core::Result<void> Scope::commit() {
    if (!m_resource) {
        return strata_core::Ok();
    }
    if (!m_open) {
        return strata_core::Err(strata_core::ScopeError::not_open(m_name));
    }

    auto result = m_resource->commit(m_token);
    if (result) {
        m_open = false;
        strata_core::tx_logger()->debug("Committed {} '{}'", scope_kind_name(m_kind), m_name);
    } else if (is_commit_refused(result.error())) {
        // The resource reverted and closed the scope itself
        m_open = false;
    }
    return result;
}

strata_core::Result<void> Scope::rollback() {
    if (!m_resource) {
        return strata_core::Ok();
    }
    if (!m_open) {
        return strata_core::Err(strata_core::ScopeError::not_open(m_name));
    }

    auto result = m_resource->rollback(m_token);
    if (result) {
        m_open = false;
        strata_core::tx_logger()->debug("Rolled back {} '{}'", scope_kind_name(m_kind), m_name);
    }
    return result;
}

} // namespace strata_model
