#pragma once

/// @file scope.hpp
/// @brief RAII guard over a ResourceHandle scope

#include "fwd.hpp"
#include "resource.hpp"
#include "failure.hpp"
#include <strata/core/error.hpp>
#include <memory>
#include <string>

namespace strata_model {

// =============================================================================
// Scope
// =============================================================================

/// Owns one open scope on a resource.
///
/// A scope that is still open when the guard is destroyed is rolled back, so
/// an early return or an exception can never leave a half-applied change
/// behind. An inactive guard owns nothing; commit and rollback on it succeed
/// without touching the resource.
class Scope {
public:
    /// Open a scope and attach the failure policy
    [[nodiscard]] static strata_core::Result<Scope> open(
        ResourceHandle& resource,
        const std::string& name,
        ScopeKind kind,
        std::shared_ptr<FailurePolicy> policy);

    /// A guard that owns no scope
    [[nodiscard]] static Scope inactive(const std::string& name = {});

    Scope(Scope&& other) noexcept;
    Scope& operator=(Scope&&) = delete;
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    ~Scope();

    /// Commit. A refused commit leaves the guard closed; any other failure
    /// keeps it open so that rollback() or the destructor can still revert.
    [[nodiscard]] strata_core::Result<void> commit();

    /// Roll back
    [[nodiscard]] strata_core::Result<void> rollback();

    /// Check whether the guard still owns an open scope
    [[nodiscard]] bool is_open() const noexcept { return m_open; }

    /// Check whether the guard ever owned a scope
    [[nodiscard]] bool is_active() const noexcept { return m_resource != nullptr; }

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] ScopeKind kind() const noexcept { return m_kind; }
    [[nodiscard]] ScopeToken token() const noexcept { return m_token; }

private:
    Scope(ResourceHandle* resource, ScopeToken token, std::string name, ScopeKind kind);

    ResourceHandle* m_resource;
    ScopeToken m_token;
    std::string m_name;
    ScopeKind m_kind;
    bool m_open;
};

/// Check whether a commit failed because the failure policy refused it
[[nodiscard]] bool is_commit_refused(const strata_core::Error& error);

} // namespace strata_model
