#pragma once

/// @file resource.hpp
/// @brief Contract of the external model the engine mutates
///
/// The host supplies a ResourceHandle for its live document. The engine never
/// constructs one and only borrows it for the duration of a call. Scopes nest
/// and must be closed innermost first.

#include "fwd.hpp"
#include <strata/core/error.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace strata_model {

// =============================================================================
// ScopeKind
// =============================================================================

/// Kind of scope opened on the resource
enum class ScopeKind : std::uint8_t {
    Transaction = 0,   // Primitive transaction; mutations require one
    Group              // Merges the transactions committed inside it into one undo unit
};

[[nodiscard]] inline const char* scope_kind_name(ScopeKind kind) noexcept {
    switch (kind) {
        case ScopeKind::Transaction: return "Transaction";
        case ScopeKind::Group: return "Group";
        default: return "Unknown";
    }
}

// =============================================================================
// ScopeToken
// =============================================================================

/// Opaque identifier of an open scope
struct ScopeToken {
    std::uint64_t value = 0;

    constexpr ScopeToken() noexcept = default;
    constexpr explicit ScopeToken(std::uint64_t v) noexcept : value(v) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return value != 0;
    }

    constexpr bool operator==(const ScopeToken& other) const noexcept = default;
};

// =============================================================================
// ResourceHandle
// =============================================================================

/// A live external model that supports nested commit/rollback scopes
class ResourceHandle {
public:
    virtual ~ResourceHandle() = default;

    /// Document title, for logging and responses
    [[nodiscard]] virtual std::string title() const = 0;

    /// Open a scope on top of the currently open ones
    [[nodiscard]] virtual strata_core::Result<ScopeToken> begin_scope(
        const std::string& name, ScopeKind kind) = 0;

    /// Commit the innermost scope; pending failures go through its policy.
    /// When the policy refuses, the scope is reverted and closed and
    /// ScopeError::CommitRefused is returned. Other errors leave it open.
    [[nodiscard]] virtual strata_core::Result<void> commit(ScopeToken token) = 0;

    /// Revert every change made since the scope was opened
    [[nodiscard]] virtual strata_core::Result<void> rollback(ScopeToken token) = 0;

    /// Attach the policy that classifies failures raised inside the scope
    [[nodiscard]] virtual strata_core::Result<void> attach_failure_policy(
        ScopeToken token, std::shared_ptr<FailurePolicy> policy) = 0;

    /// Number of scopes currently open
    [[nodiscard]] virtual std::size_t open_scope_count() const = 0;

    /// Names of the committed undo units, oldest first
    [[nodiscard]] virtual std::vector<std::string> undo_stack() const = 0;
};

} // namespace strata_model
