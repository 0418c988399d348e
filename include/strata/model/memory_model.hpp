#pragma once

/// @file memory_model.hpp
/// @brief In-memory document implementing the ResourceHandle contract
///
/// MemoryModel is the reference host used by the CLI and the tests. It keeps
/// a flat set of elements and supports nested scopes by snapshotting the
/// element table when a scope opens. Rolling a scope back restores its
/// snapshot, so an inner rollback only reverts the inner scope's changes.

#include "fwd.hpp"
#include "resource.hpp"
#include "failure.hpp"
#include <strata/core/error.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata_model {

// =============================================================================
// Element
// =============================================================================

/// A single model element
struct Element {
    ElementId id = 0;
    std::string category;
    std::string name;
    nlohmann::json parameters = nlohmann::json::object();

    bool operator==(const Element& other) const = default;
};

// =============================================================================
// MemoryModel
// =============================================================================

/// In-memory document with nested scopes and an undo stack
class MemoryModel final : public ResourceHandle {
public:
    explicit MemoryModel(std::string title = "Untitled");

    // -------------------------------------------------------------------------
    // ResourceHandle
    // -------------------------------------------------------------------------

    [[nodiscard]] std::string title() const override { return m_title; }

    [[nodiscard]] strata_core::Result<ScopeToken> begin_scope(
        const std::string& name, ScopeKind kind) override;

    [[nodiscard]] strata_core::Result<void> commit(ScopeToken token) override;
    [[nodiscard]] strata_core::Result<void> rollback(ScopeToken token) override;

    [[nodiscard]] strata_core::Result<void> attach_failure_policy(
        ScopeToken token, std::shared_ptr<FailurePolicy> policy) override;

    [[nodiscard]] std::size_t open_scope_count() const override { return m_scopes.size(); }
    [[nodiscard]] std::vector<std::string> undo_stack() const override { return m_undo; }

    // -------------------------------------------------------------------------
    // Mutations (require an open transaction)
    // -------------------------------------------------------------------------

    /// Create an element. A name already used in the category raises a warning.
    [[nodiscard]] strata_core::Result<ElementId> create_element(
        const std::string& category,
        const std::string& name,
        nlohmann::json parameters = nlohmann::json::object());

    /// Delete an element
    [[nodiscard]] strata_core::Result<void> delete_element(ElementId id);

    /// Set a single parameter value
    [[nodiscard]] strata_core::Result<void> set_parameter(
        ElementId id, const std::string& key, nlohmann::json value);

    /// Raise a failure message inside the current transaction
    [[nodiscard]] strata_core::Result<void> post_failure(FailureMessage message);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    /// Find an element (nullptr if absent)
    [[nodiscard]] const Element* find(ElementId id) const;

    [[nodiscard]] std::size_t element_count() const noexcept { return m_elements.size(); }
    [[nodiscard]] std::size_t count_in_category(const std::string& category) const;

    /// All elements ordered by id
    [[nodiscard]] std::vector<Element> elements() const;

    /// Failures raised and not yet processed by a commit
    [[nodiscard]] std::size_t pending_failure_count() const noexcept { return m_pending.size(); }

    // -------------------------------------------------------------------------
    // Fault injection
    // -------------------------------------------------------------------------

    /// Make the next begin_scope call fail with the given reason
    void fail_next_begin(std::string reason) { m_fail_next_begin = std::move(reason); }

private:
    struct OpenScope {
        ScopeToken token;
        std::string name;
        ScopeKind kind = ScopeKind::Transaction;
        std::shared_ptr<FailurePolicy> policy;

        // State captured when the scope opened
        std::map<ElementId, Element> elements;
        ElementId next_id = 1;
        std::size_t pending_depth = 0;
        std::size_t undo_depth = 0;
    };

    [[nodiscard]] strata_core::Result<void> require_transaction(const char* what) const;
    [[nodiscard]] strata_core::Result<void> require_innermost(ScopeToken token) const;
    [[nodiscard]] bool name_in_use(const std::string& category, const std::string& name) const;

    void restore(const OpenScope& scope);

    std::string m_title;
    std::map<ElementId, Element> m_elements;
    ElementId m_next_id = 1;
    std::uint64_t m_next_token = 1;

    std::vector<OpenScope> m_scopes;
    std::vector<FailureMessage> m_pending;
    std::vector<std::string> m_undo;
    std::optional<std::string> m_fail_next_begin;
};

} // namespace strata_model
