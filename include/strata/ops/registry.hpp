#pragma once

/// @file registry.hpp
/// @brief Name-based catalog of operation handlers
///
/// The OperationRegistry maps case-insensitive names and aliases to handlers.
/// It is filled once at startup and read-only afterwards. invoke() is the one
/// place where exceptions escaping a handler are turned into results; the
/// batch executor and the guarded wrappers all go through it.

#include "fwd.hpp"
#include "operation.hpp"
#include "context.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata_ops {

/// Handler signature
using OperationHandler = std::function<OperationResult(ExecutionContext&, const Params&)>;

// =============================================================================
// Registry Records
// =============================================================================

/// Discovery metadata of an operation
struct OperationInfo {
    std::string name;
    std::vector<std::string> aliases;
    std::string category = "General";
    std::string description;
};

/// A registered operation
struct OperationEntry {
    OperationInfo info;
    OperationHandler handler;
};

/// A name that was registered twice; the later registration won
struct RegistrationConflict {
    std::string key;           // Lowercased name or alias
    std::string previous;      // Operation that owned the key
    std::string replacement;   // Operation that owns it now
};

// =============================================================================
// OperationRegistry
// =============================================================================

class OperationRegistry {
public:
    OperationRegistry() = default;

    // Non-copyable
    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    /// Register a handler under its name and aliases
    void register_operation(OperationInfo info, OperationHandler handler);

    /// Look up a name or alias (case-insensitive)
    [[nodiscard]] const OperationEntry* resolve(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const {
        return resolve(name) != nullptr;
    }

    /// Run an operation, converting unknown names and escaping exceptions to results
    [[nodiscard]] OperationResult invoke(ExecutionContext& ctx, const Operation& operation) const;

    /// Operations sorted by name, optionally restricted to one category
    [[nodiscard]] std::vector<OperationInfo> list(const std::string& category = {}) const;

    /// Distinct categories, sorted
    [[nodiscard]] std::vector<std::string> categories() const;

    [[nodiscard]] const std::vector<RegistrationConflict>& conflicts() const noexcept {
        return m_conflicts;
    }

    /// Number of live operations
    [[nodiscard]] std::size_t size() const { return list().size(); }

private:
    [[nodiscard]] bool is_live(const std::shared_ptr<OperationEntry>& entry) const;

    std::vector<std::shared_ptr<OperationEntry>> m_entries;
    std::unordered_map<std::string, std::shared_ptr<OperationEntry>> m_index;
    std::vector<RegistrationConflict> m_conflicts;
};

/// Lowercase copy used as registry key
[[nodiscard]] std::string normalize_name(const std::string& name);

} // namespace strata_ops
