#pragma once

/// @file failure.hpp
/// @brief Classification of warnings and errors raised by the model during a mutation
///
/// The host model reports problems asynchronously: a mutation succeeds but leaves
/// pending failure messages behind, and they are only examined when the
/// enclosing scope commits. A FailurePolicy decides, per message, whether it is
/// suppressed (warnings), resolved (errors with an automatic resolution) or
/// fatal (the commit is refused and the scope rolled back).

#include "fwd.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace strata_model {

// =============================================================================
// FailureMessage
// =============================================================================

/// Severity reported by the model
enum class FailureSeverity : std::uint8_t {
    Warning = 0,
    Error
};

[[nodiscard]] inline const char* failure_severity_name(FailureSeverity severity) noexcept {
    switch (severity) {
        case FailureSeverity::Warning: return "Warning";
        case FailureSeverity::Error: return "Error";
        default: return "Unknown";
    }
}

/// A pending warning or error raised during a mutation
struct FailureMessage {
    FailureSeverity severity = FailureSeverity::Warning;
    std::string description;
    bool resolvable = false;            // Error has an automatic resolution
    std::vector<ElementId> elements;    // Elements the message refers to

    [[nodiscard]] bool is_warning() const noexcept {
        return severity == FailureSeverity::Warning;
    }

    [[nodiscard]] static FailureMessage warning(std::string description) {
        FailureMessage m;
        m.severity = FailureSeverity::Warning;
        m.description = std::move(description);
        return m;
    }

    [[nodiscard]] static FailureMessage error(std::string description, bool resolvable = false) {
        FailureMessage m;
        m.severity = FailureSeverity::Error;
        m.description = std::move(description);
        m.resolvable = resolvable;
        return m;
    }
};

// =============================================================================
// FailureOutcome
// =============================================================================

/// What the model should do after the policy processed the pending messages
enum class FailureAction : std::uint8_t {
    Continue = 0,   // Commit proceeds
    Rollback        // Commit is refused and the scope rolled back
};

/// Result of processing the pending messages of one commit
struct FailureOutcome {
    FailureAction action = FailureAction::Continue;
    std::vector<FailureMessage> suppressed;
    std::vector<FailureMessage> resolved;
    std::vector<FailureMessage> fatal;

    [[nodiscard]] bool should_rollback() const noexcept {
        return action == FailureAction::Rollback;
    }

    [[nodiscard]] std::size_t handled_count() const noexcept {
        return suppressed.size() + resolved.size();
    }

    /// Human readable description of the fatal messages
    [[nodiscard]] std::string summary() const;
};

// =============================================================================
// FailurePolicy
// =============================================================================

/// Classifies pending failure messages at commit time
class FailurePolicy {
public:
    virtual ~FailurePolicy() = default;

    /// Policy name for logging
    [[nodiscard]] virtual const char* name() const noexcept = 0;

    /// Process the messages raised inside one scope
    [[nodiscard]] virtual FailureOutcome process(const std::vector<FailureMessage>& pending) const = 0;
};

/// Deletes warnings, applies automatic resolutions, fails on anything else
class SuppressWarningsPolicy final : public FailurePolicy {
public:
    [[nodiscard]] const char* name() const noexcept override { return "SuppressWarnings"; }
    [[nodiscard]] FailureOutcome process(const std::vector<FailureMessage>& pending) const override;
};

/// Treats warnings as fatal; resolvable errors are still resolved
class StrictPolicy final : public FailurePolicy {
public:
    [[nodiscard]] const char* name() const noexcept override { return "Strict"; }
    [[nodiscard]] FailureOutcome process(const std::vector<FailureMessage>& pending) const override;
};

/// Policy used for the continue-on-warning flag of batches and sessions
[[nodiscard]] std::shared_ptr<FailurePolicy> make_failure_policy(bool continue_on_warning);

} // namespace strata_model
