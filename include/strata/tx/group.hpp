#pragma once

/// @file group.hpp
/// @brief Transaction groups, checkpoints and the session that owns them
///
/// A transaction group merges every primitive transaction committed while it
/// is active into one undo unit. GroupSession keeps at most one group active
/// and records the checkpoint log a caller uses to follow its progress.

#include "fwd.hpp"
#include <strata/core/error.hpp>
#include <strata/model/resource.hpp>
#include <strata/model/scope.hpp>
#include <strata/model/failure.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata_tx {

// =============================================================================
// GroupState
// =============================================================================

/// Transaction group state
enum class GroupState : std::uint8_t {
    Inactive = 0,   // No group
    Active,         // Started, accepting checkpoints
    Committed,      // Assimilated into one undo unit
    RolledBack      // Everything since start reverted
};

/// Get state name
[[nodiscard]] inline const char* group_state_name(GroupState state) noexcept {
    switch (state) {
        case GroupState::Inactive: return "Inactive";
        case GroupState::Active: return "Active";
        case GroupState::Committed: return "Committed";
        case GroupState::RolledBack: return "RolledBack";
        default: return "Unknown";
    }
}

// =============================================================================
// Checkpoint
// =============================================================================

/// Wall-clock time of day as HH:MM:SS
[[nodiscard]] std::string format_time_of_day(std::chrono::system_clock::time_point when);

/// An entry in a group's checkpoint log
struct Checkpoint {
    std::string label;
    std::chrono::system_clock::time_point timestamp;
    bool timestamped = true;    // Rendered with its time of day

    /// Log line, e.g. "14:03:12 - Walls placed"
    [[nodiscard]] std::string text() const;
};

/// Render a checkpoint log
[[nodiscard]] std::vector<std::string> checkpoint_texts(const std::vector<Checkpoint>& checkpoints);

// =============================================================================
// TransactionGroup
// =============================================================================

/// One-shot group over a resource. Once committed or rolled back every
/// further transition is rejected.
class TransactionGroup {
public:
    /// Open the group scope and record the "Started" checkpoint
    [[nodiscard]] static strata_core::Result<TransactionGroup> start(
        strata_model::ResourceHandle& resource,
        const std::string& name,
        std::shared_ptr<strata_model::FailurePolicy> policy);

    TransactionGroup(TransactionGroup&&) noexcept = default;
    TransactionGroup& operator=(TransactionGroup&&) = delete;
    TransactionGroup(const TransactionGroup&) = delete;
    TransactionGroup& operator=(const TransactionGroup&) = delete;

    /// Append a checkpoint
    [[nodiscard]] strata_core::Result<void> add_checkpoint(const std::string& label);

    /// Assimilate into one undo unit. A refused commit reverts the group and
    /// leaves it RolledBack.
    [[nodiscard]] strata_core::Result<void> commit();

    /// Revert everything since start
    [[nodiscard]] strata_core::Result<void> rollback();

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] GroupState state() const noexcept { return m_state; }
    [[nodiscard]] bool is_active() const noexcept { return m_state == GroupState::Active; }
    [[nodiscard]] const std::vector<Checkpoint>& checkpoints() const noexcept { return m_checkpoints; }

private:
    TransactionGroup(std::string name, strata_model::Scope scope);

    [[nodiscard]] strata_core::Result<void> require_active() const;

    std::string m_name;
    GroupState m_state;
    strata_model::Scope m_scope;
    std::vector<Checkpoint> m_checkpoints;
};

// =============================================================================
// GroupSession
// =============================================================================

/// Outcome of closing the active group
struct GroupOutcome {
    std::string name;
    GroupState state = GroupState::Inactive;
    std::vector<Checkpoint> checkpoints;
};

/// Snapshot of the session
struct GroupStatus {
    bool has_active = false;
    std::string name;
    std::size_t checkpoint_count = 0;
    std::vector<Checkpoint> checkpoints;
};

/// A group that finished during this session
struct GroupRecord {
    std::string name;
    GroupState state = GroupState::Inactive;
    std::size_t checkpoint_count = 0;
    std::chrono::system_clock::time_point finished_at;
};

/// Owns the active group of one resource. Hosts create one session per
/// resource and pass it to whoever needs it.
class GroupSession {
public:
    explicit GroupSession(strata_model::ResourceHandle& resource,
                          std::shared_ptr<strata_model::FailurePolicy> policy = nullptr);

    GroupSession(const GroupSession&) = delete;
    GroupSession& operator=(const GroupSession&) = delete;

    /// Start a group; an empty name becomes "AI Operation HH:MM:SS"
    [[nodiscard]] strata_core::Result<std::string> start(const std::string& name);

    /// Add a checkpoint; an empty label becomes "Checkpoint <n>"
    [[nodiscard]] strata_core::Result<Checkpoint> checkpoint(const std::string& label);

    [[nodiscard]] strata_core::Result<GroupOutcome> commit();
    [[nodiscard]] strata_core::Result<GroupOutcome> rollback();

    [[nodiscard]] GroupStatus status() const;

    [[nodiscard]] bool has_active() const noexcept { return m_active.has_value(); }

    /// Groups finished in this session, oldest first
    [[nodiscard]] const std::vector<GroupRecord>& history() const noexcept { return m_history; }

    [[nodiscard]] strata_model::ResourceHandle& resource() const noexcept { return *m_resource; }

private:
    [[nodiscard]] strata_core::Result<GroupOutcome> finish(bool commit);

    strata_model::ResourceHandle* m_resource;
    std::shared_ptr<strata_model::FailurePolicy> m_policy;
    std::optional<TransactionGroup> m_active;
    std::vector<GroupRecord> m_history;
};

} // namespace strata_tx
