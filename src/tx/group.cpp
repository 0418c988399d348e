/// @file group.cpp
/// @brief Transaction group and session implementation

#include <strata/tx/group.hpp>
#include <strata/core/log.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace strata_tx {

// =============================================================================
// Checkpoint
// =============================================================================

std::string format_time_of_day(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

std::string Checkpoint::text() const {
    if (!timestamped) {
        return label;
    }
    return format_time_of_day(timestamp) + " - " + label;
}

std::vector<std::string> checkpoint_texts(const std::vector<Checkpoint>& checkpoints) {
    std::vector<std::string> out;
    out.reserve(checkpoints.size());
    for (const auto& cp : checkpoints) {
        out.push_back(cp.text());
    }
    return out;
}

// =============================================================================
// TransactionGroup
// =============================================================================

strata_core::Result<TransactionGroup> TransactionGroup::start(
    strata_model::ResourceHandle& resource,
    const std::string& name,
    std::shared_ptr<strata_model::FailurePolicy> policy)
{
    auto scope = strata_model::Scope::open(resource, name, strata_model::ScopeKind::Group, std::move(policy));
    if (!scope) {
        return strata_core::Err<TransactionGroup>(scope.error());
    }
    return strata_core::Ok(TransactionGroup(name, std::move(*scope)));
}

TransactionGroup::TransactionGroup(std::string name, strata_model::Scope scope)
    : m_name(std::move(name))
    , m_state(GroupState::Active)
    , m_scope(std::move(scope))
{
    Checkpoint started;
    started.label = "Started: " + m_name;
    started.timestamp = std::chrono::system_clock::now();
    started.timestamped = false;
    m_checkpoints.push_back(std::move(started));
}

strata_core::Result<void> TransactionGroup::require_active() const {
    if (m_state != GroupState::Active) {
        const char* state = m_state == GroupState::Committed ? "committed" : "rolled back";
        return strata_core::Err(strata_core::GroupError::terminated(m_name, state));
    }
    return strata_core::Ok();
}

strata_core::Result<void> TransactionGroup::add_checkpoint(const std::string& label) {
    auto active = require_active();
    if (!active) {
        return active;
    }

    Checkpoint cp;
    cp.label = label;
    cp.timestamp = std::chrono::system_clock::now();
    m_checkpoints.push_back(std::move(cp));
    return strata_core::Ok();
}

strata_core::Result<void> TransactionGroup::commit() {
    auto active = require_active();
    if (!active) {
        return active;
    }

    auto result = m_scope.commit();
    if (result) {
        m_state = GroupState::Committed;
        strata_core::tx_logger()->info("Transaction group '{}' committed ({} checkpoints)",
            m_name, m_checkpoints.size());
        return result;
    }

    strata_core::tx_logger()->warn("Transaction group '{}' could not commit: {}",
        m_name, result.error().message());

    if (m_scope.is_open()) {
        auto reverted = m_scope.rollback();
        if (!reverted) {
            strata_core::tx_logger()->error("Transaction group '{}' could not roll back: {}",
                m_name, reverted.error().message());
        }
    }
    m_state = GroupState::RolledBack;
    return result;
}

strata_core::Result<void> TransactionGroup::rollback() {
    auto active = require_active();
    if (!active) {
        return active;
    }

    auto result = m_scope.rollback();
    if (!result) {
        return result;
    }

    m_state = GroupState::RolledBack;
    strata_core::tx_logger()->info("Transaction group '{}' rolled back ({} checkpoints)",
        m_name, m_checkpoints.size());
    return result;
}

// =============================================================================
// GroupSession
// =============================================================================

GroupSession::GroupSession(strata_model::ResourceHandle& resource,
                           std::shared_ptr<strata_model::FailurePolicy> policy)
    : m_resource(&resource)
    , m_policy(policy ? std::move(policy) : strata_model::make_failure_policy(true)) {}

strata_core::Result<std::string> GroupSession::start(const std::string& name) {
    if (m_active) {
        return strata_core::Err<std::string>(strata_core::GroupError::already_active(m_active->name()));
    }

    std::string group_name = name.empty()
        ? "AI Operation " + format_time_of_day(std::chrono::system_clock::now())
        : name;

    auto group = TransactionGroup::start(*m_resource, group_name, m_policy);
    if (!group) {
        return strata_core::Err<std::string>(group.error());
    }
    m_active.emplace(std::move(*group));

    strata_core::tx_logger()->info("Transaction group '{}' started", group_name);
    return strata_core::Ok(group_name);
}

strata_core::Result<Checkpoint> GroupSession::checkpoint(const std::string& label) {
    if (!m_active) {
        return strata_core::Err<Checkpoint>(strata_core::GroupError::no_active_group());
    }

    std::string text = label.empty()
        ? "Checkpoint " + std::to_string(m_active->checkpoints().size())
        : label;

    auto added = m_active->add_checkpoint(text);
    if (!added) {
        return strata_core::Err<Checkpoint>(added.error());
    }

    strata_core::tx_logger()->debug("Checkpoint '{}' in '{}'", text, m_active->name());
    return m_active->checkpoints().back();
}

strata_core::Result<GroupOutcome> GroupSession::commit() {
    return finish(true);
}

strata_core::Result<GroupOutcome> GroupSession::rollback() {
    return finish(false);
}

strata_core::Result<GroupOutcome> GroupSession::finish(bool commit) {
    if (!m_active) {
        return strata_core::Err<GroupOutcome>(strata_core::GroupError::no_active_group());
    }

    auto result = commit ? m_active->commit() : m_active->rollback();

    if (m_active->is_active()) {
        // Resource refused the rollback; the group stays usable
        return strata_core::Err<GroupOutcome>(result.error());
    }

    GroupOutcome outcome;
    outcome.name = m_active->name();
    outcome.state = m_active->state();
    outcome.checkpoints = m_active->checkpoints();

    GroupRecord record;
    record.name = outcome.name;
    record.state = outcome.state;
    record.checkpoint_count = outcome.checkpoints.size();
    record.finished_at = std::chrono::system_clock::now();
    m_history.push_back(std::move(record));

    m_active.reset();

    if (!result) {
        auto error = result.error();
        error.with_context("group", outcome.name);
        return strata_core::Err<GroupOutcome>(std::move(error));
    }
    return outcome;
}

GroupStatus GroupSession::status() const {
    GroupStatus status;
    if (m_active) {
        status.has_active = true;
        status.name = m_active->name();
        status.checkpoints = m_active->checkpoints();
        status.checkpoint_count = status.checkpoints.size();
    }
    return status;
}

} // namespace strata_tx
