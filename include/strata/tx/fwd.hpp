#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_tx module

#include <cstdint>

namespace strata_tx {

// =============================================================================
// Transaction Groups
// =============================================================================

enum class GroupState : std::uint8_t;
struct Checkpoint;
class TransactionGroup;
struct GroupOutcome;
struct GroupStatus;
struct GroupRecord;
class GroupSession;

// =============================================================================
// Orchestration
// =============================================================================

struct BatchPolicy;
struct BatchEntry;
struct BatchResult;
class BatchExecutor;

enum class VerifyPhase : std::uint8_t;
struct SafeExecuteResult;
struct VerifyResult;
class GuardedExecutor;

} // namespace strata_tx
