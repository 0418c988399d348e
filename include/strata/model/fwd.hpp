#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_model module

#include <cstdint>

namespace strata_model {

// =============================================================================
// Resource Contract
// =============================================================================

enum class ScopeKind : std::uint8_t;
struct ScopeToken;
class ResourceHandle;
class Scope;

// =============================================================================
// Failure Classification
// =============================================================================

enum class FailureSeverity : std::uint8_t;
enum class FailureAction : std::uint8_t;
struct FailureMessage;
struct FailureOutcome;
class FailurePolicy;
class SuppressWarningsPolicy;
class StrictPolicy;

// =============================================================================
// Reference Model
// =============================================================================

using ElementId = std::uint64_t;
struct Element;
class MemoryModel;

} // namespace strata_model
