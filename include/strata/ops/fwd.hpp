#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_ops module

#include <cstdint>

namespace strata_ops {

// =============================================================================
// Values
// =============================================================================

enum class ErrorKind : std::uint8_t;
struct Operation;
struct OperationResult;
class ParamReader;

// =============================================================================
// Registry
// =============================================================================

struct OperationInfo;
struct OperationEntry;
struct RegistrationConflict;
class ExecutionContext;
class OperationRegistry;

} // namespace strata_ops
