#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for strata_core module

#include <cstdint>

namespace strata_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ParamError;
struct GroupError;
struct ScopeError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace strata_core
