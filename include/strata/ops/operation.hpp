#pragma once

/// @file operation.hpp
/// @brief Operation requests and their structured results

#include "fwd.hpp"
#include <strata/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace strata_ops {

/// Operation parameters (always a JSON object)
using Params = nlohmann::json;

// =============================================================================
// ErrorKind
// =============================================================================

/// Failure category of an operation result
enum class ErrorKind : std::uint8_t {
    None = 0,
    Validation,     // Bad or missing parameters
    NotFound,       // Unknown operation or missing target
    State,          // Illegal state transition
    Resource,       // The resource refused a scope or commit
    Exception       // Unexpected fault inside a handler
};

[[nodiscard]] inline const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Validation: return "Validation";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::State: return "State";
        case ErrorKind::Resource: return "Resource";
        case ErrorKind::Exception: return "Exception";
        default: return "Unknown";
    }
}

/// Map a core error onto the operation failure taxonomy
[[nodiscard]] ErrorKind error_kind_of(const strata_core::Error& error) noexcept;

// =============================================================================
// Operation
// =============================================================================

/// A named request with its parameters
struct Operation {
    std::string name;
    Params params = Params::object();

    Operation() = default;
    Operation(std::string n, Params p = Params::object())
        : name(std::move(n))
        , params(p.is_null() ? Params::object() : std::move(p)) {}
};

// =============================================================================
// OperationResult
// =============================================================================

/// Outcome of one operation
struct OperationResult {
    bool success = false;
    nlohmann::json payload;          // Object on success, null otherwise
    std::string error_message;
    ErrorKind error_kind = ErrorKind::None;

    [[nodiscard]] static OperationResult ok(nlohmann::json payload = nlohmann::json::object());

    [[nodiscard]] static OperationResult failed(ErrorKind kind, std::string message);

    [[nodiscard]] static OperationResult from_error(const strata_core::Error& error);

    [[nodiscard]] static OperationResult not_found(const std::string& name);

    [[nodiscard]] static OperationResult exception(const std::string& name, const std::string& what);

    /// Response shape: success flag, payload fields and error
    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace strata_ops
