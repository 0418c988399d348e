#pragma once

/// @file error.hpp
/// @brief Error handling types for strata_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>

namespace strata_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    ValidationError,
    InvalidState,
    ResourceFailure,
    IOError,
    ParseError,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::ResourceFailure: return "ResourceFailure";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Operation parameter errors
struct ParamError {
    enum class Kind : std::uint8_t {
        Missing,       // Required parameter absent or null
        InvalidType,   // Parameter present with the wrong JSON type
        InvalidValue,  // Parameter has the right type but an unusable value
    };

    Kind kind;
    std::string message;
    std::string param;
    std::string expected;  // For InvalidType

    [[nodiscard]] static ParamError missing(const std::string& name) {
        return ParamError{Kind::Missing, "Missing required parameter: " + name, name, {}};
    }

    [[nodiscard]] static ParamError invalid_type(const std::string& name, const std::string& type) {
        return ParamError{Kind::InvalidType,
            "Parameter '" + name + "' must be " + type, name, type};
    }

    [[nodiscard]] static ParamError invalid_value(const std::string& name, const std::string& reason) {
        return ParamError{Kind::InvalidValue,
            "Parameter '" + name + "' is invalid: " + reason, name, {}};
    }
};

/// Transaction group state machine errors
struct GroupError {
    enum class Kind : std::uint8_t {
        AlreadyActive,   // start() while a group is Active
        NoActiveGroup,   // commit/rollback/checkpoint while Inactive
        Terminated,      // transition requested on a Committed/RolledBack group
    };

    Kind kind;
    std::string message;
    std::string group_name;

    [[nodiscard]] static GroupError already_active(const std::string& active) {
        return GroupError{Kind::AlreadyActive, "A transaction group is already active", active};
    }

    [[nodiscard]] static GroupError no_active_group() {
        return GroupError{Kind::NoActiveGroup, "No active transaction group", {}};
    }

    [[nodiscard]] static GroupError terminated(const std::string& name, const char* state) {
        return GroupError{Kind::Terminated,
            "Transaction group '" + name + "' is already " + state, name};
    }
};

/// Resource scope errors
struct ScopeError {
    enum class Kind : std::uint8_t {
        BeginFailed,       // Resource refused to open the scope
        NotOpen,           // Token does not name an open scope
        OutOfOrder,        // Token is not the innermost open scope
        CommitRefused,     // Failure policy rejected the pending failures
        OutsideScope,      // Mutation attempted with no open scope
    };

    Kind kind;
    std::string message;
    std::string scope_name;

    [[nodiscard]] static ScopeError begin_failed(const std::string& name, const std::string& reason) {
        return ScopeError{Kind::BeginFailed,
            "Cannot open scope '" + name + "': " + reason, name};
    }

    [[nodiscard]] static ScopeError not_open(const std::string& name) {
        return ScopeError{Kind::NotOpen, "Scope is not open: " + name, name};
    }

    [[nodiscard]] static ScopeError out_of_order(const std::string& name, const std::string& innermost) {
        return ScopeError{Kind::OutOfOrder,
            "Scope '" + name + "' closed while '" + innermost + "' is still open", name};
    }

    [[nodiscard]] static ScopeError commit_refused(const std::string& name, const std::string& reason) {
        return ScopeError{Kind::CommitRefused,
            "Commit of '" + name + "' refused: " + reason, name};
    }

    [[nodiscard]] static ScopeError outside_scope(const std::string& what) {
        return ScopeError{Kind::OutsideScope,
            "Cannot " + what + " outside of a transaction", {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ParamError,
        GroupError,
        ScopeError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ParamError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(GroupError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ScopeError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// Get all context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(ParamError::Kind kind) {
        switch (kind) {
            case ParamError::Kind::Missing: return ErrorCode::ValidationError;
            case ParamError::Kind::InvalidType: return ErrorCode::ValidationError;
            case ParamError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(GroupError::Kind kind) {
        switch (kind) {
            case GroupError::Kind::AlreadyActive: return ErrorCode::InvalidState;
            case GroupError::Kind::NoActiveGroup: return ErrorCode::InvalidState;
            case GroupError::Kind::Terminated: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ScopeError::Kind kind) {
        switch (kind) {
            case ScopeError::Kind::BeginFailed: return ErrorCode::ResourceFailure;
            case ScopeError::Kind::NotOpen: return ErrorCode::InvalidState;
            case ScopeError::Kind::OutOfOrder: return ErrorCode::InvalidState;
            case ScopeError::Kind::CommitRefused: return ErrorCode::ResourceFailure;
            case ScopeError::Kind::OutsideScope: return ErrorCode::ResourceFailure;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code and context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace strata_core
