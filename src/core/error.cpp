/// @file error.cpp
/// @brief Error handling implementation for strata_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics used by the bridge status output

#include <strata/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace strata_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_param_error(const ParamError& err) {
    std::ostringstream oss;
    oss << "[ParamError] " << err.message;
    if (!err.expected.empty()) {
        oss << " (expected: " << err.expected << ")";
    }
    return oss.str();
}

std::string format_group_error(const GroupError& err) {
    std::ostringstream oss;
    oss << "[GroupError] " << err.message;
    if (!err.group_name.empty()) {
        oss << " (group: " << err.group_name << ")";
    }
    return oss.str();
}

std::string format_scope_error(const ScopeError& err) {
    std::ostringstream oss;
    oss << "[ScopeError] " << err.message;
    if (!err.scope_name.empty()) {
        oss << " (scope: " << err.scope_name << ")";
    }
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ParamError>) {
            oss << detail::format_param_error(err);
        } else if constexpr (std::is_same_v<T, GroupError>) {
            oss << detail::format_group_error(err);
        } else if constexpr (std::is_same_v<T, ScopeError>) {
            oss << detail::format_scope_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " {" << key << "=" << value << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::int64_t, Error>;
template class Result<double, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> param_errors{0};
    std::atomic<std::uint64_t> group_errors{0};
    std::atomic<std::uint64_t> scope_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ParamError>()) {
        s_error_stats.param_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<GroupError>()) {
        s_error_stats.group_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ScopeError>()) {
        s_error_stats.scope_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.param_errors.store(0, std::memory_order_relaxed);
    s_error_stats.group_errors.store(0, std::memory_order_relaxed);
    s_error_stats.scope_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Param: " << s_error_stats.param_errors.load() << "\n"
        << "  Group: " << s_error_stats.group_errors.load() << "\n"
        << "  Scope: " << s_error_stats.scope_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace strata_core
