#pragma once

/// @file params.hpp
/// @brief Typed reading of operation parameters
///
/// Handlers read their JSON parameters into a typed struct through a
/// ParamReader. The first missing or mistyped parameter is recorded and every
/// later read returns a default value, so a handler can read all fields and
/// check ok() once:
///
/// @code
/// ParamReader reader(params);
/// CreateArgs args;
/// args.category = reader.required<std::string>("category");
/// args.name = reader.optional<std::string>("name", "");
/// if (!reader.ok()) return reader.failure();
/// @endcode

#include "fwd.hpp"
#include "operation.hpp"
#include <strata/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace strata_ops {

// =============================================================================
// ParamReader
// =============================================================================

class ParamReader {
public:
    explicit ParamReader(const Params& params) : m_params(params) {}

    /// Read a parameter that must be present
    template<typename T>
    [[nodiscard]] T required(const std::string& key) {
        if (m_error) {
            return T{};
        }
        if (!m_params.is_object() || !m_params.contains(key) || m_params.at(key).is_null()) {
            m_error = strata_core::ParamError::missing(key);
            return T{};
        }
        return convert<T>(key, m_params.at(key), T{});
    }

    /// Read a parameter that falls back to a default when absent or null
    template<typename T>
    [[nodiscard]] T optional(const std::string& key, T fallback) {
        if (m_error) {
            return fallback;
        }
        if (!m_params.is_object() || !m_params.contains(key) || m_params.at(key).is_null()) {
            return fallback;
        }
        return convert<T>(key, m_params.at(key), std::move(fallback));
    }

    /// Check whether a key is present and not null
    [[nodiscard]] bool has(const std::string& key) const {
        return m_params.is_object() && m_params.contains(key) && !m_params.at(key).is_null();
    }

    [[nodiscard]] bool ok() const noexcept { return !m_error.has_value(); }

    /// First recorded error (undefined if ok)
    [[nodiscard]] const strata_core::ParamError& error() const { return *m_error; }

    /// Validation failure for the first recorded error
    [[nodiscard]] OperationResult failure() const {
        return OperationResult::failed(ErrorKind::Validation, m_error ? m_error->message : std::string{});
    }

private:
    template<typename T>
    T convert(const std::string& key, const nlohmann::json& value, T fallback) {
        if constexpr (std::is_same_v<T, nlohmann::json>) {
            return value;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (value.is_boolean()) return value.get<bool>();
            return mistyped(key, "a boolean", std::move(fallback));
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            if (value.is_number_unsigned()) {
                auto v = value.get<std::uint64_t>();
                if (v <= std::numeric_limits<T>::max()) return static_cast<T>(v);
            } else if (value.is_number_integer()) {
                auto v = value.get<std::int64_t>();
                if (v >= 0 && static_cast<std::uint64_t>(v) <= std::numeric_limits<T>::max()) return static_cast<T>(v);
            }
            return mistyped(key, "a non-negative integer", std::move(fallback));
        } else if constexpr (std::is_integral_v<T>) {
            // Values outside the range of T are mistyped, not wrapped
            if (value.is_number_unsigned()) {
                auto v = value.get<std::uint64_t>();
                if (v <= static_cast<std::uint64_t>(std::numeric_limits<T>::max())) return static_cast<T>(v);
            } else if (value.is_number_integer()) {
                auto v = value.get<std::int64_t>();
                if (v >= std::numeric_limits<T>::min() && v <= std::numeric_limits<T>::max()) return static_cast<T>(v);
            }
            return mistyped(key, "an integer", std::move(fallback));
        } else if constexpr (std::is_floating_point_v<T>) {
            if (value.is_number()) return value.get<T>();
            return mistyped(key, "a number", std::move(fallback));
        } else if constexpr (std::is_same_v<T, std::string>) {
            if (value.is_string()) return value.get<std::string>();
            return mistyped(key, "a string", std::move(fallback));
        } else if constexpr (std::is_same_v<T, std::vector<nlohmann::json>>) {
            if (value.is_array()) return value.get<std::vector<nlohmann::json>>();
            return mistyped(key, "an array", std::move(fallback));
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            if (value.is_array()) {
                std::vector<std::string> out;
                for (const auto& item : value) {
                    if (!item.is_string()) {
                        return mistyped(key, "an array of strings", std::move(fallback));
                    }
                    out.push_back(item.get<std::string>());
                }
                return out;
            }
            return mistyped(key, "an array of strings", std::move(fallback));
        } else {
            static_assert(std::is_same_v<T, void>, "Unsupported parameter type");
        }
    }

    template<typename T>
    T mistyped(const std::string& key, const char* type, T fallback) {
        m_error = strata_core::ParamError::invalid_type(key, type);
        return fallback;
    }

    const Params& m_params;
    std::optional<strata_core::ParamError> m_error;
};

} // namespace strata_ops
