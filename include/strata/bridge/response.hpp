#pragma once

/// @file response.hpp
/// @brief JSON responses returned to the caller
///
/// Every response is an object with a boolean "success". Failures carry
/// "error" and "errorKind"; group state errors report the kind name as
/// "error" and the readable text as "message".

#include "fwd.hpp"
#include <strata/core/error.hpp>
#include <strata/ops/operation.hpp>
#include <strata/ops/registry.hpp>
#include <strata/tx/batch.hpp>
#include <strata/tx/group.hpp>
#include <strata/tx/guarded.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace strata_bridge {

// =============================================================================
// ResponseBuilder
// =============================================================================

class ResponseBuilder {
public:
    [[nodiscard]] static ResponseBuilder ok();
    [[nodiscard]] static ResponseBuilder error(const std::string& message,
                                               strata_ops::ErrorKind kind = strata_ops::ErrorKind::Validation);
    [[nodiscard]] static ResponseBuilder from_error(const strata_core::Error& error);
    [[nodiscard]] static ResponseBuilder from_result(const strata_ops::OperationResult& result);

    /// Set a payload field
    ResponseBuilder& with(const std::string& key, nlohmann::json value);

    ResponseBuilder& message(const std::string& text) { return with("message", text); }

    [[nodiscard]] nlohmann::json build() const { return m_body; }

private:
    ResponseBuilder() : m_body(nlohmann::json::object()) {}

    nlohmann::json m_body;
};

// =============================================================================
// Result Rendering
// =============================================================================

[[nodiscard]] nlohmann::json batch_response(const strata_tx::BatchResult& result);
[[nodiscard]] nlohmann::json safe_execute_response(const std::string& method,
                                                   const strata_tx::SafeExecuteResult& result);
[[nodiscard]] nlohmann::json verify_response(const strata_tx::VerifyResult& result);
[[nodiscard]] nlohmann::json status_response(const strata_tx::GroupStatus& status);
[[nodiscard]] nlohmann::json operation_info_json(const strata_ops::OperationInfo& info);

} // namespace strata_bridge
