/// @file response.cpp
/// @brief Response building

#include <strata/bridge/response.hpp>
#include <strata/core/log.hpp>

namespace strata_bridge {

namespace {

const char* group_error_name(strata_core::GroupError::Kind kind) {
    switch (kind) {
        case strata_core::GroupError::Kind::AlreadyActive: return "AlreadyActive";
        case strata_core::GroupError::Kind::NoActiveGroup: return "NoActiveGroup";
        case strata_core::GroupError::Kind::Terminated: return "Terminated";
        default: return "GroupError";
    }
}

} // anonymous namespace

// =============================================================================
// ResponseBuilder
// =============================================================================

ResponseBuilder ResponseBuilder::ok() {
    ResponseBuilder b;
    b.m_body["success"] = true;
    return b;
}

ResponseBuilder ResponseBuilder::error(const std::string& message, strata_ops::ErrorKind kind) {
    ResponseBuilder b;
    b.m_body["success"] = false;
    b.m_body["error"] = message;
    b.m_body["errorKind"] = strata_ops::error_kind_name(kind);
    return b;
}

ResponseBuilder ResponseBuilder::from_error(const strata_core::Error& error) {
    strata_core::debug::record_error(error);
    strata_core::bridge_logger()->debug("Error response: {}", strata_core::build_error_chain(error));

    auto kind = strata_ops::error_kind_of(error);

    if (const auto* group = error.as<strata_core::GroupError>()) {
        auto b = ResponseBuilder::error(group_error_name(group->kind), kind);
        b.message(group->message);
        if (group->kind == strata_core::GroupError::Kind::AlreadyActive) {
            b.with("activeGroup", group->group_name);
        }
        return b;
    }

    auto b = ResponseBuilder::error(error.message(), kind);
    if (const auto* param = error.as<strata_core::ParamError>()) {
        b.with("parameter", param->param);
    }
    return b;
}

ResponseBuilder ResponseBuilder::from_result(const strata_ops::OperationResult& result) {
    ResponseBuilder b;
    b.m_body = result.to_json();
    return b;
}

ResponseBuilder& ResponseBuilder::with(const std::string& key, nlohmann::json value) {
    m_body[key] = std::move(value);
    return *this;
}

// =============================================================================
// Result Rendering
// =============================================================================

nlohmann::json batch_response(const strata_tx::BatchResult& result) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& entry : result.entries) {
        nlohmann::json item;
        item["index"] = entry.index;
        item["method"] = entry.name;
        item["success"] = entry.result.success;
        if (entry.result.success) {
            item["result"] = entry.result.to_json();
        } else {
            item["error"] = entry.result.error_message;
            item["errorKind"] = strata_ops::error_kind_name(entry.result.error_kind);
        }
        results.push_back(std::move(item));
    }

    nlohmann::json out;
    out["success"] = result.success();
    out["batchName"] = result.batch_name;
    out["totalOperations"] = result.total;
    out["succeededCount"] = result.succeeded;
    out["failedCount"] = result.failed;
    out["rolledBack"] = result.rolled_back;
    out["committed"] = result.committed;
    out["results"] = std::move(results);
    out["createdElementIds"] = result.created_ids;
    out["message"] = result.message;

    if (!result.success()) {
        out["error"] = result.message;
        if (result.error_kind != strata_ops::ErrorKind::None) {
            out["errorKind"] = strata_ops::error_kind_name(result.error_kind);
        }
    }
    return out;
}

nlohmann::json safe_execute_response(const std::string& method, const strata_tx::SafeExecuteResult& result) {
    nlohmann::json out;
    out["success"] = result.success();
    out["method"] = method;
    out["result"] = result.result.to_json();
    out["wasRolledBack"] = result.was_rolled_back;
    out["message"] = result.message;
    if (!result.success()) {
        out["error"] = result.result.error_message;
        out["errorKind"] = strata_ops::error_kind_name(result.result.error_kind);
    }
    return out;
}

nlohmann::json verify_response(const strata_tx::VerifyResult& result) {
    nlohmann::json out;
    out["success"] = result.success;
    out["phase"] = strata_tx::verify_phase_name(result.phase);
    out["mainResult"] = result.main_result.to_json();
    if (result.verify_result) {
        out["verifyResult"] = result.verify_result->to_json();
    }
    out["wasRolledBack"] = result.was_rolled_back;
    out["message"] = result.message;
    if (!result.success) {
        out["error"] = result.message;
    }
    return out;
}

nlohmann::json status_response(const strata_tx::GroupStatus& status) {
    nlohmann::json out;
    out["success"] = true;
    out["hasActiveGroup"] = status.has_active;
    out["activeGroupName"] = status.has_active ? nlohmann::json(status.name) : nlohmann::json(nullptr);
    out["checkpointCount"] = status.checkpoint_count;
    out["checkpoints"] = strata_tx::checkpoint_texts(status.checkpoints);
    out["errorsReported"] = strata_core::debug::total_error_count();
    return out;
}

nlohmann::json operation_info_json(const strata_ops::OperationInfo& info) {
    nlohmann::json out;
    out["name"] = info.name;
    out["aliases"] = info.aliases;
    out["category"] = info.category;
    out["description"] = info.description;
    return out;
}

} // namespace strata_bridge
