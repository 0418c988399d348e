/// @file operation.cpp
/// @brief OperationResult factories

#include <strata/ops/operation.hpp>

namespace strata_ops {

ErrorKind error_kind_of(const strata_core::Error& error) noexcept {
    switch (error.code()) {
        case strata_core::ErrorCode::InvalidArgument:
        case strata_core::ErrorCode::ValidationError:
        case strata_core::ErrorCode::ParseError:
        case strata_core::ErrorCode::NotSupported:
            return ErrorKind::Validation;
        case strata_core::ErrorCode::NotFound:
            return ErrorKind::NotFound;
        case strata_core::ErrorCode::AlreadyExists:
        case strata_core::ErrorCode::InvalidState:
            return ErrorKind::State;
        case strata_core::ErrorCode::ResourceFailure:
        case strata_core::ErrorCode::IOError:
        case strata_core::ErrorCode::Unknown:
        default:
            return ErrorKind::Resource;
    }
}

OperationResult OperationResult::ok(nlohmann::json payload) {
    OperationResult r;
    r.success = true;
    r.payload = payload.is_null() ? nlohmann::json::object() : std::move(payload);
    return r;
}

OperationResult OperationResult::failed(ErrorKind kind, std::string message) {
    OperationResult r;
    r.success = false;
    r.error_kind = kind == ErrorKind::None ? ErrorKind::Resource : kind;
    r.error_message = std::move(message);
    return r;
}

OperationResult OperationResult::from_error(const strata_core::Error& error) {
    return failed(error_kind_of(error), error.message());
}

OperationResult OperationResult::not_found(const std::string& name) {
    return failed(ErrorKind::NotFound, "Method not found: " + name);
}

OperationResult OperationResult::exception(const std::string& name, const std::string& what) {
    return failed(ErrorKind::Exception, name + " threw: " + what);
}

nlohmann::json OperationResult::to_json() const {
    nlohmann::json out = nlohmann::json::object();
    out["success"] = success;

    if (payload.is_object()) {
        for (auto it = payload.begin(); it != payload.end(); ++it) {
            if (it.key() != "success") {
                out[it.key()] = it.value();
            }
        }
    }

    if (!success) {
        out["error"] = error_message;
        out["errorKind"] = error_kind_name(error_kind);
    }
    return out;
}

} // namespace strata_ops
