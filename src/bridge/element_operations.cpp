/// @file element_operations.cpp
/// @brief Element operation handlers

#include <strata/bridge/element_operations.hpp>
#include <strata/ops/params.hpp>
#include <strata/core/log.hpp>

namespace strata_bridge {

using strata_ops::ErrorKind;
using strata_ops::ExecutionContext;
using strata_ops::OperationResult;
using strata_ops::Params;
using strata_ops::ParamReader;

namespace {

strata_model::MemoryModel* model_of(ExecutionContext& ctx) {
    return ctx.resource_as<strata_model::MemoryModel>();
}

OperationResult no_model() {
    return OperationResult::failed(ErrorKind::Resource, "Element operations require the in-memory model");
}

OperationResult element_not_found(strata_model::ElementId id) {
    return OperationResult::failed(ErrorKind::NotFound, "Element " + std::to_string(id) + " not found");
}

/// Commit on success, roll back on failure
OperationResult close_scope(strata_model::Scope& scope, OperationResult result) {
    if (result.success) {
        auto committed = scope.commit();
        if (!committed) {
            return OperationResult::from_error(committed.error());
        }
        return result;
    }

    auto reverted = scope.rollback();
    if (!reverted) {
        strata_core::ops_logger()->error("Rollback of '{}' failed: {}",
            scope.name(), reverted.error().message());
    }
    return result;
}

// =============================================================================
// Handlers
// =============================================================================

OperationResult create_element(ExecutionContext& ctx, const Params& params) {
    ParamReader reader(params);
    CreateElementArgs args;
    args.category = reader.required<std::string>("category");
    args.name = reader.optional<std::string>("name", "");
    args.parameters = reader.optional<nlohmann::json>("parameters", nlohmann::json::object());
    if (!reader.ok()) {
        return reader.failure();
    }
    if (!args.parameters.is_object()) {
        return OperationResult::failed(ErrorKind::Validation, "Parameter 'parameters' must be an object");
    }

    auto* model = model_of(ctx);
    if (!model) {
        return no_model();
    }

    auto scope = ctx.ensure_scope("Create " + args.category);
    if (!scope) {
        return OperationResult::from_error(scope.error());
    }

    auto id = model->create_element(args.category, args.name, args.parameters);
    if (!id) {
        return close_scope(*scope, OperationResult::from_error(id.error()));
    }

    return close_scope(*scope, OperationResult::ok({
        {"elementId", *id},
        {"category", args.category},
        {"name", args.name},
        {"message", "Created " + args.category + " " + std::to_string(*id)},
    }));
}

OperationResult delete_element(ExecutionContext& ctx, const Params& params) {
    ParamReader reader(params);
    ElementRefArgs args;
    args.element_id = reader.required<strata_model::ElementId>("elementId");
    if (!reader.ok()) {
        return reader.failure();
    }

    auto* model = model_of(ctx);
    if (!model) {
        return no_model();
    }
    if (!model->find(args.element_id)) {
        return element_not_found(args.element_id);
    }

    auto scope = ctx.ensure_scope("Delete Element");
    if (!scope) {
        return OperationResult::from_error(scope.error());
    }

    auto deleted = model->delete_element(args.element_id);
    if (!deleted) {
        return close_scope(*scope, OperationResult::from_error(deleted.error()));
    }
    return close_scope(*scope, OperationResult::ok({{"deletedId", args.element_id}}));
}

OperationResult set_parameter(ExecutionContext& ctx, const Params& params) {
    ParamReader reader(params);
    SetParameterArgs args;
    args.element_id = reader.required<strata_model::ElementId>("elementId");
    args.name = reader.required<std::string>("name");
    args.value = reader.required<nlohmann::json>("value");
    if (!reader.ok()) {
        return reader.failure();
    }

    auto* model = model_of(ctx);
    if (!model) {
        return no_model();
    }
    if (!model->find(args.element_id)) {
        return element_not_found(args.element_id);
    }

    auto scope = ctx.ensure_scope("Set Parameter");
    if (!scope) {
        return OperationResult::from_error(scope.error());
    }

    auto set = model->set_parameter(args.element_id, args.name, args.value);
    if (!set) {
        return close_scope(*scope, OperationResult::from_error(set.error()));
    }
    return close_scope(*scope, OperationResult::ok({
        {"elementId", args.element_id},
        {"parameter", args.name},
        {"value", args.value},
    }));
}

OperationResult get_element(ExecutionContext& ctx, const Params& params) {
    ParamReader reader(params);
    ElementRefArgs args;
    args.element_id = reader.required<strata_model::ElementId>("elementId");
    if (!reader.ok()) {
        return reader.failure();
    }

    auto* model = model_of(ctx);
    if (!model) {
        return no_model();
    }

    const auto* element = model->find(args.element_id);
    if (!element) {
        return element_not_found(args.element_id);
    }
    return OperationResult::ok({{"element", element_json(*element)}});
}

OperationResult count_elements(ExecutionContext& ctx, const Params& params) {
    ParamReader reader(params);
    CountArgs args;
    args.category = reader.optional<std::string>("category", "");
    if (!reader.ok()) {
        return reader.failure();
    }

    auto* model = model_of(ctx);
    if (!model) {
        return no_model();
    }

    auto count = args.category.empty() ? model->element_count() : model->count_in_category(args.category);
    return OperationResult::ok({{"category", args.category}, {"count", count}});
}

OperationResult assert_element_count(ExecutionContext& ctx, const Params& params) {
    ParamReader reader(params);
    AssertCountArgs args;
    args.category = reader.optional<std::string>("category", "");
    args.expected = reader.required<std::int64_t>("expected");
    if (!reader.ok()) {
        return reader.failure();
    }

    auto* model = model_of(ctx);
    if (!model) {
        return no_model();
    }

    auto count = static_cast<std::int64_t>(
        args.category.empty() ? model->element_count() : model->count_in_category(args.category));
    if (count != args.expected) {
        std::string where = args.category.empty() ? "the model" : "'" + args.category + "'";
        return OperationResult::failed(ErrorKind::State,
            "Expected " + std::to_string(args.expected) + " elements in " + where
            + ", found " + std::to_string(count));
    }
    return OperationResult::ok({{"count", count}});
}

OperationResult report_failure(ExecutionContext& ctx, const Params& params) {
    ParamReader reader(params);
    ReportFailureArgs args;
    auto severity = reader.optional<std::string>("severity", "warning");
    args.description = reader.required<std::string>("description");
    args.resolvable = reader.optional<bool>("resolvable", false);
    if (!reader.ok()) {
        return reader.failure();
    }

    if (severity == "warning") {
        args.severity = strata_model::FailureSeverity::Warning;
    } else if (severity == "error") {
        args.severity = strata_model::FailureSeverity::Error;
    } else {
        return OperationResult::failed(ErrorKind::Validation,
            "Parameter 'severity' must be 'warning' or 'error'");
    }

    auto* model = model_of(ctx);
    if (!model) {
        return no_model();
    }

    auto scope = ctx.ensure_scope("Report Failure");
    if (!scope) {
        return OperationResult::from_error(scope.error());
    }

    auto message = args.severity == strata_model::FailureSeverity::Warning
        ? strata_model::FailureMessage::warning(args.description)
        : strata_model::FailureMessage::error(args.description, args.resolvable);

    auto posted = model->post_failure(std::move(message));
    if (!posted) {
        return close_scope(*scope, OperationResult::from_error(posted.error()));
    }
    return close_scope(*scope, OperationResult::ok({
        {"severity", severity},
        {"description", args.description},
    }));
}

} // anonymous namespace

nlohmann::json element_json(const strata_model::Element& element) {
    return {
        {"id", element.id},
        {"category", element.category},
        {"name", element.name},
        {"parameters", element.parameters},
    };
}

void register_element_operations(strata_ops::OperationRegistry& registry) {
    registry.register_operation(
        {"createElement", {"addElement"}, k_element_category, "Create an element in a category"},
        create_element);
    registry.register_operation(
        {"deleteElement", {"removeElement"}, k_element_category, "Delete an element by id"},
        delete_element);
    registry.register_operation(
        {"setParameter", {"setElementParameter"}, k_element_category, "Set a parameter value on an element"},
        set_parameter);
    registry.register_operation(
        {"getElement", {}, k_element_category, "Read an element by id"},
        get_element);
    registry.register_operation(
        {"countElements", {}, k_element_category, "Count elements, optionally in one category"},
        count_elements);
    registry.register_operation(
        {"assertElementCount", {"verifyElementCount"}, k_element_category,
         "Fail unless a category holds the expected number of elements"},
        assert_element_count);
    registry.register_operation(
        {"reportFailure", {}, "Diagnostics", "Raise a model warning or error in the current transaction"},
        report_failure);

    strata_core::ops_logger()->debug("Element operations registered");
}

} // namespace strata_bridge
