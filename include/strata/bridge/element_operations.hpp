#pragma once

/// @file element_operations.hpp
/// @brief Operations over the in-memory reference model
///
/// These handlers let the bridge run end to end against MemoryModel. Each one
/// reads its parameters into a typed struct and, when it mutates, asks the
/// execution context for a scope so it works both standalone and inside a
/// batch.

#include "fwd.hpp"
#include <strata/ops/registry.hpp>
#include <strata/model/memory_model.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace strata_bridge {

// =============================================================================
// Parameter Structs
// =============================================================================

struct CreateElementArgs {
    std::string category;
    std::string name;
    nlohmann::json parameters = nlohmann::json::object();
};

struct ElementRefArgs {
    strata_model::ElementId element_id = 0;
};

struct SetParameterArgs {
    strata_model::ElementId element_id = 0;
    std::string name;
    nlohmann::json value;
};

struct CountArgs {
    std::string category;   // Empty counts every element
};

struct AssertCountArgs {
    std::string category;
    std::int64_t expected = 0;
};

struct ReportFailureArgs {
    strata_model::FailureSeverity severity = strata_model::FailureSeverity::Warning;
    std::string description;
    bool resolvable = false;
};

// =============================================================================
// Registration
// =============================================================================

/// Category the element operations are listed under
inline constexpr const char* k_element_category = "Elements";

/// Register createElement, deleteElement, setParameter, getElement,
/// countElements, assertElementCount and reportFailure
void register_element_operations(strata_ops::OperationRegistry& registry);

/// Element as a JSON object
[[nodiscard]] nlohmann::json element_json(const strata_model::Element& element);

} // namespace strata_bridge
