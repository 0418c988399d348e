/// @file memory_model.cpp
/// @brief In-memory reference model

#include <strata/model/memory_model.hpp>
#include <strata/core/log.hpp>

#include <algorithm>

namespace strata_model {

MemoryModel::MemoryModel(std::string title)
    : m_title(std::move(title)) {}

// =============================================================================
// Scopes
// =============================================================================

strata_core::Result<ScopeToken> MemoryModel::begin_scope(const std::string& name, ScopeKind kind) {
    if (m_fail_next_begin) {
        auto reason = std::move(*m_fail_next_begin);
        m_fail_next_begin.reset();
        return strata_core::Err<ScopeToken>(strata_core::ScopeError::begin_failed(name, reason));
    }

    if (kind == ScopeKind::Group && !m_scopes.empty()
        && m_scopes.back().kind == ScopeKind::Transaction) {
        return strata_core::Err<ScopeToken>(strata_core::ScopeError::begin_failed(
            name, "a transaction group cannot start inside an open transaction"));
    }

    OpenScope scope;
    scope.token = ScopeToken{m_next_token++};
    scope.name = name;
    scope.kind = kind;
    scope.elements = m_elements;
    scope.next_id = m_next_id;
    scope.pending_depth = m_pending.size();
    scope.undo_depth = m_undo.size();

    m_scopes.push_back(std::move(scope));

    strata_core::model_logger()->trace("[{}] begin {} '{}' (depth {})",
        m_title, scope_kind_name(kind), name, m_scopes.size());
    return m_scopes.back().token;
}

strata_core::Result<void> MemoryModel::commit(ScopeToken token) {
    auto valid = require_innermost(token);
    if (!valid) {
        return valid;
    }

    OpenScope scope = std::move(m_scopes.back());
    m_scopes.pop_back();

    // Failures raised inside this scope are judged by its policy
    std::vector<FailureMessage> raised(
        m_pending.begin() + static_cast<std::ptrdiff_t>(scope.pending_depth), m_pending.end());

    if (!raised.empty()) {
        StrictPolicy fallback;
        const FailurePolicy& policy = scope.policy ? *scope.policy : fallback;
        auto outcome = policy.process(raised);

        if (outcome.should_rollback()) {
            restore(scope);
            strata_core::model_logger()->warn("[{}] commit of '{}' refused: {}",
                m_title, scope.name, outcome.summary());
            return strata_core::Err(strata_core::ScopeError::commit_refused(scope.name, outcome.summary()));
        }
        m_pending.resize(scope.pending_depth);
    }

    // Everything committed since the scope opened becomes one undo unit
    m_undo.resize(scope.undo_depth);
    m_undo.push_back(scope.name);

    strata_core::model_logger()->trace("[{}] commit {} '{}'",
        m_title, scope_kind_name(scope.kind), scope.name);
    return strata_core::Ok();
}

strata_core::Result<void> MemoryModel::rollback(ScopeToken token) {
    auto valid = require_innermost(token);
    if (!valid) {
        return valid;
    }

    OpenScope scope = std::move(m_scopes.back());
    m_scopes.pop_back();
    restore(scope);

    strata_core::model_logger()->trace("[{}] rollback {} '{}'",
        m_title, scope_kind_name(scope.kind), scope.name);
    return strata_core::Ok();
}

strata_core::Result<void> MemoryModel::attach_failure_policy(
    ScopeToken token, std::shared_ptr<FailurePolicy> policy)
{
    auto it = std::find_if(m_scopes.begin(), m_scopes.end(),
        [token](const OpenScope& s) { return s.token == token; });
    if (it == m_scopes.end()) {
        return strata_core::Err(strata_core::ScopeError::not_open(std::to_string(token.value)));
    }
    it->policy = std::move(policy);
    return strata_core::Ok();
}

strata_core::Result<void> MemoryModel::require_innermost(ScopeToken token) const {
    auto it = std::find_if(m_scopes.begin(), m_scopes.end(),
        [token](const OpenScope& s) { return s.token == token; });
    if (it == m_scopes.end()) {
        return strata_core::Err(strata_core::ScopeError::not_open(std::to_string(token.value)));
    }
    if (it->token != m_scopes.back().token) {
        return strata_core::Err(strata_core::ScopeError::out_of_order(it->name, m_scopes.back().name));
    }
    return strata_core::Ok();
}

void MemoryModel::restore(const OpenScope& scope) {
    m_elements = scope.elements;
    m_next_id = scope.next_id;
    m_pending.resize(std::min(m_pending.size(), scope.pending_depth));
    m_undo.resize(std::min(m_undo.size(), scope.undo_depth));
}

// =============================================================================
// Mutations
// =============================================================================

strata_core::Result<void> MemoryModel::require_transaction(const char* what) const {
    if (m_scopes.empty() || m_scopes.back().kind != ScopeKind::Transaction) {
        return strata_core::Err(strata_core::ScopeError::outside_scope(what));
    }
    return strata_core::Ok();
}

bool MemoryModel::name_in_use(const std::string& category, const std::string& name) const {
    return std::any_of(m_elements.begin(), m_elements.end(), [&](const auto& entry) {
        return entry.second.category == category && entry.second.name == name;
    });
}

strata_core::Result<ElementId> MemoryModel::create_element(
    const std::string& category,
    const std::string& name,
    nlohmann::json parameters)
{
    auto in_tx = require_transaction("create an element");
    if (!in_tx) {
        return strata_core::Err<ElementId>(in_tx.error());
    }

    if (category.empty()) {
        return strata_core::Err<ElementId>(strata_core::ParamError::invalid_value(
            "category", "must not be empty"));
    }

    if (!name.empty() && name_in_use(category, name)) {
        FailureMessage warning = FailureMessage::warning(
            "Element name '" + name + "' is already used in category '" + category + "'");
        m_pending.push_back(std::move(warning));
    }

    Element element;
    element.id = m_next_id++;
    element.category = category;
    element.name = name;
    element.parameters = parameters.is_object() ? std::move(parameters) : nlohmann::json::object();

    ElementId id = element.id;
    m_elements.emplace(id, std::move(element));

    strata_core::model_logger()->debug("[{}] created {} #{} '{}'", m_title, category, id, name);
    return id;
}

strata_core::Result<void> MemoryModel::delete_element(ElementId id) {
    auto in_tx = require_transaction("delete an element");
    if (!in_tx) {
        return in_tx;
    }

    auto it = m_elements.find(id);
    if (it == m_elements.end()) {
        return strata_core::Err(strata_core::Error(strata_core::ErrorCode::NotFound,
            "Element " + std::to_string(id) + " not found"));
    }
    m_elements.erase(it);

    strata_core::model_logger()->debug("[{}] deleted #{}", m_title, id);
    return strata_core::Ok();
}

strata_core::Result<void> MemoryModel::set_parameter(
    ElementId id, const std::string& key, nlohmann::json value)
{
    auto in_tx = require_transaction("modify an element");
    if (!in_tx) {
        return in_tx;
    }

    auto it = m_elements.find(id);
    if (it == m_elements.end()) {
        return strata_core::Err(strata_core::Error(strata_core::ErrorCode::NotFound,
            "Element " + std::to_string(id) + " not found"));
    }
    if (key.empty()) {
        return strata_core::Err(strata_core::ParamError::invalid_value("parameter", "must not be empty"));
    }

    it->second.parameters[key] = std::move(value);
    return strata_core::Ok();
}

strata_core::Result<void> MemoryModel::post_failure(FailureMessage message) {
    auto in_tx = require_transaction("report a failure");
    if (!in_tx) {
        return in_tx;
    }

    strata_core::model_logger()->debug("[{}] {} raised: {}",
        m_title, failure_severity_name(message.severity), message.description);
    m_pending.push_back(std::move(message));
    return strata_core::Ok();
}

// =============================================================================
// Queries
// =============================================================================

const Element* MemoryModel::find(ElementId id) const {
    auto it = m_elements.find(id);
    return it != m_elements.end() ? &it->second : nullptr;
}

std::size_t MemoryModel::count_in_category(const std::string& category) const {
    return static_cast<std::size_t>(std::count_if(m_elements.begin(), m_elements.end(),
        [&](const auto& entry) { return entry.second.category == category; }));
}

std::vector<Element> MemoryModel::elements() const {
    std::vector<Element> out;
    out.reserve(m_elements.size());
    for (const auto& [id, element] : m_elements) {
        out.push_back(element);
    }
    return out;
}

} // namespace strata_model
