/// @file registry.cpp
/// @brief OperationRegistry implementation

#include <strata/ops/registry.hpp>
#include <strata/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <set>

namespace strata_ops {

std::string normalize_name(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

void OperationRegistry::register_operation(OperationInfo info, OperationHandler handler) {
    auto entry = std::make_shared<OperationEntry>();
    entry->info = std::move(info);
    entry->handler = std::move(handler);

    std::vector<std::string> keys;
    keys.push_back(entry->info.name);
    keys.insert(keys.end(), entry->info.aliases.begin(), entry->info.aliases.end());

    for (const auto& raw : keys) {
        if (raw.empty()) {
            continue;
        }
        auto key = normalize_name(raw);

        auto it = m_index.find(key);
        if (it != m_index.end() && it->second != entry) {
            RegistrationConflict conflict{key, it->second->info.name, entry->info.name};
            strata_core::ops_logger()->warn("Operation name '{}' registered twice ({} replaced by {})",
                raw, conflict.previous, conflict.replacement);
            m_conflicts.push_back(std::move(conflict));
        }
        m_index[key] = entry;
    }

    strata_core::ops_logger()->debug("Registered operation '{}' [{}]",
        entry->info.name, entry->info.category);
    m_entries.push_back(std::move(entry));
}

const OperationEntry* OperationRegistry::resolve(const std::string& name) const {
    if (name.empty()) {
        return nullptr;
    }
    auto it = m_index.find(normalize_name(name));
    return it != m_index.end() ? it->second.get() : nullptr;
}

OperationResult OperationRegistry::invoke(ExecutionContext& ctx, const Operation& operation) const {
    const auto* entry = resolve(operation.name);
    if (!entry) {
        strata_core::ops_logger()->debug("Unknown operation '{}'", operation.name);
        return OperationResult::not_found(operation.name);
    }

    const Params& params = operation.params.is_null() ? Params::object() : operation.params;

    try {
        return entry->handler(ctx, params);
    } catch (const std::exception& e) {
        strata_core::ops_logger()->error("Operation '{}' threw: {}", entry->info.name, e.what());
        return OperationResult::exception(entry->info.name, e.what());
    } catch (...) {
        strata_core::ops_logger()->error("Operation '{}' threw a non-standard exception", entry->info.name);
        return OperationResult::exception(entry->info.name, "unknown exception");
    }
}

bool OperationRegistry::is_live(const std::shared_ptr<OperationEntry>& entry) const {
    auto it = m_index.find(normalize_name(entry->info.name));
    return it != m_index.end() && it->second == entry;
}

std::vector<OperationInfo> OperationRegistry::list(const std::string& category) const {
    std::vector<OperationInfo> out;
    auto wanted = normalize_name(category);

    for (const auto& entry : m_entries) {
        if (!is_live(entry)) {
            continue;
        }
        if (!wanted.empty() && normalize_name(entry->info.category) != wanted) {
            continue;
        }
        out.push_back(entry->info);
    }

    std::sort(out.begin(), out.end(), [](const OperationInfo& a, const OperationInfo& b) {
        return normalize_name(a.name) < normalize_name(b.name);
    });
    return out;
}

std::vector<std::string> OperationRegistry::categories() const {
    std::set<std::string> unique;
    for (const auto& entry : m_entries) {
        if (is_live(entry)) {
            unique.insert(entry->info.category);
        }
    }
    return {unique.begin(), unique.end()};
}

} // namespace strata_ops
