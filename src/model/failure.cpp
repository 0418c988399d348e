/// @file failure.cpp
/// @brief Failure classification policies

#include <strata/model/failure.hpp>
#include <strata/core/log.hpp>

#include <sstream>

namespace strata_model {

namespace {

void log_outcome(const FailurePolicy& policy, const FailureOutcome& outcome) {
    auto logger = strata_core::model_logger();

    for (const auto& msg : outcome.suppressed) {
        logger->debug("[{}] suppressed warning: {}", policy.name(), msg.description);
    }
    for (const auto& msg : outcome.resolved) {
        logger->debug("[{}] resolved error: {}", policy.name(), msg.description);
    }
    for (const auto& msg : outcome.fatal) {
        logger->warn("[{}] fatal {}: {}", policy.name(),
                     failure_severity_name(msg.severity), msg.description);
    }
}

} // anonymous namespace

// =============================================================================
// FailureOutcome
// =============================================================================

std::string FailureOutcome::summary() const {
    if (fatal.empty()) {
        return {};
    }

    std::ostringstream oss;
    for (std::size_t i = 0; i < fatal.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << failure_severity_name(fatal[i].severity) << ": " << fatal[i].description;
    }
    return oss.str();
}

// =============================================================================
// SuppressWarningsPolicy
// =============================================================================

FailureOutcome SuppressWarningsPolicy::process(const std::vector<FailureMessage>& pending) const {
    FailureOutcome outcome;

    for (const auto& msg : pending) {
        if (msg.is_warning()) {
            outcome.suppressed.push_back(msg);
        } else if (msg.resolvable) {
            outcome.resolved.push_back(msg);
        } else {
            outcome.fatal.push_back(msg);
        }
    }

    if (!outcome.fatal.empty()) {
        outcome.action = FailureAction::Rollback;
    }

    log_outcome(*this, outcome);
    return outcome;
}

// =============================================================================
// StrictPolicy
// =============================================================================

FailureOutcome StrictPolicy::process(const std::vector<FailureMessage>& pending) const {
    FailureOutcome outcome;

    for (const auto& msg : pending) {
        if (!msg.is_warning() && msg.resolvable) {
            outcome.resolved.push_back(msg);
        } else {
            outcome.fatal.push_back(msg);
        }
    }

    if (!outcome.fatal.empty()) {
        outcome.action = FailureAction::Rollback;
    }

    log_outcome(*this, outcome);
    return outcome;
}

std::shared_ptr<FailurePolicy> make_failure_policy(bool continue_on_warning) {
    if (continue_on_warning) {
        return std::make_shared<SuppressWarningsPolicy>();
    }
    return std::make_shared<StrictPolicy>();
}

} // namespace strata_model
