#include "auth/login_flow.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace dirauth {

// ============================================================================
// FlowStep
// ============================================================================

nlohmann::json FlowStep::to_json() const {
    nlohmann::json j;
    switch (type) {
        case FlowStepType::FORM: {
            j["type"] = "form";
            j["step_id"] = step_id;
            auto schema = nlohmann::json::array();
            for (const auto& field : data_schema) {
                nlohmann::json f = {{"name", field.name}, {"type", field.type}};
                if (field.secret) f["secret"] = true;
                schema.push_back(std::move(f));
            }
            j["data_schema"] = std::move(schema);
            j["errors"] = errors;
            break;
        }
        case FlowStepType::CREATE_ENTRY:
            j["type"] = "create_entry";
            j["title"] = title;
            j["data"] = data;
            break;
        case FlowStepType::ABORT:
            j["type"] = "abort";
            j["reason"] = reason;
            break;
    }
    return j;
}

// ============================================================================
// LoginFlow
// ============================================================================

LoginFlow::LoginFlow(std::shared_ptr<const DecisionEngine> engine,
                     std::string title,
                     std::shared_ptr<CredentialResolver> resolver)
    : engine_(std::move(engine)), title_(std::move(title)), resolver_(std::move(resolver)) {
    if (!engine_) {
        throw std::invalid_argument("LoginFlow: decision engine is null");
    }
}

std::string_view LoginFlow::error_code(AuthFailure failure) {
    switch (failure) {
        case AuthFailure::INVALID_CREDENTIALS:
        case AuthFailure::BIND_FAILURE:
        case AuthFailure::GROUP_MEMBERSHIP_DENIED:
            return kErrorInvalidAuth;
        default:
            return kErrorGeneric;
    }
}

FlowStep LoginFlow::show_form(std::map<std::string, std::string> errors) const {
    FlowStep step;
    step.type = FlowStepType::FORM;
    step.step_id = std::string(kInitStepId);
    step.data_schema = {
        FormField{"username", "string", false},
        FormField{"password", "string", true},
    };
    step.errors = std::move(errors);
    return step;
}

FlowStep LoginFlow::step(LoginFlowState& state, std::optional<AuthnRequest> input) const {
    if (state == LoginFlowState::COMPLETED) {
        FlowStep step;
        step.type = FlowStepType::ABORT;
        step.reason = "already_completed";
        return step;
    }

    if (!input) {
        return show_form({});
    }

    const auto decision = engine_->decide(*input);
    if (decision.is_error()) {
        const auto code = error_code(decision.failure());
        utils::log::info(std::format("Login for {} failed ({}): {}",
            input->username, failure_name(decision.failure()), decision.error_message()));
        return show_form({{"base", std::string(code)}});
    }

    // Only the username leaves the flow
    input->discard_password();

    FlowStep step;
    step.type = FlowStepType::CREATE_ENTRY;
    step.title = title_;
    step.data = {{"username", input->username}};
    if (resolver_) {
        step.credential = resolver_->find_or_create(input->username);
    }
    state = LoginFlowState::COMPLETED;
    return step;
}

} // namespace dirauth
