#pragma once

#include "auth/credential_store.hpp"
#include "auth/decision_engine.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dirauth {

enum class LoginFlowState {
    AWAITING_CREDENTIALS,
    COMPLETED
};

enum class FlowStepType {
    FORM,           // show (or re-show) the credentials form
    CREATE_ENTRY,   // login finished; data carries the username
    ABORT
};

struct FormField {
    std::string name;
    std::string type = "string";
    bool secret = false;
};

/**
 * @brief What the host should do next
 */
struct FlowStep {
    FlowStepType type = FlowStepType::FORM;
    std::string step_id;
    std::vector<FormField> data_schema;
    std::map<std::string, std::string> errors;   // "base" -> "invalid_auth" | "error"
    std::string title;
    std::map<std::string, std::string> data;     // {"username": ...} on CREATE_ENTRY
    std::optional<Credential> credential;        // set when a resolver is attached
    std::string reason;                          // ABORT only

    [[nodiscard]] nlohmann::json to_json() const;
};

inline constexpr std::string_view kInitStepId = "init";
inline constexpr std::string_view kErrorInvalidAuth = "invalid_auth";
inline constexpr std::string_view kErrorGeneric = "error";

/**
 * @brief Single-step username/password login conversation
 *
 * The flow object is stateless; the caller owns the LoginFlowState and
 * passes it to every step.
 */
class LoginFlow {
public:
    LoginFlow(std::shared_ptr<const DecisionEngine> engine,
              std::string title,
              std::shared_ptr<CredentialResolver> resolver = nullptr);

    /**
     * @brief Advance the flow
     * @param state In/out; becomes COMPLETED on success
     * @param input Nothing to request the form; credentials to submit it
     */
    [[nodiscard]] FlowStep step(LoginFlowState& state, std::optional<AuthnRequest> input) const;

    // User-visible error code for a failed decision
    [[nodiscard]] static std::string_view error_code(AuthFailure failure);

private:
    [[nodiscard]] FlowStep show_form(std::map<std::string, std::string> errors) const;

    std::shared_ptr<const DecisionEngine> engine_;
    std::string title_;
    std::shared_ptr<CredentialResolver> resolver_;
};

} // namespace dirauth
