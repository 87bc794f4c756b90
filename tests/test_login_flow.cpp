#include <catch2/catch_test_macros.hpp>
#include "auth/login_flow.hpp"
#include "mocks/mock_credential_store.hpp"
#include "mocks/mock_directory.hpp"

using namespace dirauth;
using namespace dirauth::testing;

namespace {

constexpr const char* kAliceDn = "uid=alice,ou=people,dc=example,dc=com";

struct Fixture {
    std::shared_ptr<MockDirectory> dir = std::make_shared<MockDirectory>();
    std::shared_ptr<MockCredentialStore> store = std::make_shared<MockCredentialStore>();
    std::shared_ptr<const DecisionEngine> engine;

    explicit Fixture(std::vector<std::string> allowed_groups = {}) {
        dir->simple_accounts["uid=svc,ou=people,dc=example,dc=com"] = "svc-pass";
        dir->simple_accounts[kAliceDn] = "alice-pw";
        dir->add_person(kAliceDn, "uid", "alice", "Alice Example",
                        {"cn=staff,dc=example,dc=com"});

        DirectoryConfig c;
        c.server = "ldap.example.com";
        c.base_dn = "ou=people,dc=example,dc=com";
        c.bind_username = "svc";
        c.bind_password = "svc-pass";
        c.allowed_group_dns = std::move(allowed_groups);

        auto sessions = std::make_shared<const SessionBuilder>(
            std::make_shared<const DirectoryConfig>(std::move(c)),
            std::make_shared<MockDirectoryConnector>(dir));
        engine = std::make_shared<const DecisionEngine>(std::move(sessions));
    }

    LoginFlow flow(bool with_resolver = false) const {
        std::shared_ptr<CredentialResolver> resolver;
        if (with_resolver) {
            resolver = std::make_shared<CredentialResolver>(store, "ldap", "corp");
        }
        return LoginFlow(engine, "LDAP Authentication", resolver);
    }
};

} // anonymous namespace

TEST_CASE("LoginFlow - no input shows the credentials form", "[auth][flow]") {
    Fixture f;
    const auto flow = f.flow();
    auto state = LoginFlowState::AWAITING_CREDENTIALS;

    const auto step = flow.step(state, std::nullopt);
    CHECK(step.type == FlowStepType::FORM);
    CHECK(step.step_id == "init");
    CHECK(step.errors.empty());
    REQUIRE(step.data_schema.size() == 2);
    CHECK(step.data_schema[0].name == "username");
    CHECK_FALSE(step.data_schema[0].secret);
    CHECK(step.data_schema[1].name == "password");
    CHECK(step.data_schema[1].secret);
    CHECK(state == LoginFlowState::AWAITING_CREDENTIALS);
    CHECK(f.dir->count_calls("connect") == 0);
}

TEST_CASE("LoginFlow - valid credentials complete the flow", "[auth][flow]") {
    Fixture f;
    const auto flow = f.flow();
    auto state = LoginFlowState::AWAITING_CREDENTIALS;

    const auto step = flow.step(state, AuthnRequest("alice", "alice-pw"));
    REQUIRE(step.type == FlowStepType::CREATE_ENTRY);
    CHECK(step.title == "LDAP Authentication");
    REQUIRE(step.data.size() == 1);
    CHECK(step.data.at("username") == "alice");
    CHECK_FALSE(step.credential.has_value());
    CHECK(state == LoginFlowState::COMPLETED);
}

TEST_CASE("LoginFlow - wrong password re-shows form with invalid_auth", "[auth][flow]") {
    Fixture f;
    const auto flow = f.flow();
    auto state = LoginFlowState::AWAITING_CREDENTIALS;

    const auto step = flow.step(state, AuthnRequest("alice", "wrong"));
    REQUIRE(step.type == FlowStepType::FORM);
    CHECK(step.step_id == "init");
    CHECK(step.errors.at("base") == "invalid_auth");
    CHECK(state == LoginFlowState::AWAITING_CREDENTIALS);

    // the user can retry on the same flow
    const auto retry = flow.step(state, AuthnRequest("alice", "alice-pw"));
    CHECK(retry.type == FlowStepType::CREATE_ENTRY);
    CHECK(state == LoginFlowState::COMPLETED);
}

TEST_CASE("LoginFlow - payload without password is invalid_auth", "[auth][flow]") {
    Fixture f;
    const auto flow = f.flow();
    auto state = LoginFlowState::AWAITING_CREDENTIALS;

    AuthnRequest request;
    request.username = "alice";
    const auto step = flow.step(state, std::move(request));
    REQUIRE(step.type == FlowStepType::FORM);
    CHECK(step.errors.at("base") == "invalid_auth");
    CHECK(f.dir->count_calls(std::string("simple_bind ") + kAliceDn) == 0);
}

TEST_CASE("LoginFlow - group denial reads as invalid_auth", "[auth][flow][groups]") {
    Fixture f({"cn=admins,dc=example,dc=com"});
    const auto flow = f.flow();
    auto state = LoginFlowState::AWAITING_CREDENTIALS;

    const auto step = flow.step(state, AuthnRequest("alice", "alice-pw"));
    REQUIRE(step.type == FlowStepType::FORM);
    CHECK(step.errors.at("base") == "invalid_auth");
}

TEST_CASE("LoginFlow - directory unreachable reads as error", "[auth][flow]") {
    Fixture f;
    f.dir->connect_fails = true;
    const auto flow = f.flow();
    auto state = LoginFlowState::AWAITING_CREDENTIALS;

    const auto step = flow.step(state, AuthnRequest("alice", "alice-pw"));
    REQUIRE(step.type == FlowStepType::FORM);
    CHECK(step.errors.at("base") == "error");
}

TEST_CASE("LoginFlow - unknown user reads as error", "[auth][flow]") {
    Fixture f;
    f.dir->entries.clear();
    const auto flow = f.flow();
    auto state = LoginFlowState::AWAITING_CREDENTIALS;

    const auto step = flow.step(state, AuthnRequest("alice", "alice-pw"));
    REQUIRE(step.type == FlowStepType::FORM);
    CHECK(step.errors.at("base") == "error");
}

TEST_CASE("LoginFlow - completed flow aborts further steps", "[auth][flow]") {
    Fixture f;
    const auto flow = f.flow();
    auto state = LoginFlowState::COMPLETED;

    const auto step = flow.step(state, AuthnRequest("alice", "alice-pw"));
    CHECK(step.type == FlowStepType::ABORT);
    CHECK(step.reason == "already_completed");
    CHECK(f.dir->count_calls("connect") == 0);
}

TEST_CASE("LoginFlow - error code mapping", "[auth][flow]") {
    CHECK(LoginFlow::error_code(AuthFailure::INVALID_CREDENTIALS) == "invalid_auth");
    CHECK(LoginFlow::error_code(AuthFailure::BIND_FAILURE) == "invalid_auth");
    CHECK(LoginFlow::error_code(AuthFailure::GROUP_MEMBERSHIP_DENIED) == "invalid_auth");
    CHECK(LoginFlow::error_code(AuthFailure::TRANSPORT_FAILURE) == "error");
    CHECK(LoginFlow::error_code(AuthFailure::DIRECTORY_QUERY_FAILURE) == "error");
    CHECK(LoginFlow::error_code(AuthFailure::CONFIG_ERROR) == "error");
}

TEST_CASE("LoginFlow - resolver attaches an idempotent credential", "[auth][flow][credentials]") {
    Fixture f;
    const auto flow = f.flow(true);

    auto first_state = LoginFlowState::AWAITING_CREDENTIALS;
    const auto first = flow.step(first_state, AuthnRequest("alice", "alice-pw"));
    REQUIRE(first.credential.has_value());
    CHECK(first.credential->is_new);
    CHECK(first.credential->data.at("username") == "alice");

    auto second_state = LoginFlowState::AWAITING_CREDENTIALS;
    const auto second = flow.step(second_state, AuthnRequest("alice", "alice-pw"));
    REQUIRE(second.credential.has_value());
    CHECK_FALSE(second.credential->is_new);
    CHECK(second.credential->id == first.credential->id);
    CHECK(f.store->size() == 1);
}

// ============================================================================
// JSON rendering
// ============================================================================

TEST_CASE("FlowStep JSON - form", "[auth][flow][json]") {
    Fixture f;
    const auto flow = f.flow();
    auto state = LoginFlowState::AWAITING_CREDENTIALS;

    const auto j = flow.step(state, AuthnRequest("alice", "wrong")).to_json();
    CHECK(j["type"] == "form");
    CHECK(j["step_id"] == "init");
    REQUIRE(j["data_schema"].size() == 2);
    CHECK(j["data_schema"][0]["name"] == "username");
    CHECK_FALSE(j["data_schema"][0].contains("secret"));
    CHECK(j["data_schema"][1]["secret"] == true);
    CHECK(j["errors"]["base"] == "invalid_auth");
}

TEST_CASE("FlowStep JSON - create entry never carries the password", "[auth][flow][json]") {
    Fixture f;
    const auto flow = f.flow();
    auto state = LoginFlowState::AWAITING_CREDENTIALS;

    const auto j = flow.step(state, AuthnRequest("alice", "alice-pw")).to_json();
    CHECK(j["type"] == "create_entry");
    CHECK(j["title"] == "LDAP Authentication");
    CHECK(j["data"]["username"] == "alice");
    CHECK_FALSE(j["data"].contains("password"));
    CHECK(j.dump().find("alice-pw") == std::string::npos);
}

TEST_CASE("FlowStep JSON - abort", "[auth][flow][json]") {
    FlowStep step;
    step.type = FlowStepType::ABORT;
    step.reason = "already_completed";
    const auto j = step.to_json();
    CHECK(j["type"] == "abort");
    CHECK(j["reason"] == "already_completed");
}
