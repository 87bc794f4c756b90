#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "directory/idirectory_connection.hpp"
#include "directory/ldap_escape.hpp"

#include <algorithm>
#include <string>

using namespace dirauth;

// ============================================================================
// Result / Status
// ============================================================================

TEST_CASE("Result carries value or failure", "[core][error]") {
    auto ok = Result<int>::ok(42);
    REQUIRE(ok.is_ok());
    CHECK(ok.value() == 42);
    CHECK(ok.failure() == AuthFailure::NONE);

    auto err = Result<int>::error(AuthFailure::DIRECTORY_QUERY_FAILURE, "nothing found");
    REQUIRE(err.is_error());
    CHECK(err.failure() == AuthFailure::DIRECTORY_QUERY_FAILURE);
    CHECK(err.error_message() == "nothing found");
}

TEST_CASE("Status converts into a Result with the same failure", "[core][error]") {
    const auto st = Status::error(AuthFailure::BIND_FAILURE, "rejected");
    REQUIRE(st.is_error());

    const auto r = st.as_result<std::string>();
    CHECK(r.is_error());
    CHECK(r.failure() == AuthFailure::BIND_FAILURE);
    CHECK(r.error_message() == "rejected");

    CHECK(Status::ok().is_ok());
}

TEST_CASE("Failure names are stable", "[core][error]") {
    CHECK(failure_name(AuthFailure::INVALID_CREDENTIALS) == "invalid_credentials");
    CHECK(failure_name(AuthFailure::GROUP_MEMBERSHIP_DENIED) == "group_membership_denied");
    CHECK(failure_name(AuthFailure::TRANSPORT_FAILURE) == "transport_failure");
}

// ============================================================================
// String helpers
// ============================================================================

TEST_CASE("iequals ignores ASCII case", "[core][utils]") {
    CHECK(utils::iequals("CN=Staff,DC=Example,DC=Com", "cn=staff,dc=example,dc=com"));
    CHECK_FALSE(utils::iequals("cn=staff", "cn=staff2"));
    CHECK(utils::iequals("", ""));
}

TEST_CASE("join", "[core][utils]") {
    CHECK(utils::join({"a", "b", "c"}, "; ") == "a; b; c");
    CHECK(utils::join({"only"}, ", ") == "only");
    CHECK(utils::join({}, ",").empty());
}

TEST_CASE("Log level parsing", "[core][log]") {
    CHECK(utils::log::parse_level("DEBUG") == utils::log::Level::DEBUG);
    CHECK(utils::log::parse_level("warning") == utils::log::Level::WARN);
    CHECK_FALSE(utils::log::parse_level("verbose").has_value());
}

// ============================================================================
// AuthnRequest
// ============================================================================

namespace {

bool buffer_is_wiped(const std::string& s) {
    const char* buf = s.data();
    return std::all_of(buf, buf + s.capacity(), [](char c) { return c == '\0'; });
}

} // anonymous namespace

TEST_CASE("AuthnRequest discards its password", "[core][types]") {
    AuthnRequest req("alice", "s3cret");
    req.discard_password();
    CHECK(req.password.empty());
    CHECK(buffer_is_wiped(req.password));
    CHECK(req.username == "alice");
}

TEST_CASE("Moved-from AuthnRequest keeps no password bytes", "[core][types]") {
    SECTION("short password in the inline buffer") {
        AuthnRequest a("alice", "hunter2");
        AuthnRequest b(std::move(a));
        CHECK(b.password == "hunter2");
        CHECK(a.password.empty());
        CHECK(buffer_is_wiped(a.password));
    }

    SECTION("long password on the heap") {
        const std::string secret(64, 'x');
        AuthnRequest a("alice", secret);
        AuthnRequest b(std::move(a));
        CHECK(b.password == secret);
        CHECK(buffer_is_wiped(a.password));
    }

    SECTION("move assignment") {
        AuthnRequest a("alice", "hunter2");
        AuthnRequest b("bob", "tr0ub4dor");
        b = std::move(a);
        CHECK(b.username == "alice");
        CHECK(b.password == "hunter2");
        CHECK(buffer_is_wiped(a.password));
    }
}

// ============================================================================
// Escaping
// ============================================================================

TEST_CASE("Filter values escape RFC 4515 specials", "[directory][escape]") {
    CHECK(ldap_escape::filter_value("alice") == "alice");
    CHECK(ldap_escape::filter_value("*") == "\\2a");
    CHECK(ldap_escape::filter_value("a(b)c") == "a\\28b\\29c");
    CHECK(ldap_escape::filter_value("dom\\user") == "dom\\5cuser");
}

TEST_CASE("DN values escape RFC 4514 specials", "[directory][escape]") {
    CHECK(ldap_escape::dn_value("alice") == "alice");
    CHECK(ldap_escape::dn_value("a,ou=admins") == "a\\,ou\\=admins");
    CHECK(ldap_escape::dn_value(" lead") == "\\ lead");
    CHECK(ldap_escape::dn_value("trail ") == "trail\\ ");
    CHECK(ldap_escape::dn_value("#x") == "\\#x");
}

TEST_CASE("DirectoryEntry attribute lookup is case-insensitive", "[directory]") {
    DirectoryEntry entry;
    entry.dn = "uid=alice,dc=example,dc=com";
    entry.attributes["displayName"] = {"Alice Example"};
    entry.attributes["memberOf"] = {"cn=a", "cn=b"};

    CHECK(entry.first_value("displayname") == "Alice Example");
    REQUIRE(entry.values("MEMBEROF") != nullptr);
    CHECK(entry.values("MEMBEROF")->size() == 2);
    CHECK(entry.first_value("mail").empty());
    CHECK(entry.values("mail") == nullptr);
}
