// Warden Identity Registry Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/auth/errors.hpp"
#include "../../src/auth/identity_registry.hpp"

using namespace warden::auth;
using warden::core::Uuid;

namespace {

UserRecord make_user(int32_t tenant_id, std::string login) {
    UserRecord user;
    user.id = Uuid::random();
    user.tenant_id = tenant_id;
    user.login = login;
    user.display_name = "User " + login;
    return user;
}

}  // namespace

TEST_CASE("InMemoryIdentityRegistry - resolve by id", "[registry]") {
    InMemoryIdentityRegistry registry;
    UserRecord alice = make_user(7, "alice");
    registry.add_user(alice, "hash-a");

    SECTION("known user in its tenant") {
        Account account = registry.resolve_by_id(7, alice.id);
        REQUIRE(account.is_user());
        REQUIRE(account.id() == alice.id);
        REQUIRE(account.tenant_id() == 7);
        REQUIRE(account.display_name() == "User alice");
    }

    SECTION("user of another tenant resolves to the lost user") {
        Account account = registry.resolve_by_id(8, alice.id);
        REQUIRE(account.id() == ids::lost_user());
    }

    SECTION("core system account is registered by default") {
        Account account = registry.resolve_by_id(7, ids::core_system());
        REQUIRE(account.is_system());
        REQUIRE(account.is_authenticated());
    }

    SECTION("additional system accounts") {
        Account service = Account::system(Uuid::random(), "Indexer");
        registry.add_system_account(service);
        REQUIRE(registry.resolve_by_id(3, service.id()) == service);

        REQUIRE_THROWS_AS(registry.add_system_account(Account::anonymous()),
                          std::invalid_argument);
    }
}

TEST_CASE("InMemoryIdentityRegistry - resolve by credential", "[registry][security]") {
    InMemoryIdentityRegistry registry;
    UserRecord alice = make_user(7, "alice");
    registry.add_user(alice, "hash-a");

    SECTION("correct login and hash") {
        Account account = registry.resolve_by_credential(7, "alice", "hash-a");
        REQUIRE(account.id() == alice.id);
    }

    SECTION("wrong hash and unknown login are indistinguishable") {
        Account wrong_hash = registry.resolve_by_credential(7, "alice", "hash-b");
        Account unknown = registry.resolve_by_credential(7, "mallory", "hash-a");

        REQUIRE(wrong_hash.id() == ids::lost_user());
        REQUIRE(unknown.id() == ids::lost_user());
        REQUIRE(wrong_hash == unknown);
    }

    SECTION("logins are unique per tenant, not globally") {
        UserRecord other_alice = make_user(8, "alice");
        registry.add_user(other_alice, "hash-x");

        REQUIRE(registry.resolve_by_credential(7, "alice", "hash-a").id() == alice.id);
        REQUIRE(registry.resolve_by_credential(8, "alice", "hash-x").id() == other_alice.id);
        REQUIRE(registry.resolve_by_credential(8, "alice", "hash-a").id() == ids::lost_user());
    }

    SECTION("replacing a user drops its old login") {
        UserRecord renamed = alice;
        renamed.login = "alice2";
        registry.add_user(renamed, "hash-a");

        REQUIRE(registry.resolve_by_credential(7, "alice", "hash-a").id() == ids::lost_user());
        REQUIRE(registry.resolve_by_credential(7, "alice2", "hash-a").id() == alice.id);
    }
}

TEST_CASE("InMemoryIdentityRegistry - records, groups and passwords", "[registry]") {
    InMemoryIdentityRegistry registry;
    UserRecord alice = make_user(7, "alice");
    registry.add_user(alice, "hash-a");

    SECTION("find_user") {
        REQUIRE(registry.find_user(7, alice.id).login == "alice");
        REQUIRE(registry.find_user(7, Uuid::random()).is_lost());
        REQUIRE(registry.find_user(8, alice.id).is_lost());
    }

    SECTION("status updates") {
        REQUIRE(registry.user_status(alice.id) == UserStatus::Active);
        REQUIRE(registry.set_user_status(alice.id, UserStatus::Disabled));
        REQUIRE(registry.user_status(alice.id) == UserStatus::Disabled);
        REQUIRE(registry.find_user(7, alice.id).status == UserStatus::Disabled);

        REQUIRE_FALSE(registry.set_user_status(Uuid::random(), UserStatus::Active));
        REQUIRE(registry.user_status(Uuid::random()) == UserStatus::Terminated);
    }

    SECTION("group membership") {
        REQUIRE_FALSE(registry.is_in_group(alice.id, ids::admin_group()));
        registry.add_to_group(alice.id, ids::admin_group());
        REQUIRE(registry.is_in_group(alice.id, ids::admin_group()));
        registry.remove_from_group(alice.id, ids::admin_group());
        REQUIRE_FALSE(registry.is_in_group(alice.id, ids::admin_group()));
    }

    SECTION("password hash updates") {
        REQUIRE(registry.password_matches(7, alice.id, "hash-a"));
        REQUIRE_FALSE(registry.password_matches(7, alice.id, "hash-b"));
        REQUIRE_FALSE(registry.password_matches(8, alice.id, "hash-a"));

        registry.set_password_hash(7, alice.id, "hash-b");
        REQUIRE(registry.password_matches(7, alice.id, "hash-b"));
        REQUIRE(registry.resolve_by_credential(7, "alice", "hash-a").id() == ids::lost_user());

        REQUIRE_THROWS_AS(registry.set_password_hash(7, Uuid::random(), "x"),
                          InvalidCredentialError);
    }
}
