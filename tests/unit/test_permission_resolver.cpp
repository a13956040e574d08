// Warden Permission Resolver Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/authz/permission_resolver.hpp"
#include "../../src/control/config.hpp"

using namespace warden::authz;
using warden::auth::Account;
using warden::auth::Identity;
using warden::auth::Role;
using warden::auth::RoleSet;
using warden::core::Uuid;

namespace {

Identity user_identity(const Uuid& id, RoleSet roles = {Role::Everyone, Role::Users}) {
    return Identity{Account::user(id, 7, "user"), roles};
}

/// Fixed owner and ACL per provider, counting lookups
class StaticObjectProvider : public SecurityObjectProvider {
public:
    StaticObjectProvider(std::optional<Uuid> owner, std::vector<AclEntry> acl)
        : owner_(owner), acl_(std::move(acl)) {}

    std::optional<Uuid> owner(const SecurityObjectId&) const override {
        ++owner_lookups;
        return owner_;
    }

    std::vector<AclEntry> acl(const SecurityObjectId&) const override { return acl_; }

    mutable int owner_lookups = 0;

private:
    std::optional<Uuid> owner_;
    std::vector<AclEntry> acl_;
};

std::shared_ptr<InMemoryPolicyStore> acl_only_store() {
    auto store = std::make_shared<InMemoryPolicyStore>();
    store->add_rule(std::make_shared<AclRule>());
    return store;
}

}  // namespace

TEST_CASE("PermissionResolver - owner-only edit", "[authz][demand]") {
    // ACL grants edit to the owner only; everyone may read
    Uuid owner = Uuid::random();
    Uuid other = Uuid::random();
    StaticObjectProvider provider(owner, {{AclSubject::owner(), {"read", "edit"}},
                                          {AclSubject::of_role(Role::Everyone), {"read"}}});
    SecurityObjectId document{"document", "42"};
    PermissionResolver resolver(acl_only_store());

    std::vector<Action> edit{"edit"};
    std::vector<Action> read{"read"};

    SECTION("non-owner without administrators role is denied") {
        Identity caller = user_identity(other);
        REQUIRE_FALSE(resolver.check(caller, document, provider, edit));
        REQUIRE_THROWS_AS(resolver.demand(caller, document, provider, edit), AccessDeniedError);
    }

    SECTION("denial carries actor, actions and object") {
        Identity caller = user_identity(other);
        try {
            resolver.demand(caller, document, provider, edit);
            FAIL("demand should have thrown");
        } catch (const AccessDeniedError& e) {
            REQUIRE(e.actor_id() == other);
            REQUIRE(e.denied_actions() == edit);
            REQUIRE(e.object().has_value());
            REQUIRE(*e.object() == document);
        }
    }

    SECTION("control characters in the object id are escaped in the message") {
        SecurityObjectId hostile{"document", "42\nAccess granted"};
        try {
            resolver.demand(user_identity(other), hostile, provider, edit);
            FAIL("demand should have thrown");
        } catch (const AccessDeniedError& e) {
            std::string message = e.what();
            REQUIRE(message.find('\n') == std::string::npos);
            REQUIRE(message.find("42\\nAccess granted") != std::string::npos);
        }
    }

    SECTION("owner may edit") {
        Identity caller = user_identity(owner);
        REQUIRE(resolver.check(caller, document, provider, edit));
        REQUIRE_NOTHROW(resolver.demand(caller, document, provider, edit));
    }

    SECTION("anyone may read") {
        REQUIRE(resolver.check(Identity::guest(), document, provider, read));
    }

    SECTION("guest never matches the owner entry") {
        StaticObjectProvider guest_owned(warden::auth::ids::guest(),
                                         {{AclSubject::owner(), {"edit"}}});
        REQUIRE_FALSE(resolver.check(Identity::guest(), document, guest_owned, edit));
    }
}

TEST_CASE("PermissionResolver - rule semantics", "[authz]") {
    auto store = std::make_shared<InMemoryPolicyStore>();
    store->add_rule(std::make_shared<RoleRule>(Role::Users, std::vector<Action>{"read"}));
    store->add_rule(
        std::make_shared<RoleRule>(Role::Administrators, std::vector<Action>{"read", "edit"}));
    PermissionResolver resolver(store);

    Identity user = user_identity(Uuid::random());
    Identity admin =
        user_identity(Uuid::random(), {Role::Everyone, Role::Users, Role::Administrators});

    SECTION("empty action list is always granted") {
        REQUIRE(resolver.check(Identity::guest(), std::vector<Action>{}));
        REQUIRE_NOTHROW(resolver.demand(Identity::guest(), std::vector<Action>{}));
    }

    SECTION("a single rule must grant every action") {
        std::vector<Action> read_edit{"read", "edit"};
        REQUIRE_FALSE(resolver.check(user, read_edit));
        REQUIRE(resolver.check(admin, read_edit));
    }

    SECTION("grants are not combined across rules") {
        // users:read + owner:edit must not add up to read+edit
        auto split = std::make_shared<InMemoryPolicyStore>();
        split->add_rule(std::make_shared<RoleRule>(Role::Users, std::vector<Action>{"read"}));
        split->add_rule(std::make_shared<OwnerRule>(std::vector<Action>{"edit"}));
        PermissionResolver split_resolver(split);

        StaticObjectProvider provider(user.account.id(), {});
        SecurityObjectId object{"folder", "1"};
        std::vector<Action> read_edit{"read", "edit"};
        std::vector<Action> edit{"edit"};

        REQUIRE_FALSE(split_resolver.check(user, object, provider, read_edit));
        REQUIRE(split_resolver.check(user, object, provider, edit));
    }

    SECTION("decisions are repeatable") {
        std::vector<Action> edit{"edit"};
        for (int i = 0; i < 10; ++i) {
            REQUIRE_FALSE(resolver.check(user, edit));
            REQUIRE(resolver.check(admin, edit));
        }
    }

    SECTION("object rules do not apply to object-less checks") {
        auto owner_store = std::make_shared<InMemoryPolicyStore>();
        owner_store->add_rule(std::make_shared<OwnerRule>(std::vector<Action>{"edit"}));
        owner_store->add_rule(std::make_shared<AclRule>());
        PermissionResolver owner_resolver(owner_store);

        REQUIRE_FALSE(owner_resolver.check(user, std::vector<Action>{"edit"}));
    }
}

TEST_CASE("PermissionResolver - ACL subjects", "[authz][acl]") {
    PermissionResolver resolver(acl_only_store());
    Uuid alice = Uuid::random();
    Uuid bob = Uuid::random();
    SecurityObjectId object{"file", "report.pdf"};
    std::vector<Action> share{"share"};

    SECTION("specific user entry") {
        StaticObjectProvider provider(std::nullopt, {{AclSubject::of_user(alice), {"share"}}});
        REQUIRE(resolver.check(user_identity(alice), object, provider, share));
        REQUIRE_FALSE(resolver.check(user_identity(bob), object, provider, share));
    }

    SECTION("role entry") {
        StaticObjectProvider provider(std::nullopt,
                                      {{AclSubject::of_role(Role::Administrators), {"share"}}});
        REQUIRE_FALSE(resolver.check(user_identity(alice), object, provider, share));
        REQUIRE(resolver.check(
            user_identity(alice, {Role::Everyone, Role::Users, Role::Administrators}), object,
            provider, share));
    }

    SECTION("matching entries are combined") {
        StaticObjectProvider provider(alice, {{AclSubject::owner(), {"edit"}},
                                              {AclSubject::of_role(Role::Users), {"read"}}});
        std::vector<Action> read_edit{"read", "edit"};
        REQUIRE(resolver.check(user_identity(alice), object, provider, read_edit));
        REQUIRE_FALSE(resolver.check(user_identity(bob), object, provider, read_edit));
    }

    SECTION("owner is looked up only when an owner entry exists") {
        StaticObjectProvider provider(alice, {{AclSubject::of_user(alice), {"share"}}});
        REQUIRE(resolver.check(user_identity(alice), object, provider, share));
        REQUIRE(provider.owner_lookups == 0);
    }
}

TEST_CASE("InMemoryPolicyStore - from configuration", "[authz][config]") {
    warden::control::PolicyConfig config;
    config.role_rules.push_back({"users", {"read"}});
    config.role_rules.push_back({"administrators", {"read", "edit", "delete"}});
    config.owner_actions = {"read", "edit"};

    SECTION("builds role, owner and ACL rules") {
        auto store = InMemoryPolicyStore::from_config(config);
        REQUIRE(store->rules().size() == 4);

        PermissionResolver resolver(store);
        Uuid owner = Uuid::random();
        StaticObjectProvider provider(owner, {});
        SecurityObjectId object{"document", "1"};
        std::vector<Action> edit{"edit"};

        REQUIRE(resolver.check(user_identity(owner), object, provider, edit));
        REQUIRE_FALSE(resolver.check(user_identity(Uuid::random()), object, provider, edit));
    }

    SECTION("ACL rule can be disabled") {
        config.acl_rules = false;
        REQUIRE(InMemoryPolicyStore::from_config(config)->rules().size() == 3);
    }

    SECTION("unknown roles are rejected") {
        config.role_rules.push_back({"superuser", {"everything"}});
        REQUIRE_THROWS_AS(InMemoryPolicyStore::from_config(config), std::invalid_argument);
    }

    SECTION("null rules are rejected") {
        InMemoryPolicyStore store;
        REQUIRE_THROWS_AS(store.add_rule(nullptr), std::invalid_argument);
    }
}
