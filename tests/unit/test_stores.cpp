// Warden Store Unit Tests
// Generation index and login event registry

#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../../src/auth/generation_index.hpp"
#include "../../src/auth/login_events.hpp"

using namespace warden::auth;
using warden::core::Uuid;

TEST_CASE("InMemoryGenerationIndexStore", "[stores][generation]") {
    InMemoryGenerationIndexStore store;
    Uuid user = Uuid::random();

    SECTION("unknown scopes start at zero") {
        REQUIRE(store.tenant_generation(7) == 0);
        REQUIRE(store.user_generation(user) == 0);
        REQUIRE(store.tenant_token_lifetime(7) == std::chrono::minutes{0});
    }

    SECTION("bumps are per scope") {
        REQUIRE(store.bump_tenant(7) == 1);
        REQUIRE(store.bump_tenant(7) == 2);
        REQUIRE(store.tenant_generation(7) == 2);
        REQUIRE(store.tenant_generation(8) == 0);

        REQUIRE(store.bump_user(user) == 1);
        REQUIRE(store.user_generation(user) == 1);
        REQUIRE(store.user_generation(Uuid::random()) == 0);
    }

    SECTION("lifetime is independent of the generation") {
        store.set_tenant_token_lifetime(7, std::chrono::minutes{30});
        REQUIRE(store.tenant_token_lifetime(7) == std::chrono::minutes{30});
        REQUIRE(store.tenant_generation(7) == 0);

        store.bump_tenant(7);
        REQUIRE(store.tenant_token_lifetime(7) == std::chrono::minutes{30});
    }

    SECTION("concurrent bumps are not lost") {
        constexpr int kThreads = 8;
        constexpr int kBumps = 500;

        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < kBumps; ++i) {
                    store.bump_user(user);
                    store.bump_tenant(1);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(store.user_generation(user) == kThreads * kBumps);
        REQUIRE(store.tenant_generation(1) == kThreads * kBumps);
    }
}

TEST_CASE("InMemoryLoginEventStore", "[stores][login_events]") {
    InMemoryLoginEventStore store;
    Uuid user = Uuid::random();

    SECTION("no events for unknown users") {
        REQUIRE(store.valid_event_ids(7, user).empty());
    }

    SECTION("registered events are listed in ascending order") {
        int32_t first = store.register_event(7, user);
        int32_t second = store.register_event(7, user);

        REQUIRE(first != 0);
        REQUIRE(second != 0);
        REQUIRE(first != second);
        REQUIRE(store.valid_event_ids(7, user) == std::vector<int32_t>{first, second});
    }

    SECTION("events are scoped by tenant and user") {
        store.register_event(7, user);
        REQUIRE(store.valid_event_ids(8, user).empty());
        REQUIRE(store.valid_event_ids(7, Uuid::random()).empty());
    }

    SECTION("single revocation leaves other sessions intact") {
        int32_t laptop = store.register_event(7, user);
        int32_t phone = store.register_event(7, user);

        REQUIRE(store.revoke(7, user, laptop));
        REQUIRE(store.valid_event_ids(7, user) == std::vector<int32_t>{phone});

        REQUIRE_FALSE(store.revoke(7, user, laptop));
    }

    SECTION("revoke_all clears the user") {
        store.register_event(7, user);
        store.register_event(7, user);

        REQUIRE(store.revoke_all(7, user) == 2);
        REQUIRE(store.valid_event_ids(7, user).empty());
        REQUIRE(store.revoke_all(7, user) == 0);
    }

    SECTION("ids wrap back to 1 and never hand out 0") {
        InMemoryLoginEventStore near_limit(std::numeric_limits<int32_t>::max());
        REQUIRE(near_limit.register_event(7, user) == std::numeric_limits<int32_t>::max());
        REQUIRE(near_limit.register_event(7, user) == 1);
        REQUIRE(near_limit.register_event(7, user) == 2);
    }

    SECTION("starting id must be positive") {
        REQUIRE_THROWS_AS(InMemoryLoginEventStore(0), std::invalid_argument);
        REQUIRE_THROWS_AS(InMemoryLoginEventStore(-5), std::invalid_argument);
    }

    SECTION("concurrent registration yields unique ids") {
        constexpr int kThreads = 4;
        constexpr int kEvents = 250;

        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < kEvents; ++i) {
                    store.register_event(7, user);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(store.valid_event_ids(7, user).size() == kThreads * kEvents);
    }
}
