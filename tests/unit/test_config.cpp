// Warden Configuration Unit Tests

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include "../../src/auth/factory.hpp"
#include "../../src/auth/generation_index.hpp"
#include "../../src/auth/identity_registry.hpp"
#include "../../src/auth/login_events.hpp"
#include "../../src/control/config.hpp"

using namespace warden::control;

namespace {

// 32 zero bytes and 32 0xff bytes, base64url without padding
constexpr const char* kSecretA = "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA";
constexpr const char* kSecretB = "__________________________________________8";

Config valid_config() {
    Config config;
    config.security.token_secret = kSecretA;
    return config;
}

void write_file(const std::string& path, const std::string& contents) {
    std::ofstream file(path);
    file << contents;
}

}  // namespace

TEST_CASE("Config JSON deserialization", "[control][config]") {
    SECTION("missing sections keep their defaults") {
        auto config = nlohmann::json::parse("{}").get<Config>();
        REQUIRE(config.security.default_token_lifetime_minutes == 525600);
        REQUIRE_FALSE(config.security.standalone);
        REQUIRE(config.logging.level == "info");
        REQUIRE(config.logging.output == "stdout");
        REQUIRE(config.logging.rotation.max_files == 10);
        REQUIRE(config.policy.acl_rules);
        REQUIRE(config.policy.role_rules.empty());
    }

    SECTION("full document") {
        const char* json = R"({
            "version": "2.1",
            "security": {
                "token_secret": "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA",
                "previous_token_secrets": ["__________________________________________8"],
                "default_token_lifetime_minutes": 30,
                "standalone": true
            },
            "logging": {"level": "debug", "format": "json", "output": "/tmp/warden_logs",
                        "rotation": {"max_size_mb": 5, "max_files": 2}},
            "policy": {
                "role_rules": [{"role": "administrators", "actions": ["read", "edit"]}],
                "owner_actions": ["edit"],
                "acl_rules": false
            }
        })";

        auto config = ConfigLoader::load_from_json(json);
        REQUIRE(config.has_value());
        REQUIRE(config->version == "2.1");
        REQUIRE(config->security.previous_token_secrets.size() == 1);
        REQUIRE(config->security.default_token_lifetime_minutes == 30);
        REQUIRE(config->security.standalone);
        REQUIRE(config->logging.format == "json");
        REQUIRE(config->logging.rotation.max_size_mb == 5);
        REQUIRE(config->policy.role_rules.size() == 1);
        REQUIRE(config->policy.role_rules[0].role == "administrators");
        REQUIRE(config->policy.owner_actions == std::vector<std::string>{"edit"});
        REQUIRE_FALSE(config->policy.acl_rules);
    }

    SECTION("invalid JSON") {
        REQUIRE_FALSE(ConfigLoader::load_from_json("{not json").has_value());
    }
}

TEST_CASE("Config JSON serialization", "[control][config]") {
    Config config = valid_config();
    config.policy.role_rules.push_back({"users", {"read"}});

    auto reparsed = ConfigLoader::load_from_json(ConfigLoader::to_json(config));
    REQUIRE(reparsed.has_value());
    REQUIRE(reparsed->security.token_secret == kSecretA);
    REQUIRE(reparsed->policy.role_rules.size() == 1);
    REQUIRE(reparsed->policy.role_rules[0].actions == std::vector<std::string>{"read"});
}

TEST_CASE("Config validation", "[control][config]") {
    SECTION("valid config") {
        auto result = ConfigLoader::validate(valid_config());
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(result.warnings.empty());
    }

    SECTION("secret is required") {
        auto result = ConfigLoader::validate(Config{});
        REQUIRE(result.has_errors());
    }

    SECTION("secret must be 32 bytes of base64url") {
        Config config = valid_config();
        config.security.token_secret = "c2hvcnQ";
        REQUIRE(ConfigLoader::validate(config).has_errors());

        config.security.token_secret = "not+base64url/";
        REQUIRE(ConfigLoader::validate(config).has_errors());
    }

    SECTION("previous secrets are validated too") {
        Config config = valid_config();
        config.security.previous_token_secrets = {kSecretB, "short"};
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.errors.size() == 1);
    }

    SECTION("non-expiring tokens produce a warning") {
        Config config = valid_config();
        config.security.default_token_lifetime_minutes = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.has_errors());
        REQUIRE(result.warnings.size() == 1);
    }

    SECTION("unknown log level and format") {
        Config config = valid_config();
        config.logging.level = "verbose";
        config.logging.format = "xml";
        REQUIRE(ConfigLoader::validate(config).errors.size() == 2);
    }

    SECTION("policy roles and actions") {
        Config config = valid_config();
        config.policy.role_rules.push_back({"superuser", {"read"}});
        config.policy.role_rules.push_back({"users", {""}});
        config.policy.owner_actions = {"edit", ""};
        REQUIRE(ConfigLoader::validate(config).errors.size() == 3);
    }

    SECTION("invalid config is not loaded") {
        REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"security": {"token_secret": "x"}})")
                          .has_value());
    }
}

TEST_CASE("Config file operations", "[control][config]") {
    Config config = valid_config();
    config.version = "test";

    std::string temp_path = "/tmp/warden_test_config.json";
    REQUIRE(ConfigLoader::save_to_file(config, temp_path));

    auto loaded = ConfigLoader::load_from_file(temp_path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->version == "test");

    REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/warden.json").has_value());

    std::filesystem::remove(temp_path);
}

TEST_CASE("ConfigManager reload", "[control][config]") {
    std::string temp_path = "/tmp/warden_reload_test.json";
    write_file(temp_path, std::string(R"({"version": "v1", "security": {"token_secret": ")") +
                              kSecretA + R"("}})");

    ConfigManager manager;
    REQUIRE_FALSE(manager.is_loaded());
    REQUIRE(manager.load(temp_path));
    REQUIRE(manager.config_path() == temp_path);

    auto v1 = manager.get();
    REQUIRE(v1->version == "v1");

    SECTION("valid update is swapped in") {
        write_file(temp_path, std::string(R"({"version": "v2", "security": {"token_secret": ")") +
                                  kSecretB + R"("}})");
        REQUIRE(manager.reload());
        REQUIRE(manager.get()->version == "v2");

        // Readers keep the snapshot they hold
        REQUIRE(v1->version == "v1");
    }

    SECTION("invalid update keeps the previous config") {
        write_file(temp_path, R"({"version": "broken", "security": {"token_secret": ""}})");
        REQUIRE_FALSE(manager.reload());
        REQUIRE(manager.get()->version == "v1");
    }

    std::filesystem::remove(temp_path);
}

TEST_CASE("Session services from configuration", "[control][config][factory]") {
    Config config = valid_config();
    config.security.previous_token_secrets = {kSecretB};
    config.security.default_token_lifetime_minutes = 15;
    config.policy.role_rules.push_back({"users", {"read"}});

    SECTION("codec accepts tokens sealed with previous secrets") {
        Config old_config = valid_config();
        old_config.security.token_secret = kSecretB;

        auto old_codec = warden::auth::build_token_codec(old_config);
        auto codec = warden::auth::build_token_codec(config);
        REQUIRE(codec->key_count() == 2);

        warden::auth::SessionToken token;
        token.tenant_id = 1;
        token.user_id = warden::core::Uuid::random();
        REQUIRE(codec->decode(old_codec->encode(token)));
    }

    SECTION("invalid secrets are rejected") {
        config.security.token_secret = "short";
        REQUIRE_THROWS_AS(warden::auth::build_token_codec(config), std::invalid_argument);
    }

    SECTION("services carry options from config") {
        warden::auth::Collaborators collaborators;
        collaborators.tenant = std::make_shared<warden::auth::FixedTenantContext>(1);
        collaborators.identities = std::make_shared<warden::auth::InMemoryIdentityRegistry>();
        collaborators.generations = std::make_shared<warden::auth::InMemoryGenerationIndexStore>();
        collaborators.login_events = std::make_shared<warden::auth::InMemoryLoginEventStore>();
        collaborators.plans = std::make_shared<warden::auth::StaticTenantPlan>(false);

        auto services = warden::auth::build_session_services(config, std::move(collaborators));
        REQUIRE(services->options.default_token_lifetime == std::chrono::minutes{15});
        REQUIRE_FALSE(services->options.standalone);

        warden::auth::AuthenticationSession session(services);
        REQUIRE(session.state() == warden::auth::SessionState::Anonymous);
    }
}
