/*
 * Copyright 2025 Warden Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Warden - Session Token Tool
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "auth/factory.hpp"
#include "auth/token_codec.hpp"
#include "control/config.hpp"
#include "core/base64url.hpp"
#include "core/logging.hpp"

namespace {

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage:\n"
            "  %s --config <config.json> encode --tenant N --user UUID --tenant-gen N\n"
            "        --user-gen N [--expires EPOCH|never] [--event N]\n"
            "  %s --config <config.json> decode <token>\n"
            "  %s keygen\n",
            program, program, program);
}

template <typename T>
std::optional<T> parse_integer(std::string_view text) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(std::string(text), &consumed);
        if (consumed != text.size() || value < std::numeric_limits<T>::min() ||
            value > std::numeric_limits<T>::max()) {
            return std::nullopt;
        }
        return static_cast<T>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int run_keygen() {
    auto key = warden::auth::TokenKey::generate();
    std::string_view raw(reinterpret_cast<const char*>(key.bytes.data()), key.bytes.size());
    printf("%s\n", warden::core::base64url_encode(raw).c_str());
    return EXIT_SUCCESS;
}

int run_encode(const warden::auth::TokenCodec& codec, int argc, char* argv[], int first) {
    warden::auth::SessionToken token;
    bool have_tenant = false, have_user = false, have_tenant_gen = false, have_user_gen = false;

    for (int i = first; i < argc; ++i) {
        std::string_view flag = argv[i];
        if (i + 1 >= argc) {
            fprintf(stderr, "Missing value for %s\n", argv[i]);
            return EXIT_FAILURE;
        }
        std::string_view value = argv[++i];

        if (flag == "--tenant") {
            auto parsed = parse_integer<int32_t>(value);
            if (!parsed) {
                fprintf(stderr, "Invalid --tenant: %s\n", argv[i]);
                return EXIT_FAILURE;
            }
            token.tenant_id = *parsed;
            have_tenant = true;
        } else if (flag == "--user") {
            auto parsed = warden::core::Uuid::parse(value);
            if (!parsed) {
                fprintf(stderr, "Invalid --user: %s\n", argv[i]);
                return EXIT_FAILURE;
            }
            token.user_id = *parsed;
            have_user = true;
        } else if (flag == "--tenant-gen") {
            auto parsed = parse_integer<int32_t>(value);
            if (!parsed) {
                fprintf(stderr, "Invalid --tenant-gen: %s\n", argv[i]);
                return EXIT_FAILURE;
            }
            token.tenant_generation = *parsed;
            have_tenant_gen = true;
        } else if (flag == "--user-gen") {
            auto parsed = parse_integer<int32_t>(value);
            if (!parsed) {
                fprintf(stderr, "Invalid --user-gen: %s\n", argv[i]);
                return EXIT_FAILURE;
            }
            token.user_generation = *parsed;
            have_user_gen = true;
        } else if (flag == "--expires") {
            if (value == "never") {
                token.expires_at = warden::auth::kNeverExpires;
            } else {
                auto parsed = parse_integer<int64_t>(value);
                if (!parsed) {
                    fprintf(stderr, "Invalid --expires: %s\n", argv[i]);
                    return EXIT_FAILURE;
                }
                token.expires_at = *parsed;
            }
        } else if (flag == "--event") {
            auto parsed = parse_integer<int32_t>(value);
            if (!parsed) {
                fprintf(stderr, "Invalid --event: %s\n", argv[i]);
                return EXIT_FAILURE;
            }
            token.login_event_id = *parsed;
        } else {
            fprintf(stderr, "Unknown option: %s\n", flag.data());
            return EXIT_FAILURE;
        }
    }

    if (!have_tenant || !have_user || !have_tenant_gen || !have_user_gen) {
        fprintf(stderr, "encode requires --tenant, --user, --tenant-gen and --user-gen\n");
        return EXIT_FAILURE;
    }

    try {
        printf("%s\n", codec.encode(token).c_str());
    } catch (const std::exception& e) {
        fprintf(stderr, "Token encoding failed: %s\n", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int run_decode(const warden::auth::TokenCodec& codec, std::string_view encoded) {
    if (warden::auth::TokenCodec::is_bearer_sentinel(encoded)) {
        fprintf(stderr, "Value is the bearer sentinel, not a session token\n");
        return EXIT_FAILURE;
    }

    auto result = codec.decode(encoded);
    if (!result) {
        nlohmann::json j = {{"valid", false},
                            {"error", warden::auth::decode_error_to_string(result.error)}};
        printf("%s\n", j.dump(2).c_str());
        return EXIT_FAILURE;
    }

    const auto& token = result.token;
    nlohmann::json j = {{"valid", true},
                        {"tenant_id", token.tenant_id},
                        {"user_id", token.user_id.to_string()},
                        {"tenant_generation", token.tenant_generation},
                        {"user_generation", token.user_generation},
                        {"login_event_id", token.login_event_id}};
    if (token.never_expires()) {
        j["expires_at"] = "never";
    } else {
        j["expires_at"] = token.expires_at;
    }
    printf("%s\n", j.dump(2).c_str());
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2 && std::string_view(argv[1]) == "keygen") {
        return run_keygen();
    }

    if (argc < 4 || std::string_view(argv[1]) != "--config") {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];
    std::string_view command = argv[3];

    warden::control::ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_path.c_str());

        const auto& validation = config_manager.last_validation();
        if (!validation.errors.empty()) {
            fprintf(stderr, "Configuration validation errors:\n");
            for (const auto& error : validation.errors) {
                fprintf(stderr, "  - %s\n", error.c_str());
            }
        }
        return EXIT_FAILURE;
    }

    auto config = config_manager.get();
    for (const auto& warning : config_manager.last_validation().warnings) {
        fprintf(stderr, "Warning: %s\n", warning.c_str());
    }

    warden::logging::init_logging_system();
    warden::logging::init_logger("warden", config->logging);

    int status = EXIT_FAILURE;
    try {
        auto codec = warden::auth::build_token_codec(*config);

        if (command == "encode") {
            status = run_encode(*codec, argc, argv, 4);
        } else if (command == "decode" && argc == 5) {
            status = run_decode(*codec, argv[4]);
        } else {
            print_usage(argv[0]);
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
    }

    warden::logging::shutdown_logging();
    return status;
}
