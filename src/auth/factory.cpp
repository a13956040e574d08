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

// Warden Component Factory - Implementation

#include "factory.hpp"

#include <stdexcept>

#include "../authz/policy.hpp"
#include "../core/logging.hpp"

namespace warden::auth {

std::shared_ptr<const TokenCodec> build_token_codec(const control::Config& config) {
    auto primary = TokenKey::from_base64url(config.security.token_secret);
    if (!primary) {
        throw std::invalid_argument("security.token_secret is not a 32-byte base64url key");
    }

    std::vector<TokenKey> previous;
    previous.reserve(config.security.previous_token_secrets.size());
    for (const auto& secret : config.security.previous_token_secrets) {
        auto key = TokenKey::from_base64url(secret);
        if (!key) {
            throw std::invalid_argument(
                "security.previous_token_secrets contains an invalid key");
        }
        previous.push_back(*key);
    }

    auto codec = std::make_shared<const TokenCodec>(*primary, std::move(previous));
    if (auto* logger = logging::get_current_logger()) {
        LOG_INFO(logger, "Token codec ready: keys={}", codec->key_count());
    }
    return codec;
}

std::shared_ptr<const authz::PermissionResolver> build_permission_resolver(
    const control::Config& config) {
    auto store = authz::InMemoryPolicyStore::from_config(config.policy);
    return std::make_shared<const authz::PermissionResolver>(std::move(store));
}

std::shared_ptr<const SessionServices> build_session_services(const control::Config& config,
                                                              Collaborators collaborators) {
    auto services = std::make_shared<SessionServices>();
    services->tenant = std::move(collaborators.tenant);
    services->identities = std::move(collaborators.identities);
    services->generations = std::move(collaborators.generations);
    services->login_events = std::move(collaborators.login_events);
    services->plans = std::move(collaborators.plans);
    services->codec = build_token_codec(config);
    services->permissions = build_permission_resolver(config);
    services->options.default_token_lifetime =
        std::chrono::minutes{config.security.default_token_lifetime_minutes};
    services->options.standalone = config.security.standalone;
    return services;
}

}  // namespace warden::auth
