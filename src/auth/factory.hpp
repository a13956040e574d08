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

// Warden Component Factory - Header
// Builds the shared authentication services from configuration

#pragma once

#include <memory>

#include "../authz/permission_resolver.hpp"
#include "../control/config.hpp"
#include "session.hpp"
#include "token_codec.hpp"

namespace warden::auth {

/// Token codec from security.token_secret and previous secrets
/// Throws std::invalid_argument if a secret is not a 32-byte base64url key.
[[nodiscard]] std::shared_ptr<const TokenCodec> build_token_codec(const control::Config& config);

/// Permission resolver over an in-memory policy store built from config.policy
[[nodiscard]] std::shared_ptr<const authz::PermissionResolver> build_permission_resolver(
    const control::Config& config);

/// Stores and providers the session services are wired to
struct Collaborators {
    std::shared_ptr<const TenantContext> tenant;
    std::shared_ptr<IdentityRegistry> identities;
    std::shared_ptr<GenerationIndexStore> generations;
    std::shared_ptr<const LoginEventStore> login_events;
    std::shared_ptr<const TenantPlanProvider> plans;
};

/// Complete session services: collaborators plus codec, resolver and options from config
[[nodiscard]] std::shared_ptr<const SessionServices> build_session_services(
    const control::Config& config, Collaborators collaborators);

}  // namespace warden::auth
