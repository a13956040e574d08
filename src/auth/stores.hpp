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

// Warden Collaborator Interfaces
// Services the surrounding system provides to the authentication core.
// Implementations may block on external storage and may throw; the core
// treats SecurityError as rejection and any other exception as an internal
// failure (both fail closed).

#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

#include "../core/uuid.hpp"
#include "account.hpp"

namespace warden::auth {

/// Tenant resolved for the current request
class TenantContext {
public:
    virtual ~TenantContext() = default;

    [[nodiscard]] virtual int32_t current_tenant_id() const = 0;
};

/// Multi-tenant account lookup
class IdentityRegistry {
public:
    virtual ~IdentityRegistry() = default;

    /// Resolve a user or system identifier (lost-user account on miss)
    [[nodiscard]] virtual Account resolve_by_id(int32_t tenant_id, const core::Uuid& id) const = 0;

    /// Resolve by login and password hash
    /// Unknown login and wrong hash both return the lost-user account; never throws for
    /// "not found".
    [[nodiscard]] virtual Account resolve_by_credential(int32_t tenant_id, std::string_view login,
                                                        std::string_view password_hash) const = 0;

    /// Concrete user record (lost-user record on miss)
    [[nodiscard]] virtual UserRecord find_user(int32_t tenant_id, const core::Uuid& id) const = 0;

    [[nodiscard]] virtual bool is_in_group(const core::Uuid& user_id,
                                           const core::Uuid& group_id) const = 0;

    [[nodiscard]] virtual UserStatus user_status(const core::Uuid& user_id) const = 0;

    /// True if hash equals the user's stored password hash
    [[nodiscard]] virtual bool password_matches(int32_t tenant_id, const core::Uuid& user_id,
                                                std::string_view password_hash) const = 0;

    virtual void set_password_hash(int32_t tenant_id, const core::Uuid& user_id,
                                   std::string_view password_hash) = 0;
};

/// Settings-generation counters used for blanket token revocation
class GenerationIndexStore {
public:
    virtual ~GenerationIndexStore() = default;

    [[nodiscard]] virtual int32_t tenant_generation(int32_t tenant_id) const = 0;
    [[nodiscard]] virtual int32_t user_generation(const core::Uuid& user_id) const = 0;

    /// Lifetime of tokens minted for the tenant (zero = use the configured default)
    [[nodiscard]] virtual std::chrono::minutes tenant_token_lifetime(int32_t tenant_id) const = 0;

    /// Invalidate every token of the tenant; returns the new generation
    virtual int32_t bump_tenant(int32_t tenant_id) = 0;

    /// Invalidate every token of the user; returns the new generation
    virtual int32_t bump_user(const core::Uuid& user_id) = 0;
};

/// Registry of currently valid login events (per-session revocation)
class LoginEventStore {
public:
    virtual ~LoginEventStore() = default;

    [[nodiscard]] virtual std::vector<int32_t> valid_event_ids(int32_t tenant_id,
                                                               const core::Uuid& user_id) const = 0;
};

/// Tenant plan entitlements
class TenantPlanProvider {
public:
    virtual ~TenantPlanProvider() = default;

    /// Directory-provisioned (e.g. LDAP) accounts may sign in
    [[nodiscard]] virtual bool directory_login_entitled(int32_t tenant_id) const = 0;
};

/// Tenant context pinned to a single tenant (CLI, tests, single-tenant deployments)
class FixedTenantContext : public TenantContext {
public:
    explicit FixedTenantContext(int32_t tenant_id) : tenant_id_(tenant_id) {}

    [[nodiscard]] int32_t current_tenant_id() const override { return tenant_id_; }

private:
    int32_t tenant_id_;
};

/// Same entitlement answer for every tenant
class StaticTenantPlan : public TenantPlanProvider {
public:
    explicit StaticTenantPlan(bool directory_login) : directory_login_(directory_login) {}

    [[nodiscard]] bool directory_login_entitled(int32_t) const override { return directory_login_; }

private:
    bool directory_login_;
};

}  // namespace warden::auth
