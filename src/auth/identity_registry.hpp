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

// Warden Identity Registry - In-Memory Implementation
// Reference registry used by the CLI and tests; production deployments plug
// their user directory in behind IdentityRegistry.

#pragma once

#include <mutex>
#include <string>
#include <string_view>

#include "../core/containers.hpp"
#include "stores.hpp"

namespace warden::auth {

class InMemoryIdentityRegistry : public IdentityRegistry {
public:
    /// Registers the core system account
    InMemoryIdentityRegistry();
    ~InMemoryIdentityRegistry() override = default;

    // Non-copyable, non-movable (owns a mutex)
    InMemoryIdentityRegistry(const InMemoryIdentityRegistry&) = delete;
    InMemoryIdentityRegistry& operator=(const InMemoryIdentityRegistry&) = delete;

    /// Add or replace a user; login is unique per tenant
    void add_user(UserRecord user, std::string password_hash);

    /// Add a system account (must be AccountKind::System)
    void add_system_account(const Account& account);

    void add_to_group(const core::Uuid& user_id, const core::Uuid& group_id);
    void remove_from_group(const core::Uuid& user_id, const core::Uuid& group_id);

    /// Returns false for unknown users
    bool set_user_status(const core::Uuid& user_id, UserStatus status);

    // IdentityRegistry
    [[nodiscard]] Account resolve_by_id(int32_t tenant_id, const core::Uuid& id) const override;
    [[nodiscard]] Account resolve_by_credential(int32_t tenant_id, std::string_view login,
                                                std::string_view password_hash) const override;
    [[nodiscard]] UserRecord find_user(int32_t tenant_id, const core::Uuid& id) const override;
    [[nodiscard]] bool is_in_group(const core::Uuid& user_id,
                                   const core::Uuid& group_id) const override;
    [[nodiscard]] UserStatus user_status(const core::Uuid& user_id) const override;
    [[nodiscard]] bool password_matches(int32_t tenant_id, const core::Uuid& user_id,
                                        std::string_view password_hash) const override;
    void set_password_hash(int32_t tenant_id, const core::Uuid& user_id,
                           std::string_view password_hash) override;

private:
    struct UserEntry {
        UserRecord record;
        std::string password_hash;
    };

    /// Constant-time comparison; a length mismatch still costs a full compare
    [[nodiscard]] static bool hash_equals(std::string_view expected, std::string_view actual);

    mutable std::mutex mutex_;
    core::fast_map<core::Uuid, UserEntry> users_;
    core::fast_map<int32_t, core::fast_map<std::string, core::Uuid>> logins_;  // tenant -> login
    core::fast_map<core::Uuid, Account> system_accounts_;
    core::fast_map<core::Uuid, core::fast_set<core::Uuid>> groups_;  // user -> groups
    std::string dummy_hash_;  // Compared against on unknown logins
};

}  // namespace warden::auth
