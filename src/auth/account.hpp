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

// Warden Accounts - Header
// Account values, user records, roles and the request identity

#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/uuid.hpp"

namespace warden::auth {

/// Capability set of an account
enum class AccountKind : uint8_t {
    User,       // Tenant user, receives session tokens
    System,     // Internal service identity
    Anonymous   // Guest, never authenticated
};

/// Immutable account value
/// Identity changes produce a new Account; there are no setters.
class Account {
public:
    [[nodiscard]] static Account user(core::Uuid id, int32_t tenant_id, std::string display_name);
    [[nodiscard]] static Account system(core::Uuid id, std::string display_name);
    [[nodiscard]] static Account anonymous();

    [[nodiscard]] AccountKind kind() const noexcept { return kind_; }
    [[nodiscard]] const core::Uuid& id() const noexcept { return id_; }
    [[nodiscard]] int32_t tenant_id() const noexcept { return tenant_id_; }
    [[nodiscard]] bool is_authenticated() const noexcept { return authenticated_; }
    [[nodiscard]] const std::string& display_name() const noexcept { return display_name_; }

    [[nodiscard]] bool is_user() const noexcept { return kind_ == AccountKind::User; }
    [[nodiscard]] bool is_system() const noexcept { return kind_ == AccountKind::System; }
    [[nodiscard]] bool is_anonymous() const noexcept { return kind_ == AccountKind::Anonymous; }

    friend bool operator==(const Account&, const Account&) = default;

private:
    Account(AccountKind kind, core::Uuid id, int32_t tenant_id, bool authenticated,
            std::string display_name);

    AccountKind kind_;
    core::Uuid id_;
    int32_t tenant_id_;
    bool authenticated_;
    std::string display_name_;
};

[[nodiscard]] std::string_view account_kind_to_string(AccountKind kind);

/// Employment status of a user record
enum class UserStatus : uint8_t {
    Active,
    Disabled,
    Terminated
};

[[nodiscard]] std::string_view user_status_to_string(UserStatus status);

/// Concrete user record as held by the identity registry
struct UserRecord {
    core::Uuid id;
    int32_t tenant_id = 0;
    std::string login;
    std::string display_name;
    UserStatus status = UserStatus::Active;
    std::optional<std::string> directory_sid;  // Set for directory-provisioned users

    [[nodiscard]] bool is_lost() const noexcept;
    [[nodiscard]] bool is_directory_bound() const noexcept { return directory_sid.has_value(); }
};

/// Well-known identifiers
namespace ids {

/// Core system account (internal services)
[[nodiscard]] const core::Uuid& core_system();

/// Guest account used for unauthenticated requests
[[nodiscard]] const core::Uuid& guest();

/// Sentinel returned by registries for unknown users and bad credentials
[[nodiscard]] const core::Uuid& lost_user();

/// Administrators group
[[nodiscard]] const core::Uuid& admin_group();

}  // namespace ids

/// Sentinel record for "no such user" (also used for wrong passwords)
[[nodiscard]] UserRecord lost_user_record(int32_t tenant_id);

/// Capability tags attached to an identity
enum class Role : uint8_t {
    Everyone = 0,
    System = 1,
    Administrators = 2,
    Users = 3
};

[[nodiscard]] std::string_view role_to_string(Role role);
[[nodiscard]] std::optional<Role> role_from_string(std::string_view name);

/// Small closed set of roles (bitmask)
class RoleSet {
public:
    RoleSet() = default;
    RoleSet(std::initializer_list<Role> roles);

    void add(Role role) noexcept { bits_ |= mask(role); }
    [[nodiscard]] bool has(Role role) const noexcept { return (bits_ & mask(role)) != 0; }
    [[nodiscard]] bool empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] std::vector<Role> to_vector() const;
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const RoleSet&, const RoleSet&) = default;

private:
    [[nodiscard]] static constexpr uint8_t mask(Role role) noexcept {
        return static_cast<uint8_t>(1u << static_cast<uint8_t>(role));
    }

    uint8_t bits_ = 0;
};

/// Request identity: one account plus its derived roles
struct Identity {
    Account account = Account::anonymous();
    RoleSet roles{Role::Everyone};

    /// Identity of a request that has not authenticated
    [[nodiscard]] static Identity guest() { return Identity{}; }

    [[nodiscard]] bool is_authenticated() const noexcept { return account.is_authenticated(); }
    [[nodiscard]] bool in_role(Role role) const noexcept { return roles.has(role); }
};

}  // namespace warden::auth
