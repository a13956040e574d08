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

// Warden Accounts - Implementation

#include "account.hpp"

namespace warden::auth {

// ============================================================================
// Account
// ============================================================================

Account::Account(AccountKind kind, core::Uuid id, int32_t tenant_id, bool authenticated,
                 std::string display_name)
    : kind_(kind),
      id_(id),
      tenant_id_(tenant_id),
      authenticated_(authenticated),
      display_name_(std::move(display_name)) {}

Account Account::user(core::Uuid id, int32_t tenant_id, std::string display_name) {
    return Account(AccountKind::User, id, tenant_id, true, std::move(display_name));
}

Account Account::system(core::Uuid id, std::string display_name) {
    // System accounts are global: tenant 0
    return Account(AccountKind::System, id, 0, true, std::move(display_name));
}

Account Account::anonymous() {
    return Account(AccountKind::Anonymous, ids::guest(), 0, false, "Guest");
}

std::string_view account_kind_to_string(AccountKind kind) {
    switch (kind) {
        case AccountKind::User:
            return "user";
        case AccountKind::System:
            return "system";
        case AccountKind::Anonymous:
            return "anonymous";
    }
    return "unknown";
}

std::string_view user_status_to_string(UserStatus status) {
    switch (status) {
        case UserStatus::Active:
            return "active";
        case UserStatus::Disabled:
            return "disabled";
        case UserStatus::Terminated:
            return "terminated";
    }
    return "unknown";
}

// ============================================================================
// Well-known identifiers
// ============================================================================

namespace ids {

const core::Uuid& core_system() {
    static const core::Uuid id = core::uuid_or_nil("a37ee56e-3302-4a7b-b67e-ddbea64cd032");
    return id;
}

const core::Uuid& guest() {
    static const core::Uuid id = core::uuid_or_nil("712d9ec3-5d2b-4b13-824f-71f00191dcca");
    return id;
}

const core::Uuid& lost_user() {
    static const core::Uuid id = core::uuid_or_nil("4a515a15-d4d6-4b8e-828e-e0586f18f3a3");
    return id;
}

const core::Uuid& admin_group() {
    static const core::Uuid id = core::uuid_or_nil("cd84e66b-b803-40fc-99f9-b2969a54a1de");
    return id;
}

}  // namespace ids

bool UserRecord::is_lost() const noexcept {
    return id == ids::lost_user();
}

UserRecord lost_user_record(int32_t tenant_id) {
    UserRecord record;
    record.id = ids::lost_user();
    record.tenant_id = tenant_id;
    record.display_name = "Unknown user";
    record.status = UserStatus::Terminated;
    return record;
}

// ============================================================================
// Roles
// ============================================================================

std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::Everyone:
            return "everyone";
        case Role::System:
            return "system";
        case Role::Administrators:
            return "administrators";
        case Role::Users:
            return "users";
    }
    return "unknown";
}

std::optional<Role> role_from_string(std::string_view name) {
    if (name == "everyone") return Role::Everyone;
    if (name == "system") return Role::System;
    if (name == "administrators") return Role::Administrators;
    if (name == "users") return Role::Users;
    return std::nullopt;
}

RoleSet::RoleSet(std::initializer_list<Role> roles) {
    for (Role role : roles) {
        add(role);
    }
}

std::vector<Role> RoleSet::to_vector() const {
    std::vector<Role> result;
    for (Role role : {Role::Everyone, Role::System, Role::Administrators, Role::Users}) {
        if (has(role)) {
            result.push_back(role);
        }
    }
    return result;
}

std::string RoleSet::to_string() const {
    std::string result;
    for (Role role : to_vector()) {
        if (!result.empty()) {
            result += ",";
        }
        result += role_to_string(role);
    }
    return result;
}

}  // namespace warden::auth
