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

#include "identity_registry.hpp"

#include <stdexcept>

#include <openssl/crypto.h>

#include "errors.hpp"

namespace warden::auth {

InMemoryIdentityRegistry::InMemoryIdentityRegistry() : dummy_hash_(64, '0') {
    system_accounts_.emplace(ids::core_system(), Account::system(ids::core_system(), "System"));
}

void InMemoryIdentityRegistry::add_user(UserRecord user, std::string password_hash) {
    std::lock_guard lock(mutex_);

    auto existing = users_.find(user.id);
    if (existing != users_.end()) {
        logins_[existing->second.record.tenant_id].erase(existing->second.record.login);
    }

    logins_[user.tenant_id][user.login] = user.id;
    core::Uuid id = user.id;
    users_.insert_or_assign(id, UserEntry{std::move(user), std::move(password_hash)});
}

void InMemoryIdentityRegistry::add_system_account(const Account& account) {
    if (!account.is_system()) {
        throw std::invalid_argument("add_system_account requires a system account");
    }

    std::lock_guard lock(mutex_);
    system_accounts_.insert_or_assign(account.id(), account);
}

void InMemoryIdentityRegistry::add_to_group(const core::Uuid& user_id,
                                            const core::Uuid& group_id) {
    std::lock_guard lock(mutex_);
    groups_[user_id].insert(group_id);
}

void InMemoryIdentityRegistry::remove_from_group(const core::Uuid& user_id,
                                                 const core::Uuid& group_id) {
    std::lock_guard lock(mutex_);
    auto it = groups_.find(user_id);
    if (it != groups_.end()) {
        it->second.erase(group_id);
    }
}

bool InMemoryIdentityRegistry::set_user_status(const core::Uuid& user_id, UserStatus status) {
    std::lock_guard lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return false;
    }
    it->second.record.status = status;
    return true;
}

Account InMemoryIdentityRegistry::resolve_by_id(int32_t tenant_id, const core::Uuid& id) const {
    std::lock_guard lock(mutex_);

    auto system = system_accounts_.find(id);
    if (system != system_accounts_.end()) {
        return system->second;
    }

    auto it = users_.find(id);
    if (it != users_.end() && it->second.record.tenant_id == tenant_id) {
        return Account::user(id, tenant_id, it->second.record.display_name);
    }

    return Account::user(ids::lost_user(), tenant_id, "Unknown user");
}

Account InMemoryIdentityRegistry::resolve_by_credential(int32_t tenant_id, std::string_view login,
                                                        std::string_view password_hash) const {
    std::lock_guard lock(mutex_);

    const UserEntry* entry = nullptr;
    auto tenant_logins = logins_.find(tenant_id);
    if (tenant_logins != logins_.end()) {
        auto login_it = tenant_logins->second.find(std::string(login));
        if (login_it != tenant_logins->second.end()) {
            auto user_it = users_.find(login_it->second);
            if (user_it != users_.end()) {
                entry = &user_it->second;
            }
        }
    }

    // Unknown logins still pay for a hash comparison
    const std::string_view expected = entry ? std::string_view(entry->password_hash)
                                            : std::string_view(dummy_hash_);
    const bool matches = hash_equals(expected, password_hash);

    if (entry && matches) {
        return Account::user(entry->record.id, tenant_id, entry->record.display_name);
    }
    return Account::user(ids::lost_user(), tenant_id, "Unknown user");
}

UserRecord InMemoryIdentityRegistry::find_user(int32_t tenant_id, const core::Uuid& id) const {
    std::lock_guard lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end() || it->second.record.tenant_id != tenant_id) {
        return lost_user_record(tenant_id);
    }
    return it->second.record;
}

bool InMemoryIdentityRegistry::is_in_group(const core::Uuid& user_id,
                                           const core::Uuid& group_id) const {
    std::lock_guard lock(mutex_);
    auto it = groups_.find(user_id);
    return it != groups_.end() && it->second.contains(group_id);
}

UserStatus InMemoryIdentityRegistry::user_status(const core::Uuid& user_id) const {
    std::lock_guard lock(mutex_);
    auto it = users_.find(user_id);
    return it != users_.end() ? it->second.record.status : UserStatus::Terminated;
}

bool InMemoryIdentityRegistry::password_matches(int32_t tenant_id, const core::Uuid& user_id,
                                                std::string_view password_hash) const {
    std::lock_guard lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end() || it->second.record.tenant_id != tenant_id) {
        return false;
    }
    return hash_equals(it->second.password_hash, password_hash);
}

void InMemoryIdentityRegistry::set_password_hash(int32_t tenant_id, const core::Uuid& user_id,
                                                 std::string_view password_hash) {
    std::lock_guard lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end() || it->second.record.tenant_id != tenant_id) {
        throw InvalidCredentialError();
    }
    it->second.password_hash = std::string(password_hash);
}

bool InMemoryIdentityRegistry::hash_equals(std::string_view expected, std::string_view actual) {
    if (expected.size() != actual.size()) {
        (void)CRYPTO_memcmp(expected.data(), expected.data(), expected.size());
        return false;
    }
    return CRYPTO_memcmp(expected.data(), actual.data(), expected.size()) == 0;
}

}  // namespace warden::auth
