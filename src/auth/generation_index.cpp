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

#include "generation_index.hpp"

namespace warden::auth {

int32_t InMemoryGenerationIndexStore::tenant_generation(int32_t tenant_id) const {
    std::lock_guard lock(mutex_);
    auto it = tenants_.find(tenant_id);
    return it != tenants_.end() ? it->second.generation : 0;
}

int32_t InMemoryGenerationIndexStore::user_generation(const core::Uuid& user_id) const {
    std::lock_guard lock(mutex_);
    auto it = users_.find(user_id);
    return it != users_.end() ? it->second : 0;
}

std::chrono::minutes InMemoryGenerationIndexStore::tenant_token_lifetime(int32_t tenant_id) const {
    std::lock_guard lock(mutex_);
    auto it = tenants_.find(tenant_id);
    return it != tenants_.end() ? it->second.lifetime : std::chrono::minutes{0};
}

int32_t InMemoryGenerationIndexStore::bump_tenant(int32_t tenant_id) {
    std::lock_guard lock(mutex_);
    return ++tenants_[tenant_id].generation;
}

int32_t InMemoryGenerationIndexStore::bump_user(const core::Uuid& user_id) {
    std::lock_guard lock(mutex_);
    return ++users_[user_id];
}

void InMemoryGenerationIndexStore::set_tenant_token_lifetime(int32_t tenant_id,
                                                             std::chrono::minutes lifetime) {
    std::lock_guard lock(mutex_);
    tenants_[tenant_id].lifetime = lifetime;
}

}  // namespace warden::auth
