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

// Generation Index - Blanket Token Revocation
//
// Every token carries the tenant and user generation counters that were
// current when it was minted. Bumping a counter invalidates every earlier
// token for that scope in O(1), without a blacklist of individual tokens.
//
// Writes are visible to readers on any thread as soon as the call returns;
// nothing is cached outside the lock.

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "../core/containers.hpp"
#include "stores.hpp"

namespace warden::auth {

/// Mutex-guarded in-memory generation counters
class InMemoryGenerationIndexStore : public GenerationIndexStore {
public:
    InMemoryGenerationIndexStore() = default;
    ~InMemoryGenerationIndexStore() override = default;

    // Non-copyable, non-movable (owns a mutex)
    InMemoryGenerationIndexStore(const InMemoryGenerationIndexStore&) = delete;
    InMemoryGenerationIndexStore& operator=(const InMemoryGenerationIndexStore&) = delete;

    [[nodiscard]] int32_t tenant_generation(int32_t tenant_id) const override;
    [[nodiscard]] int32_t user_generation(const core::Uuid& user_id) const override;
    [[nodiscard]] std::chrono::minutes tenant_token_lifetime(int32_t tenant_id) const override;

    /// Invalidate every outstanding token of the tenant (e.g. secret rotation)
    /// Returns the new counter value.
    int32_t bump_tenant(int32_t tenant_id) override;

    /// Invalidate every outstanding token of the user (password change, forced logout)
    /// Returns the new counter value.
    int32_t bump_user(const core::Uuid& user_id) override;

    /// Set token lifetime for the tenant (zero = configured default)
    void set_tenant_token_lifetime(int32_t tenant_id, std::chrono::minutes lifetime);

private:
    struct TenantEntry {
        int32_t generation = 0;
        std::chrono::minutes lifetime{0};
    };

    mutable std::mutex mutex_;
    core::fast_map<int32_t, TenantEntry> tenants_;
    core::fast_map<core::Uuid, int32_t> users_;
};

}  // namespace warden::auth
