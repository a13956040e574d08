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

// Login Event Registry - Per-Session Token Revocation
//
// A token minted with a non-zero login event id stays valid only while that
// id is registered for its (tenant, user). Revoking one id logs out a single
// device; other sessions of the same user are unaffected.

#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

#include "../core/containers.hpp"
#include "stores.hpp"

namespace warden::auth {

/// (tenant, user) key for per-user tables
struct TenantUserKey {
    int32_t tenant_id = 0;
    core::Uuid user_id;

    friend bool operator==(const TenantUserKey&, const TenantUserKey&) = default;
};

}  // namespace warden::auth

template <>
struct ankerl::unordered_dense::hash<warden::auth::TenantUserKey> {
    using is_avalanching = void;

    [[nodiscard]] auto operator()(const warden::auth::TenantUserKey& key) const noexcept
        -> uint64_t {
        uint64_t user_hash = ankerl::unordered_dense::hash<warden::core::Uuid>{}(key.user_id);
        return detail::wyhash::mix(user_hash, static_cast<uint64_t>(key.tenant_id));
    }
};

namespace warden::auth {

/// Mutex-guarded in-memory login event registry
class InMemoryLoginEventStore : public LoginEventStore {
public:
    InMemoryLoginEventStore() = default;

    /// Start numbering at first_event_id; throws std::invalid_argument unless positive
    explicit InMemoryLoginEventStore(int32_t first_event_id);
    ~InMemoryLoginEventStore() override = default;

    // Non-copyable, non-movable (owns a mutex)
    InMemoryLoginEventStore(const InMemoryLoginEventStore&) = delete;
    InMemoryLoginEventStore& operator=(const InMemoryLoginEventStore&) = delete;

    /// Currently valid event ids, ascending
    [[nodiscard]] std::vector<int32_t> valid_event_ids(int32_t tenant_id,
                                                       const core::Uuid& user_id) const override;

    /// Register a new login event; returns its id (always positive, wraps to 1)
    int32_t register_event(int32_t tenant_id, const core::Uuid& user_id);

    /// Revoke one event; returns false if it was not registered
    bool revoke(int32_t tenant_id, const core::Uuid& user_id, int32_t event_id);

    /// Revoke every event of the user; returns the number removed
    size_t revoke_all(int32_t tenant_id, const core::Uuid& user_id);

private:
    mutable std::mutex mutex_;
    core::fast_map<TenantUserKey, core::fast_set<int32_t>> events_;
    std::atomic<int32_t> next_event_id_{1};
};

}  // namespace warden::auth
