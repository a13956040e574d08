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

#include "login_events.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace warden::auth {

std::vector<int32_t> InMemoryLoginEventStore::valid_event_ids(int32_t tenant_id,
                                                              const core::Uuid& user_id) const {
    std::vector<int32_t> result;
    {
        std::lock_guard lock(mutex_);
        auto it = events_.find(TenantUserKey{tenant_id, user_id});
        if (it == events_.end()) {
            return result;
        }
        result.assign(it->second.begin(), it->second.end());
    }

    std::sort(result.begin(), result.end());
    return result;
}

InMemoryLoginEventStore::InMemoryLoginEventStore(int32_t first_event_id)
    : next_event_id_(first_event_id) {
    if (first_event_id <= 0) {
        throw std::invalid_argument("Login event ids must be positive");
    }
}

int32_t InMemoryLoginEventStore::register_event(int32_t tenant_id, const core::Uuid& user_id) {
    // 0 marks an untracked token, so the counter wraps back to 1
    int32_t event_id = next_event_id_.load(std::memory_order_relaxed);
    int32_t next = 0;
    do {
        next = event_id == std::numeric_limits<int32_t>::max() ? 1 : event_id + 1;
    } while (!next_event_id_.compare_exchange_weak(event_id, next, std::memory_order_relaxed));

    std::lock_guard lock(mutex_);
    events_[TenantUserKey{tenant_id, user_id}].insert(event_id);
    return event_id;
}

bool InMemoryLoginEventStore::revoke(int32_t tenant_id, const core::Uuid& user_id,
                                     int32_t event_id) {
    std::lock_guard lock(mutex_);
    auto it = events_.find(TenantUserKey{tenant_id, user_id});
    if (it == events_.end()) {
        return false;
    }

    bool removed = it->second.erase(event_id) > 0;
    if (it->second.empty()) {
        events_.erase(it);
    }
    return removed;
}

size_t InMemoryLoginEventStore::revoke_all(int32_t tenant_id, const core::Uuid& user_id) {
    std::lock_guard lock(mutex_);
    auto it = events_.find(TenantUserKey{tenant_id, user_id});
    if (it == events_.end()) {
        return 0;
    }

    size_t removed = it->second.size();
    events_.erase(it);
    return removed;
}

}  // namespace warden::auth
