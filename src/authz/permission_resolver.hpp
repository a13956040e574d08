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

// Warden Permission Resolver - Header
//
// A request is allowed if ANY rule from the policy store grants ALL of the
// requested actions. An empty action list is always allowed. Decisions depend
// only on the identity, its roles, the object's ACL and the rule set.

#pragma once

#include <memory>
#include <span>
#include <string>
#include <vector>

#include "../auth/errors.hpp"
#include "policy.hpp"

namespace warden::authz {

/// Raised by demand() when a check fails
class AccessDeniedError : public auth::SecurityError {
public:
    AccessDeniedError(core::Uuid actor_id, std::vector<Action> denied_actions,
                      std::optional<SecurityObjectId> object = std::nullopt);

    [[nodiscard]] const core::Uuid& actor_id() const noexcept { return actor_id_; }
    [[nodiscard]] const std::vector<Action>& denied_actions() const noexcept {
        return denied_actions_;
    }
    [[nodiscard]] const std::optional<SecurityObjectId>& object() const noexcept {
        return object_;
    }

private:
    core::Uuid actor_id_;
    std::vector<Action> denied_actions_;
    std::optional<SecurityObjectId> object_;
};

class PermissionResolver {
public:
    explicit PermissionResolver(std::shared_ptr<const PolicyStore> store);

    /// Object-less check (role rules only)
    [[nodiscard]] bool check(const auth::Identity& identity,
                             std::span<const Action> actions) const;

    /// Check against a securable object
    [[nodiscard]] bool check(const auth::Identity& identity, const SecurityObjectId& object,
                             const SecurityObjectProvider& provider,
                             std::span<const Action> actions) const;

    /// Same decisions as check(), but throws AccessDeniedError on denial
    void demand(const auth::Identity& identity, std::span<const Action> actions) const;
    void demand(const auth::Identity& identity, const SecurityObjectId& object,
                const SecurityObjectProvider& provider, std::span<const Action> actions) const;

private:
    [[nodiscard]] bool evaluate(const AccessRequest& request,
                                std::span<const Action> actions) const;

    std::shared_ptr<const PolicyStore> store_;
};

}  // namespace warden::authz
