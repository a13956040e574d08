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

// Warden Authorization Policy - Implementation

#include "policy.hpp"

#include <stdexcept>

#include "../control/config.hpp"

namespace warden::authz {

namespace {

core::fast_set<Action> to_action_set(std::vector<Action> actions) {
    core::fast_set<Action> result;
    for (auto& action : actions) {
        result.insert(std::move(action));
    }
    return result;
}

bool contains_all(const core::fast_set<Action>& granted, std::span<const Action> requested) {
    for (const auto& action : requested) {
        if (!granted.contains(action)) {
            return false;
        }
    }
    return true;
}

std::string join_actions(const core::fast_set<Action>& actions) {
    std::string result;
    for (const auto& action : actions) {
        if (!result.empty()) {
            result += ",";
        }
        result += action;
    }
    return result;
}

}  // namespace

RoleRule::RoleRule(auth::Role role, std::vector<Action> actions)
    : role_(role), actions_(to_action_set(std::move(actions))) {}

bool RoleRule::grants(const AccessRequest& request, std::span<const Action> actions) const {
    return request.identity.in_role(role_) && contains_all(actions_, actions);
}

std::string RoleRule::describe() const {
    return "role:" + std::string(auth::role_to_string(role_)) + "[" + join_actions(actions_) + "]";
}

OwnerRule::OwnerRule(std::vector<Action> actions) : actions_(to_action_set(std::move(actions))) {}

bool OwnerRule::grants(const AccessRequest& request, std::span<const Action> actions) const {
    if (!request.has_object() || !request.identity.is_authenticated()) {
        return false;
    }
    if (!contains_all(actions_, actions)) {
        return false;
    }

    auto owner = request.provider->owner(*request.object);
    return owner && *owner == request.identity.account.id();
}

std::string OwnerRule::describe() const {
    return "owner[" + join_actions(actions_) + "]";
}

bool AclRule::grants(const AccessRequest& request, std::span<const Action> actions) const {
    if (!request.has_object()) {
        return false;
    }

    const auto& identity = request.identity;
    const bool authenticated = identity.is_authenticated();

    // Owner is looked up at most once, and only if an entry needs it
    std::optional<std::optional<core::Uuid>> owner;

    core::fast_set<Action> granted;
    for (auto& entry : request.provider->acl(*request.object)) {
        bool applies = false;
        switch (entry.subject.kind) {
            case AclSubjectKind::Role:
                applies = identity.in_role(entry.subject.role);
                break;
            case AclSubjectKind::User:
                applies = authenticated && entry.subject.user_id == identity.account.id();
                break;
            case AclSubjectKind::Owner:
                if (authenticated) {
                    if (!owner) {
                        owner = request.provider->owner(*request.object);
                    }
                    applies = owner->has_value() && **owner == identity.account.id();
                }
                break;
        }

        if (applies) {
            for (auto& action : entry.actions) {
                granted.insert(std::move(action));
            }
        }
    }

    return contains_all(granted, actions);
}

InMemoryPolicyStore::InMemoryPolicyStore(std::vector<std::shared_ptr<const PolicyRule>> rules)
    : rules_(std::move(rules)) {}

std::shared_ptr<InMemoryPolicyStore> InMemoryPolicyStore::from_config(
    const control::PolicyConfig& config) {
    auto store = std::make_shared<InMemoryPolicyStore>();

    for (const auto& rule : config.role_rules) {
        auto role = auth::role_from_string(rule.role);
        if (!role) {
            throw std::invalid_argument("Unknown role in policy: " + rule.role);
        }
        store->add_rule(std::make_shared<RoleRule>(*role, rule.actions));
    }

    if (!config.owner_actions.empty()) {
        store->add_rule(std::make_shared<OwnerRule>(config.owner_actions));
    }

    if (config.acl_rules) {
        store->add_rule(std::make_shared<AclRule>());
    }

    return store;
}

void InMemoryPolicyStore::add_rule(std::shared_ptr<const PolicyRule> rule) {
    if (!rule) {
        throw std::invalid_argument("Policy rule must not be null");
    }
    std::lock_guard lock(mutex_);
    rules_.push_back(std::move(rule));
}

std::vector<std::shared_ptr<const PolicyRule>> InMemoryPolicyStore::rules() const {
    std::lock_guard lock(mutex_);
    return rules_;
}

}  // namespace warden::authz
