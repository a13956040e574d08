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

// Warden Authorization Policy - Header
// Resource descriptions, policy rules and the rule store

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "../auth/account.hpp"
#include "../core/containers.hpp"

namespace warden::control {
struct PolicyConfig;
}

namespace warden::authz {

/// Opaque action identifier ("read", "edit", ...)
using Action = std::string;

/// Securable object identity: type + id
struct SecurityObjectId {
    std::string object_type;
    std::string object_id;

    [[nodiscard]] std::string to_string() const { return object_type + ":" + object_id; }

    friend bool operator==(const SecurityObjectId&, const SecurityObjectId&) = default;
};

/// Who an ACL entry applies to
enum class AclSubjectKind : uint8_t {
    Role,   // Every identity holding the role
    User,   // One specific account
    Owner   // Whoever owns the object
};

struct AclSubject {
    AclSubjectKind kind = AclSubjectKind::Owner;
    auth::Role role = auth::Role::Everyone;
    core::Uuid user_id;

    [[nodiscard]] static AclSubject of_role(auth::Role role) {
        return {AclSubjectKind::Role, role, {}};
    }
    [[nodiscard]] static AclSubject of_user(core::Uuid user_id) {
        return {AclSubjectKind::User, auth::Role::Everyone, user_id};
    }
    [[nodiscard]] static AclSubject owner() { return {}; }
};

/// Actions granted to one subject on one object
struct AclEntry {
    AclSubject subject;
    std::vector<Action> actions;
};

/// Supplies ownership and ACL data for securable objects
/// Implementations may throw; permission checks propagate such errors.
class SecurityObjectProvider {
public:
    virtual ~SecurityObjectProvider() = default;

    [[nodiscard]] virtual std::optional<core::Uuid> owner(const SecurityObjectId& object) const = 0;
    [[nodiscard]] virtual std::vector<AclEntry> acl(const SecurityObjectId& object) const = 0;
};

/// Everything a rule may look at
struct AccessRequest {
    const auth::Identity& identity;
    const SecurityObjectId* object = nullptr;              // null for object-less checks
    const SecurityObjectProvider* provider = nullptr;

    [[nodiscard]] bool has_object() const noexcept { return object && provider; }
};

/// A single allow rule
class PolicyRule {
public:
    virtual ~PolicyRule() = default;

    /// True if this rule alone grants every requested action
    [[nodiscard]] virtual bool grants(const AccessRequest& request,
                                      std::span<const Action> actions) const = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

/// Role holders may perform a fixed action set
class RoleRule : public PolicyRule {
public:
    RoleRule(auth::Role role, std::vector<Action> actions);

    [[nodiscard]] bool grants(const AccessRequest& request,
                              std::span<const Action> actions) const override;
    [[nodiscard]] std::string describe() const override;

private:
    auth::Role role_;
    core::fast_set<Action> actions_;
};

/// Authenticated owners of an object may perform a fixed action set on it
class OwnerRule : public PolicyRule {
public:
    explicit OwnerRule(std::vector<Action> actions);

    [[nodiscard]] bool grants(const AccessRequest& request,
                              std::span<const Action> actions) const override;
    [[nodiscard]] std::string describe() const override;

private:
    core::fast_set<Action> actions_;
};

/// Grants the union of actions from every ACL entry matching the identity
class AclRule : public PolicyRule {
public:
    [[nodiscard]] bool grants(const AccessRequest& request,
                              std::span<const Action> actions) const override;
    [[nodiscard]] std::string describe() const override { return "acl"; }
};

/// Source of policy rules
class PolicyStore {
public:
    virtual ~PolicyStore() = default;

    /// Snapshot of the current rule set
    [[nodiscard]] virtual std::vector<std::shared_ptr<const PolicyRule>> rules() const = 0;
};

class InMemoryPolicyStore : public PolicyStore {
public:
    InMemoryPolicyStore() = default;
    explicit InMemoryPolicyStore(std::vector<std::shared_ptr<const PolicyRule>> rules);

    // Non-copyable, non-movable (owns a mutex)
    InMemoryPolicyStore(const InMemoryPolicyStore&) = delete;
    InMemoryPolicyStore& operator=(const InMemoryPolicyStore&) = delete;

    /// Build rules from configuration (throws std::invalid_argument on unknown roles)
    [[nodiscard]] static std::shared_ptr<InMemoryPolicyStore> from_config(
        const control::PolicyConfig& config);

    void add_rule(std::shared_ptr<const PolicyRule> rule);

    [[nodiscard]] std::vector<std::shared_ptr<const PolicyRule>> rules() const override;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<const PolicyRule>> rules_;
};

}  // namespace warden::authz
