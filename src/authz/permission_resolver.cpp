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

// Warden Permission Resolver - Implementation

#include "permission_resolver.hpp"

#include <stdexcept>

#include "../core/logging.hpp"

namespace warden::authz {

namespace {

// Action names may come from callers; sanitize before logging
std::string format_actions(std::span<const Action> actions) {
    std::string result;
    for (size_t i = 0; i < actions.size(); ++i) {
        if (i > 0) {
            result += ",";
        }
        result += logging::sanitize_for_logging(actions[i]);
    }
    return result;
}

std::string denial_message(const core::Uuid& actor_id, const std::vector<Action>& actions,
                           const std::optional<SecurityObjectId>& object) {
    std::string message = "Access denied: actor=" + actor_id.to_string() + ", actions=" +
                          format_actions(actions);
    if (object) {
        message += ", object=" + logging::sanitize_for_logging(object->to_string());
    }
    return message;
}

}  // namespace

AccessDeniedError::AccessDeniedError(core::Uuid actor_id, std::vector<Action> denied_actions,
                                     std::optional<SecurityObjectId> object)
    : auth::SecurityError(denial_message(actor_id, denied_actions, object)),
      actor_id_(actor_id),
      denied_actions_(std::move(denied_actions)),
      object_(std::move(object)) {}

PermissionResolver::PermissionResolver(std::shared_ptr<const PolicyStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("PermissionResolver requires a policy store");
    }
}

bool PermissionResolver::check(const auth::Identity& identity,
                               std::span<const Action> actions) const {
    return evaluate(AccessRequest{identity}, actions);
}

bool PermissionResolver::check(const auth::Identity& identity, const SecurityObjectId& object,
                               const SecurityObjectProvider& provider,
                               std::span<const Action> actions) const {
    return evaluate(AccessRequest{identity, &object, &provider}, actions);
}

void PermissionResolver::demand(const auth::Identity& identity,
                                std::span<const Action> actions) const {
    if (!check(identity, actions)) {
        throw AccessDeniedError(identity.account.id(),
                                std::vector<Action>(actions.begin(), actions.end()));
    }
}

void PermissionResolver::demand(const auth::Identity& identity, const SecurityObjectId& object,
                                const SecurityObjectProvider& provider,
                                std::span<const Action> actions) const {
    if (!check(identity, object, provider, actions)) {
        throw AccessDeniedError(identity.account.id(),
                                std::vector<Action>(actions.begin(), actions.end()), object);
    }
}

bool PermissionResolver::evaluate(const AccessRequest& request,
                                  std::span<const Action> actions) const {
    if (actions.empty()) {
        return true;
    }

    for (const auto& rule : store_->rules()) {
        if (rule->grants(request, actions)) {
            return true;
        }
    }

    if (auto* logger = logging::get_current_logger()) {
        LOG_WARNING(logger,
                    "Authorization failed: actor={}, roles={}, actions={}, object={}",
                    request.identity.account.id().to_string(), request.identity.roles.to_string(),
                    format_actions(actions),
                    request.object ? logging::sanitize_for_logging(request.object->to_string())
                                   : std::string("-"));
    }
    return false;
}

}  // namespace warden::authz
