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

// Warden Authentication Session - Implementation

#include "session.hpp"

#include <algorithm>
#include <stdexcept>

#include "../core/logging.hpp"

namespace warden::auth {

namespace {

thread_local AuthenticationSession* g_current_session = nullptr;

constexpr std::string_view kAccountDisabledMessage = "Account disabled.";
constexpr std::string_view kNotLicensedMessage = "Directory login is not available for this tenant.";
constexpr std::string_view kPasswordReuseMessage = "A new password must be used.";
constexpr std::string_view kInternalMessage = "Authentication failed.";

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

std::string_view session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Anonymous:
            return "anonymous";
        case SessionState::Authenticating:
            return "authenticating";
        case SessionState::Authenticated:
            return "authenticated";
        case SessionState::Rejected:
            return "rejected";
    }
    return "unknown";
}

AuthenticationSession::AuthenticationSession(std::shared_ptr<const SessionServices> services)
    : services_(std::move(services)) {
    if (!services_ || !services_->tenant || !services_->identities || !services_->generations ||
        !services_->login_events || !services_->plans || !services_->codec ||
        !services_->permissions) {
        throw std::invalid_argument("AuthenticationSession requires every session service");
    }
}

bool AuthenticationSession::authenticate_by_token(std::string_view raw, const RequestInfo& info) {
    identity_ = Identity::guest();
    state_ = SessionState::Authenticating;

    auto* logger = logging::get_current_logger();

    if (raw.empty()) {
        state_ = SessionState::Anonymous;
        return false;
    }

    // Header-based bearer auth is handled outside this session
    if (TokenCodec::is_bearer_sentinel(raw)) {
        if (logger) {
            WARDEN_LOG_AUTH(logger, "bearer_sentinel", "cookie carries bearer marker",
                            info.client_ip, logging::sanitize_for_logging(info.path),
                            info.correlation_id);
        }
        state_ = SessionState::Anonymous;
        return false;
    }

    try {
        auto decoded = services_->codec->decode(raw);
        if (!decoded) {
            if (logger) {
                LOG_WARNING(logger,
                            "Token decode failed: error={}, token={}, client_ip={}, path={}, "
                            "correlation_id={}",
                            decode_error_to_string(decoded.error), logging::redact_token(raw),
                            info.client_ip, logging::sanitize_for_logging(info.path),
                            info.correlation_id);
            }
            state_ = SessionState::Rejected;
            return false;
        }

        if (!validate_token(decoded.token, info)) {
            state_ = SessionState::Rejected;
            return false;
        }

        // Tokens only ever bind user accounts; system ids resolve to the lost user
        const auto& token = decoded.token;
        auto result =
            apply_identity(Account::user(token.user_id, token.tenant_id, std::string{}));
        if (!result) {
            if (logger) {
                LOG_DEBUG(logger, "Token identity rejected: error={}, user={}, correlation_id={}",
                          auth_error_to_string(result.error), token.user_id.to_string(),
                          info.correlation_id);
            }
            return false;
        }

        if (logger) {
            LOG_DEBUG(logger, "Token authenticated: tenant={}, user={}, correlation_id={}",
                      token.tenant_id, token.user_id.to_string(), info.correlation_id);
        }
        return true;
    } catch (const SecurityError& e) {
        if (logger) {
            LOG_DEBUG(logger, "Token authentication rejected: {}, token={}, correlation_id={}",
                      e.what(), logging::redact_token(raw), info.correlation_id);
        }
    } catch (const std::exception& e) {
        if (logger) {
            WARDEN_LOG_ERROR_CTX(logger, "Token authentication failed", info.correlation_id,
                                 "internal", e.what());
        }
    }

    identity_ = Identity::guest();
    state_ = SessionState::Rejected;
    return false;
}

bool AuthenticationSession::validate_token(const SessionToken& token,
                                           const RequestInfo& info) const {
    auto* logger = logging::get_current_logger();
    auto stale = [&](std::string_view reason) {
        if (logger) {
            LOG_DEBUG(logger, "Token rejected: reason={}, tenant={}, user={}, correlation_id={}",
                      reason, token.tenant_id, token.user_id.to_string(), info.correlation_id);
        }
        return false;
    };

    const int32_t tenant_id = services_->tenant->current_tenant_id();
    if (token.tenant_id != tenant_id) {
        return stale("tenant_mismatch");
    }

    if (token.tenant_generation != services_->generations->tenant_generation(tenant_id)) {
        return stale("tenant_generation");
    }

    if (token.is_expired(unix_now())) {
        return stale("expired");
    }

    if (token.user_generation != services_->generations->user_generation(token.user_id)) {
        return stale("user_generation");
    }

    if (token.login_event_id != 0) {
        auto events = services_->login_events->valid_event_ids(tenant_id, token.user_id);
        if (std::find(events.begin(), events.end(), token.login_event_id) == events.end()) {
            return stale("login_event_revoked");
        }
    }

    return true;
}

AuthResult AuthenticationSession::authenticate_by_credential(std::string_view login,
                                                             std::string_view password_hash,
                                                             const LoginEventFactory& login_event) {
    identity_ = Identity::guest();
    state_ = SessionState::Authenticating;

    auto* logger = logging::get_current_logger();
    try {
        const int32_t tenant_id = services_->tenant->current_tenant_id();
        Account account =
            services_->identities->resolve_by_credential(tenant_id, login, password_hash);
        auto result = complete_login(account, login_event);
        if (!result && logger) {
            LOG_DEBUG(logger, "Credential login rejected: tenant={}, login={}, error={}",
                      tenant_id, logging::sanitize_for_logging(login),
                      auth_error_to_string(result.error));
        }
        return result;
    } catch (const SecurityError& e) {
        if (logger) {
            LOG_DEBUG(logger, "Credential login rejected: login={}, reason={}",
                      logging::sanitize_for_logging(login), e.what());
        }
        return reject(AuthError::InvalidCredential, std::string(kInvalidCredentialMessage));
    } catch (const std::exception& e) {
        if (logger) {
            LOG_ERROR(logger, "Credential login failed: login={}, error={}",
                      logging::sanitize_for_logging(login), e.what());
        }
        return reject(AuthError::Internal, std::string(kInternalMessage));
    }
}

AuthResult AuthenticationSession::authenticate_by_user_id(const core::Uuid& user_id,
                                                          const LoginEventFactory& login_event) {
    identity_ = Identity::guest();
    state_ = SessionState::Authenticating;

    auto* logger = logging::get_current_logger();
    try {
        const int32_t tenant_id = services_->tenant->current_tenant_id();
        Account account = services_->identities->resolve_by_id(tenant_id, user_id);
        return complete_login(account, login_event);
    } catch (const SecurityError& e) {
        if (logger) {
            LOG_DEBUG(logger, "Identity switch rejected: user={}, reason={}", user_id.to_string(),
                      e.what());
        }
        return reject(AuthError::InvalidCredential, std::string(kInvalidCredentialMessage));
    } catch (const std::exception& e) {
        if (logger) {
            LOG_ERROR(logger, "Identity switch failed: user={}, error={}", user_id.to_string(),
                      e.what());
        }
        return reject(AuthError::Internal, std::string(kInternalMessage));
    }
}

AuthResult AuthenticationSession::complete_login(const Account& account,
                                                 const LoginEventFactory& login_event) {
    auto result = apply_identity(account);
    if (!result) {
        return result;
    }

    // Only user accounts carry session tokens
    if (!identity_.account.is_user()) {
        return result;
    }

    int32_t event_id = 0;
    if (login_event) {
        event_id = login_event().value_or(0);
    }
    return AuthResult::success(mint_token(identity_.account, event_id));
}

AuthResult AuthenticationSession::assign_identity(const Account& account) {
    state_ = SessionState::Authenticating;

    auto* logger = logging::get_current_logger();
    try {
        return apply_identity(account);
    } catch (const SecurityError& e) {
        if (logger) {
            LOG_DEBUG(logger, "Identity assignment rejected: account={}, reason={}",
                      account.id().to_string(), e.what());
        }
        return reject(AuthError::InvalidCredential, std::string(kInvalidCredentialMessage));
    } catch (const std::exception& e) {
        if (logger) {
            LOG_ERROR(logger, "Identity assignment failed: account={}, error={}",
                      account.id().to_string(), e.what());
        }
        return reject(AuthError::Internal, std::string(kInternalMessage));
    }
}

AuthResult AuthenticationSession::apply_identity(const Account& account) {
    RoleSet roles{Role::Everyone};
    Account resolved = account;

    switch (account.kind()) {
        case AccountKind::Anonymous:
            return reject(AuthError::InvalidCredential, std::string(kInvalidCredentialMessage));

        case AccountKind::System:
            if (account.id() == ids::core_system()) {
                roles.add(Role::System);
            }
            break;

        case AccountKind::User: {
            const int32_t tenant_id = services_->tenant->current_tenant_id();
            UserRecord user = services_->identities->find_user(tenant_id, account.id());

            if (user.is_lost()) {
                return reject(AuthError::InvalidCredential, std::string(kInvalidCredentialMessage));
            }
            if (user.status != UserStatus::Active) {
                return reject(AuthError::AccountDisabled, std::string(kAccountDisabledMessage));
            }
            if (user.is_directory_bound() && !services_->options.standalone &&
                !services_->plans->directory_login_entitled(tenant_id)) {
                return reject(AuthError::FeatureNotLicensed, std::string(kNotLicensedMessage));
            }

            if (services_->identities->is_in_group(user.id, ids::admin_group())) {
                roles.add(Role::Administrators);
            }
            roles.add(Role::Users);

            resolved = Account::user(user.id, user.tenant_id, user.display_name);
            break;
        }
    }

    identity_ = Identity{std::move(resolved), roles};
    state_ = SessionState::Authenticated;
    return AuthResult::success();
}

AuthResult AuthenticationSession::reject(AuthError error, std::string message) {
    identity_ = Identity::guest();
    state_ = SessionState::Rejected;
    return AuthResult::failure(error, std::move(message));
}

void AuthenticationSession::logout() noexcept {
    identity_ = Identity::guest();
    state_ = SessionState::Anonymous;
}

AuthResult AuthenticationSession::change_password(const core::Uuid& user_id,
                                                  std::string_view new_password_hash) {
    auto* logger = logging::get_current_logger();
    try {
        const int32_t tenant_id = services_->tenant->current_tenant_id();
        UserRecord user = services_->identities->find_user(tenant_id, user_id);
        if (user.is_lost()) {
            return AuthResult::failure(AuthError::InvalidCredential,
                                       std::string(kInvalidCredentialMessage));
        }

        if (services_->identities->password_matches(tenant_id, user_id, new_password_hash)) {
            return AuthResult::failure(AuthError::PasswordReuse,
                                       std::string(kPasswordReuseMessage));
        }

        services_->identities->set_password_hash(tenant_id, user_id, new_password_hash);
        const int32_t generation = services_->generations->bump_user(user_id);

        if (logger) {
            LOG_INFO(logger, "Password changed: tenant={}, user={}, user_generation={}",
                     tenant_id, user_id.to_string(), generation);
        }
        return AuthResult::success();
    } catch (const SecurityError& e) {
        if (logger) {
            LOG_DEBUG(logger, "Password change rejected: user={}, reason={}", user_id.to_string(),
                      e.what());
        }
        return AuthResult::failure(AuthError::InvalidCredential,
                                   std::string(kInvalidCredentialMessage));
    } catch (const std::exception& e) {
        if (logger) {
            LOG_ERROR(logger, "Password change failed: user={}, error={}", user_id.to_string(),
                      e.what());
        }
        return AuthResult::failure(AuthError::Internal, std::string(kInternalMessage));
    }
}

std::string AuthenticationSession::mint_token(const Account& account,
                                              int32_t login_event_id) const {
    const int32_t tenant_id = services_->tenant->current_tenant_id();

    SessionToken token;
    token.tenant_id = tenant_id;
    token.user_id = account.id();
    token.tenant_generation = services_->generations->tenant_generation(tenant_id);
    token.user_generation = services_->generations->user_generation(account.id());
    token.login_event_id = login_event_id;

    auto lifetime = services_->generations->tenant_token_lifetime(tenant_id);
    if (lifetime.count() <= 0) {
        lifetime = services_->options.default_token_lifetime;
    }

    if (lifetime.count() > 0) {
        const int64_t now = unix_now();
        const int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(lifetime).count();
        token.expires_at = seconds >= kNeverExpires - now ? kNeverExpires : now + seconds;
    }

    return services_->codec->encode(token);
}

bool AuthenticationSession::check_permissions(std::span<const authz::Action> actions) const {
    return services_->permissions->check(identity_, actions);
}

bool AuthenticationSession::check_permissions(const authz::SecurityObjectId& object,
                                              const authz::SecurityObjectProvider& provider,
                                              std::span<const authz::Action> actions) const {
    return services_->permissions->check(identity_, object, provider, actions);
}

void AuthenticationSession::demand_permissions(std::span<const authz::Action> actions) const {
    services_->permissions->demand(identity_, actions);
}

void AuthenticationSession::demand_permissions(const authz::SecurityObjectId& object,
                                               const authz::SecurityObjectProvider& provider,
                                               std::span<const authz::Action> actions) const {
    services_->permissions->demand(identity_, object, provider, actions);
}

SessionScope::SessionScope(AuthenticationSession& session) noexcept
    : previous_(g_current_session) {
    g_current_session = &session;
}

SessionScope::~SessionScope() {
    g_current_session = previous_;
}

AuthenticationSession* current_session() noexcept {
    return g_current_session;
}

}  // namespace warden::auth
