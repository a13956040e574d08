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

// Warden Authentication Session - Header
//
// One AuthenticationSession per request. It owns the request's identity and
// drives the state machine:
//
//   Anonymous -> Authenticating -> Authenticated | Rejected
//   Authenticated -> Anonymous (logout)
//
// Every failure, including exceptions thrown by collaborators, leaves the
// session with the guest identity.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "../authz/permission_resolver.hpp"
#include "account.hpp"
#include "errors.hpp"
#include "stores.hpp"
#include "token_codec.hpp"

namespace warden::auth {

enum class SessionState : uint8_t {
    Anonymous,
    Authenticating,
    Authenticated,
    Rejected
};

[[nodiscard]] std::string_view session_state_to_string(SessionState state);

/// Caller context attached to authentication log lines
struct RequestInfo {
    std::string client_ip;
    std::string path;
    std::string correlation_id;
};

/// Produces the login event id for a freshly minted token (nullopt = untracked)
using LoginEventFactory = std::function<std::optional<int32_t>()>;

struct SessionOptions {
    std::chrono::minutes default_token_lifetime{0};  // 0 = tokens never expire
    bool standalone = false;                         // Directory login always entitled
};

/// Collaborators shared by every session of the process
struct SessionServices {
    std::shared_ptr<const TenantContext> tenant;
    std::shared_ptr<IdentityRegistry> identities;
    std::shared_ptr<GenerationIndexStore> generations;
    std::shared_ptr<const LoginEventStore> login_events;
    std::shared_ptr<const TenantPlanProvider> plans;
    std::shared_ptr<const TokenCodec> codec;
    std::shared_ptr<const authz::PermissionResolver> permissions;
    SessionOptions options;
};

class AuthenticationSession {
public:
    /// Throws std::invalid_argument if a service is missing
    explicit AuthenticationSession(std::shared_ptr<const SessionServices> services);
    ~AuthenticationSession() = default;

    // Non-copyable, non-movable: SessionScope publishes the session's address
    AuthenticationSession(const AuthenticationSession&) = delete;
    AuthenticationSession& operator=(const AuthenticationSession&) = delete;
    AuthenticationSession(AuthenticationSession&&) = delete;
    AuthenticationSession& operator=(AuthenticationSession&&) = delete;

    /// Authenticate from a session token (cookie value)
    /// Returns false for empty input, the bearer sentinel, undecodable tokens,
    /// stale generations, expired tokens and revoked login events.
    bool authenticate_by_token(std::string_view raw, const RequestInfo& info = {});

    /// Authenticate with login and password hash; mints a token for user accounts
    AuthResult authenticate_by_credential(std::string_view login, std::string_view password_hash,
                                          const LoginEventFactory& login_event = {});

    /// Switch to a known account by id; mints a token for user accounts
    AuthResult authenticate_by_user_id(const core::Uuid& user_id,
                                       const LoginEventFactory& login_event = {});

    /// Compute roles for the account and make it the current identity
    AuthResult assign_identity(const Account& account);

    void logout() noexcept;

    /// Store a new password hash and invalidate the user's outstanding tokens
    AuthResult change_password(const core::Uuid& user_id, std::string_view new_password_hash);

    [[nodiscard]] const Identity& current_identity() const noexcept { return identity_; }
    [[nodiscard]] bool is_authenticated() const noexcept {
        return state_ == SessionState::Authenticated && identity_.is_authenticated();
    }
    [[nodiscard]] SessionState state() const noexcept { return state_; }

    [[nodiscard]] bool check_permissions(std::span<const authz::Action> actions) const;
    [[nodiscard]] bool check_permissions(const authz::SecurityObjectId& object,
                                         const authz::SecurityObjectProvider& provider,
                                         std::span<const authz::Action> actions) const;

    /// Throws authz::AccessDeniedError on denial
    void demand_permissions(std::span<const authz::Action> actions) const;
    void demand_permissions(const authz::SecurityObjectId& object,
                            const authz::SecurityObjectProvider& provider,
                            std::span<const authz::Action> actions) const;

private:
    /// Token validation steps after decoding; false on any mismatch
    [[nodiscard]] bool validate_token(const SessionToken& token, const RequestInfo& info) const;

    /// Role computation; may throw from collaborators
    [[nodiscard]] AuthResult apply_identity(const Account& account);

    /// Finish a credential/user-id login: assign identity, then mint a token
    [[nodiscard]] AuthResult complete_login(const Account& account,
                                            const LoginEventFactory& login_event);

    [[nodiscard]] std::string mint_token(const Account& account, int32_t login_event_id) const;

    [[nodiscard]] AuthResult reject(AuthError error, std::string message);

    std::shared_ptr<const SessionServices> services_;
    Identity identity_;
    SessionState state_ = SessionState::Anonymous;
};

/// Publishes a session as the calling thread's current session
/// The previous value is restored on destruction, so scopes nest.
class SessionScope {
public:
    explicit SessionScope(AuthenticationSession& session) noexcept;
    ~SessionScope();

    SessionScope(const SessionScope&) = delete;
    SessionScope& operator=(const SessionScope&) = delete;

private:
    AuthenticationSession* previous_;
};

/// Session published on this thread, nullptr outside any SessionScope
[[nodiscard]] AuthenticationSession* current_session() noexcept;

}  // namespace warden::auth
