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

// Warden Authentication Errors - Header

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace warden::auth {

/// Expected authentication failures, returned as values
enum class AuthError : uint8_t {
    None,
    InvalidCredential,   // Bad login/password or unknown user (indistinguishable)
    AccountDisabled,     // Account exists but is not active
    FeatureNotLicensed,  // Tenant plan lacks an entitlement (directory login)
    PasswordReuse,       // New password equals the current one
    Internal             // Unexpected failure, converted to rejection
};

[[nodiscard]] std::string_view auth_error_to_string(AuthError error);

/// Message shown for every credential failure (wrong password and unknown
/// login must stay indistinguishable)
inline constexpr std::string_view kInvalidCredentialMessage = "Invalid username or password.";

/// Base for security failures raised by collaborators (stores, providers)
/// Caught at the authentication boundary and treated as rejection.
class SecurityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Credential rejected by a collaborator
class InvalidCredentialError : public SecurityError {
public:
    InvalidCredentialError() : SecurityError(std::string(kInvalidCredentialMessage)) {}
    using SecurityError::SecurityError;
};

/// Authentication result
/// token is set when a fresh session token was minted for a user account.
struct AuthResult {
    bool ok = false;
    AuthError error = AuthError::None;
    std::string message;
    std::optional<std::string> token;

    [[nodiscard]] static AuthResult success(std::optional<std::string> token = std::nullopt) {
        return {true, AuthError::None, "", std::move(token)};
    }

    [[nodiscard]] static AuthResult failure(AuthError error, std::string message) {
        return {false, error, std::move(message), std::nullopt};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return ok; }
};

}  // namespace warden::auth
