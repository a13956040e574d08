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

#include "errors.hpp"

namespace warden::auth {

std::string_view auth_error_to_string(AuthError error) {
    switch (error) {
        case AuthError::None:
            return "none";
        case AuthError::InvalidCredential:
            return "invalid_credential";
        case AuthError::AccountDisabled:
            return "account_disabled";
        case AuthError::FeatureNotLicensed:
            return "feature_not_licensed";
        case AuthError::PasswordReuse:
            return "password_reuse";
        case AuthError::Internal:
            return "internal";
    }
    return "unknown";
}

}  // namespace warden::auth
