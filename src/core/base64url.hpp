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

// Warden Base64url - Header
// RFC 4648 section 5 encoding without padding

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace warden::core {

/// Base64url encode (RFC 4648), no padding
[[nodiscard]] std::string base64url_encode(std::string_view input);

/// Strict base64url decode
/// Rejects padding, characters outside the url-safe alphabet, impossible
/// lengths and non-zero trailing bits, so every accepted string has exactly
/// one decoding.
[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

}  // namespace warden::core
