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

// Warden Session Token Codec - Header
// Versioned binary session token sealed with AES-256-GCM
//
// Wire format (version 1, integers big-endian):
//   envelope  = version(1) | nonce(12) | ciphertext(40) | tag(16)
//   plaintext = tenant_id(i32) | user_id(16) | tenant_gen(i32) | user_gen(i32)
//               | expires_at(i64, INT64_MAX = never) | login_event_id(i32)
//   transport = base64url(envelope) without padding (92 characters)
//
// The version byte is bound as additional authenticated data.

#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/uuid.hpp"

namespace warden::auth {

// Wire format constants
constexpr uint8_t TOKEN_VERSION = 1;
constexpr size_t TOKEN_KEY_SIZE = 32;
constexpr size_t TOKEN_NONCE_SIZE = 12;
constexpr size_t TOKEN_TAG_SIZE = 16;
constexpr size_t TOKEN_PLAINTEXT_SIZE = 4 + 16 + 4 + 4 + 8 + 4;
constexpr size_t TOKEN_ENVELOPE_SIZE = 1 + TOKEN_NONCE_SIZE + TOKEN_PLAINTEXT_SIZE + TOKEN_TAG_SIZE;
constexpr size_t MAX_ENCODED_TOKEN_LENGTH = 512;  // Inputs above this are rejected unread

/// Expiration sentinel for tokens that never expire
constexpr int64_t kNeverExpires = std::numeric_limits<int64_t>::max();

/// Reserved cookie value: header-based bearer auth is in use, no cookie present
inline constexpr std::string_view kBearerSentinel = "Bearer";

/// Logical session token fields
struct SessionToken {
    int32_t tenant_id = 0;
    core::Uuid user_id;
    int32_t tenant_generation = 0;
    int32_t user_generation = 0;
    int64_t expires_at = kNeverExpires;  // Unix epoch seconds
    int32_t login_event_id = 0;          // 0 = not tracked

    [[nodiscard]] bool never_expires() const noexcept { return expires_at == kNeverExpires; }
    [[nodiscard]] bool is_expired(int64_t now) const noexcept {
        return !never_expires() && expires_at < now;
    }

    friend bool operator==(const SessionToken&, const SessionToken&) = default;
};

/// Token decode failure reasons
enum class DecodeError : uint8_t {
    None,
    Malformed,           // Bad transport encoding or envelope length
    UnsupportedVersion,  // Unknown version byte
    IntegrityFailure,    // Authentication tag mismatch under every key
    Internal             // Cipher context failure
};

[[nodiscard]] std::string_view decode_error_to_string(DecodeError error);

/// Token decode result
struct DecodeResult {
    bool valid = false;
    SessionToken token;
    DecodeError error = DecodeError::None;

    [[nodiscard]] static DecodeResult success(SessionToken token) {
        return {true, token, DecodeError::None};
    }

    [[nodiscard]] static DecodeResult failure(DecodeError error) {
        return {false, {}, error};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// 256-bit token sealing key
struct TokenKey {
    std::array<uint8_t, TOKEN_KEY_SIZE> bytes{};

    /// Load key from base64url-encoded secret (must decode to exactly 32 bytes)
    [[nodiscard]] static std::optional<TokenKey> from_base64url(std::string_view secret);

    /// Fresh random key
    [[nodiscard]] static TokenKey generate();
};

/// Session token encoder/decoder
/// Stateless after construction; safe to share across threads.
class TokenCodec {
public:
    /// primary seals new tokens; previous keys are accepted for decoding only
    explicit TokenCodec(TokenKey primary, std::vector<TokenKey> previous = {});
    ~TokenCodec() = default;

    TokenCodec(const TokenCodec&) = default;
    TokenCodec& operator=(const TokenCodec&) = default;
    TokenCodec(TokenCodec&&) noexcept = default;
    TokenCodec& operator=(TokenCodec&&) noexcept = default;

    /// Seal token fields (throws std::runtime_error if OpenSSL fails)
    [[nodiscard]] std::string encode(const SessionToken& token) const;

    /// Open a token; never throws, all failures are reported as DecodeError
    [[nodiscard]] DecodeResult decode(std::string_view encoded) const;

    /// True for the reserved bearer marker; checked before any decoding
    [[nodiscard]] static bool is_bearer_sentinel(std::string_view value) noexcept {
        return value == kBearerSentinel;
    }

    [[nodiscard]] size_t key_count() const noexcept { return 1 + previous_.size(); }

private:
    /// Try to open the envelope with one key
    [[nodiscard]] std::optional<SessionToken> open_with(const TokenKey& key,
                                                        std::string_view envelope,
                                                        bool& cipher_failure) const;

    TokenKey primary_;
    std::vector<TokenKey> previous_;
};

}  // namespace warden::auth
