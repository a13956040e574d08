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

// Warden Session Token Codec - Implementation

#include "token_codec.hpp"

#include <cstring>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include "../core/base64url.hpp"

namespace warden::auth {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

// ============================================================================
// Big-endian field packing
// ============================================================================

void put_u32(uint8_t* out, uint32_t value) noexcept {
    out[0] = static_cast<uint8_t>(value >> 24);
    out[1] = static_cast<uint8_t>(value >> 16);
    out[2] = static_cast<uint8_t>(value >> 8);
    out[3] = static_cast<uint8_t>(value);
}

void put_u64(uint8_t* out, uint64_t value) noexcept {
    put_u32(out, static_cast<uint32_t>(value >> 32));
    put_u32(out + 4, static_cast<uint32_t>(value));
}

[[nodiscard]] uint32_t get_u32(const uint8_t* in) noexcept {
    return (static_cast<uint32_t>(in[0]) << 24) | (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
}

[[nodiscard]] uint64_t get_u64(const uint8_t* in) noexcept {
    return (static_cast<uint64_t>(get_u32(in)) << 32) | get_u32(in + 4);
}

using Plaintext = std::array<uint8_t, TOKEN_PLAINTEXT_SIZE>;

[[nodiscard]] Plaintext pack(const SessionToken& token) noexcept {
    Plaintext out{};
    uint8_t* p = out.data();

    put_u32(p, static_cast<uint32_t>(token.tenant_id));
    p += 4;
    std::memcpy(p, token.user_id.bytes.data(), token.user_id.bytes.size());
    p += token.user_id.bytes.size();
    put_u32(p, static_cast<uint32_t>(token.tenant_generation));
    p += 4;
    put_u32(p, static_cast<uint32_t>(token.user_generation));
    p += 4;
    put_u64(p, static_cast<uint64_t>(token.expires_at));
    p += 8;
    put_u32(p, static_cast<uint32_t>(token.login_event_id));

    return out;
}

[[nodiscard]] SessionToken unpack(const Plaintext& in) noexcept {
    SessionToken token;
    const uint8_t* p = in.data();

    token.tenant_id = static_cast<int32_t>(get_u32(p));
    p += 4;
    std::memcpy(token.user_id.bytes.data(), p, token.user_id.bytes.size());
    p += token.user_id.bytes.size();
    token.tenant_generation = static_cast<int32_t>(get_u32(p));
    p += 4;
    token.user_generation = static_cast<int32_t>(get_u32(p));
    p += 4;
    token.expires_at = static_cast<int64_t>(get_u64(p));
    p += 8;
    token.login_event_id = static_cast<int32_t>(get_u32(p));

    return token;
}

}  // namespace

std::string_view decode_error_to_string(DecodeError error) {
    switch (error) {
        case DecodeError::None:
            return "none";
        case DecodeError::Malformed:
            return "malformed";
        case DecodeError::UnsupportedVersion:
            return "unsupported_version";
        case DecodeError::IntegrityFailure:
            return "integrity_failure";
        case DecodeError::Internal:
            return "internal";
    }
    return "unknown";
}

// ============================================================================
// TokenKey
// ============================================================================

std::optional<TokenKey> TokenKey::from_base64url(std::string_view secret) {
    auto decoded = core::base64url_decode(secret);
    if (!decoded || decoded->size() != TOKEN_KEY_SIZE) {
        return std::nullopt;
    }

    TokenKey key;
    std::memcpy(key.bytes.data(), decoded->data(), TOKEN_KEY_SIZE);
    return key;
}

TokenKey TokenKey::generate() {
    TokenKey key;
    if (RAND_bytes(key.bytes.data(), static_cast<int>(key.bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating token key");
    }
    return key;
}

// ============================================================================
// TokenCodec
// ============================================================================

TokenCodec::TokenCodec(TokenKey primary, std::vector<TokenKey> previous)
    : primary_(primary), previous_(std::move(previous)) {}

std::string TokenCodec::encode(const SessionToken& token) const {
    std::array<uint8_t, TOKEN_ENVELOPE_SIZE> envelope{};
    uint8_t* version = envelope.data();
    uint8_t* nonce = version + 1;
    uint8_t* ciphertext = nonce + TOKEN_NONCE_SIZE;
    uint8_t* tag = ciphertext + TOKEN_PLAINTEXT_SIZE;

    *version = TOKEN_VERSION;
    if (RAND_bytes(nonce, static_cast<int>(TOKEN_NONCE_SIZE)) != 1) {
        throw std::runtime_error("RAND_bytes failed while sealing session token");
    }

    const Plaintext plaintext = pack(token);

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    }

    int len = 0;
    bool ok =
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(TOKEN_NONCE_SIZE),
                            nullptr) == 1 &&
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, primary_.bytes.data(), nonce) == 1 &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, version, 1) == 1 &&
        EVP_EncryptUpdate(ctx.get(), ciphertext, &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) == 1 &&
        static_cast<size_t>(len) == TOKEN_PLAINTEXT_SIZE &&
        EVP_EncryptFinal_ex(ctx.get(), ciphertext + len, &len) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TOKEN_TAG_SIZE),
                            tag) == 1;

    if (!ok) {
        throw std::runtime_error("AES-256-GCM sealing failed");
    }

    return core::base64url_encode(
        std::string_view(reinterpret_cast<const char*>(envelope.data()), envelope.size()));
}

DecodeResult TokenCodec::decode(std::string_view encoded) const {
    if (encoded.empty() || encoded.size() > MAX_ENCODED_TOKEN_LENGTH) {
        return DecodeResult::failure(DecodeError::Malformed);
    }

    try {
        auto envelope = core::base64url_decode(encoded);
        if (!envelope || envelope->empty()) {
            return DecodeResult::failure(DecodeError::Malformed);
        }

        if (static_cast<uint8_t>((*envelope)[0]) != TOKEN_VERSION) {
            return DecodeResult::failure(DecodeError::UnsupportedVersion);
        }

        if (envelope->size() != TOKEN_ENVELOPE_SIZE) {
            return DecodeResult::failure(DecodeError::Malformed);
        }

        bool cipher_failure = false;
        if (auto token = open_with(primary_, *envelope, cipher_failure)) {
            return DecodeResult::success(*token);
        }

        // Key rotation: tokens sealed with a retired key stay readable
        for (const auto& key : previous_) {
            if (auto token = open_with(key, *envelope, cipher_failure)) {
                return DecodeResult::success(*token);
            }
        }

        return DecodeResult::failure(cipher_failure ? DecodeError::Internal
                                                    : DecodeError::IntegrityFailure);
    } catch (const std::exception&) {
        // Allocation failure while decoding untrusted input
        return DecodeResult::failure(DecodeError::Internal);
    }
}

std::optional<SessionToken> TokenCodec::open_with(const TokenKey& key, std::string_view envelope,
                                                  bool& cipher_failure) const {
    const auto* bytes = reinterpret_cast<const uint8_t*>(envelope.data());
    const uint8_t* version = bytes;
    const uint8_t* nonce = version + 1;
    const uint8_t* ciphertext = nonce + TOKEN_NONCE_SIZE;
    const uint8_t* tag = ciphertext + TOKEN_PLAINTEXT_SIZE;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        cipher_failure = true;
        return std::nullopt;
    }

    Plaintext plaintext{};
    int len = 0;
    bool ok =
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(TOKEN_NONCE_SIZE),
                            nullptr) == 1 &&
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.bytes.data(), nonce) == 1 &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len, version, 1) == 1 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext,
                          static_cast<int>(TOKEN_PLAINTEXT_SIZE)) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TOKEN_TAG_SIZE),
                            const_cast<uint8_t*>(tag)) == 1;

    if (!ok) {
        cipher_failure = true;
        return std::nullopt;
    }

    // Tag verification happens here; plaintext is discarded on mismatch
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &final_len) <= 0) {
        return std::nullopt;
    }

    return unpack(plaintext);
}

}  // namespace warden::auth
