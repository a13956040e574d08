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

// Warden Base64url - Implementation

#include "base64url.hpp"

#include <algorithm>
#include <vector>

#include <openssl/evp.h>

namespace warden::core {

namespace {

/// 6-bit value of a url-safe alphabet character, -1 if outside the alphabet
[[nodiscard]] int sextet_value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '-') {
        return 62;
    }
    if (c == '_') {
        return 63;
    }
    return -1;
}

}  // namespace

std::string base64url_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    // Standard base64 encode (EVP_EncodeBlock NUL-terminates its output)
    std::vector<unsigned char> buffer(4 * ((input.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(buffer.data(),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));

    std::string result(reinterpret_cast<const char*>(buffer.data()),
                       static_cast<size_t>(written));

    // Convert base64 to base64url: '+' -> '-', '/' -> '_', drop '='
    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    return result;
}

std::optional<std::string> base64url_decode(std::string_view input) {
    if (input.empty()) {
        return std::string();
    }

    // A single trailing character can never encode a whole byte
    const size_t remainder = input.size() % 4;
    if (remainder == 1) {
        return std::nullopt;
    }

    for (char c : input) {
        if (sextet_value(c) < 0) {
            return std::nullopt;
        }
    }

    // Canonical form only: bits below the last full byte must be zero
    const int last = sextet_value(input.back());
    if ((remainder == 2 && (last & 0x0F) != 0) || (remainder == 3 && (last & 0x03) != 0)) {
        return std::nullopt;
    }

    // Convert base64url to standard base64 and restore padding
    std::string base64(input);
    std::replace(base64.begin(), base64.end(), '-', '+');
    std::replace(base64.begin(), base64.end(), '_', '/');
    const size_t padding = (4 - remainder) % 4;
    base64.append(padding, '=');

    std::vector<unsigned char> buffer(3 * (base64.size() / 4));
    int decoded = EVP_DecodeBlock(buffer.data(),
                                  reinterpret_cast<const unsigned char*>(base64.data()),
                                  static_cast<int>(base64.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts the zero bytes produced by padding
    return std::string(reinterpret_cast<const char*>(buffer.data()),
                       static_cast<size_t>(decoded) - padding);
}

}  // namespace warden::core
