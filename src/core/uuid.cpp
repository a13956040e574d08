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

// Warden UUID - Implementation

#include "uuid.hpp"

#include <algorithm>
#include <stdexcept>

#include <openssl/rand.h>

namespace warden::core {

namespace {

[[nodiscard]] int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

[[nodiscard]] constexpr bool is_hyphen_position(size_t i) noexcept {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

}  // namespace

std::optional<Uuid> Uuid::parse(std::string_view text) {
    if (text.size() != 36) {
        return std::nullopt;
    }

    Uuid id;
    size_t out = 0;
    for (size_t i = 0; i < text.size();) {
        if (is_hyphen_position(i)) {
            if (text[i] != '-') {
                return std::nullopt;
            }
            ++i;
            continue;
        }

        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        id.bytes[out++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }

    return id;
}

Uuid Uuid::random() {
    Uuid id;
    if (RAND_bytes(id.bytes.data(), static_cast<int>(id.bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating UUID");
    }

    // Set version to 4 (random UUID)
    id.bytes[6] = (id.bytes[6] & 0x0F) | 0x40;
    // Set variant to RFC4122
    id.bytes[8] = (id.bytes[8] & 0x3F) | 0x80;
    return id;
}

std::string Uuid::to_string() const {
    static constexpr char kHex[] = "0123456789abcdef";

    std::string result;
    result.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result += '-';
        }
        result += kHex[bytes[i] >> 4];
        result += kHex[bytes[i] & 0x0F];
    }
    return result;
}

bool Uuid::is_nil() const noexcept {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

Uuid uuid_or_nil(std::string_view text) {
    return Uuid::parse(text).value_or(Uuid{});
}

}  // namespace warden::core
