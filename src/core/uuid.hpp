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

// Warden UUID - Header
// 128-bit identifiers for users, groups and system accounts

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "containers.hpp"

namespace warden::core {

/// 128-bit identifier, stored in RFC 4122 byte order (as printed)
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    /// Parse canonical 8-4-4-4-12 form (case-insensitive)
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view text);

    /// Random version 4 UUID (OpenSSL RAND_bytes)
    [[nodiscard]] static Uuid random();

    /// Lowercase 8-4-4-4-12 form
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool is_nil() const noexcept;

    friend bool operator==(const Uuid&, const Uuid&) = default;
};

/// Parse a compile-time-known UUID literal; returns nil on malformed input
[[nodiscard]] Uuid uuid_or_nil(std::string_view text);

}  // namespace warden::core

template <>
struct ankerl::unordered_dense::hash<warden::core::Uuid> {
    using is_avalanching = void;

    [[nodiscard]] auto operator()(const warden::core::Uuid& id) const noexcept -> uint64_t {
        return detail::wyhash::hash(id.bytes.data(), id.bytes.size());
    }
};
