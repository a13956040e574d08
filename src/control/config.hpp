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

// Warden Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::control {

/// Session token and account settings
struct SecurityConfig {
    std::string token_secret;                         // base64url, 32 bytes decoded
    std::vector<std::string> previous_token_secrets;  // Still accepted for decoding
    uint32_t default_token_lifetime_minutes = 525600;  // One year; 0 = never expires
    bool standalone = false;  // Standalone install: directory login needs no plan entitlement
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";     // debug, info, warning, error
    std::string format = "text";    // json, text
    std::string output = "stdout";  // "stdout" or a log directory ({name}.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Role -> allowed actions
struct RoleRuleConfig {
    std::string role;  // everyone, system, administrators, users
    std::vector<std::string> actions;
};

/// Authorization policy
struct PolicyConfig {
    std::vector<RoleRuleConfig> role_rules;
    std::vector<std::string> owner_actions;  // Granted to an object's owner
    bool acl_rules = true;                   // Honour per-object ACL entries
};

/// Full Warden configuration
struct Config {
    SecurityConfig security;
    LogConfig logging;
    PolicyConfig policy;

    std::string version = "1.0";
    std::string description;
};

// Custom from_json functions to handle missing fields with defaults

inline void from_json(const nlohmann::json& j, SecurityConfig& s) {
    s.token_secret = j.value("token_secret", std::string());
    s.previous_token_secrets = j.value("previous_token_secrets", std::vector<std::string>());
    s.default_token_lifetime_minutes = j.value("default_token_lifetime_minutes", 525600u);
    s.standalone = j.value("standalone", false);
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string("stdout"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, RoleRuleConfig& r) {
    r.role = j.value("role", std::string());
    r.actions = j.value("actions", std::vector<std::string>());
}

inline void from_json(const nlohmann::json& j, PolicyConfig& p) {
    if (j.contains("role_rules")) {
        j.at("role_rules").get_to(p.role_rules);
    }
    p.owner_actions = j.value("owner_actions", std::vector<std::string>());
    p.acl_rules = j.value("acl_rules", true);
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // contains() + get_to() keeps defaults for absent sections
    if (j.contains("security")) {
        j.at("security").get_to(c.security);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("policy")) {
        j.at("policy").get_to(c.policy);
    }
    if (j.contains("version")) {
        j.at("version").get_to(c.version);
    }
    if (j.contains("description")) {
        j.at("description").get_to(c.description);
    }
}

inline void to_json(nlohmann::json& j, const SecurityConfig& s) {
    j = nlohmann::json{{"token_secret", s.token_secret},
                       {"previous_token_secrets", s.previous_token_secrets},
                       {"default_token_lifetime_minutes", s.default_token_lifetime_minutes},
                       {"standalone", s.standalone}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const RoleRuleConfig& r) {
    j = nlohmann::json{{"role", r.role}, {"actions", r.actions}};
}

inline void to_json(nlohmann::json& j, const PolicyConfig& p) {
    j = nlohmann::json{
        {"role_rules", p.role_rules}, {"owner_actions", p.owner_actions}, {"acl_rules", p.acl_rules}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["security"] = c.security;
    j["logging"] = c.logging;
    j["policy"] = c.policy;
    j["version"] = c.version;
    j["description"] = c.description;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file (nullopt on I/O, parse or validation error)
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Configuration holder with reload support (RCU pattern)
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    [[nodiscard]] bool load(std::string_view path);

    /// Re-read the file; the previous configuration stays active on failure
    [[nodiscard]] bool reload();

    /// Current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }
    [[nodiscard]] bool is_loaded() const noexcept { return get() != nullptr; }

    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    [[nodiscard]] bool load_path(const std::string& path);

    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace warden::control
