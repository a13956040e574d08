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

// Warden Configuration - Implementation

#include "config.hpp"

#include <array>
#include <atomic>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "../core/base64url.hpp"

namespace warden::control {

namespace {

constexpr size_t kTokenSecretBytes = 32;
constexpr std::array<std::string_view, 4> kKnownRoles = {"everyone", "system", "administrators",
                                                         "users"};
constexpr std::array<std::string_view, 5> kKnownLogLevels = {"debug", "info", "warning", "warn",
                                                             "error"};

template <size_t N>
bool is_one_of(const std::array<std::string_view, N>& values, std::string_view value) {
    for (auto candidate : values) {
        if (candidate == value) {
            return true;
        }
    }
    return false;
}

void validate_secret(std::string_view secret, const std::string& field, ValidationResult& result) {
    auto decoded = core::base64url_decode(secret);
    if (!decoded) {
        result.add_error(field + " is not valid base64url");
    } else if (decoded->size() != kTokenSecretBytes) {
        result.add_error(field + " must decode to " + std::to_string(kTokenSecretBytes) +
                         " bytes (got " + std::to_string(decoded->size()) + ")");
    }
}

void validate_actions(const std::vector<std::string>& actions, const std::string& context,
                      ValidationResult& result) {
    for (const auto& action : actions) {
        if (action.empty()) {
            result.add_error(context + ": action names must not be empty");
        }
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json(buffer.str());
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            fprintf(stderr, "Config error: %s\n", error.c_str());
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Security
    if (config.security.token_secret.empty()) {
        result.add_error("security.token_secret is required");
    } else {
        validate_secret(config.security.token_secret, "security.token_secret", result);
    }

    for (size_t i = 0; i < config.security.previous_token_secrets.size(); ++i) {
        validate_secret(config.security.previous_token_secrets[i],
                        "security.previous_token_secrets[" + std::to_string(i) + "]", result);
    }

    if (config.security.default_token_lifetime_minutes == 0) {
        result.add_warning("security.default_token_lifetime_minutes is 0: tokens never expire");
    }

    // Logging
    if (!is_one_of(kKnownLogLevels, config.logging.level)) {
        result.add_error("logging.level must be one of debug, info, warning, error (got '" +
                         config.logging.level + "')");
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("logging.format must be 'json' or 'text'");
    }
    if (config.logging.rotation.max_files == 0) {
        result.add_error("logging.rotation.max_files must be > 0");
    }

    // Policy
    for (size_t i = 0; i < config.policy.role_rules.size(); ++i) {
        const auto& rule = config.policy.role_rules[i];
        std::string context = "policy.role_rules[" + std::to_string(i) + "]";
        if (!is_one_of(kKnownRoles, rule.role)) {
            result.add_error(context + ": unknown role '" + rule.role + "'");
        }
        if (rule.actions.empty()) {
            result.add_warning(context + ": rule grants no actions");
        }
        validate_actions(rule.actions, context, result);
    }
    validate_actions(config.policy.owner_actions, "policy.owner_actions", result);

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);
    } catch (const nlohmann::json::exception&) {
        return "";
    }
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;
    return load_path(config_path_);
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }
    return load_path(config_path_);
}

bool ConfigManager::load_path(const std::string& path) {
    auto maybe_config = ConfigLoader::load_from_file(path);
    if (!maybe_config.has_value()) {
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // Readers holding the old config keep it alive until they release it
    auto new_config = std::make_shared<const Config>(std::move(*maybe_config));
    std::atomic_store(&current_config_, new_config);
    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    return std::atomic_load(&current_config_);
}

}  // namespace warden::control
