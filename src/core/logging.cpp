#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>

#include <openssl/evp.h>

#include "../control/config.hpp"
#include "uuid.hpp"

namespace warden::logging {

static std::atomic<quill::Logger*> g_default_logger{nullptr};
static thread_local quill::Logger* g_current_logger = nullptr;

void init_logging_system() {
    quill::Backend::start();
}

static quill::LogLevel parse_level(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level == "debug") {
        return quill::LogLevel::Debug;
    } else if (level == "warning" || level == "warn") {
        return quill::LogLevel::Warning;
    } else if (level == "error") {
        return quill::LogLevel::Error;
    }
    return quill::LogLevel::Info;
}

quill::Logger* init_logger(std::string_view name, const control::LogConfig& log_config) {
    std::string logger_name(name);
    quill::Logger* logger = nullptr;

    if (log_config.output.empty() || log_config.output == "stdout") {
        auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
        logger = quill::Frontend::create_or_get_logger(logger_name, std::move(console_sink));
    } else {
        std::filesystem::create_directories(log_config.output);

        quill::RotatingFileSinkConfig config;
        config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
        config.set_max_backup_files(log_config.rotation.max_files);
        config.set_open_mode('a');

        std::string log_path = fmt::format("{}/{}.log", log_config.output, logger_name);

        if (log_config.format == "json") {
            auto json_sink =
                quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
            logger = quill::Frontend::create_or_get_logger(logger_name, std::move(json_sink));
        } else {
            auto file_sink =
                quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
            logger = quill::Frontend::create_or_get_logger(logger_name, std::move(file_sink));
        }
    }

    logger->set_log_level(parse_level(log_config.level));

    quill::Logger* expected = nullptr;
    g_default_logger.compare_exchange_strong(expected, logger, std::memory_order_acq_rel);
    return logger;
}

void shutdown_logging() {
    g_default_logger.store(nullptr, std::memory_order_release);
    g_current_logger = nullptr;
    quill::Backend::stop();
}

quill::Logger* get_current_logger() {
    if (g_current_logger) {
        return g_current_logger;
    }
    return g_default_logger.load(std::memory_order_acquire);
}

void set_current_logger(quill::Logger* logger) {
    g_current_logger = logger;
}

std::string generate_correlation_id() {
    // Base UUID generated once per thread, counter appended per request
    static thread_local std::string base_uuid = core::Uuid::random().to_string();
    static thread_local uint64_t counter = 0;

    return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_correlation_id(std::string_view id) {
    // Example: 550e8400-e29b-41d4-a716-446655440000#42
    size_t hash_pos = id.rfind('#');
    if (hash_pos == std::string_view::npos) {
        return false;
    }

    std::string_view uuid_part = id.substr(0, hash_pos);
    std::string_view counter_part = id.substr(hash_pos + 1);

    auto uuid = core::Uuid::parse(uuid_part);
    if (!uuid) {
        return false;
    }

    // Version 4, RFC 4122 variant
    if ((uuid->bytes[6] & 0xF0) != 0x40 || (uuid->bytes[8] & 0xC0) != 0x80) {
        return false;
    }

    if (counter_part.empty()) {
        return false;
    }
    return std::all_of(counter_part.begin(), counter_part.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

std::string sanitize_for_logging(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    std::string result;
    result.reserve(std::min(input.size(), MAX_LOG_STRING_LENGTH));

    for (size_t i = 0; i < input.size() && i < MAX_LOG_STRING_LENGTH; ++i) {
        char c = input[i];
        // Escape control characters to prevent log injection
        if (c == '\n') {
            result += "\\n";
        } else if (c == '\r') {
            result += "\\r";
        } else if (c == '\t') {
            result += "\\t";
        } else if (c >= 32 && c < 127) {
            result += c;
        } else {
            result += '?';
        }
    }

    if (input.size() > MAX_LOG_STRING_LENGTH) {
        result += "...(truncated)";
    }

    return result;
}

std::string redact_token(std::string_view token) {
    if (token.empty()) {
        return "<empty>";
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(token.data(), token.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return fmt::format("<len={}>", token.size());
    }

    std::string fingerprint;
    for (size_t i = 0; i < TOKEN_FINGERPRINT_LENGTH / 2 && i < digest_len; ++i) {
        fingerprint += fmt::format("{:02x}", digest[i]);
    }
    return fmt::format("sha256:{} len={}", fingerprint, token.size());
}

}  // namespace warden::logging
