#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace warden::control {
struct LogConfig;
}

namespace warden::logging {

// Security limits for log output
constexpr size_t MAX_LOG_STRING_LENGTH = 200;  // Max string length before truncation
constexpr size_t TOKEN_FINGERPRINT_LENGTH = 8;  // Token prefix kept by redact_token()

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create (or fetch) a named logger with config-driven sink and level.
// The first logger created becomes the process default.
quill::Logger* init_logger(std::string_view name, const warden::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Get the calling thread's logger, falling back to the process default.
// Returns nullptr if logging was never initialized.
quill::Logger* get_current_logger();

// Override the logger used by the calling thread (nullptr restores the default)
void set_current_logger(quill::Logger* logger);

// UUID v4 based correlation IDs: {uuid}#{counter}
std::string generate_correlation_id();

// Validate correlation ID format
bool is_valid_correlation_id(std::string_view id);

// Escape control characters and truncate user-controlled strings
std::string sanitize_for_logging(std::string_view input);

// Short, non-reversible description of a session token for log lines
std::string redact_token(std::string_view token);

// Authentication event logging with caller context
#define WARDEN_LOG_AUTH(logger, event, detail, client_ip, path, correlation_id)             \
    LOG_INFO(logger, "Auth {}: {}, client_ip={}, path={}, correlation_id={}", event, detail, \
             client_ip, path, correlation_id)

// Error logging with context
#define WARDEN_LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail) \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

}  // namespace warden::logging
