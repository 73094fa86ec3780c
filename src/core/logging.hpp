#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/JsonConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace hopstrip::control {
struct LogConfig;
}

namespace hopstrip::logging {

// Initialize Quill logging backend (called once at startup, safe to call again)
void init_logging_system();

// Initialize per-worker logger with config-driven settings.
// output "stdout" logs to the console, anything else is a directory that
// receives worker_<id>.log with size-based rotation.
// Returns logger for the given worker ID
quill::Logger* init_worker_logger(int worker_id, const hopstrip::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Map a config level name to a quill level (unknown names map to Info)
quill::LogLevel parse_log_level(std::string_view level);

// True for the level names accepted in configuration
bool is_valid_log_level(std::string_view level);

// UUID v4 generation for correlation IDs: {uuid}#{counter}
std::string generate_correlation_id();

// Validate correlation ID format ({8-4-4-4-12 uuid}#{counter})
bool is_valid_uuid(std::string_view uuid);

// Get current thread's logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Logging macros for structured logging

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id,   \
                    headers_stripped)                                                     \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}, headers_stripped={}",      \
             method, path, status, duration_us, client_ip, correlation_id, headers_stripped)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

}  // namespace hopstrip::logging
