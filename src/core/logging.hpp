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
namespace httpgate::control {
struct LogConfig;
}

namespace httpgate::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create the process logger from config (console or rotating file sink).
// Worker threads share it; quill gives every thread its own frontend queue.
quill::Logger* init_logger(const httpgate::control::LogConfig& config);

// Change the level of the process logger (used on config reload)
void set_log_level(std::string_view level);

// Shutdown logging system (called at exit, flushes pending records)
void shutdown_logging();

// Correlation ID: "<uuid v4>#<counter>", base uuid generated once per thread
std::string generate_correlation_id();

// Validate correlation ID format produced by generate_correlation_id()
bool is_valid_correlation_id(std::string_view id);

// Process logger (returns nullptr if not initialized)
quill::Logger* get_logger();

// Logging macros for structured logging

// Request completion logging
#define LOG_REQUEST(logger, method, host, path, route, target, status, retries, latency_us,     \
                    outcome, correlation_id)                                                    \
    LOG_INFO(logger,                                                                            \
             "Request completed: method={}, host={}, path={}, route={}, target={}, status={}, " \
             "retries={}, latency_us={}, outcome={}, correlation_id={}",                        \
             method, host, path, route, target, status, retries, latency_us, outcome,           \
             correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

// Upstream connection event logging
#define LOG_UPSTREAM(logger, event, target, detail, correlation_id)                    \
    LOG_INFO(logger, "Upstream {}: target={}, detail={}, correlation_id={}", event, target, \
             detail, correlation_id)

}  // namespace httpgate::logging
