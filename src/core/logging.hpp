#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/core/LogLevel.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <optional>
#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace tokengate::control {
struct LogConfig;
}

namespace tokengate::logging {

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Create the logger for a worker thread and make it current for that thread
// Log file: {config.output}/tokengate_{worker_id}.log
quill::Logger* init_worker_logger(int worker_id, const tokengate::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Map a configured level name (debug, info, warning/warn, error) to a Quill level
std::optional<quill::LogLevel> parse_log_level(std::string_view level);

// Correlation ID for request logs: {uuid v4}#{counter}
std::string generate_correlation_id();

// Check that an inbound correlation ID has the {uuid v4}#{counter} shape
bool is_valid_correlation_id(std::string_view id);

// Get current thread's logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Rejection logging with context (cause is never sent to the client)
#define LOG_AUTH_REJECT(logger, cause, client_ip, correlation_id)                           \
    LOG_WARNING(logger, "Request rejected: cause={}, client_ip={}, correlation_id={}", cause, \
                client_ip, correlation_id)

}  // namespace tokengate::logging
