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
namespace waypoint::control {
struct LogConfig;
}

namespace waypoint::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Create the process logger from config (console when output is empty,
// rotating text/JSON file otherwise) and make it current
quill::Logger* init_logger(const waypoint::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Get the current logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Map a config level name to a quill level (unknown names map to Info)
quill::LogLevel parse_log_level(std::string_view level);

// Logging macros for structured logging

// Route registration
#define WAYPOINT_LOG_ROUTE(logger, method, pattern) \
    LOG_DEBUG(logger, "Route registered: method={}, pattern={}", method, pattern)

// Rejected route registration
#define WAYPOINT_LOG_ROUTE_ERROR(logger, method, pattern, error_kind, error_detail)          \
    LOG_ERROR(logger, "Route rejected: method={}, pattern={}, error_kind={}, error_detail={}", \
              method, pattern, error_kind, error_detail)

// Request dispatch decision
#define WAYPOINT_LOG_DISPATCH(logger, method, path, action, status, target)                  \
    LOG_INFO(logger, "Request dispatched: method={}, path={}, action={}, status={}, target={}", \
             method, path, action, status, target)

}  // namespace waypoint::logging
