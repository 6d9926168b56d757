/**
 * @file utilities.hpp
 * @brief Common utility functions for AgentAuth
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout AgentAuth:
 * - Logging and error reporting
 * - Time and date formatting/parsing
 * - String manipulation
 * - File I/O helpers
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace agentauth {
namespace utilities {

/**
 * @brief Log levels for AgentAuth logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Initialize logging from AGENTAUTH_LOG_LEVEL / AGENTAUTH_LOG_FILE
 */
void initialize_logging_from_env();

/**
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @return LogLevel or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Current Unix time in seconds
 */
int64_t current_timestamp();

/**
 * @brief Format timestamp as ISO 8601 string
 * @param timestamp Unix timestamp (seconds since epoch)
 * @return Formatted string (e.g., "2025-11-10T15:30:45Z")
 */
std::string format_timestamp(int64_t timestamp);

/**
 * @brief Parse an ISO 8601 timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS", optional fractional seconds (truncated),
 * and a "Z" or "+HH:MM"/"-HH:MM" suffix. No suffix means UTC.
 *
 * @return Unix timestamp or std::nullopt if invalid
 */
std::optional<int64_t> parse_timestamp(const std::string& text);

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 */
int64_t days_from_civil(int64_t year, unsigned month, unsigned day);

/**
 * @brief Read entire file into string
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Read entire file into byte vector
 * @return File contents or std::nullopt if error
 */
std::optional<std::vector<uint8_t>> read_file_binary(const std::string& file_path);

/**
 * @brief Write string to file, creating parent directories
 * @return true if successful, false otherwise
 */
bool write_file(const std::string& file_path, const std::string& content);

/**
 * @brief Split string by delimiter (empty fields preserved)
 */
std::vector<std::string> split_string(const std::string& str, char delimiter);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Check if string starts with prefix
 */
bool starts_with(const std::string& str, const std::string& prefix);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set or empty
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Generate UUID v4 string from the CSPRNG
 * @return UUID string (e.g., "550e8400-e29b-41d4-a716-446655440000")
 */
std::string generate_uuid();

} // namespace utilities
} // namespace agentauth
