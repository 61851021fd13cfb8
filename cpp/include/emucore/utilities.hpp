/**
 * @file utilities.hpp
 * @brief Common utility functions for EmuCore
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout EmuCore:
 * - Logging and error reporting
 * - File I/O and checksum helpers
 * - String manipulation
 * - Host and network interface helpers
 * - Identifier generation and validation
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace emucore {
namespace utilities {

/**
 * @brief Log levels for EmuCore logging
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
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Write string to file, creating parent directories
 * @param file_path Path to file
 * @param content Content to write
 * @return true if successful, false otherwise
 */
bool write_file(const std::string& file_path, const std::string& content);

/**
 * @brief Calculate MD5 digest of a file, streaming its content
 * @param file_path Path to file
 * @return Lowercase hex digest, or std::nullopt if the file cannot be read
 */
std::optional<std::string> calculate_file_md5(const std::string& file_path);

/**
 * @brief Split string by delimiter
 */
std::vector<std::string> split_string(const std::string& str, char delimiter);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

/**
 * @brief Get hostname of current machine
 * @return Hostname or "unknown" if unable to determine
 */
std::string get_hostname();

/**
 * @brief Check whether a host network interface exists and is up
 * @param interface_name Interface name (e.g. "eth0", "tap0")
 */
bool is_interface_up(const std::string& interface_name);

/**
 * @brief Memory currently available to new processes, in MB
 * @return Available memory or std::nullopt if it cannot be determined
 */
std::optional<uint64_t> get_available_memory_mb();

/**
 * @brief Percentage of host memory still available
 */
std::optional<double> get_memory_percent_left();

/**
 * @brief Locate an executable by absolute path or through PATH
 * @param name Executable name or path
 * @return Full path, or empty path if not found
 */
std::filesystem::path find_executable(const std::string& name);

/**
 * @brief Compare dotted version strings numerically ("0.9.14" < "0.9.18")
 * @return negative, zero or positive like strcmp
 */
int compare_versions(const std::string& lhs, const std::string& rhs);

/**
 * @brief Generate UUID v4 string
 * @return UUID string (e.g., "550e8400-e29b-41d4-a716-446655440000")
 */
std::string generate_uuid();

/**
 * @brief Check that a string is a well-formed UUID (8-4-4-4-12 hex)
 */
bool is_valid_uuid(const std::string& value);

} // namespace utilities
} // namespace emucore
