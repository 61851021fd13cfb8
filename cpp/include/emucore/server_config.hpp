/**
 * @file server_config.hpp
 * @brief Compute server configuration, limits and path validation
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <filesystem>

namespace emucore {
namespace config {

// ============================================================================
// Port Ranges
// ============================================================================

/// Default first TCP console port
constexpr uint16_t DEFAULT_CONSOLE_START_PORT = 5000;

/// Default last TCP console port
constexpr uint16_t DEFAULT_CONSOLE_END_PORT = 10000;

/// Default first UDP tunnel port
constexpr uint16_t DEFAULT_UDP_START_PORT = 10000;

/// Default last UDP tunnel port
constexpr uint16_t DEFAULT_UDP_END_PORT = 20000;

/// First port of the VNC console range
constexpr uint16_t VNC_CONSOLE_START_PORT = 5900;

/// Last port of the VNC console range
constexpr uint16_t VNC_CONSOLE_END_PORT = 6000;

/// Address that listens on every IPv4 interface
constexpr const char* WILDCARD_HOST = "0.0.0.0";

/// Address that listens on every IPv6 interface
constexpr const char* WILDCARD_HOST_V6 = "::";

// ============================================================================
// Images
// ============================================================================

/// Suffix of the checksum sidecar written next to every image
constexpr const char* CHECKSUM_SUFFIX = ".md5sum";

/// Suffix of partially uploaded images
constexpr const char* UPLOAD_SUFFIX = ".tmp";

/// Upload buffer size
constexpr size_t IMAGE_CHUNK_SIZE = 8192;

/// Length of an MD5 hex digest
constexpr size_t MD5_HEX_LENGTH = 32;

// ============================================================================
// Bridge Hypervisor
// ============================================================================

/// Oldest bridge release that supports packet filters
constexpr const char* MINIMUM_BRIDGE_VERSION = "0.9.14";

/// Time allowed for the bridge process to accept connections
constexpr auto BRIDGE_CONNECT_TIMEOUT = std::chrono::seconds(10);

/// Delay between bridge connection attempts
constexpr auto BRIDGE_CONNECT_RETRY = std::chrono::milliseconds(100);

/// Grace period between SIGTERM and SIGKILL
constexpr auto PROCESS_STOP_TIMEOUT = std::chrono::seconds(3);

// ============================================================================
// Identifiers
// ============================================================================

/// Maximum identifier length (device names, backend names)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// Maximum filename length
constexpr size_t MAX_FILENAME_LENGTH = 255;

// ============================================================================
// Banned Ports
// ============================================================================

/**
 * @brief Ports browsers refuse to connect to
 *
 * Console ports are opened from web clients, so these are never handed out.
 */
const std::set<uint16_t>& banned_ports();

/**
 * @brief Check if a port is in the banned set
 */
bool is_banned_port(uint16_t port);

// ============================================================================
// Directories
// ============================================================================

/**
 * @brief Get EmuCore data directory from environment or use default
 * @return Filesystem path to data directory
 */
std::filesystem::path get_data_directory();

/**
 * @brief Default images directory (EMUCORE_IMAGES_DIR or <data>/images)
 */
std::filesystem::path get_images_directory();

/**
 * @brief Default projects directory (EMUCORE_PROJECTS_DIR or <data>/projects)
 */
std::filesystem::path get_projects_directory();

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric + underscore/hyphen only)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Check if path is safe (no traversal, within allowed directory)
 * @param path Path to validate
 * @param base_dir Base directory that path must be within
 * @return true if safe, false if path traversal detected
 */
bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);

// ============================================================================
// Server Configuration
// ============================================================================

/**
 * @brief Settings of one compute server process
 *
 * Every field has a default so a partial JSON document is accepted.
 */
struct ServerConfig {
    /// Address the server listens on
    std::string host = "0.0.0.0";

    /// Address console ports are opened on
    std::string console_host = "0.0.0.0";

    /// Open consoles on every interface regardless of console_host
    bool allow_remote_console = false;

    /// Server runs on the same machine as the controller
    bool local = false;

    uint16_t console_start_port_range = DEFAULT_CONSOLE_START_PORT;
    uint16_t console_end_port_range = DEFAULT_CONSOLE_END_PORT;
    uint16_t udp_start_port_range = DEFAULT_UDP_START_PORT;
    uint16_t udp_end_port_range = DEFAULT_UDP_END_PORT;

    /// Root of the image tree
    std::filesystem::path images_path;

    /// Extra directories searched for images
    std::vector<std::filesystem::path> additional_images_paths;

    /// Root of the project tree
    std::filesystem::path projects_path;

    /// Bridge hypervisor executable (name or path)
    std::string ubridge_path = "ubridge";

    /**
     * @brief Configuration with default values and environment overrides
     */
    static ServerConfig defaults();

    /**
     * @brief Parse configuration from a JSON document
     * @param json_str JSON text
     * @return Parsed configuration, or std::nullopt on malformed input
     */
    static std::optional<ServerConfig> from_json(const std::string& json_str);

    /**
     * @brief Load configuration from a JSON file
     * @param file_path Path to the configuration file
     * @return Parsed configuration, or std::nullopt if missing or malformed
     */
    static std::optional<ServerConfig> load(const std::filesystem::path& file_path);

    /**
     * @brief Serialize configuration to JSON
     */
    std::string to_json() const;
};

} // namespace config
} // namespace emucore
