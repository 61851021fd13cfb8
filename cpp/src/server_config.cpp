/**
 * @file server_config.cpp
 * @brief Implementation of server configuration and validation functions
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "emucore/server_config.hpp"
#include "emucore/utilities.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

using json = nlohmann::json;

namespace emucore {
namespace config {

// ============================================================================
// Banned Ports
// ============================================================================

const std::set<uint16_t>& banned_ports() {
    static const std::set<uint16_t> ports = {
        1, 7, 9, 11, 13, 15, 17, 19, 20, 21, 22, 23, 25, 37, 42, 43, 53, 77, 79, 87, 95,
        101, 102, 103, 104, 109, 110, 111, 113, 115, 117, 119, 123, 135, 139, 143, 179,
        389, 465, 512, 513, 514, 515, 526, 530, 531, 532, 540, 556, 563, 587, 601, 636,
        993, 995, 2049, 3659, 4045, 6000, 6665, 6666, 6667, 6668, 6669
    };
    return ports;
}

bool is_banned_port(uint16_t port) {
    return banned_ports().count(port) > 0;
}

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    // EMUCORE_DATA_DIR overrides the default location
    std::string env_data_dir = utilities::get_env("EMUCORE_DATA_DIR");
    std::filesystem::path data_dir = env_data_dir.empty() ? "/opt/fsi/var/emucore" : env_data_dir;

    // Create directory if it doesn't exist
    std::error_code ec;
    if (!std::filesystem::exists(data_dir, ec)) {
        std::filesystem::create_directories(data_dir, ec);
        if (ec) {
            utilities::log_warn("Config: cannot create data directory " +
                                data_dir.string() + ": " + ec.message());
        }
    }

    return data_dir;
}

std::filesystem::path get_images_directory() {
    std::string env_images_dir = utilities::get_env("EMUCORE_IMAGES_DIR");
    if (!env_images_dir.empty()) {
        return std::filesystem::path(env_images_dir);
    }
    return get_data_directory() / "images";
}

std::filesystem::path get_projects_directory() {
    std::string env_projects_dir = utilities::get_env("EMUCORE_PROJECTS_DIR");
    if (!env_projects_dir.empty()) {
        return std::filesystem::path(env_projects_dir);
    }
    return get_data_directory() / "projects";
}

// ============================================================================
// Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    // Check length
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    // Validate characters: alphanumeric + underscore + hyphen only
    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }

    return true;
}

bool is_safe_path(const std::filesystem::path& path, const std::filesystem::path& base_dir) {
    try {
        // Resolve to canonical paths (resolves .., symlinks, etc.)
        std::filesystem::path canonical_path = std::filesystem::weakly_canonical(path);
        std::filesystem::path canonical_base = std::filesystem::weakly_canonical(base_dir);

        std::string path_str = canonical_path.string();
        std::string base_str = canonical_base.string();

        if (path_str == base_str) {
            return true;
        }

        // Ensure base_str ends with separator for proper prefix matching
        if (!base_str.empty() && base_str.back() != std::filesystem::path::preferred_separator) {
            base_str += std::filesystem::path::preferred_separator;
        }

        // Check if path starts with base directory
        if (path_str.find(base_str) != 0) {
            return false;
        }

        // Check if relative path starts with ".." (traversal detected)
        auto relative = std::filesystem::relative(canonical_path, canonical_base);
        if (!relative.empty() && relative.string().find("..") == 0) {
            return false;
        }

        return true;

    } catch (const std::filesystem::filesystem_error&) {
        // If path resolution fails, consider it unsafe
        return false;
    }
}

// ============================================================================
// Server Configuration
// ============================================================================

namespace {
    bool read_port(const json& j, const char* key, uint16_t& out) {
        if (!j.contains(key)) {
            return true;
        }
        if (!j[key].is_number_integer()) {
            return false;
        }
        auto value = j[key].get<int64_t>();
        if (value < 1 || value > 65535) {
            return false;
        }
        out = static_cast<uint16_t>(value);
        return true;
    }
}

ServerConfig ServerConfig::defaults() {
    ServerConfig cfg;
    cfg.images_path = get_images_directory();
    cfg.projects_path = get_projects_directory();
    return cfg;
}

std::optional<ServerConfig> ServerConfig::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            utilities::log_error("Config: document is not a JSON object");
            return std::nullopt;
        }

        ServerConfig cfg = defaults();
        cfg.host = j.value("host", cfg.host);
        cfg.console_host = j.value("console_host", cfg.console_host);
        cfg.allow_remote_console = j.value("allow_remote_console", cfg.allow_remote_console);
        cfg.local = j.value("local", cfg.local);
        cfg.ubridge_path = j.value("ubridge_path", cfg.ubridge_path);

        if (!read_port(j, "console_start_port_range", cfg.console_start_port_range) ||
            !read_port(j, "console_end_port_range", cfg.console_end_port_range) ||
            !read_port(j, "udp_start_port_range", cfg.udp_start_port_range) ||
            !read_port(j, "udp_end_port_range", cfg.udp_end_port_range)) {
            utilities::log_error("Config: port range values must be integers in 1-65535");
            return std::nullopt;
        }

        if (j.contains("images_path")) {
            cfg.images_path = j["images_path"].get<std::string>();
        }
        if (j.contains("projects_path")) {
            cfg.projects_path = j["projects_path"].get<std::string>();
        }
        if (j.contains("additional_images_paths")) {
            // Accept either a list or a ';' separated string
            const auto& extra = j["additional_images_paths"];
            if (extra.is_array()) {
                for (const auto& item : extra) {
                    cfg.additional_images_paths.emplace_back(item.get<std::string>());
                }
            } else {
                for (const auto& item : utilities::split_string(extra.get<std::string>(), ';')) {
                    auto trimmed = utilities::trim_string(item);
                    if (!trimmed.empty()) {
                        cfg.additional_images_paths.emplace_back(trimmed);
                    }
                }
            }
        }

        return cfg;

    } catch (const json::exception& ex) {
        utilities::log_error(std::string("Config: invalid configuration: ") + ex.what());
        return std::nullopt;
    }
}

std::optional<ServerConfig> ServerConfig::load(const std::filesystem::path& file_path) {
    auto content = utilities::read_file(file_path.string());
    if (!content) {
        utilities::log_error("Config: cannot read " + file_path.string());
        return std::nullopt;
    }
    return from_json(*content);
}

std::string ServerConfig::to_json() const {
    json j;
    j["host"] = host;
    j["console_host"] = console_host;
    j["allow_remote_console"] = allow_remote_console;
    j["local"] = local;
    j["console_start_port_range"] = console_start_port_range;
    j["console_end_port_range"] = console_end_port_range;
    j["udp_start_port_range"] = udp_start_port_range;
    j["udp_end_port_range"] = udp_end_port_range;
    j["images_path"] = images_path.string();
    j["projects_path"] = projects_path.string();
    j["ubridge_path"] = ubridge_path;

    json extra = json::array();
    for (const auto& path : additional_images_paths) {
        extra.push_back(path.string());
    }
    j["additional_images_paths"] = extra;

    return j.dump();
}

} // namespace config
} // namespace emucore
