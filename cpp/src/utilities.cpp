/**
 * @file utilities.cpp
 * @brief Implementation of common utility functions for EmuCore
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "emucore/utilities.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <sodium.h>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include <ifaddrs.h>
#include <net/if.h>
#include <unistd.h>

namespace emucore {
namespace utilities {

namespace {
    // Global logger instance
    std::shared_ptr<spdlog::logger> g_logger;
    std::once_flag g_logger_once;

    // Convert LogLevel to spdlog level
    spdlog::level::level_enum to_spdlog_level(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:    return spdlog::level::debug;
            case LogLevel::INFO:     return spdlog::level::info;
            case LogLevel::WARN:     return spdlog::level::warn;
            case LogLevel::ERROR:    return spdlog::level::err;
            case LogLevel::CRITICAL: return spdlog::level::critical;
            default:                 return spdlog::level::info;
        }
    }

    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
}

// ============================================================================
// LOGGING FUNCTIONS
// ============================================================================

void initialize_logging(const std::string& log_file, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink (colored)
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(level));
        sinks.push_back(console_sink);

        // File sink (rotating, 10MB per file, 3 files max)
        if (!log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3);
            file_sink->set_level(to_spdlog_level(level));
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("emucore", sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        spdlog::set_default_logger(logger);
        g_logger = logger;

    } catch (const spdlog::spdlog_ex& ex) {
        fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
}

void log(LogLevel level, const std::string& message) {
    std::call_once(g_logger_once, []() {
        if (!g_logger) {
            initialize_logging();
        }
    });

    if (!g_logger) {
        return;
    }

    switch (level) {
        case LogLevel::DEBUG:    g_logger->debug(message); break;
        case LogLevel::INFO:     g_logger->info(message); break;
        case LogLevel::WARN:     g_logger->warn(message); break;
        case LogLevel::ERROR:    g_logger->error(message); break;
        case LogLevel::CRITICAL: g_logger->critical(message); break;
    }
}

void log_debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void log_info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void log_warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void log_critical(const std::string& message) {
    log(LogLevel::CRITICAL, message);
}

// ============================================================================
// FILE I/O FUNCTIONS
// ============================================================================

std::optional<std::string> read_file(const std::string& file_path) {
    try {
        std::ifstream file(file_path, std::ios::in);
        if (!file.is_open()) {
            return std::nullopt;
        }

        std::ostringstream content;
        content << file.rdbuf();
        return content.str();

    } catch (const std::exception& ex) {
        log_error("Exception reading file " + file_path + ": " + ex.what());
        return std::nullopt;
    }
}

bool write_file(const std::string& file_path, const std::string& content) {
    try {
        // Create parent directories if needed
        std::filesystem::path path(file_path);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(file_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            log_error("Failed to open file for writing: " + file_path);
            return false;
        }

        file << content;
        return file.good();

    } catch (const std::exception& ex) {
        log_error("Exception writing file " + file_path + ": " + ex.what());
        return false;
    }
}

std::optional<std::string> calculate_file_md5(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        log_error("Failed to open file for hashing: " + file_path);
        return std::nullopt;
    }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        log_error("Failed to initialize MD5 digest for " + file_path);
        return std::nullopt;
    }

    std::array<char, 64 * 1024> buffer{};
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file.gcount();
        if (count > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
            log_error("Failed to update MD5 digest for " + file_path);
            return std::nullopt;
        }
    }
    if (file.bad()) {
        log_error("Failed to read file for hashing: " + file_path);
        return std::nullopt;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        log_error("Failed to finalize MD5 digest for " + file_path);
        return std::nullopt;
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < digest_length; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(digest[i]);
    }
    return oss.str();
}

// ============================================================================
// STRING MANIPULATION FUNCTIONS
// ============================================================================

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }

    return result;
}

std::string trim_string(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
        [](unsigned char ch) { return std::isspace(ch); });

    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char ch) { return std::isspace(ch); }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.length() > str.length()) {
        return false;
    }
    return str.compare(0, prefix.length(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.length() > str.length()) {
        return false;
    }
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

// ============================================================================
// HOST/NETWORK FUNCTIONS
// ============================================================================

std::string get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string get_hostname() {
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        return "unknown";
    }
    hostname[sizeof(hostname) - 1] = '\0';
    return std::string(hostname);
}

bool is_interface_up(const std::string& interface_name) {
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        log_error("Could not list network interfaces while checking " + interface_name);
        return false;
    }

    bool up = false;
    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name != nullptr && interface_name == ifa->ifa_name) {
            if (ifa->ifa_flags & IFF_UP) {
                up = true;
                break;
            }
        }
    }

    freeifaddrs(ifaddr);
    return up;
}

namespace {
    // Reads "<key>: <value> kB" entries from /proc/meminfo
    std::optional<uint64_t> read_meminfo_kb(const std::string& key) {
        std::ifstream meminfo("/proc/meminfo");
        if (!meminfo.is_open()) {
            return std::nullopt;
        }

        std::string line;
        while (std::getline(meminfo, line)) {
            if (starts_with(line, key + ":")) {
                std::istringstream iss(line.substr(key.size() + 1));
                uint64_t value = 0;
                if (iss >> value) {
                    return value;
                }
            }
        }
        return std::nullopt;
    }
}

std::optional<uint64_t> get_available_memory_mb() {
    auto available_kb = read_meminfo_kb("MemAvailable");
    if (!available_kb) {
        return std::nullopt;
    }
    return *available_kb / 1024;
}

std::optional<double> get_memory_percent_left() {
    auto available_kb = read_meminfo_kb("MemAvailable");
    auto total_kb = read_meminfo_kb("MemTotal");
    if (!available_kb || !total_kb || *total_kb == 0) {
        return std::nullopt;
    }
    return 100.0 * static_cast<double>(*available_kb) / static_cast<double>(*total_kb);
}

std::filesystem::path find_executable(const std::string& name) {
    if (name.empty()) {
        return {};
    }

    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) {
            return std::filesystem::path(name);
        }
        return {};
    }

    for (const auto& directory : split_string(get_env("PATH"), ':')) {
        if (directory.empty()) continue;
        std::filesystem::path candidate = std::filesystem::path(directory) / name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

int compare_versions(const std::string& lhs, const std::string& rhs) {
    auto to_numbers = [](const std::string& version) {
        std::vector<long> numbers;
        for (const auto& part : split_string(version, '.')) {
            // Trailing qualifiers such as "14a" compare on their numeric prefix
            size_t digits = 0;
            while (digits < part.size() && std::isdigit(static_cast<unsigned char>(part[digits]))) {
                digits++;
            }
            numbers.push_back(digits == 0 ? 0 : std::stol(part.substr(0, digits)));
        }
        return numbers;
    };

    auto left = to_numbers(lhs);
    auto right = to_numbers(rhs);
    size_t length = std::max(left.size(), right.size());
    left.resize(length, 0);
    right.resize(length, 0);

    for (size_t i = 0; i < length; ++i) {
        if (left[i] != right[i]) {
            return left[i] < right[i] ? -1 : 1;
        }
    }
    return 0;
}

// ============================================================================
// IDENTIFIERS
// ============================================================================

std::string generate_uuid() {
    if (sodium_init() < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }

    std::array<uint8_t, 16> bytes{};
    randombytes_buf(bytes.data(), bytes.size());

    // Set version (4) and variant bits according to RFC 4122
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << "-";
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

bool is_valid_uuid(const std::string& value) {
    if (value.size() != 36) {
        return false;
    }

    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (value[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace utilities
} // namespace emucore
