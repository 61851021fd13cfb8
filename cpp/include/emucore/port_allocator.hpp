/**
 * @file port_allocator.hpp
 * @brief Thread-safe console and tunnel port allocation
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Allocates TCP console ports and UDP tunnel ports for devices.
 * - Thread-safe allocation
 * - Live bind probe before a port is handed out
 * - Banned (browser-unsafe) ports are never handed out
 * - Ownership recorded against the requesting project
 */

#pragma once

#include "emucore/server_config.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace emucore {

class Project;

/**
 * @brief Transport a port is probed and tracked for
 */
enum class PortProtocol {
    TCP,
    UDP
};

/**
 * @brief Inclusive port range
 */
struct PortRange {
    uint16_t start;
    uint16_t end;
};

/**
 * @brief Bind test for one port
 *
 * Returns normally when the port can be bound on host, throws
 * std::system_error otherwise.
 */
using PortProbe = std::function<void(const std::string& host, uint16_t port, PortProtocol protocol)>;

/**
 * @brief PortAllocator - Thread-safe console and tunnel port allocation
 *
 * Tracks two independent pools: TCP console ports and UDP tunnel ports.
 * One allocator is shared by every backend manager of a server process.
 *
 * Default ranges: console 5000-10000, UDP 10000-20000
 */
class PortAllocator {
public:
    /**
     * @brief Construct port allocator from server configuration
     * @param cfg Server configuration (hosts and ranges)
     * @param probe Bind test; defaults to check_port
     * @throws PortRangeInvalidError if a configured range has end < start
     */
    explicit PortAllocator(
        const config::ServerConfig& cfg = config::ServerConfig{},
        PortProbe probe = {}
    );

    ~PortAllocator() = default;

    // Disable copy and move (one instance per server process)
    PortAllocator(const PortAllocator&) = delete;
    PortAllocator& operator=(const PortAllocator&) = delete;
    PortAllocator(PortAllocator&&) = delete;
    PortAllocator& operator=(PortAllocator&&) = delete;

    // ========================================================================
    // Probing
    // ========================================================================

    /**
     * @brief Find the first bindable port of a range
     *
     * Ports in ignore and banned ports are skipped. When host is not the
     * wildcard address the port must also bind on the wildcard address.
     * A failed probe on the second-to-last port ends the search without
     * testing the last port.
     *
     * @throws PortRangeInvalidError if end < start
     * @throws PortExhaustedError if no port of the range is free
     */
    static uint16_t find_unused_port(
        uint16_t start,
        uint16_t end,
        const std::string& host,
        PortProtocol protocol,
        const std::set<uint16_t>& ignore,
        const PortProbe& probe = {}
    );

    /**
     * @brief Bind and immediately release a test socket on every address of host
     * @throws std::system_error if any bind fails
     */
    static void check_port(const std::string& host, uint16_t port, PortProtocol protocol);

    // ========================================================================
    // TCP Console Ports
    // ========================================================================

    /**
     * @brief Allocate a free TCP port and record it on the project
     * @param project Owner of the port
     * @param range Range to allocate from (console range if not given)
     */
    uint16_t get_free_tcp_port(Project& project, std::optional<PortRange> range = std::nullopt);

    /**
     * @brief Reserve a specific TCP port, substituting a free one if needed
     *
     * If the port is already used, outside the range or fails a bind probe
     * a fresh port from the same range is allocated instead. Never raises
     * for those three cases.
     *
     * @return The reserved port (the requested one or its replacement)
     */
    uint16_t reserve_tcp_port(uint16_t port, Project& project,
                              std::optional<PortRange> range = std::nullopt);

    /**
     * @brief Reserve exactly the requested TCP port
     * @throws PortConflictError if the port is used, outside the range or not bindable
     */
    uint16_t reserve_tcp_port_strict(uint16_t port, Project& project,
                                     std::optional<PortRange> range = std::nullopt);

    /**
     * @brief Release a TCP port (no-op if not tracked)
     */
    void release_tcp_port(uint16_t port, Project& project);

    // ========================================================================
    // UDP Tunnel Ports
    // ========================================================================

    uint16_t get_free_udp_port(Project& project);

    /**
     * @brief Reserve exactly the requested UDP port
     * @throws PortConflictError if the port is used or outside the UDP range
     */
    uint16_t reserve_udp_port(uint16_t port, Project& project);

    void release_udp_port(uint16_t port, Project& project);

    // ========================================================================
    // Query Functions
    // ========================================================================

    bool is_tcp_port_used(uint16_t port) const;
    bool is_udp_port_used(uint16_t port) const;

    std::set<uint16_t> tcp_ports() const;
    std::set<uint16_t> udp_ports() const;

    std::string console_host() const;

    /**
     * @brief Set the console host
     *
     * When remote consoles are allowed the wildcard address is used instead
     * ("::" if host is an IPv6 address).
     */
    void set_console_host(const std::string& host);

    std::string udp_host() const;
    void set_udp_host(const std::string& host);

    PortRange console_port_range() const;
    void set_console_port_range(PortRange range);

    PortRange udp_port_range() const;
    void set_udp_port_range(PortRange range);

    /**
     * @brief Snapshot of hosts, ranges and used ports as JSON
     */
    std::string to_json() const;

private:
    /// Host console ports are probed on
    std::string console_host_;

    /// Host UDP ports are probed on
    std::string udp_host_;

    /// Open consoles on the wildcard address
    bool allow_remote_console_;

    PortRange console_range_;
    PortRange udp_range_;

    /// Ports handed out and not yet released
    std::set<uint16_t> used_tcp_ports_;
    std::set<uint16_t> used_udp_ports_;

    /// Bind test used for allocation
    PortProbe probe_;

    /// Held across probe and mark so two callers never pick the same port
    mutable std::mutex mutex_;

    uint16_t allocate_tcp_locked(Project& project, PortRange range);
    PortRange tcp_range_or_default(std::optional<PortRange> range) const;
    bool probe_passes(const std::string& host, uint16_t port, PortProtocol protocol) const;

    static void validate_range(PortRange range);
};

} // namespace emucore
