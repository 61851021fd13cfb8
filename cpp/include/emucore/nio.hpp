/**
 * @file nio.hpp
 * @brief Virtual links (NIO) attached to device adapter ports
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A link endpoint is one of four closed variants:
 * - UDP tunnel (local port, remote host and port)
 * - TAP interface
 * - Raw Ethernet interface
 * - NAT pseudo-interface
 * Any variant may capture packets to a pcap file.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace emucore {

/// UDP tunnel endpoint
struct NioUdp {
    uint16_t lport;
    std::string rhost;
    uint16_t rport;
};

/// TAP interface endpoint
struct NioTap {
    std::string tap_device;
};

/// Raw Ethernet interface endpoint
struct NioEthernet {
    std::string ethernet_device;
};

/// NAT pseudo-interface
struct NioNat {
};

using NioEndpoint = std::variant<NioUdp, NioTap, NioEthernet, NioNat>;

/// Packet filters: filter type -> arguments (e.g. "delay" -> {"10", "5"})
using NioFilters = std::map<std::string, std::vector<std::string>>;

/// Visitor helper for std::visit over NioEndpoint
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

/**
 * @brief Nio - One endpoint of a virtual network connection
 *
 * The endpoint is fixed once built; capture state, filters and the
 * suspend flag change over the link lifetime.
 */
class Nio {
public:
    explicit Nio(NioEndpoint endpoint);

    const NioEndpoint& endpoint() const { return endpoint_; }

    /**
     * @brief Wire name of the variant ("nio_udp", "nio_tap", "nio_ethernet", "nio_nat")
     */
    std::string type_name() const;

    /**
     * @brief Local UDP port held by a UDP tunnel, if any
     */
    std::optional<uint16_t> owned_udp_port() const;

    // ========================================================================
    // Packet Capture
    // ========================================================================

    /**
     * @brief Enter capture mode
     * @param pcap_output_file Capture destination
     * @param data_link_type Link type used to frame captured packets
     */
    void start_packet_capture(const std::string& pcap_output_file,
                              const std::string& data_link_type = "DLT_EN10MB");

    void stop_packet_capture();

    bool capturing() const { return capturing_; }
    const std::string& pcap_output_file() const { return pcap_output_file_; }
    const std::string& pcap_data_link_type() const { return pcap_data_link_type_; }

    // ========================================================================
    // Filters and Suspension
    // ========================================================================

    const NioFilters& filters() const { return filters_; }
    void set_filters(NioFilters filters) { filters_ = std::move(filters); }

    bool suspend() const { return suspend_; }
    void set_suspend(bool suspend) { suspend_ = suspend; }

    /**
     * @brief Serialize link to JSON
     */
    std::string to_json() const;

    /**
     * @brief Human readable form used in log lines
     */
    std::string to_string() const;

private:
    NioEndpoint endpoint_;

    bool capturing_;
    std::string pcap_output_file_;
    std::string pcap_data_link_type_;

    NioFilters filters_;
    bool suspend_;
};

/**
 * @brief Build a link from its JSON settings
 *
 * Accepted types: nio_udp, nio_tap, nio_ethernet, nio_generic_ethernet,
 * nio_nat. UDP tunnels must reach their remote end; Ethernet interfaces
 * must exist and be up.
 *
 * @throws NioError on unknown type, missing fields or failed validation
 */
std::shared_ptr<Nio> create_nio(const std::string& settings_json);

/**
 * @brief Resolve and connect a UDP socket to host:port
 * @throws NioError if the destination cannot be resolved or connected
 */
void check_udp_destination(const std::string& host, uint16_t port);

} // namespace emucore
