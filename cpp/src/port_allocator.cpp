/**
 * @file port_allocator.cpp
 * @brief Implementation of thread-safe console and tunnel port allocation
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Thread-safe port allocation with live bind probing
 */

#include "emucore/port_allocator.hpp"
#include "emucore/errors.hpp"
#include "emucore/project.hpp"
#include "emucore/utilities.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <system_error>
#include <utility>

using json = nlohmann::json;

namespace emucore {

namespace {
    const char* protocol_name(PortProtocol protocol) {
        return protocol == PortProtocol::TCP ? "TCP" : "UDP";
    }

    // Bind a socket of type Socket on every address the resolver returns
    template <typename Protocol, typename Socket>
    void bind_all(asio::io_context& io, const std::string& host, uint16_t port) {
        typename Protocol::resolver resolver(io);
        std::error_code ec;
        auto results = resolver.resolve(host, std::to_string(port),
            asio::ip::resolver_base::passive | asio::ip::resolver_base::numeric_service, ec);
        if (ec) {
            throw std::system_error(ec, "Cannot resolve " + host);
        }

        for (const auto& entry : results) {
            auto endpoint = entry.endpoint();
            Socket socket(io);
            socket.open(endpoint.protocol(), ec);
            if (ec) {
                throw std::system_error(ec, "Cannot open socket");
            }
            socket.set_option(asio::socket_base::reuse_address(true), ec);
            if (ec) {
                throw std::system_error(ec, "Cannot set SO_REUSEADDR");
            }
            socket.bind(endpoint, ec);
            if (ec) {
                throw std::system_error(ec, "Cannot bind " + endpoint.address().to_string() +
                                            ":" + std::to_string(port));
            }
            // Socket closes on scope exit
        }
    }
}

// ============================================================================
// Constructor
// ============================================================================

PortAllocator::PortAllocator(const config::ServerConfig& cfg, PortProbe probe)
    : console_host_(cfg.console_host)
    , udp_host_(config::WILDCARD_HOST)
    , allow_remote_console_(cfg.allow_remote_console)
    , console_range_{cfg.console_start_port_range, cfg.console_end_port_range}
    , udp_range_{cfg.udp_start_port_range, cfg.udp_end_port_range}
    , probe_(probe ? std::move(probe) : PortProbe(&PortAllocator::check_port))
{
    validate_range(console_range_);
    validate_range(udp_range_);
    set_console_host(cfg.console_host);
}

// ============================================================================
// Probing
// ============================================================================

void PortAllocator::check_port(const std::string& host, uint16_t port, PortProtocol protocol) {
    asio::io_context io;
    if (protocol == PortProtocol::TCP) {
        bind_all<asio::ip::tcp, asio::ip::tcp::acceptor>(io, host, port);
    } else {
        bind_all<asio::ip::udp, asio::ip::udp::socket>(io, host, port);
    }
}

uint16_t PortAllocator::find_unused_port(
    uint16_t start,
    uint16_t end,
    const std::string& host,
    PortProtocol protocol,
    const std::set<uint16_t>& ignore,
    const PortProbe& probe)
{
    if (end < start) {
        throw PortRangeInvalidError("Invalid port range " + std::to_string(start) + "-" +
                                    std::to_string(end));
    }

    const PortProbe& test = probe ? probe : PortProbe(&PortAllocator::check_port);
    std::error_code last_error;

    // 32-bit counter so a range ending at 65535 terminates
    for (uint32_t candidate = start; candidate <= end; ++candidate) {
        auto port = static_cast<uint16_t>(candidate);
        if (ignore.count(port) > 0 || config::is_banned_port(port)) {
            continue;
        }

        try {
            test(host, port, protocol);
            if (host != config::WILDCARD_HOST) {
                test(config::WILDCARD_HOST, port, protocol);
            }
            return port;
        } catch (const std::system_error& ex) {
            last_error = ex.code();
            // A failure right before the last port ends the search
            if (candidate + 1 == end) {
                break;
            }
        }
    }

    throw PortExhaustedError(start, end, host, last_error);
}

bool PortAllocator::probe_passes(const std::string& host, uint16_t port, PortProtocol protocol) const {
    try {
        probe_(host, port, protocol);
        return true;
    } catch (const std::system_error& ex) {
        utilities::log_debug(std::string("PortAllocator: ") + protocol_name(protocol) + " port " +
                             std::to_string(port) + " not bindable on " + host + ": " + ex.what());
        return false;
    }
}

// ============================================================================
// TCP Console Ports
// ============================================================================

uint16_t PortAllocator::allocate_tcp_locked(Project& project, PortRange range) {
    uint16_t port = find_unused_port(range.start, range.end, console_host_,
                                     PortProtocol::TCP, used_tcp_ports_, probe_);
    used_tcp_ports_.insert(port);
    project.record_tcp_port(port);
    utilities::log_debug("PortAllocator: TCP port " + std::to_string(port) + " has been allocated");
    return port;
}

PortRange PortAllocator::tcp_range_or_default(std::optional<PortRange> range) const {
    return range ? *range : console_range_;
}

uint16_t PortAllocator::get_free_tcp_port(Project& project, std::optional<PortRange> range) {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocate_tcp_locked(project, tcp_range_or_default(range));
}

uint16_t PortAllocator::reserve_tcp_port(uint16_t port, Project& project, std::optional<PortRange> range) {
    std::lock_guard<std::mutex> lock(mutex_);
    PortRange effective = tcp_range_or_default(range);

    if (used_tcp_ports_.count(port) > 0) {
        uint16_t replacement = allocate_tcp_locked(project, effective);
        utilities::log_debug("PortAllocator: TCP port " + std::to_string(port) +
                             " already in use on host " + console_host_ +
                             ". Port has been replaced by " + std::to_string(replacement));
        return replacement;
    }

    if (port < effective.start || port > effective.end) {
        uint16_t replacement = allocate_tcp_locked(project, effective);
        utilities::log_debug("PortAllocator: TCP port " + std::to_string(port) +
                             " is outside the range " + std::to_string(effective.start) + "-" +
                             std::to_string(effective.end) + " on host " + console_host_ +
                             ". Port has been replaced by " + std::to_string(replacement));
        return replacement;
    }

    if (!probe_passes(console_host_, port, PortProtocol::TCP)) {
        uint16_t replacement = allocate_tcp_locked(project, effective);
        utilities::log_debug("PortAllocator: TCP port " + std::to_string(port) +
                             " already in use on host " + console_host_ +
                             ". Port has been replaced by " + std::to_string(replacement));
        return replacement;
    }

    used_tcp_ports_.insert(port);
    project.record_tcp_port(port);
    utilities::log_debug("PortAllocator: TCP port " + std::to_string(port) + " has been reserved");
    return port;
}

uint16_t PortAllocator::reserve_tcp_port_strict(uint16_t port, Project& project, std::optional<PortRange> range) {
    std::lock_guard<std::mutex> lock(mutex_);
    PortRange effective = tcp_range_or_default(range);

    if (used_tcp_ports_.count(port) > 0) {
        throw PortConflictError("TCP port " + std::to_string(port) +
                                " already in use on host " + console_host_);
    }

    if (port < effective.start || port > effective.end) {
        throw PortConflictError("TCP port " + std::to_string(port) + " is outside the range " +
                                std::to_string(effective.start) + "-" + std::to_string(effective.end));
    }

    if (!probe_passes(console_host_, port, PortProtocol::TCP)) {
        throw PortConflictError("TCP port " + std::to_string(port) +
                                " already in use on host " + console_host_);
    }

    used_tcp_ports_.insert(port);
    project.record_tcp_port(port);
    utilities::log_debug("PortAllocator: TCP port " + std::to_string(port) + " has been reserved");
    return port;
}

void PortAllocator::release_tcp_port(uint16_t port, Project& project) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = used_tcp_ports_.find(port);
    if (it == used_tcp_ports_.end()) {
        return;
    }

    used_tcp_ports_.erase(it);
    project.remove_tcp_port(port);
    utilities::log_debug("PortAllocator: TCP port " + std::to_string(port) + " has been released");
}

// ============================================================================
// UDP Tunnel Ports
// ============================================================================

uint16_t PortAllocator::get_free_udp_port(Project& project) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint16_t port = find_unused_port(udp_range_.start, udp_range_.end, udp_host_,
                                     PortProtocol::UDP, used_udp_ports_, probe_);
    used_udp_ports_.insert(port);
    project.record_udp_port(port);
    utilities::log_debug("PortAllocator: UDP port " + std::to_string(port) + " has been allocated");
    return port;
}

uint16_t PortAllocator::reserve_udp_port(uint16_t port, Project& project) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (used_udp_ports_.count(port) > 0) {
        throw PortConflictError("UDP port " + std::to_string(port) +
                                " already in use on host " + udp_host_);
    }

    if (port < udp_range_.start || port > udp_range_.end) {
        throw PortConflictError("UDP port " + std::to_string(port) + " is outside the range " +
                                std::to_string(udp_range_.start) + "-" + std::to_string(udp_range_.end));
    }

    used_udp_ports_.insert(port);
    project.record_udp_port(port);
    utilities::log_debug("PortAllocator: UDP port " + std::to_string(port) + " has been reserved");
    return port;
}

void PortAllocator::release_udp_port(uint16_t port, Project& project) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = used_udp_ports_.find(port);
    if (it == used_udp_ports_.end()) {
        return;
    }

    used_udp_ports_.erase(it);
    project.remove_udp_port(port);
    utilities::log_debug("PortAllocator: UDP port " + std::to_string(port) + " has been released");
}

// ============================================================================
// Query Functions
// ============================================================================

bool PortAllocator::is_tcp_port_used(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_tcp_ports_.find(port) != used_tcp_ports_.end();
}

bool PortAllocator::is_udp_port_used(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_udp_ports_.find(port) != used_udp_ports_.end();
}

std::set<uint16_t> PortAllocator::tcp_ports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_tcp_ports_;
}

std::set<uint16_t> PortAllocator::udp_ports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return used_udp_ports_;
}

std::string PortAllocator::console_host() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return console_host_;
}

void PortAllocator::set_console_host(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!allow_remote_console_) {
        console_host_ = host;
        return;
    }

    utilities::log_warn("PortAllocator: Remote console connections are allowed");
    console_host_ = config::WILDCARD_HOST;

    std::error_code ec;
    auto address = asio::ip::make_address(host, ec);
    if (ec) {
        utilities::log_warn("PortAllocator: Could not determine IP address type for console host " + host);
    } else if (address.is_v6()) {
        console_host_ = config::WILDCARD_HOST_V6;
    }
}

std::string PortAllocator::udp_host() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return udp_host_;
}

void PortAllocator::set_udp_host(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex_);
    udp_host_ = host;
}

PortRange PortAllocator::console_port_range() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return console_range_;
}

void PortAllocator::set_console_port_range(PortRange range) {
    validate_range(range);
    std::lock_guard<std::mutex> lock(mutex_);
    console_range_ = range;
}

PortRange PortAllocator::udp_port_range() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return udp_range_;
}

void PortAllocator::set_udp_port_range(PortRange range) {
    validate_range(range);
    std::lock_guard<std::mutex> lock(mutex_);
    udp_range_ = range;
}

std::string PortAllocator::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json j;
    j["console_host"] = console_host_;
    j["udp_host"] = udp_host_;
    j["console_port_range"] = {console_range_.start, console_range_.end};
    j["udp_port_range"] = {udp_range_.start, udp_range_.end};
    j["used_tcp_ports"] = used_tcp_ports_;
    j["used_udp_ports"] = used_udp_ports_;
    return j.dump();
}

// ============================================================================
// Private Helper Functions
// ============================================================================

void PortAllocator::validate_range(PortRange range) {
    if (range.end < range.start) {
        throw PortRangeInvalidError("Invalid port range " + std::to_string(range.start) + "-" +
                                    std::to_string(range.end));
    }
}

} // namespace emucore
