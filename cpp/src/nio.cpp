/**
 * @file nio.cpp
 * @brief Implementation of virtual links
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "emucore/nio.hpp"
#include "emucore/errors.hpp"
#include "emucore/utilities.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace emucore {

Nio::Nio(NioEndpoint endpoint)
    : endpoint_(std::move(endpoint))
    , capturing_(false)
    , suspend_(false)
{
}

std::string Nio::type_name() const {
    return std::visit(overloaded{
        [](const NioUdp&) { return std::string("nio_udp"); },
        [](const NioTap&) { return std::string("nio_tap"); },
        [](const NioEthernet&) { return std::string("nio_ethernet"); },
        [](const NioNat&) { return std::string("nio_nat"); }
    }, endpoint_);
}

std::optional<uint16_t> Nio::owned_udp_port() const {
    if (const auto* udp = std::get_if<NioUdp>(&endpoint_)) {
        return udp->lport;
    }
    return std::nullopt;
}

// ============================================================================
// Packet Capture
// ============================================================================

void Nio::start_packet_capture(const std::string& pcap_output_file, const std::string& data_link_type) {
    capturing_ = true;
    pcap_output_file_ = pcap_output_file;
    pcap_data_link_type_ = data_link_type;
}

void Nio::stop_packet_capture() {
    capturing_ = false;
    pcap_output_file_.clear();
    pcap_data_link_type_.clear();
}

// ============================================================================
// Serialization
// ============================================================================

std::string Nio::to_json() const {
    json j;
    j["type"] = type_name();

    std::visit(overloaded{
        [&j](const NioUdp& udp) {
            j["lport"] = udp.lport;
            j["rhost"] = udp.rhost;
            j["rport"] = udp.rport;
        },
        [&j](const NioTap& tap) { j["tap_device"] = tap.tap_device; },
        [&j](const NioEthernet& ethernet) { j["ethernet_device"] = ethernet.ethernet_device; },
        [](const NioNat&) {}
    }, endpoint_);

    j["filters"] = filters_;
    j["suspend"] = suspend_;
    j["capturing"] = capturing_;
    if (capturing_) {
        j["pcap_output_file"] = pcap_output_file_;
        j["pcap_data_link_type"] = pcap_data_link_type_;
    }
    return j.dump();
}

std::string Nio::to_string() const {
    return std::visit(overloaded{
        [](const NioUdp& udp) {
            return "NIO UDP " + std::to_string(udp.lport) + " => " + udp.rhost + ":" +
                   std::to_string(udp.rport);
        },
        [](const NioTap& tap) { return "NIO TAP " + tap.tap_device; },
        [](const NioEthernet& ethernet) { return "NIO Ethernet " + ethernet.ethernet_device; },
        [](const NioNat&) { return std::string("NIO NAT"); }
    }, endpoint_);
}

// ============================================================================
// Factory
// ============================================================================

void check_udp_destination(const std::string& host, uint16_t port) {
    asio::io_context io;
    asio::ip::udp::resolver resolver(io);

    std::error_code ec;
    auto results = resolver.resolve(host, std::to_string(port),
        asio::ip::resolver_base::passive | asio::ip::resolver_base::numeric_service, ec);
    if (ec) {
        throw NioError("Could not create an UDP connection to " + host + ":" +
                       std::to_string(port) + ": " + ec.message());
    }
    if (results.empty()) {
        throw NioError("getaddrinfo returned an empty list on " + host + ":" + std::to_string(port));
    }

    for (const auto& entry : results) {
        asio::ip::udp::socket socket(io);
        socket.connect(entry.endpoint(), ec);
        if (ec) {
            throw NioError("Could not create an UDP connection to " + host + ":" +
                           std::to_string(port) + ": " + ec.message());
        }
    }
}

namespace {
    uint16_t read_port(const json& settings, const char* key) {
        if (!settings.contains(key) || !settings[key].is_number_integer()) {
            throw NioError(std::string("Missing or invalid '") + key + "' in NIO settings");
        }
        auto value = settings[key].get<int64_t>();
        if (value < 0 || value > 65535) {
            throw NioError(std::string("'") + key + "' is not a valid port: " + std::to_string(value));
        }
        return static_cast<uint16_t>(value);
    }

    std::string read_string(const json& settings, const char* key) {
        if (!settings.contains(key) || !settings[key].is_string()) {
            throw NioError(std::string("Missing or invalid '") + key + "' in NIO settings");
        }
        return settings[key].get<std::string>();
    }

    NioFilters read_filters(const json& settings) {
        NioFilters filters;
        if (!settings.contains("filters") || settings["filters"].is_null()) {
            return filters;
        }
        if (!settings["filters"].is_object()) {
            throw NioError("NIO filters must be an object");
        }

        for (const auto& item : settings["filters"].items()) {
            std::vector<std::string> values;
            for (const auto& value : item.value()) {
                values.push_back(value.is_string() ? value.get<std::string>() : value.dump());
            }
            filters[item.key()] = values;
        }
        return filters;
    }
}

std::shared_ptr<Nio> create_nio(const std::string& settings_json) {
    json settings;
    try {
        settings = json::parse(settings_json);
    } catch (const json::parse_error& ex) {
        throw NioError(std::string("Invalid NIO settings: ") + ex.what());
    }

    if (!settings.is_object()) {
        throw NioError("NIO settings must be a JSON object");
    }

    std::string type = read_string(settings, "type");
    std::shared_ptr<Nio> nio;

    if (type == "nio_udp") {
        uint16_t lport = read_port(settings, "lport");
        std::string rhost = read_string(settings, "rhost");
        uint16_t rport = read_port(settings, "rport");
        check_udp_destination(rhost, rport);
        nio = std::make_shared<Nio>(NioUdp{lport, rhost, rport});
    } else if (type == "nio_tap") {
        nio = std::make_shared<Nio>(NioTap{read_string(settings, "tap_device")});
    } else if (type == "nio_ethernet" || type == "nio_generic_ethernet") {
        std::string ethernet_device = read_string(settings, "ethernet_device");
        if (!utilities::is_interface_up(ethernet_device)) {
            throw NioError("Ethernet interface " + ethernet_device + " does not exist or is down");
        }
        nio = std::make_shared<Nio>(NioEthernet{ethernet_device});
    } else if (type == "nio_nat") {
        nio = std::make_shared<Nio>(NioNat{});
    } else {
        throw NioError("Unknown NIO type " + type);
    }

    try {
        nio->set_filters(read_filters(settings));
        if (settings.contains("suspend")) {
            nio->set_suspend(settings["suspend"].get<bool>());
        }
    } catch (const json::type_error& ex) {
        throw NioError(std::string("Invalid NIO settings: ") + ex.what());
    }

    utilities::log_debug("NIO: created " + nio->to_string());
    return nio;
}

} // namespace emucore
