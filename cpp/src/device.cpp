/**
 * @file device.cpp
 * @brief Implementation of the device base class
 *
 * EmuCore - Network Emulation Compute Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "emucore/device.hpp"
#include "emucore/device_manager.hpp"
#include "emucore/errors.hpp"
#include "emucore/port_allocator.hpp"
#include "emucore/project.hpp"
#include "emucore/server_config.hpp"
#include "emucore/utilities.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <regex>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace emucore {

namespace {
    // VNC_CONSOLE_END_PORT itself is excluded
    const PortRange VNC_RANGE{config::VNC_CONSOLE_START_PORT,
                              static_cast<uint16_t>(config::VNC_CONSOLE_END_PORT - 1)};

    std::string port_label(size_t adapter_number, size_t port_number) {
        return std::to_string(adapter_number) + "/" + std::to_string(port_number);
    }

    json optional_port(const std::optional<uint16_t>& port) {
        return port ? json(*port) : json(nullptr);
    }
}

// ============================================================================
// Enumerations
// ============================================================================

std::string console_type_to_string(ConsoleType type) {
    switch (type) {
        case ConsoleType::Telnet: return "telnet";
        case ConsoleType::Vnc:    return "vnc";
        case ConsoleType::Spice:  return "spice";
        case ConsoleType::Http:   return "http";
        case ConsoleType::Https:  return "https";
        case ConsoleType::None:   return "none";
    }
    return "none";
}

ConsoleType console_type_from_string(const std::string& name) {
    if (name == "telnet") return ConsoleType::Telnet;
    if (name == "vnc") return ConsoleType::Vnc;
    if (name == "spice") return ConsoleType::Spice;
    if (name == "http") return ConsoleType::Http;
    if (name == "https") return ConsoleType::Https;
    if (name == "none") return ConsoleType::None;
    throw DeviceError("Unknown console type: " + name);
}

std::string device_status_to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Stopped:   return "stopped";
        case DeviceStatus::Started:   return "started";
        case DeviceStatus::Suspended: return "suspended";
    }
    return "stopped";
}

// ============================================================================
// Construction
// ============================================================================

Device::Device(
    const std::string& name,
    const std::string& device_id,
    std::shared_ptr<Project> project,
    DeviceManager& manager,
    std::optional<uint16_t> console,
    ConsoleType console_type,
    std::optional<uint16_t> aux,
    ConsoleType aux_type)
    : id_(device_id)
    , name_(name)
    , project_(std::move(project))
    , manager_(manager)
    , console_type_(console_type)
    , aux_type_(aux_type)
    , status_(DeviceStatus::Stopped)
    , closed_(false)
    , bridge_requires_privileges_(false)
{
    if (!project_) {
        throw DeviceError("Device '" + name + "' has no project");
    }

    console_ = acquire_port(console, console_type_);
    try {
        aux_ = acquire_port(aux, aux_type_);
    } catch (const std::exception&) {
        release_port(console_);
        throw;
    }

    utilities::log_debug(log_prefix() + " initialized. Console port " +
                         (console_ ? std::to_string(*console_) : std::string("none")) +
                         ", aux port " + (aux_ ? std::to_string(*aux_) : std::string("none")));
}

Device::~Device() {
    // Construction of a derived class failed or the device was never closed
    if (!closed_.load()) {
        try {
            release_port(console_);
            release_port(aux_);
        } catch (const std::exception& ex) {
            utilities::log_error(log_prefix() + " could not release console ports: " + ex.what());
        }
    }

    if (!temporary_directory_.empty()) {
        std::error_code ec;
        fs::remove_all(temporary_directory_, ec);
        if (ec) {
            utilities::log_warn(log_prefix() + " could not delete temporary directory " +
                                temporary_directory_.string() + ": " + ec.message());
        }
    }
}

std::optional<uint16_t> Device::acquire_port(std::optional<uint16_t> requested, ConsoleType type) {
    if (type == ConsoleType::None) {
        return std::nullopt;
    }

    auto& allocator = manager_.port_allocator();
    std::optional<PortRange> range;
    if (type == ConsoleType::Vnc) {
        range = VNC_RANGE;
    }

    if (requested) {
        return allocator.reserve_tcp_port(*requested, *project_, range);
    }
    return allocator.get_free_tcp_port(*project_, range);
}

void Device::release_port(std::optional<uint16_t>& port) {
    if (port) {
        manager_.port_allocator().release_tcp_port(*port, *project_);
        port.reset();
    }
}

std::string Device::module_name() const {
    return manager_.module_name();
}

std::string Device::log_prefix() const {
    return module_name() + ": '" + name_ + "' [" + id_ + "]";
}

// ============================================================================
// Identity
// ============================================================================

std::string Device::name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return name_;
}

void Device::rename(const std::string& new_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    utilities::log_info(log_prefix() + " renamed to '" + new_name + "'");
    name_ = new_name;
}

// ============================================================================
// Consoles
// ============================================================================

std::optional<uint16_t> Device::console() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return console_;
}

void Device::set_console(std::optional<uint16_t> port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (port == console_) {
        return;
    }

    if (console_type_ == ConsoleType::Vnc && port && *port < config::VNC_CONSOLE_START_PORT) {
        throw InvalidConsolePortError("VNC console require a port superior or equal to " +
                                      std::to_string(config::VNC_CONSOLE_START_PORT));
    }

    release_port(console_);
    if (port) {
        std::optional<PortRange> range;
        if (console_type_ == ConsoleType::Vnc) {
            range = VNC_RANGE;
        }
        console_ = manager_.port_allocator().reserve_tcp_port(*port, *project_, range);
        utilities::log_info(log_prefix() + " console port set to " + std::to_string(*console_));
    }
}

ConsoleType Device::console_type() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return console_type_;
}

void Device::set_console_type(ConsoleType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (type != console_type_) {
        auto port = acquire_port(std::nullopt, type);
        release_port(console_);
        console_ = port;
        utilities::log_info(log_prefix() + " console type set to " + console_type_to_string(type) +
                            (console_ ? " (console port is " + std::to_string(*console_) + ")" : std::string()));
    }
    console_type_ = type;
}

std::optional<uint16_t> Device::aux() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aux_;
}

void Device::set_aux(std::optional<uint16_t> port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (port == aux_) {
        return;
    }

    if (aux_type_ == ConsoleType::Vnc && port && *port < config::VNC_CONSOLE_START_PORT) {
        throw InvalidConsolePortError("VNC console require a port superior or equal to " +
                                      std::to_string(config::VNC_CONSOLE_START_PORT));
    }

    release_port(aux_);
    if (port) {
        std::optional<PortRange> range;
        if (aux_type_ == ConsoleType::Vnc) {
            range = VNC_RANGE;
        }
        aux_ = manager_.port_allocator().reserve_tcp_port(*port, *project_, range);
        utilities::log_info(log_prefix() + " aux port set to " + std::to_string(*aux_));
    }
}

ConsoleType Device::aux_type() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aux_type_;
}

void Device::set_aux_type(ConsoleType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (type != aux_type_) {
        auto port = acquire_port(std::nullopt, type);
        release_port(aux_);
        aux_ = port;
        utilities::log_info(log_prefix() + " aux type set to " + console_type_to_string(type));
    }
    aux_type_ = type;
}

// ============================================================================
// Status and Lifecycle
// ============================================================================

DeviceStatus Device::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

void Device::set_status(DeviceStatus status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }
    updated();
}

void Device::updated() const {
    project_->emit("node.updated", to_json());
}

void Device::create() {
    utilities::log_info(log_prefix() + " created");
}

void Device::stop() {
    stop_bridge();
    if (status() != DeviceStatus::Stopped) {
        set_status(DeviceStatus::Stopped);
    }
}

void Device::suspend() {
    throw DeviceError(log_prefix() + " does not support suspend");
}

void Device::resume() {
    throw DeviceError(log_prefix() + " does not support resume");
}

bool Device::close() {
    if (closed_.exchange(true)) {
        return false;
    }

    utilities::log_debug(log_prefix() + " is closing");

    std::vector<uint16_t> udp_ports;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        release_port(console_);
        release_port(aux_);

        for (const auto& adapter : adapters_) {
            for (const auto& nio : adapter->ports()) {
                if (nio && nio->owned_udp_port()) {
                    udp_ports.push_back(*nio->owned_udp_port());
                }
            }
        }

        for (const auto& nio : {local_udp_tunnel_.first, local_udp_tunnel_.second}) {
            if (nio && nio->owned_udp_port()) {
                udp_ports.push_back(*nio->owned_udp_port());
            }
        }
        local_udp_tunnel_ = {};
    }

    auto& allocator = manager_.port_allocator();
    for (uint16_t port : udp_ports) {
        allocator.release_udp_port(port, *project_);
    }

    stop_bridge();

    utilities::log_info(log_prefix() + " closed");
    return true;
}

// ============================================================================
// Files
// ============================================================================

fs::path Device::working_dir() const {
    return project_->device_working_directory(module_name(), id_);
}

fs::path Device::working_path() const {
    return project_->device_working_path(module_name(), id_);
}

fs::path Device::temporary_directory() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (temporary_directory_.empty()) {
        std::string pattern = (fs::temp_directory_path() / "emucore-XXXXXX").string();
        if (mkdtemp(pattern.data()) == nullptr) {
            throw DeviceError("Can't create temporary directory: " + std::string(std::strerror(errno)));
        }
        temporary_directory_ = pattern;
    }
    return temporary_directory_;
}

void Device::delete_working_directory() {
    fs::path directory = working_path();
    std::error_code ec;
    fs::remove_all(directory, ec);
    if (ec) {
        throw DeviceError("Could not delete the device working directory " + directory.string() +
                          ": " + ec.message());
    }
}

// ============================================================================
// Adapters and Links
// ============================================================================

void Device::add_adapter(std::unique_ptr<Adapter> adapter) {
    std::lock_guard<std::mutex> lock(mutex_);
    adapters_.push_back(std::move(adapter));
}

size_t Device::adapter_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adapters_.size();
}

Adapter& Device::adapter_at(size_t adapter_number) const {
    if (adapter_number >= adapters_.size()) {
        throw AdapterOutOfRangeError("Adapter " + std::to_string(adapter_number) +
                                     " doesn't exist on " + name_);
    }
    return *adapters_[adapter_number];
}

void Device::adapter_add_nio_binding(size_t adapter_number, size_t port_number, std::shared_ptr<Nio> nio) {
    std::optional<uint16_t> replaced_port;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Adapter& adapter = adapter_at(adapter_number);
        auto previous = adapter.get_nio(port_number);
        if (previous && previous != nio) {
            replaced_port = previous->owned_udp_port();
        }
        adapter.add_nio(port_number, nio);
        utilities::log_info(log_prefix() + ": " + nio->to_string() + " has been added to adapter " +
                            port_label(adapter_number, port_number));
    }

    if (replaced_port) {
        manager_.port_allocator().release_udp_port(*replaced_port, *project_);
    }
}

std::shared_ptr<Nio> Device::adapter_remove_nio_binding(size_t adapter_number, size_t port_number) {
    std::shared_ptr<Nio> nio;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        nio = adapter_at(adapter_number).remove_nio(port_number);
        if (!nio) {
            return nullptr;
        }
        if (nio->capturing()) {
            nio->stop_packet_capture();
        }
        utilities::log_info(log_prefix() + ": " + nio->to_string() + " has been removed from adapter " +
                            port_label(adapter_number, port_number));
    }

    if (auto port = nio->owned_udp_port()) {
        manager_.port_allocator().release_udp_port(*port, *project_);
    }
    return nio;
}

std::shared_ptr<Nio> Device::get_nio(size_t adapter_number, size_t port_number) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return adapter_at(adapter_number).get_nio(port_number);
}

fs::path Device::start_capture(size_t adapter_number, size_t port_number,
                               const std::string& output_file, const std::string& data_link_type) {
    fs::path capture_dir = project_->capture_working_directory();
    fs::path output = (capture_dir / output_file).lexically_normal();
    if (output_file.empty() || !config::is_safe_path(output, capture_dir)) {
        throw ForbiddenError("Capture file '" + output_file + "' is not allowed");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto nio = adapter_at(adapter_number).get_nio(port_number);
    if (!nio) {
        throw DeviceError("Adapter " + port_label(adapter_number, port_number) + " is not connected");
    }
    if (nio->capturing()) {
        throw DeviceError("Packet capture is already active on adapter " +
                          port_label(adapter_number, port_number));
    }

    nio->start_packet_capture(output.string(), data_link_type);
    utilities::log_info(log_prefix() + ": starting packet capture on adapter " +
                        port_label(adapter_number, port_number) + " to " + output.string());
    return output;
}

void Device::stop_capture(size_t adapter_number, size_t port_number) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto nio = adapter_at(adapter_number).get_nio(port_number);
    if (!nio) {
        throw DeviceError("Adapter " + port_label(adapter_number, port_number) + " is not connected");
    }
    nio->stop_packet_capture();
    utilities::log_info(log_prefix() + ": stopping packet capture on adapter " +
                        port_label(adapter_number, port_number));
}

std::pair<std::shared_ptr<Nio>, std::shared_ptr<Nio>> Device::create_local_udp_tunnel() {
    auto& allocator = manager_.port_allocator();
    uint16_t source_port = allocator.get_free_udp_port(*project_);
    uint16_t destination_port = 0;
    std::pair<std::shared_ptr<Nio>, std::shared_ptr<Nio>> tunnel;

    try {
        destination_port = allocator.get_free_udp_port(*project_);

        json source = {
            {"type", "nio_udp"},
            {"lport", source_port},
            {"rhost", "127.0.0.1"},
            {"rport", destination_port}
        };
        json destination = {
            {"type", "nio_udp"},
            {"lport", destination_port},
            {"rhost", "127.0.0.1"},
            {"rport", source_port}
        };
        tunnel.first = manager_.create_nio(source.dump());
        tunnel.second = manager_.create_nio(destination.dump());
    } catch (const std::exception&) {
        allocator.release_udp_port(source_port, *project_);
        if (destination_port != 0) {
            allocator.release_udp_port(destination_port, *project_);
        }
        throw;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    local_udp_tunnel_ = tunnel;
    return tunnel;
}

bool Device::check_available_ram(uint64_t requested_mb) const {
    auto available_mb = utilities::get_available_memory_mb();
    auto percent_left = utilities::get_memory_percent_left();
    if (!available_mb || !percent_left) {
        utilities::log_debug(log_prefix() + " cannot read host memory information");
        return false;
    }

    if (requested_mb <= *available_mb) {
        return false;
    }

    std::string message = "\"" + name() + "\" requires " + std::to_string(requested_mb) +
                          "MB of RAM to run but there is only " + std::to_string(*available_mb) +
                          "MB - " + std::to_string(static_cast<int>(*percent_left)) +
                          "% of RAM left on \"" + utilities::get_hostname() + "\"";
    utilities::log_warn(message);
    project_->emit("log.warning", json{{"message", message}}.dump());
    return true;
}

// ============================================================================
// Bridge Hypervisor
// ============================================================================

void Device::start_bridge(bool require_privileged_access) {
    std::lock_guard<std::mutex> lock(bridge_mutex_);
    start_bridge_locked(require_privileged_access);
}

void Device::start_bridge_locked(bool require_privileged_access) {
    if (bridge_ && bridge_->is_running()) {
        return;
    }

    const auto& cfg = manager_.config();
    fs::path executable = utilities::find_executable(cfg.ubridge_path);
    if (executable.empty()) {
        throw DeviceError("Bridge executable '" + cfg.ubridge_path + "' is not available");
    }

    if (require_privileged_access && !DeviceManager::has_privileged_access(executable)) {
        throw DeviceError("Bridge executable '" + executable.string() +
                          "' requires root access or the capability to interact with network adapters");
    }

    auto bridge = std::make_unique<BridgeHypervisor>(project_, manager_.port_allocator(),
                                                     executable, working_dir(), cfg.host);
    utilities::log_info(log_prefix() + " starting new bridge hypervisor");
    bridge->start();
    bridge->connect();

    bridge_ = std::move(bridge);
    bridge_requires_privileges_ = require_privileged_access;
}

void Device::stop_bridge() {
    std::lock_guard<std::mutex> lock(bridge_mutex_);
    if (!bridge_) {
        return;
    }

    try {
        bridge_->stop();
    } catch (const std::exception& ex) {
        utilities::log_error(log_prefix() + " could not stop bridge hypervisor: " + ex.what());
    }
    bridge_.reset();
}

bool Device::bridge_running() {
    std::lock_guard<std::mutex> lock(bridge_mutex_);
    return bridge_ && bridge_->is_running();
}

std::vector<std::string> Device::bridge_send(const std::string& command) {
    std::lock_guard<std::mutex> lock(bridge_mutex_);
    if (!bridge_ || !bridge_->is_running()) {
        throw BridgeError("Cannot send command '" + command + "': bridge hypervisor is not running");
    }

    try {
        return bridge_->send(command);
    } catch (const BridgeError& ex) {
        throw BridgeError("Error while sending command '" + command + "': " + ex.what() +
                          ": " + bridge_->read_stdout());
    }
}

void Device::add_bridge_udp_connection(const std::string& bridge_name, const Nio& source, const Nio& destination) {
    bridge_send("bridge create " + bridge_name);

    if (!std::holds_alternative<NioUdp>(destination.endpoint())) {
        throw DeviceError("Destination NIO of bridge " + bridge_name + " is not UDP");
    }

    for (const Nio* nio : {&source, &destination}) {
        if (const auto* udp = std::get_if<NioUdp>(&nio->endpoint())) {
            bridge_send("bridge add_nio_udp " + bridge_name + " " + std::to_string(udp->lport) + " " +
                        udp->rhost + " " + std::to_string(udp->rport));
        }
    }

    if (destination.capturing()) {
        bridge_send("bridge start_capture " + bridge_name + " \"" + destination.pcap_output_file() + "\"");
    }

    bridge_send("bridge start " + bridge_name);
    bridge_apply_filters(bridge_name, destination.filters());
}

void Device::bridge_apply_filters(const std::string& bridge_name, const NioFilters& filters) {
    static const std::regex syntax_error("Cannot compile filter '(.*)': syntax error");

    bridge_send("bridge reset_packet_filters " + bridge_name);
    for (const auto& filter : build_filter_list(filters)) {
        std::string command = "bridge add_packet_filter " + bridge_name + " " + filter;
        try {
            bridge_send(command);
        } catch (const BridgeError& ex) {
            std::smatch match;
            std::string what = ex.what();
            if (!std::regex_search(what, match, syntax_error)) {
                throw;
            }
            std::string message = "Warning: ignoring BPF packet filter '" + match[1].str() +
                                  "' due to syntax error";
            utilities::log_warn(log_prefix() + " " + message);
            project_->emit("log.warning", json{{"message", message}}.dump());
        }
    }
}

void Device::delete_bridge(const std::string& bridge_name) {
    if (bridge_running()) {
        bridge_send("bridge delete " + bridge_name);
    }
}

std::vector<std::string> Device::build_filter_list(const NioFilters& filters) {
    std::vector<std::string> result;
    size_t index = 0;

    for (const auto& [filter_type, values] : filters) {
        if (filter_type == "bpf") {
            // One filter per non-empty line of the expression
            for (const auto& value : values) {
                for (const auto& line : utilities::split_string(value, '\n')) {
                    std::string expression = utilities::trim_string(line);
                    if (expression.empty()) {
                        continue;
                    }
                    result.push_back("filter" + std::to_string(index++) + " bpf \"" + expression + "\"");
                }
            }
        } else {
            std::string entry = "filter" + std::to_string(index++) + " " + filter_type;
            for (const auto& value : values) {
                entry += " " + value;
            }
            result.push_back(entry);
        }
    }
    return result;
}

// ============================================================================
// Serialization
// ============================================================================

std::string Device::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json j;
    j["name"] = name_;
    j["node_id"] = id_;
    j["project_id"] = project_->id();
    j["node_directory"] = working_path().string();
    j["status"] = device_status_to_string(status_);
    j["console"] = optional_port(console_);
    j["console_type"] = console_type_to_string(console_type_);
    j["console_host"] = manager_.port_allocator().console_host();
    j["aux"] = optional_port(aux_);
    j["aux_type"] = console_type_to_string(aux_type_);
    return j.dump();
}

} // namespace emucore
